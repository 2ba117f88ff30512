#pragma once

#include "artscan/v1.hpp"
#include "internal/db/model/artwork_record.hpp"
#include "internal/db/model/issue_record.hpp"
#include "internal/db/model/museum_record.hpp"
#include "internal/db/model/scan_record.hpp"
#include "internal/recognition/fallback_dispatcher.hpp"

namespace artscan::service {

artscan::v1::Museum      ToProto(const db::model::MuseumRecord& record);
artscan::v1::Artwork     ToProto(const db::model::ArtworkRecord& record);
artscan::v1::ScanEvent   ToProto(const db::model::ScanRecord& record);
artscan::v1::IssueReport ToProto(const db::model::IssueRecord& record);
artscan::v1::Analysis    ToProto(const recognition::Analysis& analysis);

} // namespace artscan::service
