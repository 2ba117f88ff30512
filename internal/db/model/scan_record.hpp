#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "internal/model/enums.hpp"

namespace artscan::db::model {

/*
  Append-only scan event.

  artwork_id is empty for the not_art outcome and after the artwork
  was deleted by moderation.
*/
struct ScanRecord {
  int64_t                id = 0;
  std::string            user_id;
  std::optional<int64_t> artwork_id;
  std::string            image_url;

  artscan::model::ScanStatus status = artscan::v1::SCAN_STATUS_UNSPECIFIED;

  // strictly increasing per user
  uint64_t timestamp_ms = 0;
};

} // namespace artscan::db::model
