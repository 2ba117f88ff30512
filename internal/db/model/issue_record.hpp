#pragma once

#include <cstdint>
#include <string>

#include "internal/model/enums.hpp"

namespace artscan::db::model {

struct IssueRecord {
  int64_t     id         = 0;
  int64_t     artwork_id = 0;
  std::string user_id;

  artscan::model::IssueKind  kind  = artscan::v1::ISSUE_KIND_UNSPECIFIED;
  std::string                note;
  artscan::model::IssueState state = artscan::v1::ISSUE_STATE_OPEN;

  uint64_t created_at_ms  = 0;
  uint64_t resolved_at_ms = 0;  // 0 while open
};

} // namespace artscan::db::model
