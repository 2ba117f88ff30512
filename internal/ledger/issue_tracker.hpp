#pragma once

#include <google/protobuf/struct.pb.h>

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"

namespace artscan::ledger {

struct ArtworkCorrection {
  std::optional<std::string>              title;
  std::optional<std::string>              artist;
  std::optional<google::protobuf::Struct> description;  // merged key by key

  bool Empty() const {
    return !title && !artist && !description;
  }
};

struct ResolveResult {
  db::model::IssueRecord                  report;
  std::optional<db::model::ArtworkRecord> artwork;  // state after resolution
  bool                                    artwork_deleted = false;
};

/*
  IssueTracker

  User-reported catalog problems and their moderation. Reports are never
  resolved automatically; only open reports can be resolved.
*/
class IssueTracker {
 public:
  using MillisClock = std::function<uint64_t()>;

  explicit IssueTracker(std::shared_ptr<db::Repository> repository, MillisClock clock = {});

  // Throws util::ArtworkNotFound when the artwork does not exist.
  db::model::IssueRecord ReportIssue(int64_t artwork_id, const std::string& user_id, model::IssueKind kind, const std::string& note);

  // Throws util::NotFound for an unknown report, util::InvalidState when
  // the report is no longer open.
  ResolveResult ResolveIssue(int64_t report_id, model::ResolveOutcome outcome, const ArtworkCorrection& correction = {});

  std::vector<db::model::IssueRecord> ListIssues(std::optional<model::IssueState> state, const db::Pagination& pagination) const;

 private:
  db::model::ArtworkRecord LoadArtwork(db::Transaction& tx, int64_t artwork_id) const;

  std::shared_ptr<db::Repository> repository_;
  MillisClock                     clock_;
};

} // namespace artscan::ledger
