#pragma once

#include <functional>
#include <string>
#include <utility>

#include "errors.hpp"

namespace artscan::util {

/*
  Caller-owned cancellation probe.

  Checked at every suspension point of a scan up to the moment the
  catalog insert transaction begins.
*/
class CancellationToken {
 public:
  CancellationToken() = default;
  explicit CancellationToken(std::function<bool()> probe) : probe_(std::move(probe)) {
  }

  bool IsCancelled() const {
    return probe_ && probe_();
  }

  void ThrowIfCancelled(const std::string& stage) const {
    if (IsCancelled()) {
      throw Cancelled("scan cancelled before " + stage);
    }
  }

 private:
  std::function<bool()> probe_;
};

} // namespace artscan::util
