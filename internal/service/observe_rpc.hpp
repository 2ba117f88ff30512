#pragma once

#include <chrono>
#include <exception>
#include <string_view>
#include <type_traits>
#include <utility>

#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"

namespace artscan::service {

// Runs fn inside a span and records request count and latency for route.
template <typename Fn>
auto ObserveRpc(std::string_view route, Fn&& fn) {
  artscan::observability::SpanScope span(route);

  const auto started_at = std::chrono::steady_clock::now();
  const auto elapsed_ms = [&] {
    return std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started_at).count();
  };

  try {
    if constexpr (std::is_void_v<std::invoke_result_t<Fn, artscan::observability::SpanScope&>>) {
      fn(span);
      artscan::observability::Metrics::Instance().RecordRequest(route, true);
      artscan::observability::Metrics::Instance().ObserveRequestLatencyMs(route, elapsed_ms());
      return;
    } else {
      auto result = fn(span);
      artscan::observability::Metrics::Instance().RecordRequest(route, true);
      artscan::observability::Metrics::Instance().ObserveRequestLatencyMs(route, elapsed_ms());
      return result;
    }
  } catch (const std::exception& ex) {
    span.RecordException(ex.what());
    ARTSCAN_LOG_ERROR("RPC failed", {artscan::observability::StringField("route", route), artscan::observability::StringField("error", ex.what())});
    artscan::observability::Metrics::Instance().RecordRequest(route, false);
    artscan::observability::Metrics::Instance().ObserveRequestLatencyMs(route, elapsed_ms());
    throw;
  }
}

} // namespace artscan::service
