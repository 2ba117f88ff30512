#include "internal/observability/logging.hpp"

#include <cstdlib>
#include <sstream>
#include <string>

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include "config/config.pb.h"

#ifdef ENABLE_OTEL
#include <opentelemetry/context/runtime_context.h>
#include <opentelemetry/trace/provider.h>
#include <opentelemetry/trace/span.h>
#endif

namespace artscan::observability {
namespace {

constexpr const char* kDefaultPattern = "%Y-%m-%dT%H:%M:%S.%e%z [%^%l%$] [t%t] %v";

// Environment overrides config; config overrides the built-in default.
std::string Setting(const char* env_var, const std::string& configured, const char* fallback) {
  if (const char* value = std::getenv(env_var); value != nullptr && *value != '\0') {
    return value;
  }
  return configured.empty() ? std::string(fallback) : configured;
}

bool TraceContextRequested(const artscan::runtime::config::LoggingConfig& logging) {
  const std::string flag = Setting("ARTSCAN_LOG_INCLUDE_TRACE_CONTEXT", "", logging.include_trace_context() ? "true" : "false");
  return flag == "1" || flag == "true";
}

bool g_include_trace_context{false};

std::string SerializeFields(std::initializer_list<LogField> fields) {
  std::string out;
  for (const auto& field : fields) {
    if (!out.empty()) {
      out.push_back(' ');
    }
    out.append(field.key).append("=").append(field.value);
  }
  return out;
}

#ifdef ENABLE_OTEL
template <std::size_t N>
std::string ToHex(const uint8_t (&bytes)[N]) {
  static constexpr char kDigits[] = "0123456789abcdef";
  std::string           hex(N * 2, '0');
  for (std::size_t i = 0; i < N; ++i) {
    hex[2 * i]     = kDigits[bytes[i] >> 4];
    hex[2 * i + 1] = kDigits[bytes[i] & 0x0F];
  }
  return hex;
}

std::string TraceContextFields() {
  if (!g_include_trace_context) {
    return {};
  }
  auto span = opentelemetry::trace::GetSpan(opentelemetry::context::RuntimeContext::GetCurrent());
  if (!span || !span->GetContext().IsValid()) {
    return {};
  }

  const auto context = span->GetContext();
  uint8_t    trace_id[16];
  uint8_t    span_id[8];
  context.trace_id().CopyBytesTo(trace_id);
  context.span_id().CopyBytesTo(span_id);
  return "trace_id=" + ToHex(trace_id) + " span_id=" + ToHex(span_id);
}
#else
std::string TraceContextFields() {
  return {};
}
#endif

} // namespace

LogField StringField(std::string_view key, std::string_view value) {
  return {std::string(key), std::string(value)};
}

LogField IntField(std::string_view key, std::int64_t value) {
  return {std::string(key), std::to_string(value)};
}

LogField DoubleField(std::string_view key, double value) {
  std::ostringstream out;
  out << value;
  return {std::string(key), out.str()};
}

LogField BoolField(std::string_view key, bool value) {
  return {std::string(key), value ? "true" : "false"};
}

void InitializeLogging(const artscan::runtime::config::RuntimeConfig& config) {
  auto logger = spdlog::get("artscan");
  if (!logger) {
    logger = spdlog::stdout_color_mt("artscan");
  }
  const auto& logging = config.logging();
  logger->set_pattern(Setting("ARTSCAN_LOG_PATTERN", logging.pattern(), kDefaultPattern));
  logger->set_level(spdlog::level::from_str(Setting("ARTSCAN_LOG_LEVEL", logging.level(), "info")));
  spdlog::set_default_logger(std::move(logger));
  spdlog::flush_on(spdlog::level::warn);
  g_include_trace_context = TraceContextRequested(logging);
}

void ShutdownLogging() {
  spdlog::shutdown();
}

void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields) {
  auto suffix = SerializeFields(fields);
  if (auto trace = TraceContextFields(); !trace.empty()) {
    suffix += suffix.empty() ? trace : " " + trace;
  }
  if (suffix.empty()) {
    spdlog::log(level, "{}", message);
  } else {
    spdlog::log(level, "{} {}", message, suffix);
  }
}

} // namespace artscan::observability
