#include "internal/observability/logging.hpp"

#include <cstdlib>
#include <stdexcept>
#include <string>

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include "config/config.pb.h"

#ifdef ENABLE_OTEL
#include <opentelemetry/context/runtime_context.h>
#include <opentelemetry/trace/provider.h>
#include <opentelemetry/trace/span.h>
#endif

namespace capacity::observability {
namespace {

constexpr const char* kLoggerName = "capacity-manager";
constexpr const char* kDefaultPattern = "%Y-%m-%dT%H:%M:%S.%e%z [%^%l%$] %v";

bool g_include_trace_context{false};

// environment overrides the file
std::string Setting(const char* env, const std::string& configured, const char* fallback) {
  if (const char* value = std::getenv(env); value != nullptr && *value != '\0') {
    return value;
  }
  return configured.empty() ? fallback : configured;
}

spdlog::level::level_enum ParseLevel(const std::string& name) {
  const auto level = spdlog::level::from_str(name);
  // from_str maps anything unknown to off
  if (level == spdlog::level::off && name != "off") {
    throw std::invalid_argument("logging.level: unknown level '" + name + "'");
  }
  return level;
}

bool Truthy(const std::string& value) {
  return value == "1" || value == "true" || value == "yes";
}

// key=value, with the value quoted when it would split the line
void AppendField(std::string& out, const LogField& field) {
  if (!out.empty()) out.push_back(' ');
  out += field.key;
  out.push_back('=');

  const bool quote = field.value.empty() || field.value.find_first_of(" \"=") != std::string::npos;
  if (!quote) {
    out += field.value;
    return;
  }
  out.push_back('"');
  for (char c : field.value) {
    if (c == '"' || c == '\\') out.push_back('\\');
    out.push_back(c);
  }
  out.push_back('"');
}

#ifdef ENABLE_OTEL
template <std::size_t N>
void AppendHex(std::string& out, const uint8_t (&bytes)[N]) {
  static constexpr char kHex[] = "0123456789abcdef";
  for (uint8_t b : bytes) {
    out.push_back(kHex[b >> 4]);
    out.push_back(kHex[b & 0x0F]);
  }
}

void AppendTraceContext(std::string& out) {
  if (!g_include_trace_context) return;

  auto span = opentelemetry::trace::GetSpan(opentelemetry::context::RuntimeContext::GetCurrent());
  if (!span) return;

  const auto context = span->GetContext();
  if (!context.IsValid()) return;

  uint8_t trace_bytes[16];
  uint8_t span_bytes[8];
  context.trace_id().CopyBytesTo(trace_bytes);
  context.span_id().CopyBytesTo(span_bytes);

  if (!out.empty()) out.push_back(' ');
  out += "trace_id=";
  AppendHex(out, trace_bytes);
  out += " span_id=";
  AppendHex(out, span_bytes);
}
#else
void AppendTraceContext(std::string&) {
}
#endif

} // namespace

LogField StringField(std::string_view key, std::string_view value) {
  return {std::string(key), std::string(value)};
}

LogField IntField(std::string_view key, std::int64_t value) {
  return {std::string(key), std::to_string(value)};
}

LogField UintField(std::string_view key, std::uint64_t value) {
  return {std::string(key), std::to_string(value)};
}

LogField BoolField(std::string_view key, bool value) {
  return {std::string(key), value ? "true" : "false"};
}

void InitializeLogging(const capacity::runtime::config::RuntimeConfig& config) {
  const auto& logging = config.logging();
  const auto  level   = ParseLevel(Setting("CAPACITY_LOG_LEVEL", logging.level(), "info"));

  auto logger = spdlog::get(kLoggerName);
  if (!logger) {
    logger = spdlog::stdout_color_mt(kLoggerName);
  }
  logger->set_pattern(Setting("CAPACITY_LOG_PATTERN", logging.pattern(), kDefaultPattern));
  logger->set_level(level);
  spdlog::set_default_logger(std::move(logger));
  spdlog::flush_on(spdlog::level::warn);

  const auto trace_override = Setting("CAPACITY_LOG_INCLUDE_TRACE_CONTEXT", "", "");
  g_include_trace_context   = trace_override.empty() ? logging.include_trace_context() : Truthy(trace_override);
}

void ShutdownLogging() {
  spdlog::shutdown();
}

void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields) {
  if (!spdlog::should_log(level)) return;

  std::string suffix;
  for (const auto& field : fields) {
    AppendField(suffix, field);
  }
  AppendTraceContext(suffix);

  if (suffix.empty()) {
    spdlog::log(level, "{}", message);
  } else {
    spdlog::log(level, "{} {}", message, suffix);
  }
}

} // namespace capacity::observability
