#include "internal/observability/spans.hpp"

#ifdef ENABLE_OTEL

#include <cstdlib>
#include <string>

#include "config/config.pb.h"

namespace capacity::observability {

namespace {

std::string Upper(std::string_view s) {
  std::string out(s);
  for (auto& c : out) {
    if (c >= 'a' && c <= 'z') c = static_cast<char>(c - 'a' + 'A');
  }
  return out;
}

const char* Env(const std::string& name) {
  const char* value = std::getenv(name.c_str());
  return value != nullptr && *value != '\0' ? value : nullptr;
}

} // namespace

OtlpConfig ResolveOtlpConfig(const capacity::runtime::config::RuntimeConfig& config, std::string_view signal) {
  const auto& observability = config.observability();

  OtlpConfig out;
  if (!observability.service_name().empty()) {
    out.service_name = observability.service_name();
  }
  out.transport = observability.transport() == capacity::runtime::config::OTLP_TRANSPORT_HTTP ? OtlpTransport::kHttpProtobuf : OtlpTransport::kGrpc;

  // config, then the per-signal variable, then the shared one
  if (!observability.endpoint().empty()) {
    out.endpoint = observability.endpoint();
  } else if (const char* endpoint = Env("OTEL_EXPORTER_OTLP_" + Upper(signal) + "_ENDPOINT")) {
    out.endpoint = endpoint;
  } else if (const char* endpoint = Env("OTEL_EXPORTER_OTLP_ENDPOINT")) {
    out.endpoint = endpoint;
  } else if (out.transport == OtlpTransport::kHttpProtobuf) {
    out.endpoint = "http://localhost:4318/v1/" + std::string(signal);
  } else {
    out.endpoint = "localhost:4317";
  }

  out.insecure = out.endpoint.rfind("https://", 0) != 0;
  return out;
}

} // namespace capacity::observability

#endif
