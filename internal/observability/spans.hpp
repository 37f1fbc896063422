#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

namespace capacity::runtime::config {
class RuntimeConfig;
}

namespace capacity::observability {

enum class OtlpTransport {
  kGrpc,
  kHttpProtobuf,
};

struct OtlpConfig {
  std::string   service_name{"capacity-manager"};
  std::string   endpoint{};
  OtlpTransport transport{OtlpTransport::kGrpc};
  bool          insecure{true};
};

#ifdef ENABLE_OTEL
// Exporter settings for one signal ("traces" or "metrics").
OtlpConfig ResolveOtlpConfig(const capacity::runtime::config::RuntimeConfig& config, std::string_view signal);
#endif

bool InitializeTracing(const capacity::runtime::config::RuntimeConfig& config);
bool InitializeMetrics(const capacity::runtime::config::RuntimeConfig& config);
void ShutdownTracing();
void ShutdownMetrics();

class SpanScope {
 public:
  explicit SpanScope(std::string_view name);
  ~SpanScope();

  SpanScope(const SpanScope&)            = delete;
  SpanScope& operator=(const SpanScope&) = delete;

  SpanScope(SpanScope&&) noexcept;
  SpanScope& operator=(SpanScope&&) noexcept;

  void SetAttribute(std::string_view key, std::string_view value);
  void SetAttribute(std::string_view key, std::int64_t value);
  void SetAttribute(std::string_view key, double value);
  void AddEvent(std::string_view name);
  void RecordException(std::string_view description);

 private:
#ifdef ENABLE_OTEL
  struct Impl;
  std::unique_ptr<Impl> impl_;
#endif
};

class Metrics {
 public:
  static Metrics& Instance();

  void RecordRequest(std::string_view route, bool success);
  void ObserveRequestLatencyMs(std::string_view route, double latency_ms);

  // weight debited from subscriptions after dispatch, labelled by mode
  void AddDebitedWeight(std::string_view mode, std::uint64_t weight);
  void RecordDiscrepancy(std::uint64_t shortfall);
  void SetLockedTotal(std::uint64_t amount);
  void AdjustLockedTotal(std::int64_t delta);

 private:
  Metrics();
#ifdef ENABLE_OTEL
  struct Impl;
  std::unique_ptr<Impl> impl_;
#endif
};

#ifndef ENABLE_OTEL
inline bool InitializeTracing(const capacity::runtime::config::RuntimeConfig&) {
  return false;
}

inline bool InitializeMetrics(const capacity::runtime::config::RuntimeConfig&) {
  return false;
}

inline void ShutdownTracing() {
}

inline void ShutdownMetrics() {
}

inline SpanScope::SpanScope(std::string_view) {
}

inline SpanScope::~SpanScope() {
}

inline SpanScope::SpanScope(SpanScope&&) noexcept = default;

inline SpanScope& SpanScope::operator=(SpanScope&&) noexcept = default;

inline void SpanScope::SetAttribute(std::string_view, std::string_view) {
}

inline void SpanScope::SetAttribute(std::string_view, std::int64_t) {
}

inline void SpanScope::SetAttribute(std::string_view, double) {
}

inline void SpanScope::AddEvent(std::string_view) {
}

inline void SpanScope::RecordException(std::string_view) {
}

inline Metrics::Metrics() {
}

inline Metrics& Metrics::Instance() {
  static Metrics instance;
  return instance;
}

inline void Metrics::RecordRequest(std::string_view, bool) {
}

inline void Metrics::ObserveRequestLatencyMs(std::string_view, double) {
}

inline void Metrics::AddDebitedWeight(std::string_view, std::uint64_t) {
}

inline void Metrics::RecordDiscrepancy(std::uint64_t) {
}

inline void Metrics::SetLockedTotal(std::uint64_t) {
}

inline void Metrics::AdjustLockedTotal(std::int64_t) {
}
#endif

} // namespace capacity::observability
