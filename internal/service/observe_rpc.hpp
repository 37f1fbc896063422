#pragma once

#include <chrono>
#include <string_view>
#include <type_traits>

#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"

namespace capacity::service {

// Runs `fn` inside a span, recording request count and latency for `route`.
// Failures are logged and rethrown for the transport to map.
template <typename Fn>
auto ObserveRpc(std::string_view route, Fn&& fn) {
  capacity::observability::SpanScope span(route);

  const auto started_at = std::chrono::steady_clock::now();
  const auto elapsed_ms = [&] {
    return std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started_at).count();
  };

  try {
    if constexpr (std::is_void_v<std::invoke_result_t<Fn>>) {
      fn();
      capacity::observability::Metrics::Instance().RecordRequest(route, true);
      capacity::observability::Metrics::Instance().ObserveRequestLatencyMs(route, elapsed_ms());
      return;
    } else {
      auto result = fn();
      capacity::observability::Metrics::Instance().RecordRequest(route, true);
      capacity::observability::Metrics::Instance().ObserveRequestLatencyMs(route, elapsed_ms());
      return result;
    }
  } catch (const std::exception& ex) {
    span.RecordException(ex.what());
    CAPACITY_LOG_ERROR("RPC failed", {capacity::observability::StringField("route", route), capacity::observability::StringField("error", ex.what())});
    capacity::observability::Metrics::Instance().RecordRequest(route, false);
    capacity::observability::Metrics::Instance().ObserveRequestLatencyMs(route, elapsed_ms());
    throw;
  }
}

} // namespace capacity::service
