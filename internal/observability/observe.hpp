#pragma once

#include <chrono>
#include <exception>
#include <string_view>
#include <type_traits>
#include <utility>

#include "internal/observability/logging.hpp"
#include "internal/observability/metrics.hpp"

namespace chunkstore::observability {

/*
  Runs fn and reports success/error count and latency for route.
  Exceptions are logged and rethrown unchanged.
*/
template <typename Fn>
auto Observe(std::string_view route, Fn&& fn) {
  const auto started_at = std::chrono::steady_clock::now();
  auto       elapsed_ms = [&] {
    return std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started_at).count();
  };

  try {
    if constexpr (std::is_void_v<std::invoke_result_t<Fn>>) {
      std::forward<Fn>(fn)();
      Metrics::Instance().RecordRequest(route, true);
      Metrics::Instance().ObserveRequestLatencyMs(route, elapsed_ms());
      return;
    } else {
      auto result = std::forward<Fn>(fn)();
      Metrics::Instance().RecordRequest(route, true);
      Metrics::Instance().ObserveRequestLatencyMs(route, elapsed_ms());
      return result;
    }
  } catch (const std::exception& ex) {
    CHUNKSTORE_LOG_DEBUG("store operation failed", {StringField("route", route), StringField("error", ex.what())});
    Metrics::Instance().RecordRequest(route, false);
    Metrics::Instance().ObserveRequestLatencyMs(route, elapsed_ms());
    throw;
  }
}

} // namespace chunkstore::observability
