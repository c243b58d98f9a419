#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

namespace chunkstore::runtime::config {
class RuntimeConfig;
}

namespace chunkstore::observability {

struct OtlpConfig {
  std::string service_name{"chunkstore"};
  std::string endpoint{};
  std::uint32_t collection_interval_ms{1000};
};

bool InitializeMetrics(const OtlpConfig& config = {});
bool InitializeMetrics(const chunkstore::runtime::config::RuntimeConfig& config);
void ShutdownMetrics();

/*
  Process wide metric instruments.

  Routes are "chunkstore.Set.<mode>", "chunkstore.Put.<mode>" and
  "chunkstore.CollectGarbage".
*/
class Metrics {
 public:
  static Metrics& Instance();

  void RecordRequest(std::string_view route, bool success);
  void ObserveRequestLatencyMs(std::string_view route, double latency_ms);
  void SetGcSize(std::uint64_t gc_size);
  void AddCollectedChunks(std::uint64_t count);

 private:
  Metrics();
#ifdef ENABLE_OTEL
  struct Impl;
  std::unique_ptr<Impl> impl_;
#endif
};

#ifndef ENABLE_OTEL
inline bool InitializeMetrics(const OtlpConfig&) {
  return false;
}

inline bool InitializeMetrics(const chunkstore::runtime::config::RuntimeConfig&) {
  return false;
}

inline void ShutdownMetrics() {
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

inline void Metrics::SetGcSize(std::uint64_t) {
}

inline void Metrics::AddCollectedChunks(std::uint64_t) {
}
#endif

} // namespace chunkstore::observability
