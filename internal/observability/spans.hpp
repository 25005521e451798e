#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

namespace mirrorsync::runtime::config {
class RuntimeConfig;
}

namespace mirrorsync::observability {

/*
  Tracing and metrics facade.

  Without ENABLE_OTEL every call below is an inline no-op, so call sites
  never need their own #ifdefs.
*/

bool InitializeTracing(const mirrorsync::runtime::config::RuntimeConfig& config, std::string_view service_name);
bool InitializeMetrics(const mirrorsync::runtime::config::RuntimeConfig& config, std::string_view service_name);
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
  // outcome: "synced", "unchanged", "unreachable", "skipped"
  void ObserveSyncPassMs(std::string_view outcome, double duration_ms);
  void SetMirrorsInStatus(std::string_view status, std::uint64_t count);

 private:
  Metrics();
#ifdef ENABLE_OTEL
  struct Impl;
  std::unique_ptr<Impl> impl_;
#endif
};

#ifndef ENABLE_OTEL
inline bool InitializeTracing(const mirrorsync::runtime::config::RuntimeConfig&, std::string_view) {
  return false;
}

inline bool InitializeMetrics(const mirrorsync::runtime::config::RuntimeConfig&, std::string_view) {
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

inline void Metrics::ObserveSyncPassMs(std::string_view, double) {
}

inline void Metrics::SetMirrorsInStatus(std::string_view, std::uint64_t) {
}
#endif

} // namespace mirrorsync::observability
