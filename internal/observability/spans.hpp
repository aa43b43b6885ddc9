#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

namespace negotiation::runtime::config {
class RuntimeConfig;
}

namespace negotiation::observability {

/*
  Tracing and metrics facade.

  Without ENABLE_OTEL every call below compiles to an inline no-op, so the
  engine can be instrumented unconditionally.
*/

bool InitializeTracing(const negotiation::runtime::config::RuntimeConfig& config);
bool InitializeMetrics(const negotiation::runtime::config::RuntimeConfig& config);
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

  // service façade routes, e.g. "NotifyProviderAgreed"
  void RecordRequest(std::string_view route, bool success);
  void ObserveRequestLatencyMs(std::string_view route, double latency_ms);

  // persisted state changes, labelled by role and target state name
  void RecordTransition(std::string_view role, std::string_view state);

  // outbound messages, labelled by message kind and dispatch status
  void RecordDispatch(std::string_view kind, std::string_view status);

 private:
  Metrics();
#ifdef ENABLE_OTEL
  struct Impl;
  std::unique_ptr<Impl> impl_;
#endif
};

#ifndef ENABLE_OTEL
inline bool InitializeTracing(const negotiation::runtime::config::RuntimeConfig&) {
  return false;
}

inline bool InitializeMetrics(const negotiation::runtime::config::RuntimeConfig&) {
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

inline void Metrics::RecordTransition(std::string_view, std::string_view) {
}

inline void Metrics::RecordDispatch(std::string_view, std::string_view) {
}
#endif

} // namespace negotiation::observability
