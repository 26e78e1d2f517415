#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

namespace flowlock::config::v1 {
class RuntimeConfig;
}

namespace flowlock::observability {

/*
  Tracing and metrics.

  Real exporters exist only when built with ENABLE_OTEL; otherwise every
  entry point below is an inline no-op so call sites never need #ifdefs.
*/

bool InitializeTracing(const flowlock::config::v1::RuntimeConfig& config);
bool InitializeMetrics(const flowlock::config::v1::RuntimeConfig& config);
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

  // outcome: applied | rejected | failed
  void RecordTransition(std::string_view entity_type, std::string_view outcome);
  void RecordRetry(std::string_view operation, std::string_view error_kind);
  void ObserveLockWaitMs(std::string_view entity_type, double wait_ms);
  void ObserveTransactionMs(std::string_view entity_type, double duration_ms);
  void RecordAuditWriteFailure();

 private:
  Metrics();
#ifdef ENABLE_OTEL
  struct Impl;
  std::unique_ptr<Impl> impl_;
#endif
};

#ifndef ENABLE_OTEL
inline bool InitializeTracing(const flowlock::config::v1::RuntimeConfig&) {
  return false;
}

inline bool InitializeMetrics(const flowlock::config::v1::RuntimeConfig&) {
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

inline void SpanScope::RecordException(std::string_view) {
}

inline Metrics::Metrics() {
}

inline Metrics& Metrics::Instance() {
  static Metrics instance;
  return instance;
}

inline void Metrics::RecordTransition(std::string_view, std::string_view) {
}

inline void Metrics::RecordRetry(std::string_view, std::string_view) {
}

inline void Metrics::ObserveLockWaitMs(std::string_view, double) {
}

inline void Metrics::ObserveTransactionMs(std::string_view, double) {
}

inline void Metrics::RecordAuditWriteFailure() {
}
#endif

} // namespace flowlock::observability
