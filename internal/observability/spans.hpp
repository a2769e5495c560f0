#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

namespace miner::runtime::config {
class RuntimeConfig;
}

namespace miner::observability {

/*
  Telemetry for a run.

  Spans: one per run, one per stage, one for the sync phase.
  Metrics: stage outcomes and durations, sync results.

  Built against opentelemetry-cpp when ENABLE_OTEL is defined; otherwise
  everything below is an inline no-op.
*/

enum class OtlpTransport {
  kGrpc,
  kHttpProtobuf,
};

struct OtlpConfig {
  std::string   service_name{"media-miner"};
  std::string   endpoint{};
  OtlpTransport transport{OtlpTransport::kGrpc};
  bool          insecure{true};
};

OtlpConfig ToOtlpConfig(const miner::runtime::config::RuntimeConfig& config);

bool InitializeTracing(const miner::runtime::config::RuntimeConfig& config);
bool InitializeMetrics(const miner::runtime::config::RuntimeConfig& config);
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

  // outcome: completed | cached | skipped | failed
  void RecordStageOutcome(std::string_view stage, std::string_view outcome);
  void ObserveStageDurationMs(std::string_view stage, double duration_ms);
  void RecordSync(bool success);
  void ObserveSyncDurationMs(double duration_ms);

 private:
  Metrics();
#ifdef ENABLE_OTEL
  struct Impl;
  std::unique_ptr<Impl> impl_;
#endif
};

#ifndef ENABLE_OTEL
inline bool InitializeTracing(const miner::runtime::config::RuntimeConfig&) {
  return false;
}

inline bool InitializeMetrics(const miner::runtime::config::RuntimeConfig&) {
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

inline void Metrics::RecordStageOutcome(std::string_view, std::string_view) {
}

inline void Metrics::ObserveStageDurationMs(std::string_view, double) {
}

inline void Metrics::RecordSync(bool) {
}

inline void Metrics::ObserveSyncDurationMs(double) {
}
#endif

} // namespace miner::observability
