#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

namespace recall::runtime::config {
class RuntimeConfig;
}

namespace recall::observability {

enum class OtlpTransport {
  kGrpc,
  kHttpProtobuf,
};

struct OtlpConfig {
  std::string   service_name{"recall"};
  std::string   endpoint{};
  OtlpTransport transport{OtlpTransport::kGrpc};
  bool          insecure{true};
  // Root-span sampling; child spans follow the parent decision.
  double        sample_ratio{1.0};
  // Reported as the recall.storage resource attribute ("sqlite", "postgres", "memory").
  std::string   storage_backend{};
};

bool InitializeTracing(const OtlpConfig& config = {});
bool InitializeMetrics(const OtlpConfig& config = {});
bool InitializeTracing(const recall::runtime::config::RuntimeConfig& config);
bool InitializeMetrics(const recall::runtime::config::RuntimeConfig& config);
void ShutdownTracing();
void ShutdownMetrics();

/*
  RAII span around one engine operation.

  Spans are named recall.<area>[.<step>] and, when the operation belongs to
  one owner, carry it as recall.owner_id so traces can be filtered per user.
  Memory text is never attached to a span.
*/
class SpanScope {
 public:
  explicit SpanScope(std::string_view name, std::string_view owner_id = {});
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

  // Terminal result of the operation (e.g. "applied", "failed", "done").
  void SetOutcome(std::string_view outcome);

 private:
#ifdef ENABLE_OTEL
  struct Impl;
  std::unique_ptr<Impl> impl_;
#endif
};

class Metrics {
 public:
  static Metrics& Instance();

  void RecordDecision(std::string_view operation, std::string_view outcome);
  void ObserveDecisionLatencyMs(std::string_view operation, double latency_ms);
  void RecordJob(std::string_view job_type, bool success);
  void ObserveJobDurationMs(std::string_view job_type, double duration_ms);
  void ObserveRetrievalLatencyMs(std::string_view tier, double latency_ms);
  void SetJobQueueDepth(std::string_view status, std::uint64_t jobs);

 private:
  Metrics();
#ifdef ENABLE_OTEL
  struct Impl;
  std::unique_ptr<Impl> impl_;
#endif
};

#ifndef ENABLE_OTEL
inline bool InitializeTracing(const OtlpConfig&) {
  return false;
}

inline bool InitializeMetrics(const OtlpConfig&) {
  return false;
}

inline bool InitializeTracing(const recall::runtime::config::RuntimeConfig&) {
  return false;
}

inline bool InitializeMetrics(const recall::runtime::config::RuntimeConfig&) {
  return false;
}

inline void ShutdownTracing() {
}

inline void ShutdownMetrics() {
}

inline SpanScope::SpanScope(std::string_view, std::string_view) {
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

inline void SpanScope::SetOutcome(std::string_view) {
}

inline Metrics::Metrics() {
}

inline Metrics& Metrics::Instance() {
  static Metrics instance;
  return instance;
}

inline void Metrics::RecordDecision(std::string_view, std::string_view) {
}

inline void Metrics::ObserveDecisionLatencyMs(std::string_view, double) {
}

inline void Metrics::RecordJob(std::string_view, bool) {
}

inline void Metrics::ObserveJobDurationMs(std::string_view, double) {
}

inline void Metrics::ObserveRetrievalLatencyMs(std::string_view, double) {
}

inline void Metrics::SetJobQueueDepth(std::string_view, std::uint64_t) {
}
#endif

} // namespace recall::observability
