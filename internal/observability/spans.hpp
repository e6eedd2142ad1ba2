#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

namespace profile::runtime::config {
class RuntimeConfig;
}

namespace profile::observability {

enum class OtlpTransport {
  kGrpc,
  kHttpProtobuf,
};

struct OtlpConfig {
  std::string   service_name{"profile-store"};
  std::string   endpoint{};
  OtlpTransport transport{OtlpTransport::kGrpc};
  bool          insecure{true};
  std::uint32_t export_interval_ms{5000};
};

bool InitializeTracing(const profile::runtime::config::RuntimeConfig& config);
bool InitializeMetrics(const profile::runtime::config::RuntimeConfig& config);
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

/*
  Profile store metrics.

    profile.loads          counter   {outcome = created|claimed|degraded}
    profile.saves          counter   {result  = saved|skipped|write_failed|ledger_failed}
    profile.save.latency   histogram ms
    profile.lock.wait      histogram ms, time spent polling a held session lock
    profile.active         gauge     profiles attached in this process
*/
class Metrics {
 public:
  static Metrics& Instance();

  void RecordLoad(std::string_view outcome);
  void RecordSave(std::string_view result);
  void ObserveSaveLatencyMs(double latency_ms);
  void ObserveLockWaitMs(double wait_ms);
  void SetActiveProfiles(std::uint64_t count);

 private:
  Metrics();
#ifdef ENABLE_OTEL
  struct Impl;
  std::unique_ptr<Impl> impl_;
#endif
};

#ifndef ENABLE_OTEL
inline bool InitializeTracing(const profile::runtime::config::RuntimeConfig&) {
  return false;
}

inline bool InitializeMetrics(const profile::runtime::config::RuntimeConfig&) {
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

inline void Metrics::RecordLoad(std::string_view) {
}

inline void Metrics::RecordSave(std::string_view) {
}

inline void Metrics::ObserveSaveLatencyMs(double) {
}

inline void Metrics::ObserveLockWaitMs(double) {
}

inline void Metrics::SetActiveProfiles(std::uint64_t) {
}
#endif

} // namespace profile::observability
