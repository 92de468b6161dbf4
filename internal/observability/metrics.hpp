#pragma once

#include <cstdint>
#include <memory>
#include <mutex>
#include <string_view>

namespace strata::runtime::config {
class RuntimeConfig;
}

namespace strata::observability {

// Installs the OTLP exporter named by config.observability(); false when
// metrics are disabled there or the build has no ENABLE_OTEL.
bool InitializeMetrics(const strata::runtime::config::RuntimeConfig& config);
void ShutdownMetrics();

/*
  Database metrics. Every method is a no-op unless built with
  ENABLE_OTEL and InitializeMetrics() succeeded.
*/
class Metrics {
 public:
  static Metrics& Instance();

  // One per backoff, i.e. per attempt after the first.
  void RecordTransactionRetry();
  // outcome: committed | error | serialization_exhausted
  void RecordTransaction(std::string_view outcome);
  // kind: the facade primitive, get | query | exec (also the "type"
  // field of the slow query log entry)
  void ObserveQueryDurationMs(std::string_view kind, double duration_ms);

  // Re-creates the instruments against the current global meter provider.
  void Rebind();

 private:
  Metrics();
#ifdef ENABLE_OTEL
  struct Instruments;
  // swapped whole when the meter provider changes
  std::shared_ptr<const Instruments> Current() const;

  mutable std::mutex                 mutex_;
  std::shared_ptr<const Instruments> instruments_;
#endif
};

#ifndef ENABLE_OTEL
inline bool InitializeMetrics(const strata::runtime::config::RuntimeConfig&) {
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

inline void Metrics::RecordTransactionRetry() {
}

inline void Metrics::RecordTransaction(std::string_view) {
}

inline void Metrics::ObserveQueryDurationMs(std::string_view, double) {
}

inline void Metrics::Rebind() {
}
#endif

} // namespace strata::observability
