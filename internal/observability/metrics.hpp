#pragma once

#include <cstddef>
#include <cstdint>
#include <deque>
#include <mutex>
#include <optional>
#include <string_view>

namespace woki::observability {

enum class ConflictKind { kNoCapacity, kTableLocked };

std::string_view ConflictKindName(ConflictKind kind);

struct LatencySnapshot {
  std::optional<double> p95_ms;
  std::uint64_t         samples = 0;
};

struct MetricsSnapshot {
  std::uint64_t   bookings_created       = 0;
  std::uint64_t   bookings_cancelled     = 0;
  std::uint64_t   conflicts_no_capacity  = 0;
  std::uint64_t   conflicts_table_locked = 0;
  std::uint64_t   lock_timeouts          = 0;
  LatencySnapshot assignment_time;
  LatencySnapshot lock_wait_time;
};

/*
  Process-local booking metrics.

  Counters plus bounded sample windows (oldest sample dropped first). p95 is
  reported only once enough samples exist. Nothing is persisted; every
  recording is also forwarded to MetricExporter for OTLP export.
*/
class Metrics {
 public:
  static constexpr std::size_t kMaxSamples       = 1000;
  static constexpr std::size_t kMinSamplesForP95 = 20;

  static Metrics& Instance();

  void RecordBookingCreated();
  void RecordBookingsCancelled(std::uint64_t count = 1);
  void RecordConflict(ConflictKind kind);
  void RecordLockTimeout();

  void ObserveAssignmentTimeMs(double ms);
  void ObserveLockWaitMs(double ms);

  MetricsSnapshot Snapshot() const;

  // Test isolation.
  void Reset();

 private:
  Metrics() = default;

  static void            AddSample(std::deque<double>& samples, double value);
  static LatencySnapshot Summarize(const std::deque<double>& samples);

  mutable std::mutex mutex_;
  MetricsSnapshot    counters_;
  std::deque<double> assignment_samples_;
  std::deque<double> lock_wait_samples_;
};

} // namespace woki::observability
