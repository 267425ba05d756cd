#include "internal/observability/metrics.hpp"

#include "internal/observability/spans.hpp"

#include <algorithm>
#include <cmath>
#include <vector>

namespace woki::observability {

std::string_view ConflictKindName(ConflictKind kind) {
  return kind == ConflictKind::kNoCapacity ? "no_capacity" : "table_locked";
}

Metrics& Metrics::Instance() {
  static Metrics instance;
  return instance;
}

void Metrics::RecordBookingCreated() {
  {
    std::lock_guard lock(mutex_);
    ++counters_.bookings_created;
  }
  MetricExporter::Instance().CountBookingCreated();
}

void Metrics::RecordBookingsCancelled(std::uint64_t count) {
  {
    std::lock_guard lock(mutex_);
    counters_.bookings_cancelled += count;
  }
  MetricExporter::Instance().CountBookingsCancelled(count);
}

void Metrics::RecordConflict(ConflictKind kind) {
  {
    std::lock_guard lock(mutex_);
    if (kind == ConflictKind::kNoCapacity) {
      ++counters_.conflicts_no_capacity;
    } else {
      ++counters_.conflicts_table_locked;
    }
  }
  MetricExporter::Instance().CountConflict(ConflictKindName(kind));
}

void Metrics::RecordLockTimeout() {
  {
    std::lock_guard lock(mutex_);
    ++counters_.lock_timeouts;
  }
  MetricExporter::Instance().CountLockTimeout();
}

void Metrics::ObserveAssignmentTimeMs(double ms) {
  {
    std::lock_guard lock(mutex_);
    AddSample(assignment_samples_, ms);
  }
  MetricExporter::Instance().ObserveAssignmentTimeMs(ms);
}

void Metrics::ObserveLockWaitMs(double ms) {
  {
    std::lock_guard lock(mutex_);
    AddSample(lock_wait_samples_, ms);
  }
  MetricExporter::Instance().ObserveLockWaitMs(ms);
}

MetricsSnapshot Metrics::Snapshot() const {
  std::lock_guard lock(mutex_);
  MetricsSnapshot snapshot = counters_;
  snapshot.assignment_time = Summarize(assignment_samples_);
  snapshot.lock_wait_time  = Summarize(lock_wait_samples_);
  return snapshot;
}

void Metrics::Reset() {
  std::lock_guard lock(mutex_);
  counters_ = MetricsSnapshot{};
  assignment_samples_.clear();
  lock_wait_samples_.clear();
}

void Metrics::AddSample(std::deque<double>& samples, double value) {
  samples.push_back(value);
  if (samples.size() > kMaxSamples) {
    samples.pop_front();
  }
}

LatencySnapshot Metrics::Summarize(const std::deque<double>& samples) {
  LatencySnapshot out;
  out.samples = samples.size();
  if (samples.size() < kMinSamplesForP95) {
    return out;
  }

  std::vector<double> sorted(samples.begin(), samples.end());
  std::sort(sorted.begin(), sorted.end());
  const auto index = static_cast<std::size_t>(std::ceil(static_cast<double>(sorted.size()) * 0.95)) - 1;
  out.p95_ms       = sorted[index];
  return out;
}

} // namespace woki::observability
