#pragma once

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <optional>

#include "internal/util/time.hpp"

namespace woki::model {

/*
  Half-open interval [start, end) over UTC instants.

  Touching intervals (a.end == b.start) do not overlap.
*/
struct TimeInterval {
  util::TimePoint start;
  util::TimePoint end;

  bool operator==(const TimeInterval&) const = default;
};

inline bool IsValid(const TimeInterval& interval) {
  return interval.start < interval.end;
}

inline bool Overlaps(const TimeInterval& a, const TimeInterval& b) {
  return a.start < b.end && b.start < a.end;
}

inline bool Contains(const TimeInterval& outer, const TimeInterval& inner) {
  return outer.start <= inner.start && inner.end <= outer.end;
}

inline std::optional<TimeInterval> Intersect(const TimeInterval& a, const TimeInterval& b) {
  TimeInterval out{std::max(a.start, b.start), std::min(a.end, b.end)};
  if (!IsValid(out)) {
    return std::nullopt;
  }
  return out;
}

inline std::int64_t DurationMinutes(const TimeInterval& interval) {
  return std::chrono::duration_cast<std::chrono::minutes>(interval.end - interval.start).count();
}

} // namespace woki::model
