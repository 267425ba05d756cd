#pragma once

#include <absl/time/civil_time.h>
#include <absl/time/time.h>

#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include "internal/util/time.hpp"

namespace woki::util {

/*
  Restaurant-local calendar helpers.

  Dates are "YYYY-MM-DD", times of day are "HH:mm" (00:00 .. 24:00) and are
  resolved against an IANA timezone to absolute UTC instants.
*/

inline constexpr int kMinutesPerDay = 24 * 60;

std::optional<absl::CivilDay> ParseDate(std::string_view text);

// Minutes since local midnight.
std::optional<int> ParseTimeOfDay(std::string_view text);

std::string FormatTimeOfDay(int minutes);

// Throws std::runtime_error for an unknown zone name.
absl::TimeZone LoadZone(const std::string& name);

TimePoint LocalToUtc(absl::CivilDay day, int minutes, const absl::TimeZone& zone);

// [local midnight, next local midnight) as UTC instants.
std::pair<TimePoint, TimePoint> LocalDayRange(absl::CivilDay day, const absl::TimeZone& zone);

} // namespace woki::util
