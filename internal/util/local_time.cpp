#include "local_time.hpp"

#include <cctype>
#include <cstdio>
#include <stdexcept>

namespace woki::util {

std::optional<absl::CivilDay> ParseDate(std::string_view text) {
  absl::CivilDay day;
  if (text.size() != 10 || !absl::ParseCivilTime(absl::string_view(text.data(), text.size()), &day)) {
    return std::nullopt;
  }
  // Round trip rejects normalised days (2025-02-30) and signed years.
  if (absl::FormatCivilTime(day) != text) {
    return std::nullopt;
  }
  return day;
}

std::optional<int> ParseTimeOfDay(std::string_view text) {
  if (text.size() != 5 || text[2] != ':') {
    return std::nullopt;
  }
  for (std::size_t i : {0u, 1u, 3u, 4u}) {
    if (!std::isdigit(static_cast<unsigned char>(text[i]))) {
      return std::nullopt;
    }
  }
  const int hours   = (text[0] - '0') * 10 + (text[1] - '0');
  const int minutes = (text[3] - '0') * 10 + (text[4] - '0');
  if (minutes > 59 || hours > 24) {
    return std::nullopt;
  }
  const int total = hours * 60 + minutes;
  if (total > kMinutesPerDay) {
    return std::nullopt;
  }
  return total;
}

std::string FormatTimeOfDay(int minutes) {
  char buf[8];
  std::snprintf(buf, sizeof(buf), "%02d:%02d", minutes / 60, minutes % 60);
  return buf;
}

absl::TimeZone LoadZone(const std::string& name) {
  absl::TimeZone zone;
  if (!absl::LoadTimeZone(name, &zone)) {
    throw std::runtime_error("unknown timezone: " + name);
  }
  return zone;
}

TimePoint LocalToUtc(absl::CivilDay day, int minutes, const absl::TimeZone& zone) {
  const absl::CivilMinute local = absl::CivilMinute(day) + minutes;
  return absl::ToChronoTime(absl::FromCivil(local, zone));
}

std::pair<TimePoint, TimePoint> LocalDayRange(absl::CivilDay day, const absl::TimeZone& zone) {
  return {LocalToUtc(day, 0, zone), LocalToUtc(day, kMinutesPerDay, zone)};
}

} // namespace woki::util
