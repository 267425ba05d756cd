#include "internal/core/request_validation.hpp"

#include <algorithm>
#include <optional>
#include <stdexcept>
#include <utility>

#include "internal/util/errors.hpp"
#include "internal/util/local_time.hpp"

namespace woki::core {

namespace {

using MinuteRange = std::pair<int, int>;

std::optional<int> ParseBound(const std::string& text, const char* which) {
  if (text.empty()) {
    return std::nullopt;
  }
  auto minutes = util::ParseTimeOfDay(text);
  if (!minutes) {
    throw util::InvalidInput(std::string(which) + " must be HH:mm, got '" + text + "'");
  }
  return minutes;
}

MinuteRange ParseServiceWindow(const db::model::ServiceWindowRecord& window) {
  auto start = util::ParseTimeOfDay(window.start);
  auto end   = util::ParseTimeOfDay(window.end);
  if (!start || !end || *end <= *start) {
    throw std::runtime_error("malformed service window " + window.start + "-" + window.end + " for restaurant " + window.restaurant_id);
  }
  return {*start, *end};
}

} // namespace

absl::CivilDay RequestValidation::ParseDate(const std::string& date) {
  auto day = util::ParseDate(date);
  if (!day) {
    throw util::InvalidInput("date must be YYYY-MM-DD, got '" + date + "'");
  }
  return *day;
}

void RequestValidation::CheckPartySize(std::uint32_t party_size) {
  if (party_size == 0) {
    throw util::InvalidInput("partySize must be greater than zero");
  }
}

void RequestValidation::CheckDuration(std::uint32_t duration_minutes, const BookingPolicy& policy) {
  if (duration_minutes == 0 || duration_minutes % policy.slot_minutes != 0) {
    throw util::InvalidInput("duration must be a multiple of " + std::to_string(policy.slot_minutes) + " minutes");
  }
  if (duration_minutes < policy.min_duration_minutes || duration_minutes > policy.max_duration_minutes) {
    throw util::InvalidInput("duration must be between " + std::to_string(policy.min_duration_minutes) + " and " +
                             std::to_string(policy.max_duration_minutes) + " minutes");
  }
}

namespace {

// "12:00-16:00, 20:00-23:45"
std::string DescribeHours(std::vector<MinuteRange> service) {
  if (service.empty()) {
    service.emplace_back(0, util::kMinutesPerDay);
  }
  std::sort(service.begin(), service.end());
  std::string out;
  for (const auto& [start, end] : service) {
    if (!out.empty()) out += ", ";
    out += util::FormatTimeOfDay(start) + "-" + util::FormatTimeOfDay(end);
  }
  return out;
}

} // namespace

void RequestValidation::CheckWindowSyntax(const std::string& window_start, const std::string& window_end) {
  ParseBound(window_start, "windowStart");
  ParseBound(window_end, "windowEnd");
}

std::vector<model::TimeInterval> RequestValidation::ResolveWindows(absl::CivilDay day, const absl::TimeZone& zone,
                                                                   const std::vector<db::model::ServiceWindowRecord>& service_windows,
                                                                   const std::string& window_start, const std::string& window_end) {
  const auto req_start = ParseBound(window_start, "windowStart");
  const auto req_end   = ParseBound(window_end, "windowEnd");

  std::vector<MinuteRange> service;
  for (const auto& window : service_windows) {
    service.push_back(ParseServiceWindow(window));
  }

  std::vector<MinuteRange> active;
  if (req_start && req_end) {
    const bool ordered = *req_start < *req_end;
    const bool overlaps =
        service.empty() || std::any_of(service.begin(), service.end(), [&](const MinuteRange& sw) {
          return *req_start < sw.second && *req_end > sw.first;
        });
    if (!ordered || !overlaps) {
      throw util::OutsideServiceWindow("window " + window_start + "-" + window_end + " does not intersect service hours " +
                                       DescribeHours(service));
    }
    active.emplace_back(*req_start, *req_end);
  } else {
    if (service.empty()) {
      service.emplace_back(0, util::kMinutesPerDay);
    }
    const int lo = req_start.value_or(0);
    const int hi = req_end.value_or(util::kMinutesPerDay);
    for (const auto& sw : service) {
      MinuteRange clipped{std::max(sw.first, lo), std::min(sw.second, hi)};
      if (clipped.first < clipped.second) {
        active.push_back(clipped);
      }
    }
  }

  std::sort(active.begin(), active.end());
  std::vector<model::TimeInterval> out;
  out.reserve(active.size());
  for (const auto& [start, end] : active) {
    out.push_back({util::LocalToUtc(day, start, zone), util::LocalToUtc(day, end, zone)});
  }
  return out;
}

} // namespace woki::core
