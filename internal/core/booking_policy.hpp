#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>

namespace woki::runtime::config {
class BookingConfig;
}

namespace woki::core {

// Tunables of the booking engine; zero config fields keep the defaults.
struct BookingPolicy {
  std::chrono::milliseconds lock_timeout{5000};
  std::chrono::milliseconds idempotency_ttl{60000};
  std::uint32_t             slot_minutes         = 15;
  std::uint32_t             min_duration_minutes = 30;
  std::uint32_t             max_duration_minutes = 180;
  std::size_t               max_combo_size       = 6;
  int                       max_commit_attempts  = 3;

  static BookingPolicy FromConfig(const woki::runtime::config::BookingConfig& config);
};

} // namespace woki::core
