#include "internal/core/booking_policy.hpp"

#include <algorithm>

#include "config/config.pb.h"
#include "internal/core/combo_generator.hpp"

namespace woki::core {

BookingPolicy BookingPolicy::FromConfig(const woki::runtime::config::BookingConfig& config) {
  BookingPolicy policy;
  if (config.lock_timeout_ms() > 0) policy.lock_timeout = std::chrono::milliseconds(config.lock_timeout_ms());
  if (config.idempotency_ttl_ms() > 0) policy.idempotency_ttl = std::chrono::milliseconds(config.idempotency_ttl_ms());
  if (config.slot_minutes() > 0) policy.slot_minutes = config.slot_minutes();
  if (config.min_duration_minutes() > 0) policy.min_duration_minutes = config.min_duration_minutes();
  if (config.max_duration_minutes() > 0) policy.max_duration_minutes = config.max_duration_minutes();
  if (config.max_combo_size() > 0) {
    policy.max_combo_size = std::min<std::size_t>(config.max_combo_size(), ComboGenerator::kMaxComboSize);
  }
  return policy;
}

} // namespace woki::core
