#pragma once

#include <array>
#include <cstdint>
#include <string>
#include <string_view>

namespace woki::util {

/*
  Random identifiers.

  Booking and blackout ids are a prefix plus the first 8 hex digits of a
  random RFC4122 v4 UUID, upper-cased: BK_1A2B3C4D, BLK_9F8E7D6C.
*/

using UUID = std::array<uint8_t, 16>;

UUID GenerateUUID();

std::string ToString(const UUID& id);

std::string GenerateShortId(std::string_view prefix);

inline std::string NewBookingId() {
  return GenerateShortId("BK_");
}

inline std::string NewBlackoutId() {
  return GenerateShortId("BLK_");
}

} // namespace woki::util
