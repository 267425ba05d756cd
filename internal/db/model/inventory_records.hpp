#pragma once

#include <cstdint>
#include <string>

namespace woki::db::model {

/*
  Inventory rows. Owned by configuration/seeding; read-only to the booking
  engine.
*/

struct RestaurantRecord {
  std::string id;
  std::string name;
  std::string timezone;  // IANA name
};

// Local "HH:mm" bounds, end > start.
struct ServiceWindowRecord {
  std::string restaurant_id;
  std::string start;
  std::string end;
};

struct SectorRecord {
  std::string id;
  std::string restaurant_id;
  std::string name;
};

struct TableRecord {
  std::string   id;
  std::string   sector_id;
  std::string   name;
  std::uint32_t min_size = 0;
  std::uint32_t max_size = 0;
};

} // namespace woki::db::model
