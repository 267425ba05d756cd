#include "inventory_seeder.hpp"

#include <stdexcept>
#include <vector>

namespace woki::config {

namespace {

void Check(const db::Result& result, const std::string& what) {
  if (!result) {
    throw std::runtime_error("seeding " + what + " failed: " + result.message);
  }
}

} // namespace

std::size_t InventorySeeder::Seed(db::Repository& repository, const woki::runtime::config::InventoryConfig& inventory) {
  std::size_t tables = 0;

  auto tx = repository.Begin();
  for (const auto& restaurant : inventory.restaurants()) {
    Check(repository.UpsertRestaurant(*tx, {restaurant.id(), restaurant.name(), restaurant.timezone()}), "restaurant " + restaurant.id());

    std::vector<db::model::ServiceWindowRecord> windows;
    for (const auto& window : restaurant.service_windows()) {
      windows.push_back({restaurant.id(), window.start(), window.end()});
    }
    Check(repository.ReplaceServiceWindows(*tx, restaurant.id(), windows), "service windows of " + restaurant.id());

    for (const auto& sector : restaurant.sectors()) {
      Check(repository.UpsertSector(*tx, {sector.id(), restaurant.id(), sector.name()}), "sector " + sector.id());

      for (const auto& table : sector.tables()) {
        Check(repository.UpsertTable(*tx, {table.id(), sector.id(), table.name(), table.min_size(), table.max_size()}), "table " + table.id());
        ++tables;
      }
    }
  }
  tx->Commit();

  return tables;
}

} // namespace woki::config
