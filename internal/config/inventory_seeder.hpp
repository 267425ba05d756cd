#pragma once

#include "config/config.pb.h"
#include "internal/db/api/repository.hpp"

namespace woki::config {

/*
  Writes the configured inventory into the repository in one transaction.

  Upserts are idempotent, so seeding a persistent database on every start
  only refreshes names, sizes and service windows.
*/
class InventorySeeder {
 public:
  // Returns the number of tables written.
  static std::size_t Seed(db::Repository& repository, const woki::runtime::config::InventoryConfig& inventory);
};

} // namespace woki::config
