#include "factory.hpp"

#include <memory>
#include <stdexcept>

#include "internal/config/inventory_seeder.hpp"
#include "internal/core/blackout_manager.hpp"
#include "internal/core/booking_manager.hpp"
#include "internal/core/booking_policy.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/grpc/admin_server.hpp"
#include "internal/grpc/blackout_server.hpp"
#include "internal/grpc/booking_server.hpp"
#include "internal/idempotency/idempotency_store.hpp"
#include "internal/lock/lock_coordinator.hpp"
#include "internal/observability/logging.hpp"
#include "internal/service/admin_service.hpp"
#include "internal/service/blackout_service.hpp"
#include "internal/service/booking_service.hpp"
#include "internal/service/service_context.hpp"
#if WOKI_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif

namespace woki::factory {

using namespace woki;

namespace {

std::shared_ptr<db::Repository> BuildRepository(const woki::runtime::config::RuntimeConfig& config) {
  const auto& database = config.database();
  if (database.has_sqlite()) {
#if WOKI_DB_SQLITE
    auto sqlite_db = std::make_shared<db::sqlite::SqliteDB>(database.sqlite().path(), database.sqlite().wal_mode());
    db::sqlite::BootstrapSchema(*sqlite_db);
    WOKI_LOG_INFO("Using sqlite repository", {observability::StringField("path", database.sqlite().path())});
    return std::make_shared<db::sqlite::SqliteRepository>(std::move(sqlite_db));
#else
    throw std::runtime_error("sqlite backend requested but not enabled at build time");
#endif
  }

  WOKI_LOG_INFO("Using in-memory repository");
  return std::make_shared<db::memory::MemoryRepository>();
}

} // namespace

/*
    Build full application dependency graph
*/
Application Build(const woki::runtime::config::RuntimeConfig& config) {
  Application app;

  // ------------------------------------------------------------------
  // Persistence
  // ------------------------------------------------------------------
  app.repository    = BuildRepository(config);
  const auto seeded  = woki::config::InventorySeeder::Seed(*app.repository, config.inventory());
  WOKI_LOG_INFO("Inventory seeded", {observability::IntField("restaurants", config.inventory().restaurants_size()),
                                     observability::IntField("tables", static_cast<std::int64_t>(seeded))});

  // ------------------------------------------------------------------
  // Core components
  // ------------------------------------------------------------------
  const auto policy = core::BookingPolicy::FromConfig(config.booking());

  auto locks             = std::make_shared<lock::LockCoordinator>();
  auto idempotency_store = std::make_shared<idempotency::IdempotencyStore>(policy.idempotency_ttl);

  app.bookings  = std::make_shared<core::BookingManager>(app.repository, locks, idempotency_store, policy);
  app.blackouts = std::make_shared<core::BlackoutManager>(app.repository, policy.max_commit_attempts);

  // ------------------------------------------------------------------
  // Services
  // ------------------------------------------------------------------
  service::ServiceContext ctx;
  ctx.bookings  = app.bookings;
  ctx.blackouts = app.blackouts;

  auto booking_service  = std::make_shared<service::BookingService>(ctx);
  auto blackout_service = std::make_shared<service::BlackoutService>(ctx);
  auto admin_service    = std::make_shared<service::AdminService>();

  // ------------------------------------------------------------------
  // gRPC servers
  // ------------------------------------------------------------------
  app.grpc_services.push_back(std::make_unique<grpc::BookingServer>(booking_service));
  app.grpc_services.push_back(std::make_unique<grpc::BlackoutServer>(blackout_service));
  app.grpc_services.push_back(std::make_unique<grpc::AdminServer>(admin_service));

  return app;
}

} // namespace woki::factory
