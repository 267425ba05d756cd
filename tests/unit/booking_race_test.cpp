#include <atomic>
#include <cassert>
#include <iostream>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <thread>
#include <vector>

#include "internal/core/booking_manager.hpp"
#include "internal/idempotency/idempotency_store.hpp"
#include "internal/lock/lock_coordinator.hpp"
#include "internal/observability/metrics.hpp"
#include "internal/util/errors.hpp"
#include "test_inventory.hpp"

namespace {

using woki::core::BookingManager;
using woki::core::CreateBookingCommand;
using woki::model::BookingStatus;
using woki::observability::Metrics;

constexpr int kThreads = 8;

std::unique_ptr<BookingManager> NewManager(std::shared_ptr<woki::db::Repository> repo) {
  return std::make_unique<BookingManager>(repo, std::make_shared<woki::lock::LockCoordinator>(),
                                          std::make_shared<woki::idempotency::IdempotencyStore>());
}

// S2 holds a single table; 20:00-21:00 leaves room for exactly one booking.
CreateBookingCommand LastSlot(const std::string& key) {
  CreateBookingCommand command;
  command.idempotency_key  = key;
  command.restaurant_id    = "R1";
  command.sector_id        = "S2";
  command.date             = woki::testing::kDate;
  command.party_size       = 2;
  command.duration_minutes = 60;
  command.window_start     = "20:00";
  command.window_end       = "21:00";
  return command;
}

void TestOnlyOneRequestWinsTheLastTable() {
  Metrics::Instance().Reset();
  auto repo    = woki::testing::SeededRepository();
  auto manager = NewManager(repo);

  std::atomic<int> created{0};
  std::atomic<int> rejected{0};

  std::vector<std::thread> threads;
  for (int i = 0; i < kThreads; ++i) {
    threads.emplace_back([&, i] {
      try {
        manager->CreateBooking(LastSlot("race-" + std::to_string(i)));
        created.fetch_add(1);
      } catch (const woki::util::NoCapacity&) {
        rejected.fetch_add(1);
      } catch (const woki::util::TableLocked&) {
        rejected.fetch_add(1);
      }
    });
  }
  for (auto& t : threads) {
    t.join();
  }

  assert(created.load() == 1);
  assert(rejected.load() == kThreads - 1);

  const auto bookings = manager->ListBookings("R1", "S2", woki::testing::kDate);
  assert(bookings.size() == 1);
  assert(bookings[0].status == BookingStatus::kConfirmed);
  assert(bookings[0].table_ids == std::vector<std::string>{"T9"});

  const auto snapshot = Metrics::Instance().Snapshot();
  assert(snapshot.bookings_created == 1);
  assert(snapshot.conflicts_no_capacity + snapshot.conflicts_table_locked == kThreads - 1);
}

void TestConcurrentDuplicatesShareOneBooking() {
  Metrics::Instance().Reset();
  auto repo    = woki::testing::SeededRepository();
  auto manager = NewManager(repo);

  std::mutex            mutex;
  std::set<std::string> ids;
  std::atomic<int>      fresh{0};

  std::vector<std::thread> threads;
  for (int i = 0; i < kThreads; ++i) {
    threads.emplace_back([&] {
      auto result = manager->CreateBooking(LastSlot("shared-key"));
      if (!result.replayed) {
        fresh.fetch_add(1);
      }
      std::lock_guard lock(mutex);
      ids.insert(result.booking.id);
    });
  }
  for (auto& t : threads) {
    t.join();
  }

  assert(fresh.load() == 1);
  assert(ids.size() == 1);
  assert(manager->ListBookings("R1", "S2", woki::testing::kDate).size() == 1);
  assert(Metrics::Instance().Snapshot().bookings_created == 1);
}

void TestDisjointRequestsAllSucceed() {
  Metrics::Instance().Reset();
  auto repo    = woki::testing::SeededRepository();
  auto manager = NewManager(repo);

  // four tables seat two in S1 and 90 minutes fits twice before 23:45: eight slots
  std::atomic<int>         created{0};
  std::vector<std::thread> threads;
  for (int i = 0; i < kThreads; ++i) {
    threads.emplace_back([&, i] {
      CreateBookingCommand command = LastSlot("s1-" + std::to_string(i));
      command.sector_id            = "S1";
      command.duration_minutes     = 90;
      command.window_end           = "23:45";
      // a request that loses its candidate to a concurrent writer is retried like a client would
      for (int attempt = 0; attempt < 100; ++attempt) {
        try {
          manager->CreateBooking(command);
          created.fetch_add(1);
          return;
        } catch (const woki::util::NoCapacity&) {
        } catch (const woki::util::TableLocked&) {
        }
      }
    });
  }
  for (auto& t : threads) {
    t.join();
  }
  assert(created.load() == kThreads);

  // no table is double booked
  const auto bookings = manager->ListBookings("R1", "S1", woki::testing::kDate);
  assert(bookings.size() == static_cast<std::size_t>(kThreads));
  for (std::size_t i = 0; i < bookings.size(); ++i) {
    for (std::size_t j = i + 1; j < bookings.size(); ++j) {
      const bool same_table = bookings[i].table_ids == bookings[j].table_ids;
      const bool overlap    = bookings[i].start_ms < bookings[j].end_ms && bookings[j].start_ms < bookings[i].end_ms;
      assert(!(same_table && overlap));
    }
  }
}

} // namespace

int main() {
  TestOnlyOneRequestWinsTheLastTable();
  TestConcurrentDuplicatesShareOneBooking();
  TestDisjointRequestsAllSucceed();

  std::cout << "woki_unit_booking_race: pass\n";
  return 0;
}
