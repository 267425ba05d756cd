#include "internal/core/booking_manager.hpp"

#include <cassert>
#include <functional>
#include <iostream>
#include <memory>
#include <vector>

#include "internal/idempotency/idempotency_store.hpp"
#include "internal/lock/lock_coordinator.hpp"
#include "internal/observability/metrics.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"
#include "test_inventory.hpp"

namespace {

using woki::core::BookingManager;
using woki::core::BookingPolicy;
using woki::core::CreateBookingCommand;
using woki::core::DiscoverQuery;
using woki::core::Stage;
using woki::db::model::BookingRecord;
using woki::model::BookingStatus;
using woki::model::CandidateKind;
using woki::observability::Metrics;
using woki::testing::At;
using woki::testing::MsAt;
using namespace std::chrono_literals;

/*
  Forwards to a memory repository and lets a test run code at chosen points,
  standing in for a concurrent writer.
*/
class HookedRepository final : public woki::db::Repository {
 public:
  explicit HookedRepository(std::shared_ptr<woki::db::Repository> inner) : inner_(std::move(inner)) {
  }

  std::function<void(int)> on_begin;
  std::function<void()>    after_insert_booking;

  woki::db::Repository& Inner() {
    return *inner_;
  }

  std::unique_ptr<woki::db::Transaction> Begin() override {
    ++begins_;
    if (on_begin) on_begin(begins_);
    return inner_->Begin();
  }

  woki::db::Result UpsertRestaurant(woki::db::Transaction& tx, const woki::db::model::RestaurantRecord& r) override {
    return inner_->UpsertRestaurant(tx, r);
  }
  std::optional<woki::db::model::RestaurantRecord> GetRestaurant(woki::db::Transaction& tx, const std::string& id) override {
    return inner_->GetRestaurant(tx, id);
  }
  woki::db::Result ReplaceServiceWindows(woki::db::Transaction& tx, const std::string& restaurant_id,
                                         const std::vector<woki::db::model::ServiceWindowRecord>& windows) override {
    return inner_->ReplaceServiceWindows(tx, restaurant_id, windows);
  }
  std::vector<woki::db::model::ServiceWindowRecord> ListServiceWindows(woki::db::Transaction& tx, const std::string& restaurant_id) override {
    return inner_->ListServiceWindows(tx, restaurant_id);
  }
  woki::db::Result UpsertSector(woki::db::Transaction& tx, const woki::db::model::SectorRecord& s) override {
    return inner_->UpsertSector(tx, s);
  }
  std::optional<woki::db::model::SectorRecord> GetSector(woki::db::Transaction& tx, const std::string& id) override {
    return inner_->GetSector(tx, id);
  }
  woki::db::Result UpsertTable(woki::db::Transaction& tx, const woki::db::model::TableRecord& t) override {
    return inner_->UpsertTable(tx, t);
  }
  std::vector<woki::db::model::TableRecord> ListTablesInSector(woki::db::Transaction& tx, const std::string& sector_id) override {
    return inner_->ListTablesInSector(tx, sector_id);
  }

  woki::db::Result InsertBooking(woki::db::Transaction& tx, const BookingRecord& b) override {
    auto result = inner_->InsertBooking(tx, b);
    if (after_insert_booking) after_insert_booking();
    return result;
  }
  std::optional<BookingRecord> GetBooking(woki::db::Transaction& tx, const std::string& id) override {
    return inner_->GetBooking(tx, id);
  }
  woki::db::Result UpdateBookingStatus(woki::db::Transaction& tx, const std::string& id, BookingStatus status, uint64_t updated_at_ms) override {
    return inner_->UpdateBookingStatus(tx, id, status, updated_at_ms);
  }
  std::vector<BookingRecord> ListBookings(woki::db::Transaction& tx, const std::string& restaurant_id, const std::string& sector_id,
                                          uint64_t from_ms, uint64_t to_ms) override {
    return inner_->ListBookings(tx, restaurant_id, sector_id, from_ms, to_ms);
  }

  woki::db::Result InsertBlackout(woki::db::Transaction& tx, const woki::db::model::BlackoutRecord& b) override {
    return inner_->InsertBlackout(tx, b);
  }
  std::optional<woki::db::model::BlackoutRecord> GetBlackout(woki::db::Transaction& tx, const std::string& id) override {
    return inner_->GetBlackout(tx, id);
  }
  woki::db::Result DeleteBlackout(woki::db::Transaction& tx, const std::string& id) override {
    return inner_->DeleteBlackout(tx, id);
  }
  std::vector<woki::db::model::BlackoutRecord> ListBlackouts(woki::db::Transaction& tx, const std::string& restaurant_id,
                                                             const std::string& sector_id, uint64_t from_ms, uint64_t to_ms) override {
    return inner_->ListBlackouts(tx, restaurant_id, sector_id, from_ms, to_ms);
  }

 private:
  std::shared_ptr<woki::db::Repository> inner_;
  int                                   begins_ = 0;
};

struct Engine {
  std::shared_ptr<woki::db::Repository>                 repo;
  std::shared_ptr<woki::lock::LockCoordinator>          locks;
  std::shared_ptr<woki::idempotency::IdempotencyStore>  idempotency;
  std::unique_ptr<BookingManager>                       manager;

  explicit Engine(std::shared_ptr<woki::db::Repository> r = woki::testing::SeededRepository(), BookingPolicy policy = {},
                  std::shared_ptr<woki::idempotency::IdempotencyStore> store = std::make_shared<woki::idempotency::IdempotencyStore>(),
                  BookingManager::SteadyClockFn steady_clock = std::chrono::steady_clock::now)
      : repo(std::move(r)),
        locks(std::make_shared<woki::lock::LockCoordinator>()),
        idempotency(std::move(store)),
        manager(std::make_unique<BookingManager>(repo, locks, idempotency, policy, std::move(steady_clock))) {
    Metrics::Instance().Reset();
  }
};

CreateBookingCommand Dinner(const std::string& key, std::uint32_t party_size = 2, std::uint32_t duration = 90) {
  CreateBookingCommand command;
  command.idempotency_key  = key;
  command.restaurant_id    = "R1";
  command.sector_id        = "S1";
  command.date             = woki::testing::kDate;
  command.party_size       = party_size;
  command.duration_minutes = duration;
  command.window_start     = "20:00";
  command.window_end       = "23:45";
  return command;
}

DiscoverQuery DinnerQuery(std::uint32_t party_size, std::uint32_t duration = 90) {
  DiscoverQuery query;
  query.restaurant_id    = "R1";
  query.sector_id        = "S1";
  query.date             = woki::testing::kDate;
  query.party_size       = party_size;
  query.duration_minutes = duration;
  query.window_start     = "20:00";
  query.window_end       = "23:45";
  return query;
}

template <typename E, typename Fn>
bool Throws(Fn&& fn) {
  try {
    fn();
  } catch (const E&) {
    return true;
  }
  return false;
}

// Commits a confirmed booking straight into the repository.
void InsertConfirmed(woki::db::Repository& repo, const std::string& id, const std::string& table, std::uint64_t start_ms, std::uint64_t end_ms) {
  BookingRecord record;
  record.id               = id;
  record.restaurant_id    = "R1";
  record.sector_id        = "S1";
  record.table_ids        = {table};
  record.party_size       = 2;
  record.start_ms         = start_ms;
  record.end_ms           = end_ms;
  record.duration_minutes = static_cast<std::uint32_t>((end_ms - start_ms) / 60000);
  record.status           = BookingStatus::kConfirmed;

  auto tx = repo.Begin();
  assert(repo.InsertBooking(*tx, record));
  tx->Commit();
}

// ------------------------------------------------------------------
// Discover
// ------------------------------------------------------------------

void TestDiscoverLargePartyOffersCombos() {
  Engine engine;
  const auto result = engine.manager->Discover(DinnerQuery(7));
  assert(result.slot_minutes == 15);
  assert(result.duration_minutes == 90);
  assert(!result.candidates.empty());

  const auto& best = result.candidates.front();
  assert(best.kind == CandidateKind::kCombo);
  assert((best.table_ids == std::vector<std::string>{"T1", "T4"}));
  assert(best.interval.start == At(20, 0));
  assert(best.interval.end == At(21, 30));
}

void TestDiscoverHonoursLimit() {
  Engine engine;
  auto   query  = DinnerQuery(2);
  query.limit   = 2;
  const auto result = engine.manager->Discover(query);
  assert(result.candidates.size() == 2);
  assert(result.candidates[0].table_ids == std::vector<std::string>{"T1"});
}

void TestDiscoverWithoutServiceWindowsUsesWholeDay() {
  Engine engine;
  DiscoverQuery query;
  query.restaurant_id    = "R2";
  query.sector_id        = "S3";
  query.date             = woki::testing::kDate;
  query.party_size       = 2;
  query.duration_minutes = 60;
  const auto result = engine.manager->Discover(query);
  assert(result.candidates.size() == 1);
  assert(result.candidates[0].interval.start == At(0, 0));
}

void TestDiscoverRejections() {
  Engine engine;

  auto too_big = DinnerQuery(30);
  assert(Throws<woki::util::NoCapacity>([&] { engine.manager->Discover(too_big); }));

  auto lunch_gap = DinnerQuery(2);
  lunch_gap.window_start = "17:00";
  lunch_gap.window_end   = "19:00";
  assert(Throws<woki::util::OutsideServiceWindow>([&] { engine.manager->Discover(lunch_gap); }));

  auto foreign_sector      = DinnerQuery(2);
  foreign_sector.sector_id = "S3";
  assert(Throws<woki::util::NotFound>([&] { engine.manager->Discover(foreign_sector); }));

  auto unknown_restaurant          = DinnerQuery(2);
  unknown_restaurant.restaurant_id = "R404";
  assert(Throws<woki::util::NotFound>([&] { engine.manager->Discover(unknown_restaurant); }));

  auto bad_duration             = DinnerQuery(2);
  bad_duration.duration_minutes = 50;
  assert(Throws<woki::util::InvalidInput>([&] { engine.manager->Discover(bad_duration); }));

  auto no_party = DinnerQuery(0);
  assert(Throws<woki::util::InvalidInput>([&] { engine.manager->Discover(no_party); }));

  // discovery never counts as a booking conflict
  assert(Metrics::Instance().Snapshot().conflicts_no_capacity == 0);
}

// ------------------------------------------------------------------
// CreateBooking
// ------------------------------------------------------------------

void TestCreateBookingTakesBestCandidate() {
  Engine engine;

  const auto first = engine.manager->CreateBooking(Dinner("key-1"));
  assert(!first.replayed);
  assert(first.booking.id.rfind("BK_", 0) == 0);
  assert(first.booking.id.size() == 11);
  assert(first.booking.table_ids == std::vector<std::string>{"T1"});
  assert(first.booking.start_ms == MsAt(20, 0));
  assert(first.booking.end_ms == MsAt(21, 30));
  assert(first.booking.status == BookingStatus::kConfirmed);
  assert(first.booking.duration_minutes == 90);

  // T1 is now busy at 20:00, the next best single is T2
  const auto second = engine.manager->CreateBooking(Dinner("key-2"));
  assert(second.booking.table_ids == std::vector<std::string>{"T2"});
  assert(second.booking.start_ms == MsAt(20, 0));

  const auto snapshot = Metrics::Instance().Snapshot();
  assert(snapshot.bookings_created == 2);
  assert(snapshot.assignment_time.samples == 2);
  assert(!snapshot.assignment_time.p95_ms);
  assert(snapshot.lock_wait_time.samples == 0);

  assert(engine.manager->ListBookings("R1", "S1", woki::testing::kDate).size() == 2);
}

void TestSameKeyReplaysWithoutNewBooking() {
  Engine engine;
  const auto original = engine.manager->CreateBooking(Dinner("same"));
  const auto replay   = engine.manager->CreateBooking(Dinner("same"));

  assert(replay.replayed);
  assert(replay.booking.id == original.booking.id);
  assert(engine.manager->ListBookings("R1", "S1", woki::testing::kDate).size() == 1);
  assert(Metrics::Instance().Snapshot().bookings_created == 1);

  auto changed       = Dinner("same");
  changed.party_size = 3;
  assert(Throws<woki::util::InvalidInput>([&] { engine.manager->CreateBooking(changed); }));

  // the request id is not part of the request identity
  auto traced       = Dinner("same");
  traced.request_id = "req-42";
  assert(engine.manager->CreateBooking(traced).replayed);
}

void TestExpiredKeyCreatesASecondBooking() {
  auto now   = woki::util::FromUnixMillis(1761163200000);
  auto store = std::make_shared<woki::idempotency::IdempotencyStore>(60000ms, [&now] { return now; });
  Engine engine(woki::testing::SeededRepository(), {}, store);

  const auto original = engine.manager->CreateBooking(Dinner("ttl"));
  assert(!original.replayed);

  now += 59999ms;
  const auto replay = engine.manager->CreateBooking(Dinner("ttl"));
  assert(replay.replayed);
  assert(replay.booking.id == original.booking.id);

  now += 1ms;
  const auto second = engine.manager->CreateBooking(Dinner("ttl"));
  assert(!second.replayed);
  assert(second.booking.id != original.booking.id);
  assert(second.booking.table_ids == std::vector<std::string>{"T2"});

  assert(engine.manager->ListBookings("R1", "S1", woki::testing::kDate).size() == 2);
  assert(Metrics::Instance().Snapshot().bookings_created == 2);
}

void TestBlankIdempotencyKeyIsRejected() {
  Engine engine;
  assert(Throws<woki::util::InvalidInput>([&] { engine.manager->CreateBooking(Dinner("")); }));
  assert(Throws<woki::util::InvalidInput>([&] { engine.manager->CreateBooking(Dinner("   ")); }));
  assert(engine.idempotency->Size() == 0);
}

void TestNoCapacityIsCountedAndKeyReleased() {
  Engine engine;
  assert(Throws<woki::util::NoCapacity>([&] { engine.manager->CreateBooking(Dinner("huge", 30)); }));

  const auto snapshot = Metrics::Instance().Snapshot();
  assert(snapshot.conflicts_no_capacity == 1);
  assert(snapshot.bookings_created == 0);
  assert(engine.idempotency->Size() == 0);
}

void TestReverifyCatchesWriterThatWonTheRace() {
  auto   hooked = std::make_shared<HookedRepository>(woki::testing::SeededRepository());
  Engine engine(hooked);

  // first Begin loads the day, the second opens the write transaction
  hooked->on_begin = [&](int n) {
    if (n == 2) {
      InsertConfirmed(hooked->Inner(), "BK_RIVAL001", "T1", MsAt(20, 0), MsAt(21, 30));
    }
  };

  assert(Throws<woki::util::NoCapacity>([&] { engine.manager->CreateBooking(Dinner("raced")); }));
  assert(Metrics::Instance().Snapshot().conflicts_no_capacity == 1);
  assert(engine.locks->ActiveKeys() == 0);

  // the abandoned claim lets the client retry with the same key
  hooked->on_begin = nullptr;
  const auto retry = engine.manager->CreateBooking(Dinner("raced"));
  assert(!retry.replayed);
  assert(retry.booking.table_ids == std::vector<std::string>{"T2"});
}

void TestCommitConflictsAreRetried() {
  auto   hooked = std::make_shared<HookedRepository>(woki::testing::SeededRepository());
  Engine engine(hooked);

  int conflicts                = 2;
  hooked->after_insert_booking = [&] {
    if (conflicts > 0) {
      --conflicts;
      auto tx = hooked->Inner().Begin();
      assert(hooked->Inner().UpsertRestaurant(*tx, {"R2", "Bistro Dos", "UTC"}));
      tx->Commit();
    }
  };

  const auto result = engine.manager->CreateBooking(Dinner("retry"));
  assert(result.booking.table_ids == std::vector<std::string>{"T1"});
  assert(engine.manager->ListBookings("R1", "S1", woki::testing::kDate).size() == 1);
}

void TestPersistentCommitConflictsBecomeTableLocked() {
  auto   hooked = std::make_shared<HookedRepository>(woki::testing::SeededRepository());
  Engine engine(hooked);

  hooked->after_insert_booking = [&] {
    auto tx = hooked->Inner().Begin();
    assert(hooked->Inner().UpsertRestaurant(*tx, {"R2", "Bistro Dos", "UTC"}));
    tx->Commit();
  };

  assert(Throws<woki::util::TableLocked>([&] { engine.manager->CreateBooking(Dinner("stuck")); }));

  const auto snapshot = Metrics::Instance().Snapshot();
  assert(snapshot.conflicts_table_locked == 1);
  assert(snapshot.lock_timeouts == 0);
  assert(engine.locks->ActiveKeys() == 0);
  assert(engine.manager->ListBookings("R1", "S1", woki::testing::kDate).empty());
}

void TestHeldTableLockTimesOut() {
  BookingPolicy policy;
  policy.lock_timeout = 50ms;
  Engine engine(woki::testing::SeededRepository(), policy);

  auto held = engine.locks->Acquire(woki::lock::LockCoordinator::MakeKey("R1", "S1", "T1", At(20, 0)), 1s);

  bool locked = false;
  try {
    engine.manager->CreateBooking(Dinner("blocked"));
  } catch (const woki::lock::LockTimeout&) {
    locked = true;
  }
  assert(locked);

  const auto snapshot = Metrics::Instance().Snapshot();
  assert(snapshot.lock_timeouts == 1);
  assert(snapshot.conflicts_table_locked == 1);
  assert(snapshot.bookings_created == 0);

  held.Release();
  assert(engine.manager->CreateBooking(Dinner("blocked")).booking.table_ids == std::vector<std::string>{"T1"});
}

void TestAssignmentTimeStartsAtTheChosenCandidate() {
  std::chrono::steady_clock::time_point now{};
  Engine engine(woki::testing::SeededRepository(), {}, std::make_shared<woki::idempotency::IdempotencyStore>(), [&now] { return now; });

  // a slow candidate search must not count, the write must
  std::vector<Stage> stages;
  engine.manager->SetStageObserver([&](Stage stage) {
    stages.push_back(stage);
    if (stage == Stage::kLocking) {
      now += 1000ms;
    }
    if (stage == Stage::kPersisting) {
      now += 7ms;
    }
  });

  for (int i = 0; i < 20; ++i) {
    CreateBookingCommand command;
    command.idempotency_key  = "bar-" + std::to_string(i);
    command.restaurant_id    = "R2";
    command.sector_id        = "S3";
    command.date             = woki::testing::kDate;
    command.party_size       = 2;
    command.duration_minutes = 30;
    assert(!engine.manager->CreateBooking(command).replayed);
  }

  const auto snapshot = Metrics::Instance().Snapshot();
  assert(snapshot.assignment_time.samples == 20);
  assert(snapshot.assignment_time.p95_ms);
  assert(*snapshot.assignment_time.p95_ms == 7.0);

  const std::vector<Stage> first(stages.begin(), stages.begin() + 6);
  assert((first == std::vector<Stage>{Stage::kDiscovering, Stage::kSelecting, Stage::kLocking, Stage::kReverifying, Stage::kPersisting,
                                      Stage::kDone}));
  assert(stages.size() == 120);
}

// ------------------------------------------------------------------
// Cancel and list
// ------------------------------------------------------------------

void TestCancelFreesTheTable() {
  Engine engine;
  const auto booking = engine.manager->CreateBooking(Dinner("c-1")).booking;

  engine.manager->CancelBooking(booking.id, "req-cancel");
  engine.manager->CancelBooking(booking.id);
  assert(Metrics::Instance().Snapshot().bookings_cancelled == 1);

  const auto listed = engine.manager->ListBookings("R1", "S1", woki::testing::kDate);
  assert(listed.size() == 1);
  assert(listed[0].status == BookingStatus::kCancelled);
  assert(listed[0].updated_at_ms >= listed[0].created_at_ms);

  const auto again = engine.manager->CreateBooking(Dinner("c-2")).booking;
  assert(again.table_ids == std::vector<std::string>{"T1"});
  assert(again.start_ms == MsAt(20, 0));
}

void TestCancelUnknownBooking() {
  Engine engine;
  assert(Throws<woki::util::NotFound>([&] { engine.manager->CancelBooking("BK_DEADBEEF"); }));
  assert(Throws<woki::util::InvalidInput>([&] { engine.manager->CancelBooking(""); }));
}

void TestListBookingsValidatesScope() {
  Engine engine;
  assert(engine.manager->ListBookings("R1", "S2", woki::testing::kDate).empty());
  assert(Throws<woki::util::InvalidInput>([&] { engine.manager->ListBookings("R1", "S1", "tomorrow"); }));
  assert(Throws<woki::util::NotFound>([&] { engine.manager->ListBookings("R2", "S1", woki::testing::kDate); }));
}

void TestStageNamesAndFingerprint() {
  assert(woki::core::StageName(woki::core::Stage::kValidating) == "validating");
  assert(woki::core::StageName(woki::core::Stage::kLocking) == "locking");
  assert(woki::core::StageName(woki::core::Stage::kDone) == "done");

  auto a = Dinner("k");
  auto b = Dinner("other-key");
  assert(a.Fingerprint() == b.Fingerprint());
  b.window_end = "23:00";
  assert(a.Fingerprint() != b.Fingerprint());
}

} // namespace

int main() {
  TestDiscoverLargePartyOffersCombos();
  TestDiscoverHonoursLimit();
  TestDiscoverWithoutServiceWindowsUsesWholeDay();
  TestDiscoverRejections();
  TestCreateBookingTakesBestCandidate();
  TestSameKeyReplaysWithoutNewBooking();
  TestExpiredKeyCreatesASecondBooking();
  TestBlankIdempotencyKeyIsRejected();
  TestNoCapacityIsCountedAndKeyReleased();
  TestReverifyCatchesWriterThatWonTheRace();
  TestCommitConflictsAreRetried();
  TestPersistentCommitConflictsBecomeTableLocked();
  TestHeldTableLockTimesOut();
  TestAssignmentTimeStartsAtTheChosenCandidate();
  TestCancelFreesTheTable();
  TestCancelUnknownBooking();
  TestListBookingsValidatesScope();
  TestStageNamesAndFingerprint();

  std::cout << "woki_unit_booking_manager: pass\n";
  return 0;
}
