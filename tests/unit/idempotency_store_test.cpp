#include "internal/idempotency/idempotency_store.hpp"

#include <atomic>
#include <cassert>
#include <chrono>
#include <iostream>
#include <thread>

#include "internal/util/errors.hpp"

namespace {

using woki::db::model::BookingRecord;
using woki::idempotency::IdempotencyStore;
using namespace std::chrono_literals;

// Manually advanced clock.
struct FakeClock {
  woki::util::TimePoint now = woki::util::FromUnixMillis(1761163200000);

  IdempotencyStore::ClockFn Fn() {
    return [this] { return now; };
  }
};

BookingRecord Booking(const std::string& id) {
  BookingRecord record;
  record.id            = id;
  record.restaurant_id = "R1";
  record.sector_id     = "S1";
  record.table_ids     = {"T1"};
  record.party_size    = 2;
  return record;
}

void TestCompletedClaimIsReplayed() {
  IdempotencyStore store;

  auto first = store.Reserve("abc", "fp", 100ms);
  assert(!first.replay);
  assert(first.claim.Active());
  first.claim.Complete(Booking("BK_00000001"));
  assert(!first.claim.Active());

  auto second = store.Reserve("abc", "fp", 100ms);
  assert(second.replay);
  assert(second.replay->id == "BK_00000001");
  assert(!second.claim.Active());

  const auto cached = store.Get("abc", "fp");
  assert(cached && cached->id == "BK_00000001");
}

void TestDifferentRequestUnderSameKeyIsRejected() {
  IdempotencyStore store;
  store.Set("abc", Booking("BK_00000001"), "fp-1");

  bool threw = false;
  try {
    (void)store.Reserve("abc", "fp-2", 100ms);
  } catch (const woki::util::InvalidInput&) {
    threw = true;
  }
  assert(threw);

  threw = false;
  try {
    (void)store.Get("abc", "fp-2");
  } catch (const woki::util::InvalidInput&) {
    threw = true;
  }
  assert(threw);
}

void TestEntriesExpireAfterTtl() {
  FakeClock        clock;
  IdempotencyStore store(60000ms, clock.Fn());

  store.Set("abc", Booking("BK_00000001"), "fp");
  clock.now += 59999ms;
  assert(store.Get("abc", "fp"));
  assert(store.Size() == 1);

  clock.now += 1ms;
  assert(!store.Get("abc", "fp"));
  assert(store.Size() == 0);

  // an expired key is free for a new request, even a different one
  auto fresh = store.Reserve("abc", "other", 100ms);
  assert(!fresh.replay);
  assert(fresh.claim.Active());
}

void TestAbandonedClaimFreesTheKey() {
  IdempotencyStore store;
  {
    auto reservation = store.Reserve("abc", "fp", 100ms);
    assert(reservation.claim.Active());
    assert(store.Size() == 1);
    assert(!store.Get("abc", "fp"));
  }
  assert(store.Size() == 0);

  auto retry = store.Reserve("abc", "fp", 100ms);
  assert(!retry.replay);
  assert(retry.claim.Active());
}

void TestConcurrentDuplicateWaitsForReplay() {
  IdempotencyStore store;
  auto             owner = store.Reserve("abc", "fp", 100ms);

  std::atomic<bool> replayed{false};
  std::thread       duplicate([&] {
    auto reservation = store.Reserve("abc", "fp", 5s);
    replayed.store(reservation.replay.has_value() && reservation.replay->id == "BK_00000002");
  });

  std::this_thread::sleep_for(20ms);
  owner.claim.Complete(Booking("BK_00000002"));
  duplicate.join();
  assert(replayed.load());
}

void TestDuplicateTakesOverAbandonedClaim() {
  IdempotencyStore store;
  auto             owner = store.Reserve("abc", "fp", 100ms);

  std::atomic<bool> took_over{false};
  std::thread       duplicate([&] {
    auto reservation = store.Reserve("abc", "fp", 5s);
    took_over.store(!reservation.replay && reservation.claim.Active());
    reservation.claim.Complete(Booking("BK_00000003"));
  });

  std::this_thread::sleep_for(20ms);
  owner.claim.Abandon();
  duplicate.join();
  assert(took_over.load());
  assert(store.Get("abc", "fp")->id == "BK_00000003");
}

void TestStuckClaimTimesOutDuplicate() {
  IdempotencyStore store;
  auto             owner = store.Reserve("abc", "fp", 100ms);

  bool threw = false;
  try {
    (void)store.Reserve("abc", "fp", 20ms);
  } catch (const woki::util::TableLocked&) {
    threw = true;
  }
  assert(threw);
  assert(owner.claim.Active());
}

} // namespace

int main() {
  TestCompletedClaimIsReplayed();
  TestDifferentRequestUnderSameKeyIsRejected();
  TestEntriesExpireAfterTtl();
  TestAbandonedClaimFreesTheKey();
  TestConcurrentDuplicateWaitsForReplay();
  TestDuplicateTakesOverAbandonedClaim();
  TestStuckClaimTimesOutDuplicate();

  std::cout << "woki_unit_idempotency_store: pass\n";
  return 0;
}
