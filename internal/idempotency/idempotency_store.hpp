#pragma once

#include <array>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

#include "internal/db/model/booking_record.hpp"
#include "internal/util/time.hpp"

namespace woki::idempotency {

/*
  Bounded-lifetime cache of booking creations keyed by client idempotency key.

  Each entry remembers the fingerprint of the request that created it. A key
  reused with a different fingerprint is InvalidInput, never a replay.

  Reserve() gives at-most-once creation under concurrency: the first caller
  gets a Claim and runs the creation, callers with the same key and
  fingerprint block until the claim completes (replay) or is abandoned
  (they retry the claim themselves).

  Entries expire ttl after completion, measured on the injected clock.
  Expired entries are reclaimed lazily.
*/
class IdempotencyStore {
 public:
  using ClockFn = std::function<util::TimePoint()>;

  static constexpr std::size_t kShardCount = 64;

  class Claim {
   public:
    Claim() = default;
    ~Claim();

    Claim(Claim&& other) noexcept;
    Claim& operator=(Claim&& other) noexcept;

    Claim(const Claim&)            = delete;
    Claim& operator=(const Claim&) = delete;

    // Stores the result for replay and wakes waiters.
    void Complete(const db::model::BookingRecord& result);

    // Drops the pending entry; a waiter may take over.
    void Abandon();

    bool Active() const {
      return store_ != nullptr;
    }

   private:
    friend class IdempotencyStore;

    Claim(IdempotencyStore* store, std::string key, std::string fingerprint);

    IdempotencyStore* store_ = nullptr;
    std::string       key_;
    std::string       fingerprint_;
  };

  struct Reservation {
    std::optional<db::model::BookingRecord> replay;
    Claim                                   claim;
  };

  explicit IdempotencyStore(std::chrono::milliseconds ttl = std::chrono::milliseconds{60000}, ClockFn clock = util::Now);

  IdempotencyStore(const IdempotencyStore&)            = delete;
  IdempotencyStore& operator=(const IdempotencyStore&) = delete;

  /*
    Either the cached result (replay set, claim inactive) or an active claim.

    Throws InvalidInput on fingerprint mismatch and TableLocked when an
    in-flight request holding the key does not finish within wait_timeout.
  */
  Reservation Reserve(const std::string& key, const std::string& fingerprint, std::chrono::milliseconds wait_timeout);

  // Completed, unexpired entry for key. Pending entries are not visible.
  std::optional<db::model::BookingRecord> Get(const std::string& key, const std::string& fingerprint);

  void Set(const std::string& key, const db::model::BookingRecord& result, const std::string& fingerprint);

  // Live entries, pending ones included. Sweeps expired entries first.
  std::size_t Size();

 private:
  struct Entry {
    std::string                             fingerprint;
    std::optional<db::model::BookingRecord> result;
    bool                                    pending = true;
    util::TimePoint                         expires_at;
  };

  struct Shard {
    std::mutex                             mutex;
    std::condition_variable                cv;
    std::unordered_map<std::string, Entry> entries;
  };

  Shard& ShardFor(const std::string& key);

  bool IsExpired(const Entry& entry, util::TimePoint now) const;
  void Sweep(Shard& shard, util::TimePoint now);

  void Complete(const std::string& key, const std::string& fingerprint, const db::model::BookingRecord& result);
  void Abandon(const std::string& key, const std::string& fingerprint);

  std::chrono::milliseconds       ttl_;
  ClockFn                         clock_;
  std::array<Shard, kShardCount>  shards_;
};

} // namespace woki::idempotency
