#include "idempotency_store.hpp"

#include "internal/util/errors.hpp"

namespace woki::idempotency {

namespace {

void ThrowMismatch(const std::string& key) {
  throw util::InvalidInput("idempotency key '" + key + "' was already used with a different request");
}

} // namespace

// ------------------------------------------------------------------
// Claim
// ------------------------------------------------------------------

IdempotencyStore::Claim::Claim(IdempotencyStore* store, std::string key, std::string fingerprint)
    : store_(store), key_(std::move(key)), fingerprint_(std::move(fingerprint)) {
}

IdempotencyStore::Claim::~Claim() {
  Abandon();
}

IdempotencyStore::Claim::Claim(Claim&& other) noexcept
    : store_(other.store_), key_(std::move(other.key_)), fingerprint_(std::move(other.fingerprint_)) {
  other.store_ = nullptr;
}

IdempotencyStore::Claim& IdempotencyStore::Claim::operator=(Claim&& other) noexcept {
  if (this != &other) {
    Abandon();
    store_       = other.store_;
    key_         = std::move(other.key_);
    fingerprint_ = std::move(other.fingerprint_);
    other.store_ = nullptr;
  }
  return *this;
}

void IdempotencyStore::Claim::Complete(const db::model::BookingRecord& result) {
  if (!store_) return;
  auto* store = store_;
  store_      = nullptr;
  store->Complete(key_, fingerprint_, result);
}

void IdempotencyStore::Claim::Abandon() {
  if (!store_) return;
  auto* store = store_;
  store_      = nullptr;
  store->Abandon(key_, fingerprint_);
}

// ------------------------------------------------------------------
// Store
// ------------------------------------------------------------------

IdempotencyStore::IdempotencyStore(std::chrono::milliseconds ttl, ClockFn clock) : ttl_(ttl), clock_(std::move(clock)) {
}

IdempotencyStore::Shard& IdempotencyStore::ShardFor(const std::string& key) {
  return shards_[std::hash<std::string>{}(key) % kShardCount];
}

bool IdempotencyStore::IsExpired(const Entry& entry, util::TimePoint now) const {
  return !entry.pending && entry.expires_at <= now;
}

void IdempotencyStore::Sweep(Shard& shard, util::TimePoint now) {
  for (auto it = shard.entries.begin(); it != shard.entries.end();) {
    if (IsExpired(it->second, now)) {
      it = shard.entries.erase(it);
    } else {
      ++it;
    }
  }
}

IdempotencyStore::Reservation IdempotencyStore::Reserve(const std::string& key, const std::string& fingerprint,
                                                        std::chrono::milliseconds wait_timeout) {
  auto&      shard    = ShardFor(key);
  const auto deadline = std::chrono::steady_clock::now() + wait_timeout;

  std::unique_lock lock(shard.mutex);
  for (;;) {
    auto it = shard.entries.find(key);
    if (it != shard.entries.end() && IsExpired(it->second, clock_())) {
      shard.entries.erase(it);
      it = shard.entries.end();
    }

    if (it == shard.entries.end()) {
      shard.entries[key] = Entry{fingerprint, std::nullopt, true, {}};
      return Reservation{std::nullopt, Claim(this, key, fingerprint)};
    }

    if (it->second.fingerprint != fingerprint) ThrowMismatch(key);

    if (!it->second.pending) {
      return Reservation{it->second.result, Claim{}};
    }

    const bool settled = shard.cv.wait_until(lock, deadline, [&] {
      auto cur = shard.entries.find(key);
      return cur == shard.entries.end() || !cur->second.pending;
    });
    if (!settled) {
      throw util::TableLocked("a request with idempotency key '" + key + "' is still in progress");
    }
  }
}

std::optional<db::model::BookingRecord> IdempotencyStore::Get(const std::string& key, const std::string& fingerprint) {
  auto&           shard = ShardFor(key);
  std::lock_guard lock(shard.mutex);

  auto it = shard.entries.find(key);
  if (it == shard.entries.end()) return std::nullopt;
  if (IsExpired(it->second, clock_())) {
    shard.entries.erase(it);
    return std::nullopt;
  }
  if (it->second.fingerprint != fingerprint) ThrowMismatch(key);
  if (it->second.pending) return std::nullopt;
  return it->second.result;
}

void IdempotencyStore::Set(const std::string& key, const db::model::BookingRecord& result, const std::string& fingerprint) {
  Complete(key, fingerprint, result);
}

std::size_t IdempotencyStore::Size() {
  const auto  now   = clock_();
  std::size_t total = 0;
  for (auto& shard : shards_) {
    std::lock_guard lock(shard.mutex);
    Sweep(shard, now);
    total += shard.entries.size();
  }
  return total;
}

void IdempotencyStore::Complete(const std::string& key, const std::string& fingerprint, const db::model::BookingRecord& result) {
  auto& shard = ShardFor(key);
  {
    std::lock_guard lock(shard.mutex);
    const auto      now = clock_();
    Sweep(shard, now);

    auto& entry       = shard.entries[key];
    entry.fingerprint = fingerprint;
    entry.result      = result;
    entry.pending     = false;
    entry.expires_at  = now + ttl_;
  }
  shard.cv.notify_all();
}

void IdempotencyStore::Abandon(const std::string& key, const std::string& fingerprint) {
  auto& shard = ShardFor(key);
  {
    std::lock_guard lock(shard.mutex);
    auto            it = shard.entries.find(key);
    if (it != shard.entries.end() && it->second.pending && it->second.fingerprint == fingerprint) {
      shard.entries.erase(it);
    }
  }
  shard.cv.notify_all();
}

} // namespace woki::idempotency
