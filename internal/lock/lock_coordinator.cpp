#include "lock_coordinator.hpp"

#include <algorithm>

namespace woki::lock {

// ------------------------------------------------------------------
// Handle
// ------------------------------------------------------------------

LockCoordinator::Handle::Handle(LockCoordinator* owner, std::string key, std::shared_ptr<Slot> slot, std::chrono::milliseconds waited)
    : owner_(owner), key_(std::move(key)), slot_(std::move(slot)), waited_(waited) {
}

LockCoordinator::Handle::~Handle() {
  Release();
}

LockCoordinator::Handle::Handle(Handle&& other) noexcept
    : owner_(other.owner_), key_(std::move(other.key_)), slot_(std::move(other.slot_)), waited_(other.waited_) {
  other.owner_ = nullptr;
}

LockCoordinator::Handle& LockCoordinator::Handle::operator=(Handle&& other) noexcept {
  if (this != &other) {
    Release();
    owner_       = other.owner_;
    key_         = std::move(other.key_);
    slot_        = std::move(other.slot_);
    waited_      = other.waited_;
    other.owner_ = nullptr;
  }
  return *this;
}

void LockCoordinator::Handle::Release() {
  if (!owner_) return;
  auto* owner = owner_;
  owner_      = nullptr;
  owner->Release(key_, slot_);
  slot_.reset();
}

// ------------------------------------------------------------------
// ScopedLockSet
// ------------------------------------------------------------------

LockCoordinator::ScopedLockSet::~ScopedLockSet() {
  Release();
}

void LockCoordinator::ScopedLockSet::Release() {
  for (auto it = handles_.rbegin(); it != handles_.rend(); ++it) {
    it->Release();
  }
  handles_.clear();
}

std::vector<std::string> LockCoordinator::ScopedLockSet::Keys() const {
  std::vector<std::string> keys;
  keys.reserve(handles_.size());
  for (const auto& h : handles_) keys.push_back(h.Key());
  return keys;
}

// ------------------------------------------------------------------
// Coordinator
// ------------------------------------------------------------------

LockCoordinator::Handle LockCoordinator::Acquire(const std::string& key, std::chrono::milliseconds timeout) {
  return AcquireUntil(key, SteadyClock::now() + timeout);
}

LockCoordinator::ScopedLockSet LockCoordinator::AcquireAll(std::vector<std::string> keys, std::chrono::milliseconds timeout) {
  std::sort(keys.begin(), keys.end());
  keys.erase(std::unique(keys.begin(), keys.end()), keys.end());

  const auto deadline = SteadyClock::now() + timeout;

  ScopedLockSet set;
  set.handles_.reserve(keys.size());
  for (const auto& key : keys) {
    // a timeout here unwinds `set`, releasing what was already taken
    auto handle = AcquireUntil(key, deadline);
    if (handle.Waited().count() > 0) {
      set.queued_ = true;
    }
    set.waited_ += handle.Waited();
    set.handles_.push_back(std::move(handle));
  }
  return set;
}

LockCoordinator::Handle LockCoordinator::AcquireUntil(const std::string& key, SteadyClock::time_point deadline) {
  auto slot = Checkout(key);

  std::unique_lock lock(slot->mutex);
  if (!slot->held && slot->queue.empty()) {
    slot->held = true;
    lock.unlock();
    return Handle(this, key, std::move(slot), std::chrono::milliseconds{0});
  }

  const auto started = SteadyClock::now();
  auto       waiter  = std::make_shared<Waiter>();
  slot->queue.push_back(waiter);

  const bool granted = slot->cv.wait_until(lock, deadline, [&] { return waiter->granted; });
  if (!granted) {
    // still under the slot mutex, so Release() can no longer pick this waiter
    auto it = std::find(slot->queue.begin(), slot->queue.end(), waiter);
    if (it != slot->queue.end()) slot->queue.erase(it);
    lock.unlock();
    Checkin(key);
    throw LockTimeout("timed out waiting for lock " + key);
  }
  lock.unlock();

  auto waited = std::chrono::duration_cast<std::chrono::milliseconds>(SteadyClock::now() - started);
  if (waited.count() == 0) waited = std::chrono::milliseconds{1};
  return Handle(this, key, std::move(slot), waited);
}

void LockCoordinator::Release(const std::string& key, const std::shared_ptr<Slot>& slot) {
  {
    std::lock_guard lock(slot->mutex);
    if (!slot->queue.empty()) {
      // hand-off: the slot stays held by the next waiter
      slot->queue.front()->granted = true;
      slot->queue.pop_front();
      slot->cv.notify_all();
    } else {
      slot->held = false;
    }
  }
  Checkin(key);
}

std::shared_ptr<LockCoordinator::Slot> LockCoordinator::Checkout(const std::string& key) {
  std::lock_guard lock(guard_);
  auto&           slot = slots_[key];
  if (!slot) slot = std::make_shared<Slot>();
  ++slot->users;
  return slot;
}

void LockCoordinator::Checkin(const std::string& key) {
  std::lock_guard lock(guard_);
  auto            it = slots_.find(key);
  if (it == slots_.end()) return;
  if (--it->second->users == 0) {
    slots_.erase(it);
  }
}

std::string LockCoordinator::MakeKey(const std::string& restaurant_id, const std::string& sector_id, const std::string& table_id,
                                     util::TimePoint start) {
  return restaurant_id + "|" + sector_id + "|" + table_id + "|" + util::FormatIso8601(start);
}

std::size_t LockCoordinator::WaiterCount(const std::string& key) const {
  std::shared_ptr<Slot> slot;
  {
    std::lock_guard lock(guard_);
    auto            it = slots_.find(key);
    if (it == slots_.end()) return 0;
    slot = it->second;
  }
  std::lock_guard lock(slot->mutex);
  return slot->queue.size();
}

bool LockCoordinator::IsHeld(const std::string& key) const {
  std::shared_ptr<Slot> slot;
  {
    std::lock_guard lock(guard_);
    auto            it = slots_.find(key);
    if (it == slots_.end()) return false;
    slot = it->second;
  }
  std::lock_guard lock(slot->mutex);
  return slot->held;
}

std::size_t LockCoordinator::ActiveKeys() const {
  std::lock_guard lock(guard_);
  return slots_.size();
}

} // namespace woki::lock
