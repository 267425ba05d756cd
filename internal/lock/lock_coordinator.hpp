#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace woki::lock {

class LockTimeout : public util::TableLocked {
 public:
  explicit LockTimeout(const std::string& msg) : util::TableLocked(msg) {
  }
};

/*
  In-process exclusive locks keyed by string.

  - at most one holder per key
  - waiters are granted in arrival order (FIFO hand-off on release)
  - a waiter whose deadline passes leaves the queue and is never granted
  - idle keys are dropped, so the table only holds contended or held keys

  Multi-key acquisition always goes through AcquireAll, which takes keys in
  sorted order. Two requests over overlapping key sets therefore cannot
  deadlock.
*/
class LockCoordinator {
 private:
  struct Waiter {
    bool granted = false;
  };

  struct Slot {
    std::mutex                          mutex;
    std::condition_variable             cv;
    bool                                held = false;
    std::deque<std::shared_ptr<Waiter>> queue;
    std::size_t                         users = 0;
  };

 public:
  // Exclusive hold of one key. Released on destruction.
  class Handle {
   public:
    Handle() = default;
    ~Handle();

    Handle(Handle&& other) noexcept;
    Handle& operator=(Handle&& other) noexcept;

    Handle(const Handle&)            = delete;
    Handle& operator=(const Handle&) = delete;

    void Release();

    bool Held() const {
      return owner_ != nullptr;
    }

    const std::string& Key() const {
      return key_;
    }

    // Zero when granted without queueing.
    std::chrono::milliseconds Waited() const {
      return waited_;
    }

   private:
    friend class LockCoordinator;

    Handle(LockCoordinator* owner, std::string key, std::shared_ptr<Slot> slot, std::chrono::milliseconds waited);

    LockCoordinator*          owner_ = nullptr;
    std::string               key_;
    std::shared_ptr<Slot>     slot_;
    std::chrono::milliseconds waited_{0};
  };

  // Handles for a sorted, de-duplicated key set. Released in reverse order.
  class ScopedLockSet {
   public:
    ScopedLockSet() = default;
    ~ScopedLockSet();

    ScopedLockSet(ScopedLockSet&&) noexcept            = default;
    ScopedLockSet& operator=(ScopedLockSet&&) noexcept = default;

    void Release();

    std::vector<std::string> Keys() const;

    bool Queued() const {
      return queued_;
    }

    std::chrono::milliseconds Waited() const {
      return waited_;
    }

   private:
    friend class LockCoordinator;

    std::vector<Handle>       handles_;
    bool                      queued_ = false;
    std::chrono::milliseconds waited_{0};
  };

  LockCoordinator() = default;

  LockCoordinator(const LockCoordinator&)            = delete;
  LockCoordinator& operator=(const LockCoordinator&) = delete;

  // Throws LockTimeout when the key is not granted before the timeout.
  Handle Acquire(const std::string& key, std::chrono::milliseconds timeout);

  /*
    Acquires every key in sorted order against one deadline. On timeout all
    keys taken so far are released before LockTimeout propagates.
  */
  ScopedLockSet AcquireAll(std::vector<std::string> keys, std::chrono::milliseconds timeout);

  // restaurant|sector|table|2025-10-22T20:00:00.000Z
  static std::string MakeKey(const std::string& restaurant_id, const std::string& sector_id, const std::string& table_id,
                             util::TimePoint start);

  std::size_t WaiterCount(const std::string& key) const;
  bool        IsHeld(const std::string& key) const;

  // Keys currently held or waited on.
  std::size_t ActiveKeys() const;

 private:
  using SteadyClock = std::chrono::steady_clock;

  Handle AcquireUntil(const std::string& key, SteadyClock::time_point deadline);

  std::shared_ptr<Slot> Checkout(const std::string& key);
  void                  Checkin(const std::string& key);
  void                  Release(const std::string& key, const std::shared_ptr<Slot>& slot);

  mutable std::mutex                                     guard_;
  std::unordered_map<std::string, std::shared_ptr<Slot>> slots_;
};

} // namespace woki::lock
