#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "internal/core/booking_policy.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/model/candidate.hpp"

namespace woki::lock {
class LockCoordinator;
}
namespace woki::idempotency {
class IdempotencyStore;
}

namespace woki::core {

class OperationLog;

struct DiscoverQuery {
  std::string   restaurant_id;
  std::string   sector_id;
  std::string   date;
  std::uint32_t party_size       = 0;
  std::uint32_t duration_minutes = 0;
  std::string   window_start;  // "HH:mm" or empty
  std::string   window_end;
  std::uint32_t limit = 0;  // 0 = all
  std::string   request_id;
};

struct DiscoverResult {
  std::uint32_t                 slot_minutes     = 0;
  std::uint32_t                 duration_minutes = 0;
  std::vector<model::Candidate> candidates;
};

struct CreateBookingCommand {
  std::string   idempotency_key;
  std::string   restaurant_id;
  std::string   sector_id;
  std::string   date;
  std::uint32_t party_size       = 0;
  std::uint32_t duration_minutes = 0;
  std::string   window_start;
  std::string   window_end;
  std::string   request_id;

  // Every field except the key and the request id.
  std::string Fingerprint() const;
};

struct CreateBookingResult {
  db::model::BookingRecord booking;
  bool                     replayed = false;
};

enum class Stage { kValidating, kDiscovering, kSelecting, kLocking, kReverifying, kPersisting, kDone };

std::string_view StageName(Stage stage);

/*
  Booking engine entry point.

  CreateBooking runs the commit protocol:

    Validating -> (idempotency) -> Discovering -> Selecting -> Locking
      -> Reverifying -> Persisting -> Done

  Every failure leaves through a taxonomy exception. Locks are scoped to
  the call and released on every path; an idempotency claim that does not
  reach Done is abandoned so a retry is treated as new.
*/
class BookingManager {
 public:
  using SteadyClockFn = std::function<std::chrono::steady_clock::time_point()>;
  using StageObserver = std::function<void(Stage)>;

  BookingManager(std::shared_ptr<db::Repository> repository, std::shared_ptr<lock::LockCoordinator> locks,
                 std::shared_ptr<idempotency::IdempotencyStore> idempotency, BookingPolicy policy = {},
                 SteadyClockFn steady_clock = std::chrono::steady_clock::now);

  // Called on every commit-protocol stage transition, before the stage runs.
  void SetStageObserver(StageObserver observer) {
    stage_observer_ = std::move(observer);
  }

  // NoCapacity when no candidate exists.
  DiscoverResult Discover(const DiscoverQuery& query);

  CreateBookingResult CreateBooking(const CreateBookingCommand& command);

  // No-op for an already cancelled booking.
  void CancelBooking(const std::string& booking_id, const std::string& request_id = {});

  // Every status, overlapping the restaurant-local day.
  std::vector<db::model::BookingRecord> ListBookings(const std::string& restaurant_id, const std::string& sector_id, const std::string& date);

  const BookingPolicy& Policy() const {
    return policy_;
  }

 private:
  void Enter(Stage& stage, Stage next, OperationLog& log);

  db::model::BookingRecord Persist(const CreateBookingCommand& command, const model::Candidate& candidate, Stage& stage, OperationLog& log);

  void Reverify(db::Transaction& tx, const CreateBookingCommand& command, const model::Candidate& candidate);

  std::shared_ptr<db::Repository>                repository_;
  std::shared_ptr<lock::LockCoordinator>         locks_;
  std::shared_ptr<idempotency::IdempotencyStore> idempotency_;
  BookingPolicy                                  policy_;
  SteadyClockFn                                  steady_clock_;
  StageObserver                                  stage_observer_;
};

} // namespace woki::core
