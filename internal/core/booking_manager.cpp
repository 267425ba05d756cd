#include "internal/core/booking_manager.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <stdexcept>
#include <utility>

#include "internal/core/candidate_builder.hpp"
#include "internal/core/candidate_selector.hpp"
#include "internal/core/operation_support.hpp"
#include "internal/core/request_validation.hpp"
#include "internal/idempotency/idempotency_store.hpp"
#include "internal/lock/lock_coordinator.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/metrics.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"
#include "internal/util/uuid.hpp"

namespace woki::core {

using observability::Metrics;

namespace {

// Inventory and occupancy of one sector for one local day.
struct DayContext {
  model::TimeInterval              day;
  std::vector<model::Table>        tables;
  std::vector<model::TimeInterval> windows;
  std::vector<model::BusyInterval> busy;
};

bool IsBlank(const std::string& value) {
  return std::all_of(value.begin(), value.end(), [](unsigned char c) { return std::isspace(c); });
}

absl::CivilDay ValidateRequest(const std::string& restaurant_id, const std::string& sector_id, const std::string& date,
                               std::uint32_t party_size, std::uint32_t duration_minutes, const std::string& window_start,
                               const std::string& window_end, const BookingPolicy& policy) {
  if (restaurant_id.empty() || sector_id.empty()) {
    throw util::InvalidInput("restaurantId and sectorId are required");
  }
  const auto day = RequestValidation::ParseDate(date);
  RequestValidation::CheckPartySize(party_size);
  RequestValidation::CheckDuration(duration_minutes, policy);
  RequestValidation::CheckWindowSyntax(window_start, window_end);
  return day;
}

DayContext LoadDay(db::Repository& repo, const std::string& restaurant_id, const std::string& sector_id, absl::CivilDay day,
                   const std::string& window_start, const std::string& window_end) {
  auto tx = repo.Begin();

  const auto restaurant = RequireRestaurant(repo, *tx, restaurant_id);
  RequireSector(repo, *tx, restaurant_id, sector_id);
  const auto zone = RestaurantZone(restaurant);

  DayContext ctx;
  ctx.day     = LocalDay(day, zone);
  ctx.windows = RequestValidation::ResolveWindows(day, zone, repo.ListServiceWindows(*tx, restaurant_id), window_start, window_end);
  ctx.tables  = ToTables(repo.ListTablesInSector(*tx, sector_id));

  // a window may end at 24:00, i.e. on the next local midnight
  auto range = ctx.day;
  for (const auto& window : ctx.windows) {
    range.start = std::min(range.start, window.start);
    range.end   = std::max(range.end, window.end);
  }
  ctx.busy = LoadBusy(repo, *tx, restaurant_id, sector_id, range);

  tx->Rollback();
  return ctx;
}

CandidateQuery MakeQuery(const DayContext& ctx, std::uint32_t party_size, std::uint32_t duration_minutes, const BookingPolicy& policy) {
  CandidateQuery query;
  query.tables         = ctx.tables;
  query.busy           = ctx.busy;
  query.windows        = ctx.windows;
  query.party_size     = party_size;
  query.duration       = std::chrono::minutes(duration_minutes);
  query.slot           = std::chrono::minutes(policy.slot_minutes);
  query.max_combo_size = policy.max_combo_size;
  return query;
}

void RecordRejection(const std::exception& e) {
  auto& metrics = Metrics::Instance();
  if (dynamic_cast<const util::NoCapacity*>(&e)) {
    metrics.RecordConflict(observability::ConflictKind::kNoCapacity);
    return;
  }
  if (dynamic_cast<const lock::LockTimeout*>(&e)) {
    metrics.RecordLockTimeout();
  }
  if (dynamic_cast<const util::TableLocked*>(&e)) {
    metrics.RecordConflict(observability::ConflictKind::kTableLocked);
  }
}

double MillisBetween(std::chrono::steady_clock::time_point from, std::chrono::steady_clock::time_point to) {
  return std::chrono::duration<double, std::milli>(to - from).count();
}

} // namespace

std::string_view StageName(Stage stage) {
  switch (stage) {
    case Stage::kValidating:
      return "validating";
    case Stage::kDiscovering:
      return "discovering";
    case Stage::kSelecting:
      return "selecting";
    case Stage::kLocking:
      return "locking";
    case Stage::kReverifying:
      return "reverifying";
    case Stage::kPersisting:
      return "persisting";
    case Stage::kDone:
      return "done";
  }
  return "unknown";
}

std::string CreateBookingCommand::Fingerprint() const {
  return restaurant_id + "|" + sector_id + "|" + date + "|" + std::to_string(party_size) + "|" + std::to_string(duration_minutes) + "|" +
         window_start + "|" + window_end;
}

BookingManager::BookingManager(std::shared_ptr<db::Repository> repository, std::shared_ptr<lock::LockCoordinator> locks,
                               std::shared_ptr<idempotency::IdempotencyStore> idempotency, BookingPolicy policy,
                               SteadyClockFn steady_clock)
    : repository_(std::move(repository)),
      locks_(std::move(locks)),
      idempotency_(std::move(idempotency)),
      policy_(policy),
      steady_clock_(std::move(steady_clock)) {
}

void BookingManager::Enter(Stage& stage, Stage next, OperationLog& log) {
  stage = next;
  log.EnterStage(StageName(next));
  if (stage_observer_) {
    stage_observer_(next);
  }
}

// ------------------------------------------------------------------
// Discovery
// ------------------------------------------------------------------

DiscoverResult BookingManager::Discover(const DiscoverQuery& query) {
  OperationLog log("discover", query.request_id);
  auto         stage = Stage::kValidating;
  try {
    const auto day = ValidateRequest(query.restaurant_id, query.sector_id, query.date, query.party_size, query.duration_minutes,
                                     query.window_start, query.window_end, policy_);

    Enter(stage, Stage::kDiscovering, log);
    const auto ctx = LoadDay(*repository_, query.restaurant_id, query.sector_id, day, query.window_start, query.window_end);

    Enter(stage, Stage::kSelecting, log);
    DiscoverResult result;
    result.slot_minutes     = policy_.slot_minutes;
    result.duration_minutes = query.duration_minutes;
    result.candidates       = CandidateBuilder::Build(MakeQuery(ctx, query.party_size, query.duration_minutes, policy_));
    if (result.candidates.empty()) {
      throw util::NoCapacity("no table or combination can seat " + std::to_string(query.party_size) + " for " +
                             std::to_string(query.duration_minutes) + " minutes");
    }
    if (query.limit > 0 && result.candidates.size() > query.limit) {
      result.candidates.resize(query.limit);
    }

    Enter(stage, Stage::kDone, log);
    log.Ok("ok");
    return result;
  } catch (const std::exception& e) {
    log.Failed(e, StageName(stage));
    throw;
  }
}

// ------------------------------------------------------------------
// Commit protocol
// ------------------------------------------------------------------

CreateBookingResult BookingManager::CreateBooking(const CreateBookingCommand& command) {
  OperationLog log("create_booking", command.request_id);
  auto         stage = Stage::kValidating;
  try {
    if (IsBlank(command.idempotency_key)) {
      throw util::InvalidInput("idempotency key is required");
    }
    const auto day = ValidateRequest(command.restaurant_id, command.sector_id, command.date, command.party_size, command.duration_minutes,
                                     command.window_start, command.window_end, policy_);

    auto reservation = idempotency_->Reserve(command.idempotency_key, command.Fingerprint(), policy_.lock_timeout);
    if (reservation.replay) {
      Enter(stage, Stage::kDone, log);
      log.Ok("replayed", reservation.replay->id);
      return {*reservation.replay, true};
    }

    Enter(stage, Stage::kDiscovering, log);
    const auto ctx = LoadDay(*repository_, command.restaurant_id, command.sector_id, day, command.window_start, command.window_end);

    Enter(stage, Stage::kSelecting, log);
    const auto best = CandidateSelector::SelectBest(CandidateBuilder::Build(MakeQuery(ctx, command.party_size, command.duration_minutes, policy_)));
    if (!best) {
      throw util::NoCapacity("no table or combination can seat " + std::to_string(command.party_size) + " for " +
                             std::to_string(command.duration_minutes) + " minutes");
    }

    // assignment time runs from the chosen candidate to the persisted reservation
    Enter(stage, Stage::kLocking, log);
    const auto assignment_started = steady_clock_();
    std::vector<std::string> keys;
    keys.reserve(best->table_ids.size());
    for (const auto& table_id : best->table_ids) {
      keys.push_back(lock::LockCoordinator::MakeKey(command.restaurant_id, command.sector_id, table_id, best->interval.start));
    }
    auto held = locks_->AcquireAll(std::move(keys), policy_.lock_timeout);
    if (held.Queued()) {
      Metrics::Instance().ObserveLockWaitMs(static_cast<double>(held.Waited().count()));
    }

    auto booking = Persist(command, *best, stage, log);
    held.Release();

    auto& metrics = Metrics::Instance();
    metrics.RecordBookingCreated();
    metrics.ObserveAssignmentTimeMs(MillisBetween(assignment_started, steady_clock_()));

    reservation.claim.Complete(booking);
    Enter(stage, Stage::kDone, log);
    log.Ok("created", booking.id);
    return {booking, false};
  } catch (const std::exception& e) {
    RecordRejection(e);
    log.Failed(e, StageName(stage));
    throw;
  }
}

void BookingManager::Reverify(db::Transaction& tx, const CreateBookingCommand& command, const model::Candidate& candidate) {
  for (const auto& busy : LoadBusy(*repository_, tx, command.restaurant_id, command.sector_id, candidate.interval)) {
    if (!model::Overlaps(busy.interval, candidate.interval)) {
      continue;
    }
    for (const auto& table_id : candidate.table_ids) {
      if (busy.Covers(table_id)) {
        throw util::NoCapacity("table " + table_id + " was taken before the booking could be written");
      }
    }
  }
}

db::model::BookingRecord BookingManager::Persist(const CreateBookingCommand& command, const model::Candidate& candidate, Stage& stage,
                                                 OperationLog& log) {
  for (int attempt = 1;; ++attempt) {
    try {
      Enter(stage, Stage::kReverifying, log);
      auto tx = repository_->Begin();
      Reverify(*tx, command, candidate);

      Enter(stage, Stage::kPersisting, log);
      const auto now_ms = util::ToUnixMillis(util::Now());
      db::model::BookingRecord record;
      record.id               = util::NewBookingId();
      record.restaurant_id    = command.restaurant_id;
      record.sector_id        = command.sector_id;
      record.table_ids        = candidate.table_ids;
      record.party_size       = command.party_size;
      record.start_ms         = util::ToUnixMillis(candidate.interval.start);
      record.end_ms           = util::ToUnixMillis(candidate.interval.end);
      record.duration_minutes = command.duration_minutes;
      record.status           = woki::model::BookingStatus::kConfirmed;
      record.created_at_ms    = now_ms;
      record.updated_at_ms    = now_ms;

      ThrowIfDbError(repository_->InsertBooking(*tx, record), "insert booking " + record.id);
      tx->Commit();
      return record;
    } catch (const db::TransactionConflict& e) {
      if (attempt >= policy_.max_commit_attempts) {
        throw util::TableLocked(std::string("booking write kept conflicting with concurrent writers: ") + e.what());
      }
      WOKI_LOG_WARN("booking write conflicted, retrying",
                    {observability::IntField("attempt", attempt), observability::StringField("error", e.what())});
    }
  }
}

// ------------------------------------------------------------------
// Lifecycle
// ------------------------------------------------------------------

void BookingManager::CancelBooking(const std::string& booking_id, const std::string& request_id) {
  OperationLog log("cancel_booking", request_id);
  try {
    if (booking_id.empty()) {
      throw util::InvalidInput("booking id is required");
    }

    for (int attempt = 1;; ++attempt) {
      try {
        auto tx      = repository_->Begin();
        auto booking = repository_->GetBooking(*tx, booking_id);
        if (!booking) {
          throw util::NotFound("booking " + booking_id + " not found");
        }
        if (booking->status == woki::model::BookingStatus::kCancelled) {
          tx->Rollback();
          log.Ok("already_cancelled", booking_id);
          return;
        }
        if (!woki::model::CanTransition(booking->status, woki::model::BookingStatus::kCancelled)) {
          throw std::runtime_error("booking " + booking_id + " is in state " + std::string(woki::model::StatusName(booking->status)));
        }

        ThrowIfDbError(repository_->UpdateBookingStatus(*tx, booking_id, woki::model::BookingStatus::kCancelled, util::ToUnixMillis(util::Now())),
                       "cancel booking " + booking_id);
        tx->Commit();
        break;
      } catch (const db::TransactionConflict& e) {
        if (attempt >= policy_.max_commit_attempts) {
          throw util::TableLocked(std::string("cancel kept conflicting with concurrent writers: ") + e.what());
        }
      }
    }

    Metrics::Instance().RecordBookingsCancelled();
    log.Ok("cancelled", booking_id);
  } catch (const std::exception& e) {
    log.Failed(e);
    throw;
  }
}

std::vector<db::model::BookingRecord> BookingManager::ListBookings(const std::string& restaurant_id, const std::string& sector_id,
                                                                   const std::string& date) {
  const auto day = RequestValidation::ParseDate(date);

  auto       tx         = repository_->Begin();
  const auto restaurant = RequireRestaurant(*repository_, *tx, restaurant_id);
  RequireSector(*repository_, *tx, restaurant_id, sector_id);

  const auto range = LocalDay(day, RestaurantZone(restaurant));
  auto bookings = repository_->ListBookings(*tx, restaurant_id, sector_id, util::ToUnixMillis(range.start), util::ToUnixMillis(range.end));
  tx->Rollback();
  return bookings;
}

} // namespace woki::core
