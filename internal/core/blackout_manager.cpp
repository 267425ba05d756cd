#include "internal/core/blackout_manager.hpp"

#include <algorithm>
#include <set>
#include <utility>

#include "internal/core/operation_support.hpp"
#include "internal/core/request_validation.hpp"
#include "internal/observability/metrics.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/uuid.hpp"

namespace woki::core {

namespace {

bool IsKnownReason(db::model::BlackoutReason reason) {
  switch (reason) {
    case db::model::BlackoutReason::kMaintenance:
    case db::model::BlackoutReason::kPrivateEvent:
    case db::model::BlackoutReason::kOther:
      return true;
    default:
      return false;
  }
}

void ValidateCommand(const CreateBlackoutCommand& command) {
  if (command.restaurant_id.empty() || command.sector_id.empty()) {
    throw util::InvalidInput("restaurantId and sectorId are required");
  }
  if (!(command.start < command.end)) {
    throw util::InvalidInput("blackout start must be before end");
  }
  if (!IsKnownReason(command.reason)) {
    throw util::InvalidInput("blackout reason must be MAINTENANCE, PRIVATE_EVENT or OTHER");
  }
}

std::vector<std::string> NormalizeTableIds(std::vector<std::string> ids) {
  std::sort(ids.begin(), ids.end());
  ids.erase(std::unique(ids.begin(), ids.end()), ids.end());
  return ids;
}

} // namespace

BlackoutManager::BlackoutManager(std::shared_ptr<db::Repository> repository, int max_commit_attempts)
    : repository_(std::move(repository)), max_commit_attempts_(max_commit_attempts) {
}

CreateBlackoutResult BlackoutManager::CreateBlackout(const CreateBlackoutCommand& command) {
  OperationLog log("create_blackout", command.request_id);
  try {
    ValidateCommand(command);
    const auto table_ids = NormalizeTableIds(command.table_ids);

    for (int attempt = 1;; ++attempt) {
      try {
        auto tx = repository_->Begin();
        RequireRestaurant(*repository_, *tx, command.restaurant_id);
        RequireSector(*repository_, *tx, command.restaurant_id, command.sector_id);

        std::set<std::string> sector_tables;
        for (const auto& table : repository_->ListTablesInSector(*tx, command.sector_id)) {
          sector_tables.insert(table.id);
        }
        for (const auto& id : table_ids) {
          if (!sector_tables.contains(id)) {
            throw util::NotFound("table " + id + " not found in sector " + command.sector_id);
          }
        }

        const auto now_ms = util::ToUnixMillis(util::Now());

        CreateBlackoutResult result;
        auto&                blackout = result.blackout;
        blackout.id                   = util::NewBlackoutId();
        blackout.restaurant_id        = command.restaurant_id;
        blackout.sector_id            = command.sector_id;
        blackout.table_ids            = table_ids;
        blackout.start_ms             = util::ToUnixMillis(command.start);
        blackout.end_ms               = util::ToUnixMillis(command.end);
        blackout.reason               = command.reason;
        blackout.notes                = command.notes;
        blackout.created_at_ms        = now_ms;
        blackout.updated_at_ms        = now_ms;
        ThrowIfDbError(repository_->InsertBlackout(*tx, blackout), "insert blackout " + blackout.id);

        const model::BusyInterval covered{table_ids, ToInterval(blackout.start_ms, blackout.end_ms), model::BusyKind::kBlackout};
        for (const auto& booking : repository_->ListBookings(*tx, command.restaurant_id, command.sector_id, blackout.start_ms, blackout.end_ms)) {
          if (booking.status != woki::model::BookingStatus::kConfirmed) {
            continue;
          }
          const bool affected =
              std::any_of(booking.table_ids.begin(), booking.table_ids.end(), [&](const std::string& id) { return covered.Covers(id); });
          if (!affected) {
            continue;
          }
          ThrowIfDbError(repository_->UpdateBookingStatus(*tx, booking.id, woki::model::BookingStatus::kCancelled, now_ms),
                         "cancel booking " + booking.id);
          result.cancelled_booking_ids.push_back(booking.id);
        }

        tx->Commit();

        if (!result.cancelled_booking_ids.empty()) {
          observability::Metrics::Instance().RecordBookingsCancelled(result.cancelled_booking_ids.size());
        }
        log.Ok("created", blackout.id);
        return result;
      } catch (const db::TransactionConflict& e) {
        if (attempt >= max_commit_attempts_) {
          throw util::TableLocked(std::string("blackout write kept conflicting with concurrent writers: ") + e.what());
        }
      }
    }
  } catch (const std::exception& e) {
    log.Failed(e);
    throw;
  }
}

std::vector<db::model::BlackoutRecord> BlackoutManager::ListBlackouts(const std::string& restaurant_id, const std::string& sector_id,
                                                                      const std::string& date) {
  const auto day = RequestValidation::ParseDate(date);

  auto       tx         = repository_->Begin();
  const auto restaurant = RequireRestaurant(*repository_, *tx, restaurant_id);
  RequireSector(*repository_, *tx, restaurant_id, sector_id);

  const auto range = LocalDay(day, RestaurantZone(restaurant));
  auto blackouts = repository_->ListBlackouts(*tx, restaurant_id, sector_id, util::ToUnixMillis(range.start), util::ToUnixMillis(range.end));
  tx->Rollback();
  return blackouts;
}

void BlackoutManager::DeleteBlackout(const std::string& blackout_id, const std::string& request_id) {
  OperationLog log("delete_blackout", request_id);
  try {
    for (int attempt = 1;; ++attempt) {
      try {
        auto tx = repository_->Begin();
        ThrowIfDbError(repository_->DeleteBlackout(*tx, blackout_id), "delete blackout");
        tx->Commit();
        break;
      } catch (const db::TransactionConflict& e) {
        if (attempt >= max_commit_attempts_) {
          throw util::TableLocked(std::string("blackout delete kept conflicting with concurrent writers: ") + e.what());
        }
      }
    }
    log.Ok("deleted", blackout_id);
  } catch (const std::exception& e) {
    log.Failed(e);
    throw;
  }
}

} // namespace woki::core
