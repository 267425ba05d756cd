#include "internal/core/operation_support.hpp"

#include <stdexcept>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/local_time.hpp"
#include "internal/util/uuid.hpp"

namespace woki::core {

using namespace woki::observability;

void ThrowIfDbError(const db::Result& result, const std::string& context) {
  if (result) {
    return;
  }

  const auto message = result.message.empty() ? context : context + ": " + result.message;
  switch (result.code) {
    case db::ErrorCode::NotFound:
      throw util::NotFound(message);
    case db::ErrorCode::Busy:
    case db::ErrorCode::Conflict:
      throw db::TransactionConflict(message);
    default:
      throw std::runtime_error(message);
  }
}

db::model::RestaurantRecord RequireRestaurant(db::Repository& repo, db::Transaction& tx, const std::string& restaurant_id) {
  auto restaurant = repo.GetRestaurant(tx, restaurant_id);
  if (!restaurant) {
    throw util::NotFound("restaurant " + restaurant_id + " not found");
  }
  return *restaurant;
}

db::model::SectorRecord RequireSector(db::Repository& repo, db::Transaction& tx, const std::string& restaurant_id,
                                      const std::string& sector_id) {
  auto sector = repo.GetSector(tx, sector_id);
  if (!sector || sector->restaurant_id != restaurant_id) {
    throw util::NotFound("sector " + sector_id + " not found in restaurant " + restaurant_id);
  }
  return *sector;
}

absl::TimeZone RestaurantZone(const db::model::RestaurantRecord& restaurant) {
  if (restaurant.timezone.empty()) {
    return absl::UTCTimeZone();
  }
  return util::LoadZone(restaurant.timezone);
}

model::TimeInterval LocalDay(absl::CivilDay day, const absl::TimeZone& zone) {
  auto [start, end] = util::LocalDayRange(day, zone);
  return {start, end};
}

std::vector<model::Table> ToTables(const std::vector<db::model::TableRecord>& records) {
  std::vector<model::Table> tables;
  tables.reserve(records.size());
  for (const auto& r : records) {
    tables.push_back({r.id, r.min_size, r.max_size});
  }
  return tables;
}

model::TimeInterval ToInterval(std::uint64_t start_ms, std::uint64_t end_ms) {
  return {util::FromUnixMillis(start_ms), util::FromUnixMillis(end_ms)};
}

std::vector<model::BusyInterval> LoadBusy(db::Repository& repo, db::Transaction& tx, const std::string& restaurant_id,
                                          const std::string& sector_id, const model::TimeInterval& range) {
  const auto from_ms = util::ToUnixMillis(range.start);
  const auto to_ms   = util::ToUnixMillis(range.end);

  std::vector<model::BusyInterval> busy;
  for (const auto& booking : repo.ListBookings(tx, restaurant_id, sector_id, from_ms, to_ms)) {
    if (booking.status != woki::model::BookingStatus::kConfirmed) {
      continue;
    }
    busy.push_back({booking.table_ids, ToInterval(booking.start_ms, booking.end_ms), model::BusyKind::kBooking});
  }
  for (const auto& blackout : repo.ListBlackouts(tx, restaurant_id, sector_id, from_ms, to_ms)) {
    busy.push_back({blackout.table_ids, ToInterval(blackout.start_ms, blackout.end_ms), model::BusyKind::kBlackout});
  }
  return busy;
}

std::string EnsureRequestId(const std::string& request_id) {
  if (!request_id.empty()) {
    return request_id;
  }
  return util::ToString(util::GenerateUUID());
}

// ------------------------------------------------------------------
// OperationLog
// ------------------------------------------------------------------

OperationLog::OperationLog(std::string_view op, std::string request_id)
    : op_(op), request_id_(EnsureRequestId(request_id)), started_(std::chrono::steady_clock::now()), span_("woki." + op_) {
  span_.SetAttribute("request_id", request_id_);
}

double OperationLog::ElapsedMs() const {
  return std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started_).count();
}

void OperationLog::EnterStage(std::string_view stage) {
  WOKI_LOG_DEBUG("operation stage", {StringField("op", op_), StringField("request_id", request_id_), StringField("stage", stage),
                                     DoubleField("elapsed_ms", ElapsedMs())});
  span_.AddEvent(stage);
}

void OperationLog::Ok(std::string_view outcome, std::string_view id) {
  const auto elapsed = ElapsedMs();
  span_.SetAttribute("outcome", outcome);
  MetricExporter::Instance().RecordOperation(op_, outcome, elapsed);

  if (id.empty()) {
    WOKI_LOG_INFO("operation finished", {StringField("op", op_), StringField("request_id", request_id_), StringField("outcome", outcome),
                                         DoubleField("duration_ms", elapsed)});
    return;
  }
  span_.SetAttribute("id", id);
  WOKI_LOG_INFO("operation finished", {StringField("op", op_), StringField("request_id", request_id_), StringField("outcome", outcome),
                                       DoubleField("duration_ms", elapsed), StringField("id", id)});
}

void OperationLog::Failed(const std::exception& e, std::string_view stage) {
  const auto elapsed = ElapsedMs();
  const auto code    = util::ErrorCodeName(e);
  const auto outcome = code == "internal" ? "error" : "rejected";

  span_.RecordException(e.what());
  span_.SetAttribute("error", code);
  MetricExporter::Instance().RecordOperation(op_, outcome, elapsed);

  if (code == "internal") {
    WOKI_LOG_ERROR("operation failed", {StringField("op", op_), StringField("request_id", request_id_), StringField("outcome", outcome),
                                        DoubleField("duration_ms", elapsed), StringField("stage", stage), StringField("error", code),
                                        StringField("message", e.what())});
    return;
  }
  WOKI_LOG_INFO("operation finished", {StringField("op", op_), StringField("request_id", request_id_), StringField("outcome", outcome),
                                       DoubleField("duration_ms", elapsed), StringField("stage", stage), StringField("error", code),
                                       StringField("message", e.what())});
}

} // namespace woki::core
