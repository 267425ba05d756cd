#pragma once

#include <absl/time/civil_time.h>
#include <absl/time/time.h>

#include <chrono>
#include <cstdint>
#include <exception>
#include <string>
#include <string_view>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/observability/spans.hpp"
#include "internal/model/busy_interval.hpp"
#include "internal/model/table.hpp"
#include "internal/model/time_interval.hpp"

namespace woki::core {

// Maps a failed repository Result onto the exception taxonomy.
void ThrowIfDbError(const db::Result& result, const std::string& context);

// NotFound when unknown.
db::model::RestaurantRecord RequireRestaurant(db::Repository& repo, db::Transaction& tx, const std::string& restaurant_id);

// NotFound when unknown or owned by another restaurant.
db::model::SectorRecord RequireSector(db::Repository& repo, db::Transaction& tx, const std::string& restaurant_id,
                                      const std::string& sector_id);

// Empty timezone means UTC.
absl::TimeZone RestaurantZone(const db::model::RestaurantRecord& restaurant);

model::TimeInterval LocalDay(absl::CivilDay day, const absl::TimeZone& zone);

std::vector<model::Table> ToTables(const std::vector<db::model::TableRecord>& records);

/*
  Confirmed bookings and blackouts of one sector overlapping range.
  Cancelled bookings never occupy a table.
*/
std::vector<model::BusyInterval> LoadBusy(db::Repository& repo, db::Transaction& tx, const std::string& restaurant_id,
                                          const std::string& sector_id, const model::TimeInterval& range);

model::TimeInterval ToInterval(std::uint64_t start_ms, std::uint64_t end_ms);

// Caller-supplied request id, or a fresh one.
std::string EnsureRequestId(const std::string& request_id);

/*
  One log line per operation outcome:

    op=create_booking request_id=... outcome=ok duration_ms=1.234 id=BK_...
    op=create_booking request_id=... outcome=rejected duration_ms=... stage=locking error=table_locked

  The operation runs inside a "woki.<op>" span, and its outcome and latency
  are recorded through MetricExporter.
*/
class OperationLog {
 public:
  OperationLog(std::string_view op, std::string request_id);

  void Ok(std::string_view outcome = "ok", std::string_view id = {});
  void Failed(const std::exception& e, std::string_view stage = {});

  // Debug line plus a span event.
  void EnterStage(std::string_view stage);

  const std::string& RequestId() const {
    return request_id_;
  }

  double ElapsedMs() const;

 private:
  std::string                           op_;
  std::string                           request_id_;
  std::chrono::steady_clock::time_point started_;
  observability::SpanScope              span_;
};

} // namespace woki::core
