#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/model/blackout_record.hpp"
#include "internal/db/model/booking_record.hpp"
#include "internal/db/model/inventory_records.hpp"

namespace woki::db {

/*
  Repository abstraction.

  CRITICAL GUARANTEES:

  - All access goes through a Transaction
  - Reads inside a transaction see its writes
  - Range queries use half-open overlap: start < to && end > from
  - Range results are ordered by start, then id

  The DB is the source of truth for:
    inventory (restaurants, sectors, tables, service windows)
    bookings
    blackouts
*/

class Repository {
 public:
  virtual ~Repository() = default;

  // ---------------------------------------------------------------------
  // Transactions
  // ---------------------------------------------------------------------

  virtual std::unique_ptr<Transaction> Begin() = 0;

  // ---------------------------------------------------------------------
  // Inventory
  // ---------------------------------------------------------------------

  virtual Result UpsertRestaurant(Transaction&, const model::RestaurantRecord&) = 0;

  virtual std::optional<model::RestaurantRecord> GetRestaurant(Transaction&, const std::string& id) = 0;

  // Replaces every window of the restaurant.
  virtual Result ReplaceServiceWindows(Transaction&, const std::string& restaurant_id, const std::vector<model::ServiceWindowRecord>&) = 0;

  // Ordered by start.
  virtual std::vector<model::ServiceWindowRecord> ListServiceWindows(Transaction&, const std::string& restaurant_id) = 0;

  virtual Result UpsertSector(Transaction&, const model::SectorRecord&) = 0;

  virtual std::optional<model::SectorRecord> GetSector(Transaction&, const std::string& id) = 0;

  virtual Result UpsertTable(Transaction&, const model::TableRecord&) = 0;

  // Ordered by id.
  virtual std::vector<model::TableRecord> ListTablesInSector(Transaction&, const std::string& sector_id) = 0;

  // ---------------------------------------------------------------------
  // Bookings
  // ---------------------------------------------------------------------

  virtual Result InsertBooking(Transaction&, const model::BookingRecord&) = 0;

  virtual std::optional<model::BookingRecord> GetBooking(Transaction&, const std::string& id) = 0;

  virtual Result UpdateBookingStatus(Transaction&, const std::string& id, woki::model::BookingStatus status, uint64_t updated_at_ms) = 0;

  // Every status; callers filter.
  virtual std::vector<model::BookingRecord> ListBookings(Transaction&, const std::string& restaurant_id, const std::string& sector_id,
                                                         uint64_t from_ms, uint64_t to_ms) = 0;

  // ---------------------------------------------------------------------
  // Blackouts
  // ---------------------------------------------------------------------

  virtual Result InsertBlackout(Transaction&, const model::BlackoutRecord&) = 0;

  virtual std::optional<model::BlackoutRecord> GetBlackout(Transaction&, const std::string& id) = 0;

  // NotFound when the id is unknown.
  virtual Result DeleteBlackout(Transaction&, const std::string& id) = 0;

  virtual std::vector<model::BlackoutRecord> ListBlackouts(Transaction&, const std::string& restaurant_id, const std::string& sector_id,
                                                           uint64_t from_ms, uint64_t to_ms) = 0;
};

} // namespace woki::db
