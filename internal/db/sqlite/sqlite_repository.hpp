#pragma once

#include <memory>

#include "internal/db/api/repository.hpp"
#include "sqlite_db.hpp"
#include "sqlite_tx.hpp"

namespace woki::db::sqlite {

class SqliteRepository final : public db::Repository {
public:
  explicit SqliteRepository(std::shared_ptr<SqliteDB> db);

  std::unique_ptr<Transaction> Begin() override;

  Result UpsertRestaurant(Transaction&, const model::RestaurantRecord&) override;
  std::optional<model::RestaurantRecord> GetRestaurant(Transaction&, const std::string&) override;
  Result ReplaceServiceWindows(Transaction&, const std::string& restaurant_id,
                               const std::vector<model::ServiceWindowRecord>&) override;
  std::vector<model::ServiceWindowRecord> ListServiceWindows(Transaction&, const std::string& restaurant_id) override;
  Result UpsertSector(Transaction&, const model::SectorRecord&) override;
  std::optional<model::SectorRecord> GetSector(Transaction&, const std::string&) override;
  Result UpsertTable(Transaction&, const model::TableRecord&) override;
  std::vector<model::TableRecord> ListTablesInSector(Transaction&, const std::string& sector_id) override;

  Result InsertBooking(Transaction&, const model::BookingRecord&) override;
  std::optional<model::BookingRecord> GetBooking(Transaction&, const std::string&) override;
  Result UpdateBookingStatus(Transaction&, const std::string& id, woki::model::BookingStatus status,
                             uint64_t updated_at_ms) override;
  std::vector<model::BookingRecord> ListBookings(Transaction&, const std::string& restaurant_id,
                                                 const std::string& sector_id, uint64_t from_ms,
                                                 uint64_t to_ms) override;

  Result InsertBlackout(Transaction&, const model::BlackoutRecord&) override;
  std::optional<model::BlackoutRecord> GetBlackout(Transaction&, const std::string&) override;
  Result DeleteBlackout(Transaction&, const std::string&) override;
  std::vector<model::BlackoutRecord> ListBlackouts(Transaction&, const std::string& restaurant_id,
                                                   const std::string& sector_id, uint64_t from_ms,
                                                   uint64_t to_ms) override;

private:
  std::shared_ptr<SqliteDB> db_;

  static SqliteTransaction& TX(Transaction& t);
  static Result Translate(sqlite3* db, int rc);
};

}
