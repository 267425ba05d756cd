#pragma once

#include <cstdint>
#include <map>
#include <mutex>
#include <unordered_map>
#include <vector>

#include "internal/db/api/repository.hpp"

namespace woki::db::memory {

class MemoryTransaction;

class MemoryRepository final : public db::Repository {
public:
  MemoryRepository();

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
  friend class MemoryTransaction;

  struct State {
    std::unordered_map<std::string, model::RestaurantRecord> restaurants;
    std::unordered_map<std::string, std::vector<model::ServiceWindowRecord>> service_windows;
    std::unordered_map<std::string, model::SectorRecord> sectors;
    std::map<std::string, model::TableRecord> tables;
    std::unordered_map<std::string, model::BookingRecord> bookings;
    std::unordered_map<std::string, model::BlackoutRecord> blackouts;
  };

  std::mutex mutex_;
  State      committed_;
  uint64_t   committed_version_ = 0;
};

}
