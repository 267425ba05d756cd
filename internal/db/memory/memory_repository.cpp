#include "memory_repository.hpp"

#include <algorithm>

#include "memory_tx.hpp"

namespace woki::db::memory {

namespace {

bool OverlapsRange(uint64_t start_ms, uint64_t end_ms, uint64_t from_ms, uint64_t to_ms) {
  return start_ms < to_ms && end_ms > from_ms;
}

template <typename Record>
void SortByStartThenId(std::vector<Record>& records) {
  std::sort(records.begin(), records.end(), [](const Record& a, const Record& b) {
    if (a.start_ms != b.start_ms) return a.start_ms < b.start_ms;
    return a.id < b.id;
  });
}

} // namespace

MemoryRepository::MemoryRepository() = default;

std::unique_ptr<db::Transaction> MemoryRepository::Begin() {
  return std::make_unique<MemoryTransaction>(*this);
}

static MemoryTransaction& TX(db::Transaction& tx) {
  return static_cast<MemoryTransaction&>(tx);
}

// ------------------------------------------------------------------
// Inventory
// ------------------------------------------------------------------

Result MemoryRepository::UpsertRestaurant(Transaction& t, const model::RestaurantRecord& r) {
  TX(t).Mutable().restaurants[r.id] = r;
  return Result::Ok();
}

std::optional<model::RestaurantRecord> MemoryRepository::GetRestaurant(Transaction& t, const std::string& id) {
  const auto& s  = TX(t).View();
  auto        it = s.restaurants.find(id);
  if (it == s.restaurants.end()) return std::nullopt;
  return it->second;
}

Result MemoryRepository::ReplaceServiceWindows(Transaction& t, const std::string& restaurant_id,
                                               const std::vector<model::ServiceWindowRecord>& windows) {
  auto& s = TX(t).Mutable();
  if (!s.restaurants.contains(restaurant_id)) return Result::Err(ErrorCode::NotFound, "restaurant " + restaurant_id);
  auto& stored = s.service_windows[restaurant_id];
  stored       = windows;
  for (auto& w : stored) w.restaurant_id = restaurant_id;
  std::sort(stored.begin(), stored.end(), [](const auto& a, const auto& b) { return a.start < b.start; });
  return Result::Ok();
}

std::vector<model::ServiceWindowRecord> MemoryRepository::ListServiceWindows(Transaction& t, const std::string& restaurant_id) {
  const auto& s  = TX(t).View();
  auto        it = s.service_windows.find(restaurant_id);
  if (it == s.service_windows.end()) return {};
  return it->second;
}

Result MemoryRepository::UpsertSector(Transaction& t, const model::SectorRecord& r) {
  auto& s = TX(t).Mutable();
  if (!s.restaurants.contains(r.restaurant_id)) return Result::Err(ErrorCode::ConstraintViolation, "restaurant " + r.restaurant_id);
  s.sectors[r.id] = r;
  return Result::Ok();
}

std::optional<model::SectorRecord> MemoryRepository::GetSector(Transaction& t, const std::string& id) {
  const auto& s  = TX(t).View();
  auto        it = s.sectors.find(id);
  if (it == s.sectors.end()) return std::nullopt;
  return it->second;
}

Result MemoryRepository::UpsertTable(Transaction& t, const model::TableRecord& r) {
  auto& s = TX(t).Mutable();
  if (!s.sectors.contains(r.sector_id)) return Result::Err(ErrorCode::ConstraintViolation, "sector " + r.sector_id);
  s.tables[r.id] = r;
  return Result::Ok();
}

std::vector<model::TableRecord> MemoryRepository::ListTablesInSector(Transaction& t, const std::string& sector_id) {
  std::vector<model::TableRecord> out;
  for (const auto& [_, table] : TX(t).View().tables)
    if (table.sector_id == sector_id) out.push_back(table);
  return out;
}

// ------------------------------------------------------------------
// Bookings
// ------------------------------------------------------------------

Result MemoryRepository::InsertBooking(Transaction& t, const model::BookingRecord& r) {
  auto& s = TX(t).Mutable();
  if (s.bookings.contains(r.id)) return Result::Err(ErrorCode::AlreadyExists, "booking " + r.id);
  s.bookings[r.id] = r;
  return Result::Ok();
}

std::optional<model::BookingRecord> MemoryRepository::GetBooking(Transaction& t, const std::string& id) {
  const auto& s  = TX(t).View();
  auto        it = s.bookings.find(id);
  if (it == s.bookings.end()) return std::nullopt;
  return it->second;
}

Result MemoryRepository::UpdateBookingStatus(Transaction& t, const std::string& id, woki::model::BookingStatus status,
                                             uint64_t updated_at_ms) {
  auto& s  = TX(t).Mutable();
  auto  it = s.bookings.find(id);
  if (it == s.bookings.end()) return Result::Err(ErrorCode::NotFound, "booking " + id);
  it->second.status        = status;
  it->second.updated_at_ms = updated_at_ms;
  return Result::Ok();
}

std::vector<model::BookingRecord> MemoryRepository::ListBookings(Transaction& t, const std::string& restaurant_id,
                                                                 const std::string& sector_id, uint64_t from_ms, uint64_t to_ms) {
  std::vector<model::BookingRecord> out;
  for (const auto& [_, b] : TX(t).View().bookings) {
    if (b.restaurant_id == restaurant_id && b.sector_id == sector_id && OverlapsRange(b.start_ms, b.end_ms, from_ms, to_ms)) {
      out.push_back(b);
    }
  }
  SortByStartThenId(out);
  return out;
}

// ------------------------------------------------------------------
// Blackouts
// ------------------------------------------------------------------

Result MemoryRepository::InsertBlackout(Transaction& t, const model::BlackoutRecord& r) {
  auto& s = TX(t).Mutable();
  if (s.blackouts.contains(r.id)) return Result::Err(ErrorCode::AlreadyExists, "blackout " + r.id);
  s.blackouts[r.id] = r;
  return Result::Ok();
}

std::optional<model::BlackoutRecord> MemoryRepository::GetBlackout(Transaction& t, const std::string& id) {
  const auto& s  = TX(t).View();
  auto        it = s.blackouts.find(id);
  if (it == s.blackouts.end()) return std::nullopt;
  return it->second;
}

Result MemoryRepository::DeleteBlackout(Transaction& t, const std::string& id) {
  if (TX(t).Mutable().blackouts.erase(id) == 0) return Result::Err(ErrorCode::NotFound, "blackout " + id);
  return Result::Ok();
}

std::vector<model::BlackoutRecord> MemoryRepository::ListBlackouts(Transaction& t, const std::string& restaurant_id,
                                                                   const std::string& sector_id, uint64_t from_ms, uint64_t to_ms) {
  std::vector<model::BlackoutRecord> out;
  for (const auto& [_, b] : TX(t).View().blackouts) {
    if (b.restaurant_id == restaurant_id && b.sector_id == sector_id && OverlapsRange(b.start_ms, b.end_ms, from_ms, to_ms)) {
      out.push_back(b);
    }
  }
  SortByStartThenId(out);
  return out;
}

} // namespace woki::db::memory
