#include "sqlite_repository.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <sqlite3.h>

#include <stdexcept>

namespace woki::db::sqlite {

using woki::db::ErrorCode;
using woki::db::Result;

namespace {

struct StmtDeleter {
  void operator()(sqlite3_stmt* st) const {
    sqlite3_finalize(st);
  }
};
using Stmt = std::unique_ptr<sqlite3_stmt, StmtDeleter>;

Stmt Prepare(sqlite3* db, const char* sql) {
  sqlite3_stmt* st = nullptr;
  if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK) {
    throw std::runtime_error(std::string("sqlite prepare: ") + sqlite3_errmsg(db));
  }
  return Stmt(st);
}

void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
  sqlite3_bind_text(st, idx, s.c_str(), -1, SQLITE_TRANSIENT);
}

void BindU64(sqlite3_stmt* st, int idx, uint64_t v) {
  sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

void BindI32(sqlite3_stmt* st, int idx, int v) {
  sqlite3_bind_int(st, idx, v);
}

std::string ColText(sqlite3_stmt* st, int col) {
  const unsigned char* t = sqlite3_column_text(st, col);
  return t ? reinterpret_cast<const char*>(t) : "";
}

uint64_t ColU64(sqlite3_stmt* st, int col) {
  return static_cast<uint64_t>(sqlite3_column_int64(st, col));
}

int ColI32(sqlite3_stmt* st, int col) {
  return sqlite3_column_int(st, col);
}

// Table id lists are stored as JSON arrays of strings.
std::string EncodeIds(const std::vector<std::string>& ids) {
  google::protobuf::ListValue list;
  for (const auto& id : ids) {
    list.add_values()->set_string_value(id);
  }
  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(list, &json);
  if (!status.ok()) {
    throw std::runtime_error("encode table ids: " + status.ToString());
  }
  return json;
}

std::vector<std::string> DecodeIds(const std::string& json) {
  google::protobuf::ListValue list;
  auto                        status = google::protobuf::util::JsonStringToMessage(json, &list);
  if (!status.ok()) {
    throw std::runtime_error("decode table ids: " + status.ToString());
  }
  std::vector<std::string> ids;
  ids.reserve(list.values_size());
  for (const auto& v : list.values()) {
    ids.push_back(v.string_value());
  }
  return ids;
}

constexpr const char* kBookingColumns =
    "id,restaurant_id,sector_id,table_ids,party_size,start_ms,end_ms,duration_minutes,status,created_at_ms,updated_at_ms";

model::BookingRecord ReadBooking(sqlite3_stmt* st) {
  model::BookingRecord r;
  r.id               = ColText(st, 0);
  r.restaurant_id    = ColText(st, 1);
  r.sector_id        = ColText(st, 2);
  r.table_ids        = DecodeIds(ColText(st, 3));
  r.party_size       = static_cast<uint32_t>(ColI32(st, 4));
  r.start_ms         = ColU64(st, 5);
  r.end_ms           = ColU64(st, 6);
  r.duration_minutes = static_cast<uint32_t>(ColI32(st, 7));
  r.status           = static_cast<woki::model::BookingStatus>(ColI32(st, 8));
  r.created_at_ms    = ColU64(st, 9);
  r.updated_at_ms    = ColU64(st, 10);
  return r;
}

constexpr const char* kBlackoutColumns =
    "id,restaurant_id,sector_id,table_ids,start_ms,end_ms,reason,notes,created_at_ms,updated_at_ms";

model::BlackoutRecord ReadBlackout(sqlite3_stmt* st) {
  model::BlackoutRecord r;
  r.id            = ColText(st, 0);
  r.restaurant_id = ColText(st, 1);
  r.sector_id     = ColText(st, 2);
  r.table_ids     = DecodeIds(ColText(st, 3));
  r.start_ms      = ColU64(st, 4);
  r.end_ms        = ColU64(st, 5);
  r.reason        = static_cast<model::BlackoutReason>(ColI32(st, 6));
  r.notes         = ColText(st, 7);
  r.created_at_ms = ColU64(st, 8);
  r.updated_at_ms = ColU64(st, 9);
  return r;
}

} // namespace

SqliteRepository::SqliteRepository(std::shared_ptr<SqliteDB> db)
    : db_(std::move(db)) {}

std::unique_ptr<db::Transaction> SqliteRepository::Begin() {
    return std::make_unique<SqliteTransaction>(db_);
}

SqliteTransaction& SqliteRepository::TX(Transaction& t) {
    return static_cast<SqliteTransaction&>(t);
}

Result SqliteRepository::Translate(sqlite3* db, int rc) {
    if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW)
        return Result::Ok();

    switch (rc & 0xFF) {
        case SQLITE_BUSY:
        case SQLITE_LOCKED:
            return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
        case SQLITE_CONSTRAINT:
            // sqlite3_step reports the primary code; the extended one names the constraint
            if (const int ext = sqlite3_extended_errcode(db); ext == SQLITE_CONSTRAINT_PRIMARYKEY || ext == SQLITE_CONSTRAINT_UNIQUE)
                return Result::Err(ErrorCode::AlreadyExists, sqlite3_errmsg(db));
            return Result::Err(ErrorCode::ConstraintViolation, sqlite3_errmsg(db));
        case SQLITE_IOERR:
            return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db));
        case SQLITE_CORRUPT:
            return Result::Err(ErrorCode::Corruption, sqlite3_errmsg(db));
        default:
            return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
    }
}

// ------------------------------------------------------------------
// Inventory
// ------------------------------------------------------------------

Result SqliteRepository::UpsertRestaurant(Transaction& t, const model::RestaurantRecord& r) {
    auto* db = TX(t).Handle();
    auto  st = Prepare(db,
        "INSERT INTO restaurants(id,name,timezone) VALUES(?,?,?) "
        "ON CONFLICT(id) DO UPDATE SET name=excluded.name, timezone=excluded.timezone;");

    BindText(st.get(), 1, r.id);
    BindText(st.get(), 2, r.name);
    BindText(st.get(), 3, r.timezone);
    return Translate(db, sqlite3_step(st.get()));
}

std::optional<model::RestaurantRecord> SqliteRepository::GetRestaurant(Transaction& t, const std::string& id) {
    auto* db = TX(t).Handle();
    auto  st = Prepare(db, "SELECT id,name,timezone FROM restaurants WHERE id=?;");
    BindText(st.get(), 1, id);

    if (sqlite3_step(st.get()) != SQLITE_ROW) return std::nullopt;

    model::RestaurantRecord r;
    r.id       = ColText(st.get(), 0);
    r.name     = ColText(st.get(), 1);
    r.timezone = ColText(st.get(), 2);
    return r;
}

Result SqliteRepository::ReplaceServiceWindows(Transaction& t, const std::string& restaurant_id,
                                               const std::vector<model::ServiceWindowRecord>& windows) {
    auto* db = TX(t).Handle();
    if (!GetRestaurant(t, restaurant_id)) return Result::Err(ErrorCode::NotFound, "restaurant " + restaurant_id);

    auto del = Prepare(db, "DELETE FROM service_windows WHERE restaurant_id=?;");
    BindText(del.get(), 1, restaurant_id);
    if (auto res = Translate(db, sqlite3_step(del.get())); !res) return res;

    for (const auto& w : windows) {
        auto st = Prepare(db, "INSERT INTO service_windows(restaurant_id,start_time,end_time) VALUES(?,?,?);");
        BindText(st.get(), 1, restaurant_id);
        BindText(st.get(), 2, w.start);
        BindText(st.get(), 3, w.end);
        if (auto res = Translate(db, sqlite3_step(st.get())); !res) return res;
    }
    return Result::Ok();
}

std::vector<model::ServiceWindowRecord> SqliteRepository::ListServiceWindows(Transaction& t, const std::string& restaurant_id) {
    auto* db = TX(t).Handle();
    auto  st = Prepare(db, "SELECT restaurant_id,start_time,end_time FROM service_windows WHERE restaurant_id=? ORDER BY start_time;");
    BindText(st.get(), 1, restaurant_id);

    std::vector<model::ServiceWindowRecord> out;
    while (sqlite3_step(st.get()) == SQLITE_ROW) {
        out.push_back({ColText(st.get(), 0), ColText(st.get(), 1), ColText(st.get(), 2)});
    }
    return out;
}

Result SqliteRepository::UpsertSector(Transaction& t, const model::SectorRecord& r) {
    auto* db = TX(t).Handle();
    auto  st = Prepare(db,
        "INSERT INTO sectors(id,restaurant_id,name) VALUES(?,?,?) "
        "ON CONFLICT(id) DO UPDATE SET restaurant_id=excluded.restaurant_id, name=excluded.name;");

    BindText(st.get(), 1, r.id);
    BindText(st.get(), 2, r.restaurant_id);
    BindText(st.get(), 3, r.name);
    return Translate(db, sqlite3_step(st.get()));
}

std::optional<model::SectorRecord> SqliteRepository::GetSector(Transaction& t, const std::string& id) {
    auto* db = TX(t).Handle();
    auto  st = Prepare(db, "SELECT id,restaurant_id,name FROM sectors WHERE id=?;");
    BindText(st.get(), 1, id);

    if (sqlite3_step(st.get()) != SQLITE_ROW) return std::nullopt;
    return model::SectorRecord{ColText(st.get(), 0), ColText(st.get(), 1), ColText(st.get(), 2)};
}

Result SqliteRepository::UpsertTable(Transaction& t, const model::TableRecord& r) {
    auto* db = TX(t).Handle();
    auto  st = Prepare(db,
        "INSERT INTO dining_tables(id,sector_id,name,min_size,max_size) VALUES(?,?,?,?,?) "
        "ON CONFLICT(id) DO UPDATE SET sector_id=excluded.sector_id, name=excluded.name, "
        "min_size=excluded.min_size, max_size=excluded.max_size;");

    BindText(st.get(), 1, r.id);
    BindText(st.get(), 2, r.sector_id);
    BindText(st.get(), 3, r.name);
    BindI32(st.get(), 4, static_cast<int>(r.min_size));
    BindI32(st.get(), 5, static_cast<int>(r.max_size));
    return Translate(db, sqlite3_step(st.get()));
}

std::vector<model::TableRecord> SqliteRepository::ListTablesInSector(Transaction& t, const std::string& sector_id) {
    auto* db = TX(t).Handle();
    auto  st = Prepare(db, "SELECT id,sector_id,name,min_size,max_size FROM dining_tables WHERE sector_id=? ORDER BY id;");
    BindText(st.get(), 1, sector_id);

    std::vector<model::TableRecord> out;
    while (sqlite3_step(st.get()) == SQLITE_ROW) {
        model::TableRecord r;
        r.id        = ColText(st.get(), 0);
        r.sector_id = ColText(st.get(), 1);
        r.name      = ColText(st.get(), 2);
        r.min_size  = static_cast<uint32_t>(ColI32(st.get(), 3));
        r.max_size  = static_cast<uint32_t>(ColI32(st.get(), 4));
        out.push_back(std::move(r));
    }
    return out;
}

// ------------------------------------------------------------------
// Bookings
// ------------------------------------------------------------------

Result SqliteRepository::InsertBooking(Transaction& t, const model::BookingRecord& r) {
    auto* db = TX(t).Handle();
    auto  st = Prepare(db,
        "INSERT INTO bookings(id,restaurant_id,sector_id,table_ids,party_size,start_ms,end_ms,"
        "duration_minutes,status,created_at_ms,updated_at_ms) VALUES(?,?,?,?,?,?,?,?,?,?,?);");

    BindText(st.get(), 1, r.id);
    BindText(st.get(), 2, r.restaurant_id);
    BindText(st.get(), 3, r.sector_id);
    BindText(st.get(), 4, EncodeIds(r.table_ids));
    BindI32(st.get(), 5, static_cast<int>(r.party_size));
    BindU64(st.get(), 6, r.start_ms);
    BindU64(st.get(), 7, r.end_ms);
    BindI32(st.get(), 8, static_cast<int>(r.duration_minutes));
    BindI32(st.get(), 9, static_cast<int>(r.status));
    BindU64(st.get(), 10, r.created_at_ms);
    BindU64(st.get(), 11, r.updated_at_ms);
    return Translate(db, sqlite3_step(st.get()));
}

std::optional<model::BookingRecord> SqliteRepository::GetBooking(Transaction& t, const std::string& id) {
    auto*       db  = TX(t).Handle();
    std::string sql = std::string("SELECT ") + kBookingColumns + " FROM bookings WHERE id=?;";
    auto        st  = Prepare(db, sql.c_str());
    BindText(st.get(), 1, id);

    if (sqlite3_step(st.get()) != SQLITE_ROW) return std::nullopt;
    return ReadBooking(st.get());
}

Result SqliteRepository::UpdateBookingStatus(Transaction& t, const std::string& id, woki::model::BookingStatus status,
                                             uint64_t updated_at_ms) {
    auto* db = TX(t).Handle();
    auto  st = Prepare(db, "UPDATE bookings SET status=?,updated_at_ms=? WHERE id=?;");
    BindI32(st.get(), 1, static_cast<int>(status));
    BindU64(st.get(), 2, updated_at_ms);
    BindText(st.get(), 3, id);

    if (auto res = Translate(db, sqlite3_step(st.get())); !res) return res;
    if (sqlite3_changes(db) == 0) return Result::Err(ErrorCode::NotFound, "booking " + id);
    return Result::Ok();
}

std::vector<model::BookingRecord> SqliteRepository::ListBookings(Transaction& t, const std::string& restaurant_id,
                                                                 const std::string& sector_id, uint64_t from_ms, uint64_t to_ms) {
    auto*       db  = TX(t).Handle();
    std::string sql = std::string("SELECT ") + kBookingColumns +
                      " FROM bookings WHERE restaurant_id=? AND sector_id=? AND start_ms<? AND end_ms>? ORDER BY start_ms,id;";
    auto st = Prepare(db, sql.c_str());
    BindText(st.get(), 1, restaurant_id);
    BindText(st.get(), 2, sector_id);
    BindU64(st.get(), 3, to_ms);
    BindU64(st.get(), 4, from_ms);

    std::vector<model::BookingRecord> out;
    while (sqlite3_step(st.get()) == SQLITE_ROW) {
        out.push_back(ReadBooking(st.get()));
    }
    return out;
}

// ------------------------------------------------------------------
// Blackouts
// ------------------------------------------------------------------

Result SqliteRepository::InsertBlackout(Transaction& t, const model::BlackoutRecord& r) {
    auto* db = TX(t).Handle();
    auto  st = Prepare(db,
        "INSERT INTO blackouts(id,restaurant_id,sector_id,table_ids,start_ms,end_ms,reason,notes,"
        "created_at_ms,updated_at_ms) VALUES(?,?,?,?,?,?,?,?,?,?);");

    BindText(st.get(), 1, r.id);
    BindText(st.get(), 2, r.restaurant_id);
    BindText(st.get(), 3, r.sector_id);
    BindText(st.get(), 4, EncodeIds(r.table_ids));
    BindU64(st.get(), 5, r.start_ms);
    BindU64(st.get(), 6, r.end_ms);
    BindI32(st.get(), 7, static_cast<int>(r.reason));
    BindText(st.get(), 8, r.notes);
    BindU64(st.get(), 9, r.created_at_ms);
    BindU64(st.get(), 10, r.updated_at_ms);
    return Translate(db, sqlite3_step(st.get()));
}

std::optional<model::BlackoutRecord> SqliteRepository::GetBlackout(Transaction& t, const std::string& id) {
    auto*       db  = TX(t).Handle();
    std::string sql = std::string("SELECT ") + kBlackoutColumns + " FROM blackouts WHERE id=?;";
    auto        st  = Prepare(db, sql.c_str());
    BindText(st.get(), 1, id);

    if (sqlite3_step(st.get()) != SQLITE_ROW) return std::nullopt;
    return ReadBlackout(st.get());
}

Result SqliteRepository::DeleteBlackout(Transaction& t, const std::string& id) {
    auto* db = TX(t).Handle();
    auto  st = Prepare(db, "DELETE FROM blackouts WHERE id=?;");
    BindText(st.get(), 1, id);

    if (auto res = Translate(db, sqlite3_step(st.get())); !res) return res;
    if (sqlite3_changes(db) == 0) return Result::Err(ErrorCode::NotFound, "blackout " + id);
    return Result::Ok();
}

std::vector<model::BlackoutRecord> SqliteRepository::ListBlackouts(Transaction& t, const std::string& restaurant_id,
                                                                   const std::string& sector_id, uint64_t from_ms, uint64_t to_ms) {
    auto*       db  = TX(t).Handle();
    std::string sql = std::string("SELECT ") + kBlackoutColumns +
                      " FROM blackouts WHERE restaurant_id=? AND sector_id=? AND start_ms<? AND end_ms>? ORDER BY start_ms,id;";
    auto st = Prepare(db, sql.c_str());
    BindText(st.get(), 1, restaurant_id);
    BindText(st.get(), 2, sector_id);
    BindU64(st.get(), 3, to_ms);
    BindU64(st.get(), 4, from_ms);

    std::vector<model::BlackoutRecord> out;
    while (sqlite3_step(st.get()) == SQLITE_ROW) {
        out.push_back(ReadBlackout(st.get()));
    }
    return out;
}

} // namespace woki::db::sqlite
