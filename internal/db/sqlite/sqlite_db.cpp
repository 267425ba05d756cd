#include "sqlite_db.hpp"

#include <stdexcept>
#include <vector>

namespace woki::db::sqlite {

static void ThrowIf(int rc, sqlite3* db, const char* what) {
  if (rc != SQLITE_OK) {
    throw std::runtime_error(std::string(what) + ": " + sqlite3_errmsg(db));
  }
}

SqliteDB::SqliteDB(std::string path, bool wal_mode) : path_(std::move(path)) {
  int rc = sqlite3_open_v2(path_.c_str(), &db_, SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX, nullptr);

  if (rc != SQLITE_OK) {
    std::string msg = db_ ? sqlite3_errmsg(db_) : "sqlite open failed";
    if (db_) sqlite3_close(db_);
    db_ = nullptr;
    throw std::runtime_error(msg);
  }

  Configure(wal_mode);
}

SqliteDB::~SqliteDB() {
  if (db_) sqlite3_close(db_);
}

void SqliteDB::Exec(const std::string& sql) {
  char* err = nullptr;
  int   rc  = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err);
  if (rc != SQLITE_OK) {
    std::string msg = err ? err : "sqlite exec failed";
    sqlite3_free(err);
    throw std::runtime_error(msg);
  }
}

sqlite3_stmt* SqliteDB::Prepare(const std::string& sql) {
  sqlite3_stmt* stmt = nullptr;
  int           rc   = sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr);
  ThrowIf(rc, db_, "sqlite prepare");
  return stmt;
}

void SqliteDB::Configure(bool wal_mode) {
  // WAL lets readers proceed while a writer holds the lock
  if (wal_mode) {
    Exec("PRAGMA journal_mode=WAL;");
  }

  Exec("PRAGMA synchronous=NORMAL;");

  // foreign keys are OFF by default in sqlite
  Exec("PRAGMA foreign_keys=ON;");

  // wait for locks instead of failing immediately
  ThrowIf(sqlite3_busy_timeout(db_, 5000), db_, "busy_timeout");

  Exec("PRAGMA temp_store=MEMORY;");
}

void BootstrapSchema(SqliteDB& db) {
  static const std::vector<std::string> kBootstrapSql = {
      "CREATE TABLE IF NOT EXISTS restaurants (id TEXT PRIMARY KEY, name TEXT NOT NULL, timezone TEXT NOT NULL);",
      "CREATE TABLE IF NOT EXISTS service_windows (restaurant_id TEXT NOT NULL REFERENCES restaurants(id) ON DELETE CASCADE, start_time TEXT NOT NULL, end_time TEXT NOT NULL);",
      "CREATE TABLE IF NOT EXISTS sectors (id TEXT PRIMARY KEY, restaurant_id TEXT NOT NULL REFERENCES restaurants(id), name TEXT NOT NULL);",
      "CREATE TABLE IF NOT EXISTS dining_tables (id TEXT PRIMARY KEY, sector_id TEXT NOT NULL REFERENCES sectors(id), name TEXT NOT NULL, min_size INTEGER NOT NULL, max_size INTEGER NOT NULL);",
      "CREATE TABLE IF NOT EXISTS bookings (id TEXT PRIMARY KEY, restaurant_id TEXT NOT NULL, sector_id TEXT NOT NULL, table_ids TEXT NOT NULL, party_size INTEGER NOT NULL, start_ms INTEGER NOT NULL, end_ms INTEGER NOT NULL, duration_minutes INTEGER NOT NULL, status INTEGER NOT NULL, created_at_ms INTEGER NOT NULL, updated_at_ms INTEGER NOT NULL);",
      "CREATE INDEX IF NOT EXISTS bookings_by_day ON bookings (restaurant_id, sector_id, start_ms);",
      "CREATE TABLE IF NOT EXISTS blackouts (id TEXT PRIMARY KEY, restaurant_id TEXT NOT NULL, sector_id TEXT NOT NULL, table_ids TEXT NOT NULL, start_ms INTEGER NOT NULL, end_ms INTEGER NOT NULL, reason INTEGER NOT NULL, notes TEXT NOT NULL, created_at_ms INTEGER NOT NULL, updated_at_ms INTEGER NOT NULL);",
      "CREATE INDEX IF NOT EXISTS blackouts_by_day ON blackouts (restaurant_id, sector_id, start_ms);"};

  for (const auto& sql : kBootstrapSql) {
    db.Exec(sql);
  }
}

} // namespace woki::db::sqlite
