#include "sqlite_tx.hpp"

#include <string>

#include "internal/observability/logging.hpp"

namespace woki::db::sqlite {

SqliteTransaction::SqliteTransaction(std::shared_ptr<SqliteDB> db) : db_(std::move(db)), guard_(db_->TxMutex()) {
  db_->Exec("BEGIN IMMEDIATE;");
}

SqliteTransaction::~SqliteTransaction() {
  if (finished_) {
    return;
  }
  const int rc = sqlite3_exec(db_->Handle(), "ROLLBACK;", nullptr, nullptr, nullptr);
  if (rc != SQLITE_OK) {
    WOKI_LOG_WARN("sqlite rollback failed", {woki::observability::StringField("error", sqlite3_errmsg(db_->Handle()))});
  }
}

void SqliteTransaction::Commit() {
  const int rc = sqlite3_exec(db_->Handle(), "COMMIT;", nullptr, nullptr, nullptr);
  if (rc == SQLITE_BUSY || rc == SQLITE_LOCKED) {
    throw TransactionConflict(std::string("transaction conflict: ") + sqlite3_errmsg(db_->Handle()));
  }
  if (rc != SQLITE_OK) {
    throw std::runtime_error(std::string("sqlite commit: ") + sqlite3_errmsg(db_->Handle()));
  }
  committed_ = true;
  finished_  = true;
}

void SqliteTransaction::Rollback() {
  finished_ = true;
  db_->Exec("ROLLBACK;");
}

} // namespace woki::db::sqlite
