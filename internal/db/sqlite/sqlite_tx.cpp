#include "sqlite_tx.hpp"

#include <stdexcept>

#include "internal/observability/logging.hpp"

namespace airtime::db::sqlite {

SqliteTransaction::SqliteTransaction(std::shared_ptr<SqliteDB> db) : db_(std::move(db)), lock_(db_->TxMutex()) {
  db_->Exec("BEGIN IMMEDIATE;");
}

SqliteTransaction::~SqliteTransaction() {
  if (!finished_) {
    try {
      db_->Exec("ROLLBACK;");
    } catch (const std::exception& e) {
      AIRTIME_LOG_WARN("sqlite rollback failed", {observability::StringField("error", e.what())});
    }
  }
}

void SqliteTransaction::Commit() {
  if (finished_) {
    throw std::runtime_error("transaction already finished");
  }
  db_->Exec("COMMIT;");
  committed_ = true;
  finished_  = true;
  lock_.unlock();
}

void SqliteTransaction::Rollback() {
  if (finished_) return;
  db_->Exec("ROLLBACK;");
  finished_ = true;
  lock_.unlock();
}

} // namespace airtime::db::sqlite
