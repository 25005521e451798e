#include "sqlite_tx.hpp"

#include <exception>

#include "internal/observability/logging.hpp"

namespace mirrorsync::db::sqlite {

SqliteTransaction::SqliteTransaction(std::shared_ptr<SqliteDB> db) : db_(std::move(db)), lock_(db_->TransactionMutex()) {
  db_->Exec("BEGIN IMMEDIATE;");
}

SqliteTransaction::~SqliteTransaction() {
  if (finished_) return;
  try {
    db_->Exec("ROLLBACK;");
  } catch (const std::exception& e) {
    MIRRORSYNC_LOG_WARN("sqlite rollback failed", {observability::StringField("db", db_->Path()), observability::StringField("error", e.what())});
  }
}

void SqliteTransaction::Finish(const char* sql) {
  if (finished_) return;
  try {
    db_->Exec(sql);
  } catch (const std::exception&) {
    // A failed COMMIT leaves the transaction open; roll it back before
    // another thread can begin on this connection.
    try {
      db_->Exec("ROLLBACK;");
    } catch (const std::exception& e) {
      MIRRORSYNC_LOG_WARN("sqlite rollback failed", {observability::StringField("db", db_->Path()), observability::StringField("error", e.what())});
    }
    finished_ = true;
    lock_.unlock();
    throw;
  }
  finished_ = true;
  lock_.unlock();
}

void SqliteTransaction::Commit() {
  Finish("COMMIT;");
  committed_ = true;
}

void SqliteTransaction::Rollback() {
  Finish("ROLLBACK;");
}

} // namespace mirrorsync::db::sqlite
