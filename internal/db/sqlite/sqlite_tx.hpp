#pragma once

#include <memory>
#include <mutex>

#include "internal/db/api/transaction.hpp"
#include "sqlite_db.hpp"

namespace mirrorsync::db::sqlite {

/*
  SQLite transaction wrapper.

  Holds the connection's transaction mutex until Commit, Rollback or
  destruction, so threads sharing the SqliteDB queue instead of failing
  with "cannot start a transaction within a transaction".

  Uses BEGIN IMMEDIATE:
    - grabs write lock early
    - makes redeem-code + create-mirror a single serialized unit
*/
class SqliteTransaction final : public db::Transaction {
public:
  explicit SqliteTransaction(std::shared_ptr<SqliteDB> db);
  ~SqliteTransaction();

  sqlite3* Handle() const { return db_->Handle(); }

  void Commit() override;
  void Rollback() override;
  bool IsCommitted() const override { return committed_; }

private:
  void Finish(const char* sql);

  std::shared_ptr<SqliteDB> db_;
  std::unique_lock<std::mutex> lock_;
  bool committed_ = false;
  bool finished_ = false;
};

} // namespace mirrorsync::db::sqlite
