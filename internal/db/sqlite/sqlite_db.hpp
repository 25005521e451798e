#pragma once

#include <sqlite3.h>

#include <memory>
#include <mutex>
#include <string>

namespace mirrorsync::db::sqlite {

/*
  Thin RAII wrapper around sqlite3*.

  One connection is shared by every thread in the process, and SQLite
  allows one open transaction per connection. SqliteTransaction holds
  TransactionMutex() from BEGIN until COMMIT or ROLLBACK. BEGIN IMMEDIATE
  then only arbitrates against other processes on the same file.
*/
class SqliteDB {
 public:
  explicit SqliteDB(std::string path, bool wal_mode = true);
  ~SqliteDB();

  SqliteDB(const SqliteDB&)            = delete;
  SqliteDB& operator=(const SqliteDB&) = delete;

  sqlite3* Handle() const {
    return db_;
  }

  const std::string& Path() const {
    return path_;
  }

  // Execute a SQL string (used for pragmas and schema bootstrap)
  void Exec(const std::string& sql);

  std::mutex& TransactionMutex() {
    return tx_mutex_;
  }

 private:
  void Configure(bool wal_mode);

  sqlite3*    db_ = nullptr;
  std::string path_;
  std::mutex  tx_mutex_;
};

} // namespace mirrorsync::db::sqlite
