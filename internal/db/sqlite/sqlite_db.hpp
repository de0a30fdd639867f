#pragma once

#include <sqlite3.h>

#include <string>
#include <vector>

namespace research::db::sqlite {

/*
  Thin RAII wrapper around sqlite3*.

  Opened FULLMUTEX so one handle can be shared by worker threads; writers are
  serialized by BEGIN IMMEDIATE in SqliteTransaction.
*/
class SqliteDB {
 public:
  explicit SqliteDB(std::string path);
  ~SqliteDB();

  SqliteDB(const SqliteDB&)            = delete;
  SqliteDB& operator=(const SqliteDB&) = delete;

  sqlite3* Handle() const {
    return db_;
  }

  const std::string& Path() const {
    return path_;
  }

  // Execute a SQL string (pragmas, schema, transaction control)
  void Exec(const std::string& sql);

  // Applies CREATE ... IF NOT EXISTS statements in order.
  void Bootstrap(const std::vector<std::string>& statements);

 private:
  // Configure PRAGMAs (WAL, foreign keys, busy timeout)
  void Configure();

  sqlite3*    db_ = nullptr;
  std::string path_;
};

} // namespace research::db::sqlite
