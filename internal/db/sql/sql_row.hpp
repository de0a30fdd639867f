#pragma once

#include <cstdint>
#include <string>

namespace research::db::sql {

/*
  Generic row reader.

  Backends wrap their result row:
    postgres -> pqxx::row
    sqlite   -> sqlite3_stmt

  Record decoding is shared (record_codec.hpp), so driver types never leak
  into it.
*/

class Row {
 public:
  virtual ~Row() = default;

  virtual std::string GetText(int col) const   = 0;
  virtual int64_t     GetInt64(int col) const  = 0;
  virtual double      GetDouble(int col) const = 0;
  virtual std::string GetBlob(int col) const   = 0;
  virtual bool        IsNull(int col) const    = 0;

  uint64_t GetU64(int col) const {
    return static_cast<uint64_t>(GetInt64(col));
  }

  uint32_t GetU32(int col) const {
    return static_cast<uint32_t>(GetInt64(col));
  }
};

} // namespace research::db::sql
