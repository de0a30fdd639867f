#pragma once

#include <cstdint>
#include <string>
#include <variant>
#include <vector>

namespace research::db::sql {

// Raw bytes bound as BLOB (sqlite) or BYTEA (postgres).
struct Blob {
  std::string bytes;
};

/*
  Parameter abstraction.

  Postgres: $1 $2 $3
  SQLite:   ? ? ?

  Queries are written with '?' and bound in order by both backends.
*/

using Param = std::variant<std::nullptr_t, int32_t, int64_t, uint64_t, double, std::string, Blob>;

using Params = std::vector<Param>;

} // namespace research::db::sql
