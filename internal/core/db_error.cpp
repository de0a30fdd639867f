#include "db_error.hpp"

#include <stdexcept>

#include "internal/util/errors.hpp"

namespace research::core {

void ThrowIfDbError(const research::db::Result& result, const std::string& context) {
  if (result) {
    return;
  }

  const auto message = result.message.empty() ? context : context + ": " + result.message;
  switch (result.code) {
    case research::db::ErrorCode::AlreadyExists:
      throw research::util::AlreadyExists(message);
    case research::db::ErrorCode::NotFound:
      throw research::util::NotFound(message);
    case research::db::ErrorCode::Conflict:
      throw research::util::Conflict(message);
    case research::db::ErrorCode::Busy:
    case research::db::ErrorCode::SerializationFailure:
      throw research::util::TransactionConflict(message);
    default:
      throw std::runtime_error(message + " (" + std::string(research::db::ErrorCodeName(result.code)) + ")");
  }
}

} // namespace research::core
