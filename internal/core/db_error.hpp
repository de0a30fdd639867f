#pragma once

#include <string>

#include "internal/db/api/result.hpp"

namespace research::core {

/*
  Converts a failed repository Result into the matching util exception.

  AlreadyExists and NotFound keep their meaning, Conflict becomes
  util::Conflict, Busy and SerializationFailure become
  util::TransactionConflict (the caller may retry the unit of work). Anything
  else is a std::runtime_error.
*/
void ThrowIfDbError(const research::db::Result& result, const std::string& context);

} // namespace research::core
