#pragma once

#include <array>
#include <cstdint>
#include <string>

namespace research::util {

/*
  UUID helpers. Every row id is a random RFC4122 v4 UUID in canonical text form.
*/

using UUID = std::array<uint8_t, 16>;

UUID GenerateUUID();

std::string ToString(const UUID& id);
UUID        FromString(const std::string& str);

std::string NewId();

} // namespace research::util
