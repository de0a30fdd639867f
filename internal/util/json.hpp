#pragma once

#include <google/protobuf/message.h>

#include <string>

namespace research::util {

/*
  Protobuf JSON helpers used for every JSON column and export.

  Printing keeps proto field names, prints default-valued scalars and never
  adds whitespace, so equal messages always produce equal bytes.
*/

std::string ToJson(const google::protobuf::Message& message);

// Throws util::InvalidArgument with the parser status on malformed input.
void FromJson(const std::string& json, google::protobuf::Message* message, bool ignore_unknown_fields = false);

} // namespace research::util
