#pragma once

#include <cstdint>
#include <string>

#include "internal/model/state_machine.hpp"

namespace research::db::model {

// Append-only audit row, listed in insertion order.
struct EventRecord {
  std::string id;
  std::string tenant_id;
  std::string run_id;
  std::string event_type;

  research::model::EventStatus status = research::model::EventStatus::kOk;

  std::string input_json;
  std::string output_json;
  std::string error_message;
  uint64_t    created_at_ms = 0;
};

} // namespace research::db::model
