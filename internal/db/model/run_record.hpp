#pragma once

#include <cstdint>
#include <string>

#include "internal/model/state_machine.hpp"

namespace research::db::model {

/*
  Persistent research run.

  Status only moves forward; the one exception is an explicit retry
  (failed -> queued) performed by the run service.
*/
struct RunRecord {
  std::string id;
  std::string tenant_id;
  std::string name;

  research::model::RunStatus status = research::model::RunStatus::kQueued;

  uint64_t    started_at_ms  = 0;
  uint64_t    finished_at_ms = 0;
  std::string last_error;

  uint64_t created_at_ms = 0;
  uint64_t updated_at_ms = 0;
};

} // namespace research::db::model
