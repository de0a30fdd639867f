#pragma once

#include <cstdint>
#include <string>

#include "internal/model/state_machine.hpp"

namespace research::db::model {

struct PlanRecord {
  std::string id;
  std::string tenant_id;
  std::string run_id;
  uint32_t    version = 1;

  // 0 until the first worker starts the run
  uint64_t locked_at_ms  = 0;
  uint64_t created_at_ms = 0;
};

/*
  One pipeline stage of a run.

  step_key is kept as text so that a row written by a newer build still loads;
  the worker parses it and treats an unknown key as a run failure.
*/
struct StepRecord {
  std::string id;
  std::string tenant_id;
  std::string run_id;
  std::string plan_id;
  std::string step_key;
  uint32_t    step_order = 0;

  research::model::StepStatus status = research::model::StepStatus::kPending;

  uint32_t attempt_count    = 0;
  uint32_t max_attempts     = 0;
  uint64_t next_retry_at_ms = 0;

  std::string input_json;
  std::string output_json;
  std::string last_error;

  uint64_t started_at_ms  = 0;
  uint64_t finished_at_ms = 0;
  uint64_t created_at_ms  = 0;
  uint64_t updated_at_ms  = 0;
};

} // namespace research::db::model
