#pragma once

#include <cstdint>
#include <string>

#include "internal/model/state_machine.hpp"

namespace research::db::model {

inline constexpr const char* kCompanyResearchJobType = "company_research_run";

/*
  Durable queue entry.

  At most one active (queued/running) job exists per (tenant, run, job_type).
  locked_at/locked_by identify the worker holding the job; a lock older than
  the configured timeout is treated as abandoned.
*/
struct JobRecord {
  std::string id;
  std::string tenant_id;
  std::string run_id;
  std::string job_type = kCompanyResearchJobType;

  research::model::JobStatus status = research::model::JobStatus::kQueued;

  uint32_t attempt_count = 0;
  uint32_t max_attempts  = 0;

  uint64_t    next_retry_at_ms = 0;
  uint64_t    locked_at_ms     = 0;
  std::string locked_by;
  bool        cancel_requested = false;
  std::string last_error;

  uint64_t created_at_ms = 0;
  uint64_t updated_at_ms = 0;
};

} // namespace research::db::model
