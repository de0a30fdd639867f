#pragma once

#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "config/config.pb.h"
#include "internal/acquisition/source_acquisition.hpp"
#include "internal/db/api/repository.hpp"
#include "job_queue.hpp"
#include "plan_manager.hpp"
#include "research/v1/step_output.pb.h"

namespace research::pipeline {

// Long-lived collaborators shared by every step of every run.
struct PipelineServices {
  std::shared_ptr<acquisition::SourceAcquisition> acquisition;
  research::runtime::config::WorkerConfig         worker;
  research::runtime::config::RankingConfig        ranking;
};

// Acquisition result for one source, computed before the step transaction opens.
struct PreparedSource {
  db::model::SourceDocumentRecord                doc;
  std::optional<acquisition::AcquisitionOutcome> outcome;
  std::optional<acquisition::AcquisitionError>   error;
};

// Keyed by source document id.
using PreparedSources = std::map<std::string, PreparedSource>;

/*
  Network and subprocess work of a step.

  Runs with no transaction open. Reads use short transactions of their own
  and every checkpoint renews the job lock.
*/
struct PrepareContext {
  db::Repository&              repo;
  JobQueue&                    jobs;
  const db::model::RunRecord&  run;
  const db::model::StepRecord& step;
  db::model::JobRecord&        job;
  const PipelineServices&      services;
  uint64_t                     now_ms = 0;

  std::vector<db::model::SourceDocumentRecord> ListSources() const;

  // Heartbeat plus a fresh read of the cancel state; throws StepCancelled or LeaseLost.
  void CheckCancelled() const;
};

/*
  Everything a step handler may touch.

  All writes go through tx, which the worker commits only after the handler
  returned and the step status was recorded.
*/
struct StepContext {
  db::Repository&                  repo;
  db::Transaction&                 tx;
  PlanManager&                     plans;
  const db::model::RunRecord&      run;
  const db::model::StepRecord&     step;
  const db::model::JobRecord&      job;
  const PipelineServices&          services;
  const PreparedSources&           prepared;
  uint64_t                         now_ms = 0;

  // Cancellation checkpoint read through tx; throws StepCancelled or LeaseLost.
  void CheckCancelled() const;

  void Event(std::string_view event_type, research::model::EventStatus status, research::v1::EventDetail detail,
             const std::string& error_message = {}) const;
};

enum class StepDisposition {
  kSucceeded,
  kSkipped,
  kRetry,
};

struct StepResult {
  StepDisposition          disposition = StepDisposition::kSucceeded;
  research::v1::StepOutput output;
  uint64_t                 retry_after_seconds = 0;
  std::string              message;
};

} // namespace research::pipeline
