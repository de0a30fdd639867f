#pragma once

#include <memory>
#include <string>
#include <string_view>

#include "internal/db/api/repository.hpp"
#include "job_queue.hpp"
#include "plan_manager.hpp"
#include "step_context.hpp"

namespace research::pipeline {

enum class WorkerOutcome {
  kIdle,      // nothing claimable
  kCompleted, // run succeeded
  kDeferred,  // waiting for a step retry
  kCancelled,
  kFailed,
  kNoop,      // run was already terminal
  kLeaseLost, // another worker took the job over
};

std::string_view ToString(WorkerOutcome outcome);

/*
  Job dispatcher and step loop.

  RunOnce claims at most one job and drives its run until it completes, is
  cancelled, fails or has to wait for a retry. Every step runs in three
  phases: a short claim transaction, a prepare pass doing network and
  subprocess work with no transaction open, then one transaction in which
  handler writes, step status and events commit together or not at all.
  Each transaction renews the job lock and checks that this worker still
  holds it; a worker that lost the lock stops without writing anything more.
  Failures are recorded in a fresh transaction after the rollback.
*/
class ResearchWorker {
 public:
  ResearchWorker(std::shared_ptr<db::Repository> repo, std::shared_ptr<JobQueue> jobs, PipelineServices services);

  WorkerOutcome RunOnce();

  const std::string& WorkerId() const {
    return worker_id_;
  }

 private:
  WorkerOutcome Process(db::model::JobRecord& job);
  WorkerOutcome Cancel(db::model::JobRecord& job, const std::string& step_key);
  // Run and job to failed inside tx; the caller commits.
  WorkerOutcome FailRun(db::Transaction& tx, db::model::JobRecord& job, const std::string& event_type, research::v1::EventDetail detail,
                        const std::string& error);
  void          RecordStepFailure(db::model::JobRecord& job, db::model::StepRecord step, const std::string& error);
  // False when the job is no longer held by this worker.
  bool          RecordJobFailure(db::model::JobRecord& job, const std::string& error);

  research::v1::EventDetail Detail(const db::model::JobRecord& job, const std::string& message = {}) const;

  std::shared_ptr<db::Repository> repo_;
  std::shared_ptr<JobQueue>       jobs_;
  PipelineServices                services_;
  PlanManager                     plans_;
  std::string                     worker_id_;
};

} // namespace research::pipeline
