#include "research_worker.hpp"

#include <algorithm>

#include "event_log.hpp"
#include "internal/core/db_error.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/json.hpp"
#include "internal/util/time.hpp"
#include "pipeline_errors.hpp"
#include "retry_policy.hpp"
#include "step_handlers.hpp"

namespace research::pipeline {

using research::model::EventStatus;
using research::model::RunStatus;

namespace {

void Abandon(db::Transaction& tx) {
  if (!tx.IsCommitted()) tx.Rollback();
}

void SetRunStatus(db::Repository& repo, db::Transaction& tx, db::model::RunRecord& run, RunStatus status, uint64_t now_ms) {
  if (!research::model::CanTransition(run.status, status)) {
    throw util::InvalidState("run " + run.id + " cannot move from " + std::string(research::model::ToString(run.status)) + " to " +
                             std::string(research::model::ToString(status)));
  }
  run.status        = status;
  run.updated_at_ms = now_ms;
  if (status == RunStatus::kRunning && run.started_at_ms == 0) {
    run.started_at_ms = now_ms;
  }
  if (research::model::IsTerminal(status)) {
    run.finished_at_ms = now_ms;
  }
  core::ThrowIfDbError(repo.UpdateRun(tx, run), "update run " + run.id);
}

// A run with a pending cancel never reports failed.
RunStatus FailureStatus(const db::model::RunRecord& run) {
  return run.status == RunStatus::kCancelRequested ? RunStatus::kCancelled : RunStatus::kFailed;
}

db::model::RunRecord LoadRun(db::Repository& repo, db::Transaction& tx, const db::model::JobRecord& job) {
  auto run = repo.GetRun(tx, job.tenant_id, job.run_id);
  if (!run) {
    throw util::NotFound("run " + job.run_id);
  }
  return *run;
}

} // namespace

std::string_view ToString(WorkerOutcome outcome) {
  switch (outcome) {
    case WorkerOutcome::kIdle:
      return "idle";
    case WorkerOutcome::kCompleted:
      return "completed";
    case WorkerOutcome::kDeferred:
      return "deferred";
    case WorkerOutcome::kCancelled:
      return "cancelled";
    case WorkerOutcome::kFailed:
      return "failed";
    case WorkerOutcome::kNoop:
      return "noop";
    case WorkerOutcome::kLeaseLost:
      return "lease_lost";
  }
  return "unknown";
}

ResearchWorker::ResearchWorker(std::shared_ptr<db::Repository> repo, std::shared_ptr<JobQueue> jobs, PipelineServices services)
    : repo_(std::move(repo)),
      jobs_(std::move(jobs)),
      services_(std::move(services)),
      plans_(*repo_, services_.worker),
      worker_id_(services_.worker.worker_id()) {
}

research::v1::EventDetail ResearchWorker::Detail(const db::model::JobRecord& job, const std::string& message) const {
  research::v1::EventDetail detail;
  detail.set_message(message);
  detail.set_job_id(job.id);
  detail.set_worker_id(worker_id_);
  return detail;
}

// ------------------------------------------------------------

WorkerOutcome ResearchWorker::RunOnce() {
  auto job = jobs_->ClaimNextJob(worker_id_);
  if (!job) {
    return WorkerOutcome::kIdle;
  }

  try {
    return Process(*job);
  } catch (const LeaseLost& e) {
    RESEARCH_LOG_WARN("job given up", {observability::StringField("job_id", job->id), observability::StringField("run_id", job->run_id),
                                       observability::StringField("error", e.what())});
    return WorkerOutcome::kLeaseLost;
  } catch (const std::exception& e) {
    RESEARCH_LOG_ERROR("job processing failed", {observability::StringField("job_id", job->id), observability::StringField("run_id", job->run_id),
                                                 observability::StringField("error", e.what())});
    if (!RecordJobFailure(*job, e.what())) {
      return WorkerOutcome::kLeaseLost;
    }
    return WorkerOutcome::kFailed;
  }
}

WorkerOutcome ResearchWorker::Process(db::model::JobRecord& job) {
  {
    const auto now = util::NowMillis();
    auto       tx  = repo_->Begin();
    jobs_->VerifyLease(*tx, job, worker_id_, now);

    auto run = repo_->GetRun(*tx, job.tenant_id, job.run_id);
    if (!run) {
      jobs_->MarkJobFailed(*tx, job, "run not found", 0, true, now);
      AppendEvent(*repo_, *tx, job.tenant_id, job.run_id, "worker_failed", EventStatus::kFailed, Detail(job), {}, "run not found");
      tx->Commit();
      return WorkerOutcome::kFailed;
    }

    if (research::model::IsTerminal(run->status)) {
      jobs_->MarkJobSucceeded(*tx, job, now);
      tx->Commit();
      RESEARCH_LOG_INFO("run already terminal", {observability::StringField("run_id", run->id),
                                                 observability::StringField("status", research::model::ToString(run->status))});
      return WorkerOutcome::kNoop;
    }

    if (job.cancel_requested || run->status == RunStatus::kCancelRequested) {
      Abandon(*tx);
      return Cancel(job, {});
    }

    if (run->status == RunStatus::kQueued) {
      SetRunStatus(*repo_, *tx, *run, RunStatus::kRunning, now);
    }
    auto plan = plans_.EnsurePlanAndSteps(*tx, *run, now);
    plans_.LockPlanOnStart(*tx, plan, now);
    AppendEvent(*repo_, *tx, job.tenant_id, job.run_id, "worker_claimed", EventStatus::kOk, Detail(job));
    tx->Commit();
  }

  for (;;) {
    const auto now = util::NowMillis();

    // Claim: a short transaction that renews the lock and consumes a step attempt.
    db::model::RunRecord  run;
    db::model::StepRecord step;
    {
      auto tx = repo_->Begin();
      jobs_->VerifyLease(*tx, job, worker_id_, now);

      run = LoadRun(*repo_, *tx, job);
      if (job.cancel_requested || run.status == RunStatus::kCancelRequested || run.status == RunStatus::kCancelled) {
        Abandon(*tx);
        return Cancel(job, {});
      }

      auto claim = plans_.ClaimNextStep(*tx, job.tenant_id, job.run_id, now);
      if (!claim.step) {
        if (claim.all_settled && claim.any_failed) {
          std::string error = "step failed";
          for (const auto& settled : repo_->ListSteps(*tx, job.tenant_id, job.run_id)) {
            if (settled.status == research::model::StepStatus::kFailed) {
              error = "step " + settled.step_key + " failed: " + settled.last_error;
            }
          }
          auto outcome = FailRun(*tx, job, "worker_failed", Detail(job, error), error);
          tx->Commit();
          return outcome;
        }

        if (claim.all_settled) {
          SetRunStatus(*repo_, *tx, run, RunStatus::kSucceeded, now);
          jobs_->MarkJobSucceeded(*tx, job, now);
          AppendEvent(*repo_, *tx, job.tenant_id, job.run_id, "worker_completed", EventStatus::kOk, Detail(job));
          tx->Commit();
          RESEARCH_LOG_INFO("run completed", {observability::StringField("run_id", job.run_id), observability::StringField("job_id", job.id)});
          return WorkerOutcome::kCompleted;
        }

        const auto delay = std::max<uint64_t>(1, util::SecondsUntil(now, claim.wait_until_ms));
        jobs_->DeferJob(*tx, job, delay, "waiting for step retry", now);
        AppendEvent(*repo_, *tx, job.tenant_id, job.run_id, "worker_deferred", EventStatus::kOk, Detail(job, "waiting for step retry"));
        tx->Commit();
        return WorkerOutcome::kDeferred;
      }

      step = *claim.step;
      try {
        tx->Commit();
      } catch (const util::TransactionConflict& e) {
        RESEARCH_LOG_WARN("step claim conflict", {observability::StringField("run_id", job.run_id),
                                                  observability::StringField("step_key", step.step_key),
                                                  observability::StringField("error", e.what())});
        continue;
      }
    }

    auto step_detail = [&](const std::string& message) {
      auto detail = Detail(job, message);
      detail.set_step_key(step.step_key);
      detail.set_attempt(step.attempt_count);
      return detail;
    };

    std::unique_ptr<db::Transaction> tx;
    try {
      const auto key = research::model::ParseStepKey(step.step_key);
      if (!key) {
        throw UnknownStep(step.step_key);
      }

      RESEARCH_LOG_INFO("step started", {observability::StringField("run_id", job.run_id), observability::StringField("job_id", job.id),
                                         observability::StringField("step_key", step.step_key),
                                         observability::IntField("attempt", step.attempt_count)});

      // Network and subprocess work happens here, with no transaction held.
      PreparedSources prepared;
      if (const auto prepare = PreparerFor(*key)) {
        PrepareContext prepare_ctx{*repo_, *jobs_, run, step, job, services_, now};
        prepared = prepare(prepare_ctx);
      }

      tx = repo_->Begin();
      jobs_->VerifyLease(*tx, job, worker_id_, util::NowMillis());

      StepContext ctx{*repo_, *tx, plans_, run, step, job, services_, prepared, now};
      auto        result = HandlerFor(*key)(ctx);
      const auto  output = util::ToJson(result.output);

      switch (result.disposition) {
        case StepDisposition::kSucceeded:
          plans_.MarkStepSucceeded(*tx, step, output, now);
          AppendEvent(*repo_, *tx, job.tenant_id, job.run_id, "step_succeeded", EventStatus::kOk, step_detail(result.message), output);
          break;
        case StepDisposition::kSkipped:
          plans_.MarkStepSkipped(*tx, step, output, now);
          AppendEvent(*repo_, *tx, job.tenant_id, job.run_id, "step_skipped", EventStatus::kOk, step_detail(result.output.skipped_reason()), output);
          break;
        case StepDisposition::kRetry: {
          const bool exhausted = plans_.MarkStepFailed(*tx, step, result.message, result.retry_after_seconds, false, now);
          AppendEvent(*repo_, *tx, job.tenant_id, job.run_id, exhausted ? "step_failed" : "step_retry_scheduled",
                      exhausted ? EventStatus::kFailed : EventStatus::kWarn, step_detail(result.message), output, result.message);
          break;
        }
      }
      jobs_->VerifyLease(*tx, job, worker_id_, util::NowMillis());
      tx->Commit();

      RESEARCH_LOG_INFO("step finished", {observability::StringField("run_id", job.run_id), observability::StringField("step_key", step.step_key),
                                          observability::StringField("status", research::model::ToString(step.status))});
    } catch (const LeaseLost&) {
      if (tx) Abandon(*tx);
      throw;
    } catch (const StepCancelled&) {
      if (tx) Abandon(*tx);
      RESEARCH_LOG_INFO("step cancelled", {observability::StringField("run_id", job.run_id), observability::StringField("step_key", step.step_key)});
      return Cancel(job, step.step_key);
    } catch (const RunBlocked& e) {
      if (tx) Abandon(*tx);
      auto fail_tx = repo_->Begin();
      jobs_->VerifyLease(*fail_tx, job, worker_id_, util::NowMillis());
      plans_.MarkStepFailed(*fail_tx, step, e.what(), 0, true, now);
      auto detail = step_detail(e.what());
      for (const auto& blocker : e.Blockers()) {
        detail.add_blockers(blocker);
      }
      auto outcome = FailRun(*fail_tx, job, "run_blocked", detail, e.what());
      fail_tx->Commit();
      return outcome;
    } catch (const UnknownStep& e) {
      if (tx) Abandon(*tx);
      auto fail_tx = repo_->Begin();
      jobs_->VerifyLease(*fail_tx, job, worker_id_, util::NowMillis());
      plans_.MarkStepFailed(*fail_tx, step, e.what(), 0, true, now);
      auto outcome = FailRun(*fail_tx, job, "run_failed", step_detail(e.what()), e.what());
      fail_tx->Commit();
      return outcome;
    } catch (const util::TransactionConflict& e) {
      // Another writer (usually a cancel request) committed first; re-evaluate.
      if (tx) Abandon(*tx);
      RESEARCH_LOG_WARN("step transaction conflict", {observability::StringField("run_id", job.run_id),
                                                      observability::StringField("step_key", step.step_key),
                                                      observability::StringField("error", e.what())});
    } catch (const std::exception& e) {
      if (tx) Abandon(*tx);
      RecordStepFailure(job, step, e.what());
    }
  }
}

// ------------------------------------------------------------

WorkerOutcome ResearchWorker::Cancel(db::model::JobRecord& job, const std::string& step_key) {
  const auto now = util::NowMillis();
  auto       tx  = repo_->Begin();
  jobs_->VerifyLease(*tx, job, worker_id_, now);

  const auto cancelled_steps = plans_.CancelOpenSteps(*tx, job.tenant_id, job.run_id, now);
  if (auto run = repo_->GetRun(*tx, job.tenant_id, job.run_id); run && !research::model::IsTerminal(run->status)) {
    SetRunStatus(*repo_, *tx, *run, RunStatus::kCancelled, now);
  }
  jobs_->MarkJobCancelled(*tx, job, now);

  auto detail = Detail(job, "cancelled");
  detail.set_step_key(step_key);
  AppendEvent(*repo_, *tx, job.tenant_id, job.run_id, "worker_cancelled", EventStatus::kCancelled, detail);
  tx->Commit();

  RESEARCH_LOG_INFO("run cancelled", {observability::StringField("run_id", job.run_id), observability::StringField("job_id", job.id),
                                      observability::StringField("step_key", step_key),
                                      observability::IntField("cancelled_steps", cancelled_steps)});
  return WorkerOutcome::kCancelled;
}

WorkerOutcome ResearchWorker::FailRun(db::Transaction& tx, db::model::JobRecord& job, const std::string& event_type, research::v1::EventDetail detail,
                                      const std::string& error) {
  const auto now = util::NowMillis();

  if (auto run = repo_->GetRun(tx, job.tenant_id, job.run_id); run && !research::model::IsTerminal(run->status)) {
    run->last_error = error;
    SetRunStatus(*repo_, tx, *run, FailureStatus(*run), now);
  }
  jobs_->MarkJobFailed(tx, job, error, 0, true, now);
  AppendEvent(*repo_, tx, job.tenant_id, job.run_id, event_type, EventStatus::kFailed, detail, {}, error);

  RESEARCH_LOG_ERROR("run failed", {observability::StringField("run_id", job.run_id), observability::StringField("job_id", job.id),
                                    observability::StringField("error", error)});
  return WorkerOutcome::kFailed;
}

void ResearchWorker::RecordStepFailure(db::model::JobRecord& job, db::model::StepRecord step, const std::string& error) {
  const auto  now    = util::NowMillis();
  const auto& worker = services_.worker;
  auto        tx     = repo_->Begin();
  jobs_->VerifyLease(*tx, job, worker_id_, now);

  const auto backoff   = BackoffSeconds(worker.retry_base_seconds(), worker.retry_cap_seconds(), step.attempt_count);
  const bool exhausted = plans_.MarkStepFailed(*tx, step, error, backoff, false, now);

  auto detail = Detail(job, error);
  detail.set_step_key(step.step_key);
  detail.set_attempt(step.attempt_count);
  AppendEvent(*repo_, *tx, job.tenant_id, job.run_id, "step_failed", exhausted ? EventStatus::kFailed : EventStatus::kWarn, detail, {}, error);
  tx->Commit();

  RESEARCH_LOG_WARN("step failed", {observability::StringField("run_id", job.run_id), observability::StringField("job_id", job.id),
                                    observability::StringField("step_key", step.step_key), observability::IntField("attempt", step.attempt_count),
                                    observability::BoolField("terminal", exhausted), observability::StringField("error", error)});
}

bool ResearchWorker::RecordJobFailure(db::model::JobRecord& job, const std::string& error) {
  const auto  now    = util::NowMillis();
  const auto& worker = services_.worker;
  auto        tx     = repo_->Begin();

  auto current = repo_->GetJob(*tx, job.id).value_or(job);
  if (current.status != research::model::JobStatus::kRunning || current.locked_by != worker_id_) {
    RESEARCH_LOG_WARN("job failure not recorded", {observability::StringField("job_id", job.id), observability::StringField("locked_by", current.locked_by),
                                                   observability::StringField("error", error)});
    return false;
  }

  const auto backoff  = BackoffSeconds(worker.retry_base_seconds(), worker.retry_cap_seconds(), current.attempt_count + 1);
  const bool terminal = jobs_->MarkJobFailed(*tx, current, error, backoff, false, now);

  if (terminal) {
    if (auto run = repo_->GetRun(*tx, job.tenant_id, job.run_id); run && !research::model::IsTerminal(run->status)) {
      run->last_error = error;
      SetRunStatus(*repo_, *tx, *run, FailureStatus(*run), now);
    }
  }
  AppendEvent(*repo_, *tx, job.tenant_id, job.run_id, "worker_failed", EventStatus::kFailed, Detail(job, error), {}, error);
  tx->Commit();
  job = current;
  return true;
}

} // namespace research::pipeline
