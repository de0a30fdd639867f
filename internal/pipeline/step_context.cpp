#include "step_context.hpp"

#include "event_log.hpp"
#include "pipeline_errors.hpp"

namespace research::pipeline {

namespace {

bool CancelPending(const std::optional<db::model::RunRecord>& run) {
  return run && (run->status == research::model::RunStatus::kCancelRequested || run->status == research::model::RunStatus::kCancelled);
}

} // namespace

std::vector<db::model::SourceDocumentRecord> PrepareContext::ListSources() const {
  auto tx      = repo.Begin();
  auto sources = repo.ListSources(*tx, run.tenant_id, run.id);
  tx->Commit();
  return sources;
}

void PrepareContext::CheckCancelled() const {
  jobs.Heartbeat(job, services.worker.worker_id());
  if (job.cancel_requested) {
    throw StepCancelled("cancel requested for job " + job.id);
  }

  auto       tx          = repo.Begin();
  const auto current_run = repo.GetRun(*tx, run.tenant_id, run.id);
  tx->Commit();
  if (CancelPending(current_run)) {
    throw StepCancelled("cancel requested for run " + run.id);
  }
}

void StepContext::CheckCancelled() const {
  const auto current_job = repo.GetJob(tx, job.id);
  if (!current_job || current_job->locked_by != services.worker.worker_id()) {
    throw LeaseLost("job " + job.id + " is no longer held by " + services.worker.worker_id());
  }
  if (current_job->cancel_requested) {
    throw StepCancelled("cancel requested for job " + job.id);
  }

  if (CancelPending(repo.GetRun(tx, run.tenant_id, run.id))) {
    throw StepCancelled("cancel requested for run " + run.id);
  }
}

void StepContext::Event(std::string_view event_type, research::model::EventStatus status, research::v1::EventDetail detail,
                        const std::string& error_message) const {
  detail.set_step_key(step.step_key);
  detail.set_job_id(job.id);
  detail.set_attempt(step.attempt_count);
  AppendEvent(repo, tx, run.tenant_id, run.id, event_type, status, detail, {}, error_message);
}

} // namespace research::pipeline
