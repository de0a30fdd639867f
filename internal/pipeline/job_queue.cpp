#include "job_queue.hpp"

#include "internal/core/db_error.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"
#include "internal/util/uuid.hpp"
#include "pipeline_errors.hpp"

namespace research::pipeline {

using research::model::JobStatus;

JobQueue::JobQueue(std::shared_ptr<db::Repository> repo, research::runtime::config::WorkerConfig config)
    : repo_(std::move(repo)), config_(std::move(config)) {
}

void JobQueue::Release(db::model::JobRecord& job, uint64_t now_ms) {
  job.locked_at_ms  = 0;
  job.locked_by.clear();
  job.updated_at_ms = now_ms;
}

void JobQueue::Save(db::Transaction& tx, const db::model::JobRecord& job) {
  core::ThrowIfDbError(repo_->UpdateJob(tx, job), "update job " + job.id);
}

// ------------------------------------------------------------

db::model::JobRecord JobQueue::EnqueueRunJob(db::Transaction& tx, const std::string& tenant_id, const std::string& run_id, uint64_t now_ms) {
  if (auto active = repo_->FindActiveJob(tx, tenant_id, run_id, db::model::kCompanyResearchJobType)) {
    return *active;
  }

  db::model::JobRecord job;
  job.id            = util::NewId();
  job.tenant_id     = tenant_id;
  job.run_id        = run_id;
  job.status        = JobStatus::kQueued;
  job.max_attempts  = config_.job_max_attempts();
  job.created_at_ms = now_ms;
  job.updated_at_ms = now_ms;

  auto result = repo_->InsertJob(tx, job);
  if (result.code == db::ErrorCode::AlreadyExists) {
    // Another enqueue won; its job is the active one.
    if (auto active = repo_->FindActiveJob(tx, tenant_id, run_id, db::model::kCompanyResearchJobType)) {
      return *active;
    }
  }
  core::ThrowIfDbError(result, "enqueue job for run " + run_id);

  RESEARCH_LOG_INFO("job enqueued", {observability::StringField("run_id", run_id), observability::StringField("job_id", job.id)});
  return job;
}

std::optional<db::model::JobRecord> JobQueue::ClaimNextJob(const std::string& worker_id) {
  const uint64_t now_ms       = util::NowMillis();
  const uint64_t lock_ms      = static_cast<uint64_t>(config_.job_lock_timeout_seconds()) * 1000;
  const uint64_t stale_before = now_ms > lock_ms ? now_ms - lock_ms : 0;

  auto tx  = repo_->Begin();
  auto job = repo_->ClaimNextJob(*tx, worker_id, now_ms, stale_before);
  if (!job) {
    tx->Commit();
    return std::nullopt;
  }

  try {
    tx->Commit();
  } catch (const util::TransactionConflict&) {
    RESEARCH_LOG_DEBUG("job claim lost race", {observability::StringField("job_id", job->id), observability::StringField("worker_id", worker_id)});
    return std::nullopt;
  }

  RESEARCH_LOG_INFO("job claimed", {observability::StringField("job_id", job->id), observability::StringField("run_id", job->run_id),
                                    observability::StringField("worker_id", worker_id),
                                    observability::IntField("attempt_count", job->attempt_count)});
  return job;
}

void JobQueue::VerifyLease(db::Transaction& tx, db::model::JobRecord& job, const std::string& worker_id, uint64_t now_ms) {
  auto current = repo_->GetJob(tx, job.id);
  if (!current || current->status != JobStatus::kRunning || current->locked_by != worker_id) {
    const std::string owner = current ? current->locked_by : std::string{};
    RESEARCH_LOG_WARN("job lease lost", {observability::StringField("job_id", job.id), observability::StringField("worker_id", worker_id),
                                         observability::StringField("locked_by", owner)});
    throw LeaseLost("job " + job.id + " is no longer held by " + worker_id);
  }

  current->locked_at_ms  = now_ms;
  current->updated_at_ms = now_ms;
  Save(tx, *current);
  job = *current;
}

void JobQueue::Heartbeat(db::model::JobRecord& job, const std::string& worker_id) {
  auto tx = repo_->Begin();
  VerifyLease(*tx, job, worker_id, util::NowMillis());
  tx->Commit();
}

void JobQueue::MarkJobSucceeded(db::Transaction& tx, db::model::JobRecord& job, uint64_t now_ms) {
  job.status           = JobStatus::kSucceeded;
  job.cancel_requested = false;
  job.last_error.clear();
  Release(job, now_ms);
  Save(tx, job);
}

bool JobQueue::MarkJobFailed(db::Transaction& tx, db::model::JobRecord& job, const std::string& error, uint64_t backoff_seconds, bool terminal,
                             uint64_t now_ms) {
  job.attempt_count += 1;
  job.last_error = error;
  Release(job, now_ms);

  const bool exhausted = terminal || job.attempt_count >= job.max_attempts;
  if (exhausted) {
    job.status = JobStatus::kFailed;
  } else {
    job.status           = JobStatus::kQueued;
    job.next_retry_at_ms = util::MillisAfter(now_ms, backoff_seconds);
  }
  Save(tx, job);

  RESEARCH_LOG_WARN("job failed", {observability::StringField("job_id", job.id), observability::StringField("run_id", job.run_id),
                                   observability::IntField("attempt_count", job.attempt_count), observability::BoolField("terminal", exhausted),
                                   observability::StringField("error", error)});
  return exhausted;
}

void JobQueue::DeferJob(db::Transaction& tx, db::model::JobRecord& job, uint64_t delay_seconds, const std::string& reason, uint64_t now_ms) {
  job.status           = JobStatus::kQueued;
  job.next_retry_at_ms = util::MillisAfter(now_ms, delay_seconds);
  Release(job, now_ms);
  Save(tx, job);

  RESEARCH_LOG_INFO("job deferred", {observability::StringField("job_id", job.id), observability::StringField("run_id", job.run_id),
                                     observability::IntField("delay_seconds", static_cast<int64_t>(delay_seconds)),
                                     observability::StringField("reason", reason)});
}

void JobQueue::MarkJobCancelled(db::Transaction& tx, db::model::JobRecord& job, uint64_t now_ms) {
  job.status = JobStatus::kCancelled;
  Release(job, now_ms);
  Save(tx, job);
}

bool JobQueue::RequestCancel(db::Transaction& tx, const std::string& tenant_id, const std::string& run_id, uint64_t now_ms) {
  auto job = repo_->FindActiveJob(tx, tenant_id, run_id, db::model::kCompanyResearchJobType);
  if (!job) {
    return false;
  }
  job->cancel_requested = true;
  job->updated_at_ms    = now_ms;
  Save(tx, *job);
  return true;
}

} // namespace research::pipeline
