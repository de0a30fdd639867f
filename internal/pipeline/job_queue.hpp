#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>

#include "config/config.pb.h"
#include "internal/db/api/repository.hpp"

namespace research::pipeline {

/*
  Durable run queue on top of the jobs table.

  Claiming is a single conditional update in its own transaction; a claim that
  loses a race returns nothing. The claiming worker keeps its lock alive with
  heartbeats; a lock older than job_lock_timeout_seconds may be claimed by
  another worker. Every other operation writes inside the
  caller's transaction so job state commits together with run and step state.
*/
class JobQueue {
 public:
  JobQueue(std::shared_ptr<db::Repository> repo, research::runtime::config::WorkerConfig config);

  // Returns the active job of the run, inserting a queued one when none exists.
  db::model::JobRecord EnqueueRunJob(db::Transaction& tx, const std::string& tenant_id, const std::string& run_id, uint64_t now_ms);

  // Oldest eligible job: queued and due, or running with an expired lock.
  std::optional<db::model::JobRecord> ClaimNextJob(const std::string& worker_id);

  // Reloads job inside tx and refreshes the lock held by worker_id, so the
  // heartbeat commits with the caller's writes. Throws LeaseLost when the job
  // is no longer running under worker_id.
  void VerifyLease(db::Transaction& tx, db::model::JobRecord& job, const std::string& worker_id, uint64_t now_ms);

  // VerifyLease in a transaction of its own.
  void Heartbeat(db::model::JobRecord& job, const std::string& worker_id);

  void MarkJobSucceeded(db::Transaction& tx, db::model::JobRecord& job, uint64_t now_ms);

  // Consumes an attempt. Returns true when the job is now terminally failed.
  bool MarkJobFailed(db::Transaction& tx, db::model::JobRecord& job, const std::string& error, uint64_t backoff_seconds, bool terminal,
                     uint64_t now_ms);

  // Requeues without consuming an attempt.
  void DeferJob(db::Transaction& tx, db::model::JobRecord& job, uint64_t delay_seconds, const std::string& reason, uint64_t now_ms);

  void MarkJobCancelled(db::Transaction& tx, db::model::JobRecord& job, uint64_t now_ms);

  // Flags the active job of the run. Returns false when there is none.
  bool RequestCancel(db::Transaction& tx, const std::string& tenant_id, const std::string& run_id, uint64_t now_ms);

 private:
  void Release(db::model::JobRecord& job, uint64_t now_ms);
  void Save(db::Transaction& tx, const db::model::JobRecord& job);

  std::shared_ptr<db::Repository>         repo_;
  research::runtime::config::WorkerConfig config_;
};

} // namespace research::pipeline
