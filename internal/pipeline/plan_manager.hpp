#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "config/config.pb.h"
#include "internal/db/api/repository.hpp"
#include "internal/model/step_key.hpp"

namespace research::pipeline {

struct StepClaim {
  std::optional<db::model::StepRecord> step;

  // No step can run any more: every step is terminal.
  bool all_settled = false;
  // Some terminal step failed (only meaningful with all_settled).
  bool any_failed = false;
  // Earliest time the blocking step may retry (only without step/all_settled).
  uint64_t wait_until_ms = 0;
};

/*
  Plan / step state machine of one run.

  Steps run strictly in step_order: the lowest non-terminal step is the only
  candidate, and a failed step waiting for its retry time blocks the ones
  behind it. All operations write inside the caller's transaction.
*/
class PlanManager {
 public:
  PlanManager(db::Repository& repo, research::runtime::config::WorkerConfig config);

  // Idempotent; creates the version 1 plan and the fixed steps as pending.
  db::model::PlanRecord EnsurePlanAndSteps(db::Transaction& tx, const db::model::RunRecord& run, uint64_t now_ms);

  // Sets locked_at on first start only.
  void LockPlanOnStart(db::Transaction& tx, db::model::PlanRecord& plan, uint64_t now_ms);

  StepClaim ClaimNextStep(db::Transaction& tx, const std::string& tenant_id, const std::string& run_id, uint64_t now_ms);

  void MarkStepSucceeded(db::Transaction& tx, db::model::StepRecord& step, const std::string& output_json, uint64_t now_ms);
  void MarkStepSkipped(db::Transaction& tx, db::model::StepRecord& step, const std::string& output_json, uint64_t now_ms);

  // Returns true when the step is now terminally failed.
  bool MarkStepFailed(db::Transaction& tx, db::model::StepRecord& step, const std::string& error, uint64_t backoff_seconds, bool terminal,
                      uint64_t now_ms);

  // Every non-terminal step becomes cancelled. Returns the number changed.
  uint32_t CancelOpenSteps(db::Transaction& tx, const std::string& tenant_id, const std::string& run_id, uint64_t now_ms);

  // Failed steps go back to pending with their attempts reset.
  uint32_t ResetFailedSteps(db::Transaction& tx, const std::string& tenant_id, const std::string& run_id, uint64_t now_ms);

  // Keys of steps other than exclude_key that are not succeeded, skipped or cancelled.
  std::vector<std::string> Blockers(db::Transaction& tx, const std::string& tenant_id, const std::string& run_id, research::model::StepKey exclude_key);

  uint32_t MaxAttemptsFor(research::model::StepKey key) const;

 private:
  void Save(db::Transaction& tx, const db::model::StepRecord& step);

  db::Repository&                         repo_;
  research::runtime::config::WorkerConfig config_;
};

} // namespace research::pipeline
