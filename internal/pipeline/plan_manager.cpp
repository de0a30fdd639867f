#include "plan_manager.hpp"

#include <algorithm>
#include <set>

#include "internal/core/db_error.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"
#include "internal/util/uuid.hpp"

namespace research::pipeline {

using research::model::StepKey;
using research::model::StepStatus;

namespace {

bool Terminal(const db::model::StepRecord& step) {
  return research::model::IsTerminal(step.status, step.attempt_count, step.max_attempts);
}

} // namespace

PlanManager::PlanManager(db::Repository& repo, research::runtime::config::WorkerConfig config) : repo_(repo), config_(std::move(config)) {
}

uint32_t PlanManager::MaxAttemptsFor(StepKey key) const {
  if (key == StepKey::kFetchUrlSources) {
    // Per-source retries must be able to finish before the step gives up.
    return std::max(config_.step_max_attempts(), config_.source_max_attempts() + 1);
  }
  return config_.step_max_attempts();
}

void PlanManager::Save(db::Transaction& tx, const db::model::StepRecord& step) {
  core::ThrowIfDbError(repo_.UpdateStep(tx, step), "update step " + step.step_key);
}

// ------------------------------------------------------------

db::model::PlanRecord PlanManager::EnsurePlanAndSteps(db::Transaction& tx, const db::model::RunRecord& run, uint64_t now_ms) {
  auto plan = repo_.GetPlan(tx, run.tenant_id, run.id);
  if (!plan) {
    db::model::PlanRecord fresh;
    fresh.id            = util::NewId();
    fresh.tenant_id     = run.tenant_id;
    fresh.run_id        = run.id;
    fresh.version       = 1;
    fresh.created_at_ms = now_ms;

    auto result = repo_.InsertPlan(tx, fresh);
    if (result.code != db::ErrorCode::AlreadyExists) {
      core::ThrowIfDbError(result, "insert plan for run " + run.id);
    }
    plan = repo_.GetPlan(tx, run.tenant_id, run.id);
    if (!plan) {
      throw util::InvalidState("plan for run " + run.id + " vanished after insert");
    }
  }

  std::set<std::string> existing;
  for (const auto& step : repo_.ListSteps(tx, run.tenant_id, run.id)) {
    existing.insert(step.step_key);
  }

  for (auto key : research::model::kPlanSteps) {
    const std::string step_key(research::model::ToString(key));
    if (existing.contains(step_key)) continue;

    db::model::StepRecord step;
    step.id            = util::NewId();
    step.tenant_id     = run.tenant_id;
    step.run_id        = run.id;
    step.plan_id       = plan->id;
    step.step_key      = step_key;
    step.step_order    = research::model::StepOrder(key);
    step.status        = StepStatus::kPending;
    step.max_attempts  = MaxAttemptsFor(key);
    step.created_at_ms = now_ms;
    step.updated_at_ms = now_ms;

    auto result = repo_.InsertStep(tx, step);
    if (result.code != db::ErrorCode::AlreadyExists) {
      core::ThrowIfDbError(result, "insert step " + step_key);
    }
  }
  return *plan;
}

void PlanManager::LockPlanOnStart(db::Transaction& tx, db::model::PlanRecord& plan, uint64_t now_ms) {
  if (plan.locked_at_ms != 0) {
    return;
  }
  plan.locked_at_ms = now_ms;
  core::ThrowIfDbError(repo_.UpdatePlan(tx, plan), "lock plan " + plan.id);
}

// ------------------------------------------------------------

StepClaim PlanManager::ClaimNextStep(db::Transaction& tx, const std::string& tenant_id, const std::string& run_id, uint64_t now_ms) {
  StepClaim claim;

  auto steps = repo_.ListSteps(tx, tenant_id, run_id);
  for (auto& step : steps) {
    if (Terminal(step)) {
      if (step.status == StepStatus::kFailed) claim.any_failed = true;
      continue;
    }

    if (step.status == StepStatus::kFailed && step.next_retry_at_ms > now_ms) {
      claim.wait_until_ms = step.next_retry_at_ms;
      return claim;
    }

    if (step.status == StepStatus::kRunning && step.attempt_count >= step.max_attempts) {
      // Left running by a worker that died on its last attempt.
      step.status         = StepStatus::kFailed;
      step.last_error     = "abandoned on final attempt";
      step.finished_at_ms = now_ms;
      step.updated_at_ms  = now_ms;
      Save(tx, step);
      claim.any_failed = true;
      continue;
    }

    step.status = StepStatus::kRunning;
    step.attempt_count += 1;
    step.started_at_ms    = now_ms;
    step.finished_at_ms   = 0;
    step.next_retry_at_ms = 0;
    step.updated_at_ms    = now_ms;
    Save(tx, step);

    claim.step = std::move(step);
    return claim;
  }

  claim.all_settled = true;
  return claim;
}

void PlanManager::MarkStepSucceeded(db::Transaction& tx, db::model::StepRecord& step, const std::string& output_json, uint64_t now_ms) {
  step.status      = StepStatus::kSucceeded;
  step.output_json = output_json;
  step.last_error.clear();
  step.finished_at_ms = now_ms;
  step.updated_at_ms  = now_ms;
  Save(tx, step);
}

void PlanManager::MarkStepSkipped(db::Transaction& tx, db::model::StepRecord& step, const std::string& output_json, uint64_t now_ms) {
  step.status      = StepStatus::kSkipped;
  step.output_json = output_json;
  step.last_error.clear();
  step.finished_at_ms = now_ms;
  step.updated_at_ms  = now_ms;
  Save(tx, step);
}

bool PlanManager::MarkStepFailed(db::Transaction& tx, db::model::StepRecord& step, const std::string& error, uint64_t backoff_seconds,
                                 bool terminal, uint64_t now_ms) {
  step.status         = StepStatus::kFailed;
  step.last_error     = error;
  step.finished_at_ms = now_ms;
  step.updated_at_ms  = now_ms;
  if (terminal) {
    step.max_attempts = step.attempt_count;
  }

  const bool exhausted = step.attempt_count >= step.max_attempts;
  step.next_retry_at_ms = exhausted ? 0 : util::MillisAfter(now_ms, backoff_seconds);
  Save(tx, step);
  return exhausted;
}

uint32_t PlanManager::CancelOpenSteps(db::Transaction& tx, const std::string& tenant_id, const std::string& run_id, uint64_t now_ms) {
  uint32_t changed = 0;
  for (auto& step : repo_.ListSteps(tx, tenant_id, run_id)) {
    if (Terminal(step)) continue;
    step.status           = StepStatus::kCancelled;
    step.next_retry_at_ms = 0;
    step.finished_at_ms   = now_ms;
    step.updated_at_ms    = now_ms;
    Save(tx, step);
    ++changed;
  }
  return changed;
}

uint32_t PlanManager::ResetFailedSteps(db::Transaction& tx, const std::string& tenant_id, const std::string& run_id, uint64_t now_ms) {
  uint32_t changed = 0;
  for (auto& step : repo_.ListSteps(tx, tenant_id, run_id)) {
    if (step.status != StepStatus::kFailed) continue;

    const auto key        = research::model::ParseStepKey(step.step_key);
    step.status           = StepStatus::kPending;
    step.attempt_count    = 0;
    step.max_attempts     = key ? MaxAttemptsFor(*key) : config_.step_max_attempts();
    step.last_error.clear();
    step.next_retry_at_ms = 0;
    step.started_at_ms    = 0;
    step.finished_at_ms   = 0;
    step.updated_at_ms    = now_ms;
    Save(tx, step);
    ++changed;
  }
  return changed;
}

std::vector<std::string> PlanManager::Blockers(db::Transaction& tx, const std::string& tenant_id, const std::string& run_id, StepKey exclude_key) {
  const auto               excluded = research::model::ToString(exclude_key);
  std::vector<std::string> blockers;
  for (const auto& step : repo_.ListSteps(tx, tenant_id, run_id)) {
    if (step.step_key == excluded) continue;
    if (!research::model::IsSettled(step.status)) {
      blockers.push_back(step.step_key);
    }
  }
  return blockers;
}

} // namespace research::pipeline
