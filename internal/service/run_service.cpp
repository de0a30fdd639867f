#include "run_service.hpp"

#include "internal/core/db_error.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/observability/logging.hpp"
#include "internal/pipeline/event_log.hpp"
#include "internal/pipeline/job_queue.hpp"
#include "internal/pipeline/plan_manager.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/text.hpp"
#include "internal/util/time.hpp"
#include "internal/util/uuid.hpp"

namespace research::service {

using research::model::EventStatus;
using research::model::RunStatus;

namespace {

template <typename Fn>
auto Observe(std::string_view route, const std::string& run_id, Fn&& fn) {
  try {
    return fn();
  } catch (const std::exception& ex) {
    RESEARCH_LOG_ERROR("operation failed", {observability::StringField("route", route), observability::StringField("run_id", run_id),
                                            observability::StringField("error", ex.what())});
    throw;
  }
}

db::model::RunRecord RequireRun(db::Repository& repo, db::Transaction& tx, const std::string& tenant_id, const std::string& run_id) {
  auto run = repo.GetRun(tx, tenant_id, run_id);
  if (!run) {
    throw util::NotFound("run " + run_id);
  }
  return *run;
}

research::v1::EventDetail Detail(const std::string& message) {
  research::v1::EventDetail detail;
  detail.set_message(message);
  return detail;
}

void ValidateSource(const SourceInput& input) {
  using research::model::SourceType;
  switch (input.source_type) {
    case SourceType::kUrl:
      if (util::Trim(input.url).empty()) throw util::InvalidArgument("url source requires a url");
      break;
    case SourceType::kText:
    case SourceType::kList:
    case SourceType::kProposal:
      if (util::Trim(input.content_text).empty()) {
        throw util::InvalidArgument(std::string(research::model::ToString(input.source_type)) + " source requires content text");
      }
      break;
    case SourceType::kPdf:
      // Missing bytes are recorded as a quality flag during extraction.
      break;
  }
}

} // namespace

std::string_view ToString(CancelOutcome outcome) {
  switch (outcome) {
    case CancelOutcome::kNotFound:
      return "not_found";
    case CancelOutcome::kNoopTerminal:
      return "noop_terminal";
    case CancelOutcome::kRequested:
      return "requested";
    case CancelOutcome::kNoActiveJob:
      return "no_active_job";
  }
  return "unknown";
}

RunService::RunService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

// ------------------------------------------------------------

db::model::RunRecord RunService::CreateRun(const std::string& tenant_id, const std::string& name) {
  return Observe("RunService.CreateRun", {}, [&] {
    if (tenant_id.empty()) throw util::InvalidArgument("tenant_id is required");

    const auto now = util::NowMillis();

    db::model::RunRecord run;
    run.id            = util::NewId();
    run.tenant_id     = tenant_id;
    run.name          = name;
    run.status        = RunStatus::kQueued;
    run.created_at_ms = now;
    run.updated_at_ms = now;

    auto tx = ctx_.repository->Begin();
    core::ThrowIfDbError(ctx_.repository->InsertRun(*tx, run), "insert run");
    pipeline::AppendEvent(*ctx_.repository, *tx, tenant_id, run.id, "run_created", EventStatus::kOk, Detail(name));
    tx->Commit();

    RESEARCH_LOG_INFO("run created", {observability::StringField("run_id", run.id), observability::StringField("tenant_id", tenant_id)});
    return run;
  });
}

db::model::SourceDocumentRecord RunService::AttachSource(const std::string& tenant_id, const std::string& run_id, const SourceInput& input) {
  return Observe("RunService.AttachSource", run_id, [&] {
    ValidateSource(input);

    const auto now = util::NowMillis();
    auto       tx  = ctx_.repository->Begin();

    const auto run = RequireRun(*ctx_.repository, *tx, tenant_id, run_id);
    if (run.status != RunStatus::kQueued) {
      throw util::Conflict("run " + run_id + " is " + std::string(research::model::ToString(run.status)) + "; sources can no longer be attached");
    }
    if (auto plan = ctx_.repository->GetPlan(*tx, tenant_id, run_id); plan && plan->locked_at_ms != 0) {
      throw util::Conflict("plan of run " + run_id + " is locked; sources can no longer be attached");
    }

    db::model::SourceDocumentRecord doc;
    doc.id            = util::NewId();
    doc.tenant_id     = tenant_id;
    doc.run_id        = run_id;
    doc.source_type   = input.source_type;
    doc.status        = research::model::SourceStatus::kNew;
    doc.title         = input.title;
    doc.url           = util::Trim(input.url);
    doc.content_text  = input.content_text;
    doc.content_bytes = input.content_bytes;
    doc.mime_type     = input.mime_type;
    doc.max_attempts  = ctx_.worker.source_max_attempts();
    doc.created_at_ms = now;
    doc.updated_at_ms = now;

    core::ThrowIfDbError(ctx_.repository->InsertSource(*tx, doc), "insert source");

    auto detail = Detail(std::string(research::model::ToString(doc.source_type)));
    detail.set_source_id(doc.id);
    pipeline::AppendEvent(*ctx_.repository, *tx, tenant_id, run_id, "source_attached", EventStatus::kOk, detail);
    tx->Commit();

    // Raw bytes stay in the store only.
    doc.content_bytes.clear();
    return doc;
  });
}

db::model::JobRecord RunService::StartRun(const std::string& tenant_id, const std::string& run_id) {
  return Observe("RunService.StartRun", run_id, [&] {
    const auto now = util::NowMillis();
    auto       tx  = ctx_.repository->Begin();

    const auto run = RequireRun(*ctx_.repository, *tx, tenant_id, run_id);
    if (run.status != RunStatus::kQueued && run.status != RunStatus::kRunning) {
      throw util::InvalidState("run " + run_id + " is " + std::string(research::model::ToString(run.status)) + " and cannot be started");
    }

    pipeline::PlanManager plans(*ctx_.repository, ctx_.worker);
    plans.EnsurePlanAndSteps(*tx, run, now);

    auto job    = ctx_.jobs->EnqueueRunJob(*tx, tenant_id, run_id, now);
    auto detail = Detail("started");
    detail.set_job_id(job.id);
    pipeline::AppendEvent(*ctx_.repository, *tx, tenant_id, run_id, "run_started", EventStatus::kOk, detail);
    tx->Commit();
    return job;
  });
}

CancelOutcome RunService::CancelRun(const std::string& tenant_id, const std::string& run_id) {
  return Observe("RunService.CancelRun", run_id, [&] {
    const auto now = util::NowMillis();
    auto       tx  = ctx_.repository->Begin();

    auto run = ctx_.repository->GetRun(*tx, tenant_id, run_id);
    if (!run) {
      return CancelOutcome::kNotFound;
    }
    if (research::model::IsTerminal(run->status)) {
      return CancelOutcome::kNoopTerminal;
    }

    if (ctx_.jobs->RequestCancel(*tx, tenant_id, run_id, now)) {
      run->status        = RunStatus::kCancelRequested;
      run->updated_at_ms = now;
      core::ThrowIfDbError(ctx_.repository->UpdateRun(*tx, *run), "update run " + run_id);
      pipeline::AppendEvent(*ctx_.repository, *tx, tenant_id, run_id, "run_cancel_requested", EventStatus::kOk, Detail("cancel requested"));
      tx->Commit();
      RESEARCH_LOG_INFO("run cancel requested", {observability::StringField("run_id", run_id)});
      return CancelOutcome::kRequested;
    }

    pipeline::PlanManager plans(*ctx_.repository, ctx_.worker);
    plans.CancelOpenSteps(*tx, tenant_id, run_id, now);
    run->status         = RunStatus::kCancelled;
    run->finished_at_ms = now;
    run->updated_at_ms  = now;
    core::ThrowIfDbError(ctx_.repository->UpdateRun(*tx, *run), "update run " + run_id);
    pipeline::AppendEvent(*ctx_.repository, *tx, tenant_id, run_id, "run_cancelled", EventStatus::kCancelled, Detail("no active job"));
    tx->Commit();
    RESEARCH_LOG_INFO("run cancelled", {observability::StringField("run_id", run_id)});
    return CancelOutcome::kNoActiveJob;
  });
}

db::model::JobRecord RunService::RetryRun(const std::string& tenant_id, const std::string& run_id) {
  return Observe("RunService.RetryRun", run_id, [&] {
    const auto now = util::NowMillis();
    auto       tx  = ctx_.repository->Begin();

    auto run = RequireRun(*ctx_.repository, *tx, tenant_id, run_id);
    if (!research::model::CanRetry(run.status)) {
      throw util::InvalidState("run " + run_id + " is " + std::string(research::model::ToString(run.status)) + "; only failed runs can be retried");
    }

    pipeline::PlanManager plans(*ctx_.repository, ctx_.worker);
    const auto            reset = plans.ResetFailedSteps(*tx, tenant_id, run_id, now);

    run.status         = RunStatus::kQueued;
    run.last_error.clear();
    run.finished_at_ms = 0;
    run.updated_at_ms  = now;
    core::ThrowIfDbError(ctx_.repository->UpdateRun(*tx, run), "update run " + run_id);

    auto job    = ctx_.jobs->EnqueueRunJob(*tx, tenant_id, run_id, now);
    auto detail = Detail("steps reset: " + std::to_string(reset));
    detail.set_job_id(job.id);
    pipeline::AppendEvent(*ctx_.repository, *tx, tenant_id, run_id, "run_retry", EventStatus::kOk, detail);
    tx->Commit();

    RESEARCH_LOG_INFO("run retried", {observability::StringField("run_id", run_id), observability::IntField("steps_reset", reset)});
    return job;
  });
}

// ------------------------------------------------------------

db::model::RunRecord RunService::GetRun(const std::string& tenant_id, const std::string& run_id) {
  auto tx  = ctx_.repository->Begin();
  auto run = RequireRun(*ctx_.repository, *tx, tenant_id, run_id);
  tx->Commit();
  return run;
}

std::vector<db::model::StepRecord> RunService::ListSteps(const std::string& tenant_id, const std::string& run_id) {
  auto tx    = ctx_.repository->Begin();
  auto steps = ctx_.repository->ListSteps(*tx, tenant_id, run_id);
  tx->Commit();
  return steps;
}

std::vector<db::model::EventRecord> RunService::ListEvents(const std::string& tenant_id, const std::string& run_id) {
  auto tx     = ctx_.repository->Begin();
  auto events = ctx_.repository->ListEvents(*tx, tenant_id, run_id);
  tx->Commit();
  return events;
}

std::vector<db::model::SourceDocumentRecord> RunService::ListSources(const std::string& tenant_id, const std::string& run_id) {
  auto tx      = ctx_.repository->Begin();
  auto sources = ctx_.repository->ListSources(*tx, tenant_id, run_id);
  tx->Commit();
  return sources;
}

research::v1::RankingReport RunService::RankedProspects(const std::string& tenant_id, const std::string& run_id,
                                                        const ranking::RankingFilters& filters) {
  return Observe("RunService.RankedProspects", run_id, [&] {
    auto tx = ctx_.repository->Begin();
    RequireRun(*ctx_.repository, *tx, tenant_id, run_id);

    ranking::ProspectRanker ranker(*ctx_.repository, ctx_.ranking);
    auto                    report = ranker.Rank(*tx, tenant_id, run_id, filters);
    tx->Commit();
    return report;
  });
}

std::vector<enrichment::AssignmentRead> RunService::ListAssignments(const std::string& tenant_id, const std::string& entity_type,
                                                                    const std::string& canonical_id) {
  auto tx = ctx_.repository->Begin();

  enrichment::AssignmentStore store(*ctx_.repository);
  auto                        assignments = store.ListForTarget(*tx, tenant_id, entity_type, canonical_id);
  tx->Commit();
  return assignments;
}

} // namespace research::service
