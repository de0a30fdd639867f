#include "internal/service/run_service.hpp"

#include <algorithm>
#include <cassert>
#include <iostream>
#include <memory>
#include <string>

#include "internal/config/config_loader.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/model/step_key.hpp"
#include "internal/pipeline/job_queue.hpp"
#include "internal/util/errors.hpp"

namespace {

using research::model::JobStatus;
using research::model::RunStatus;
using research::model::SourceType;
using research::model::StepStatus;
using research::service::CancelOutcome;
using research::service::RunService;
using research::service::SourceInput;

constexpr const char* kTenant = "tenant-a";

struct Harness {
  Harness() : repo(std::make_shared<research::db::memory::MemoryRepository>()) {
    research::runtime::config::RuntimeConfig config;
    research::config::ResolveDefaults(config);

    research::service::ServiceContext ctx;
    ctx.repository = repo;
    ctx.jobs       = std::make_shared<research::pipeline::JobQueue>(repo, config.worker());
    ctx.worker     = config.worker();
    ctx.ranking    = config.ranking();
    runs           = std::make_unique<RunService>(ctx);
  }

  std::shared_ptr<research::db::memory::MemoryRepository> repo;
  std::unique_ptr<RunService>                             runs;
};

SourceInput TextSource(const std::string& text) {
  SourceInput input;
  input.source_type  = SourceType::kText;
  input.title        = "notes";
  input.content_text = text;
  return input;
}

template <typename E, typename Fn>
bool Throws(Fn&& fn) {
  try {
    fn();
  } catch (const E&) {
    return true;
  }
  return false;
}

bool HasEvent(const std::vector<research::db::model::EventRecord>& events, const std::string& type) {
  return std::any_of(events.begin(), events.end(), [&](const auto& event) { return event.event_type == type; });
}

// Puts the run into the state a worker leaves behind after a terminal step failure.
void FailRun(Harness& h, const std::string& run_id, const std::string& job_id) {
  auto tx = h.repo->Begin();

  auto run           = *h.repo->GetRun(*tx, kTenant, run_id);
  run.status         = RunStatus::kFailed;
  run.last_error     = "step finalize failed";
  run.finished_at_ms = 99;
  assert(h.repo->UpdateRun(*tx, run));

  auto job   = *h.repo->GetJob(*tx, job_id);
  job.status = JobStatus::kFailed;
  assert(h.repo->UpdateJob(*tx, job));

  for (auto step : h.repo->ListSteps(*tx, kTenant, run_id)) {
    if (step.step_key == "finalize") {
      step.status        = StepStatus::kFailed;
      step.attempt_count = step.max_attempts;
      step.last_error    = "boom";
    } else {
      step.status = StepStatus::kSucceeded;
    }
    assert(h.repo->UpdateStep(*tx, step));
  }
  tx->Commit();
}

void TestCreateRun() {
  Harness    h;
  const auto run = h.runs->CreateRun(kTenant, "q3 shortlist");
  assert(!run.id.empty());
  assert(run.status == RunStatus::kQueued);

  const auto loaded = h.runs->GetRun(kTenant, run.id);
  assert(loaded.name == "q3 shortlist");
  assert(HasEvent(h.runs->ListEvents(kTenant, run.id), "run_created"));

  assert(Throws<research::util::InvalidArgument>([&] { h.runs->CreateRun("", "x"); }));
  assert(Throws<research::util::NotFound>([&] { h.runs->GetRun(kTenant, "missing"); }));
  assert(Throws<research::util::NotFound>([&] { h.runs->GetRun("tenant-b", run.id); }));
}

void TestAttachSourceValidation() {
  Harness    h;
  const auto run = h.runs->CreateRun(kTenant, "attach");

  SourceInput url;
  url.source_type = SourceType::kUrl;
  url.url         = "  ";
  assert(Throws<research::util::InvalidArgument>([&] { h.runs->AttachSource(kTenant, run.id, url); }));
  assert(Throws<research::util::InvalidArgument>([&] { h.runs->AttachSource(kTenant, run.id, TextSource("   ")); }));
  assert(Throws<research::util::NotFound>([&] { h.runs->AttachSource(kTenant, "missing", TextSource("Acme Robotics")); }));

  url.url = " https://example.com/list ";
  const auto doc = h.runs->AttachSource(kTenant, run.id, url);
  assert(doc.url == "https://example.com/list");
  assert(doc.status == research::model::SourceStatus::kNew);
  assert(doc.max_attempts == 3);

  SourceInput pdf;
  pdf.source_type   = SourceType::kPdf;
  pdf.title         = "annual report";
  pdf.content_bytes = "%PDF-1.4";
  const auto pdf_doc = h.runs->AttachSource(kTenant, run.id, pdf);
  assert(pdf_doc.content_bytes.empty());

  assert(h.runs->ListSources(kTenant, run.id).size() == 2);
  assert(HasEvent(h.runs->ListEvents(kTenant, run.id), "source_attached"));
}

void TestStartCreatesPlanAndSingleJob() {
  Harness    h;
  const auto run = h.runs->CreateRun(kTenant, "start");
  h.runs->AttachSource(kTenant, run.id, TextSource("Acme Robotics"));

  const auto first  = h.runs->StartRun(kTenant, run.id);
  const auto second = h.runs->StartRun(kTenant, run.id);
  assert(first.id == second.id);
  assert(first.status == JobStatus::kQueued);
  assert(first.max_attempts == 10);

  const auto steps = h.runs->ListSteps(kTenant, run.id);
  assert(steps.size() == research::model::kStepCount);
  assert(HasEvent(h.runs->ListEvents(kTenant, run.id), "run_started"));

  assert(Throws<research::util::NotFound>([&] { h.runs->StartRun(kTenant, "missing"); }));
}

void TestAttachAfterStartConflicts() {
  Harness    h;
  const auto run = h.runs->CreateRun(kTenant, "locked");
  h.runs->StartRun(kTenant, run.id);

  // the worker moves the run to running and locks the plan
  {
    auto tx       = h.repo->Begin();
    auto record   = *h.repo->GetRun(*tx, kTenant, run.id);
    record.status = RunStatus::kRunning;
    assert(h.repo->UpdateRun(*tx, record));
    tx->Commit();
  }
  assert(Throws<research::util::Conflict>([&] { h.runs->AttachSource(kTenant, run.id, TextSource("Acme Robotics")); }));
}

void TestCancelOutcomes() {
  Harness h;
  assert(h.runs->CancelRun(kTenant, "missing") == CancelOutcome::kNotFound);

  // no job yet: cancelled directly
  const auto idle = h.runs->CreateRun(kTenant, "idle");
  assert(h.runs->CancelRun(kTenant, idle.id) == CancelOutcome::kNoActiveJob);
  assert(h.runs->GetRun(kTenant, idle.id).status == RunStatus::kCancelled);
  assert(h.runs->GetRun(kTenant, idle.id).finished_at_ms != 0);
  assert(HasEvent(h.runs->ListEvents(kTenant, idle.id), "run_cancelled"));

  // already terminal
  assert(h.runs->CancelRun(kTenant, idle.id) == CancelOutcome::kNoopTerminal);

  // active job: flagged for the worker
  const auto active = h.runs->CreateRun(kTenant, "active");
  const auto job    = h.runs->StartRun(kTenant, active.id);
  assert(h.runs->CancelRun(kTenant, active.id) == CancelOutcome::kRequested);
  assert(h.runs->GetRun(kTenant, active.id).status == RunStatus::kCancelRequested);
  assert(HasEvent(h.runs->ListEvents(kTenant, active.id), "run_cancel_requested"));

  auto tx = h.repo->Begin();
  assert(h.repo->GetJob(*tx, job.id)->cancel_requested);
  tx->Commit();

  assert(research::service::ToString(CancelOutcome::kRequested) == "requested");
  assert(research::service::ToString(CancelOutcome::kNoopTerminal) == "noop_terminal");
}

void TestRetryOnlyFromFailed() {
  Harness    h;
  const auto run = h.runs->CreateRun(kTenant, "retry");
  const auto job = h.runs->StartRun(kTenant, run.id);

  assert(Throws<research::util::InvalidState>([&] { h.runs->RetryRun(kTenant, run.id); }));

  FailRun(h, run.id, job.id);
  const auto retry = h.runs->RetryRun(kTenant, run.id);
  assert(retry.id != job.id);
  assert(retry.status == JobStatus::kQueued);

  const auto reset = h.runs->GetRun(kTenant, run.id);
  assert(reset.status == RunStatus::kQueued);
  assert(reset.last_error.empty());
  assert(reset.finished_at_ms == 0);

  for (const auto& step : h.runs->ListSteps(kTenant, run.id)) {
    if (step.step_key == "finalize") {
      assert(step.status == StepStatus::kPending);
      assert(step.attempt_count == 0);
    } else {
      assert(step.status == StepStatus::kSucceeded);
    }
  }
  assert(HasEvent(h.runs->ListEvents(kTenant, run.id), "run_retry"));
  assert(Throws<research::util::NotFound>([&] { h.runs->RetryRun(kTenant, "missing"); }));
}

void TestRankedProspectsRequiresRun() {
  Harness    h;
  const auto run = h.runs->CreateRun(kTenant, "empty");
  assert(h.runs->RankedProspects(kTenant, run.id).prospects_size() == 0);
  assert(Throws<research::util::NotFound>([&] { h.runs->RankedProspects(kTenant, "missing"); }));
  assert(h.runs->ListAssignments(kTenant, "company", "nobody").empty());
}

} // namespace

int main() {
  TestCreateRun();
  TestAttachSourceValidation();
  TestStartCreatesPlanAndSingleJob();
  TestAttachAfterStartConflicts();
  TestCancelOutcomes();
  TestRetryOnlyFromFailed();
  TestRankedProspectsRequiresRun();

  std::cout << "research_unit_run_service: pass\n";
  return 0;
}
