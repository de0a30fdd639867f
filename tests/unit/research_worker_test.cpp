#include "internal/pipeline/research_worker.hpp"

#include <algorithm>
#include <cassert>
#include <chrono>
#include <functional>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <thread>

#include "internal/config/config_loader.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/service/run_service.hpp"
#include "internal/util/json.hpp"

namespace {

using research::acquisition::FetchRequest;
using research::acquisition::FetchResponse;
using research::acquisition::HttpFetcher;
using research::acquisition::PdfText;
using research::acquisition::PdfTextExtractor;
using research::model::JobStatus;
using research::model::RunStatus;
using research::model::SourceType;
using research::model::StepStatus;
using research::pipeline::ResearchWorker;
using research::pipeline::WorkerOutcome;
using research::service::CancelOutcome;
using research::service::SourceInput;

constexpr const char* kTenant = "tenant-a";

class StatusFetcher final : public HttpFetcher {
 public:
  explicit StatusFetcher(long status) : status_(status) {
  }

  FetchResponse Get(const FetchRequest& request) override {
    ++calls;
    if (on_get) on_get(calls);
    FetchResponse response;
    response.status_code  = status_;
    response.final_url    = request.url;
    response.content_type = "text/html";
    response.body         = "<html><body><p>unavailable</p></body></html>";
    return response;
  }

  int                      calls = 0;
  std::function<void(int)> on_get;

 private:
  long status_;
};

class NoPdf final : public PdfTextExtractor {
 public:
  PdfText Extract(std::string_view) override {
    if (on_extract) on_extract();
    return {};
  }

  std::function<void()> on_extract;
};

struct Harness {
  explicit Harness(long fetch_status = 200, uint32_t lock_timeout_seconds = 0)
      : repo(std::make_shared<research::db::memory::MemoryRepository>()) {
    research::runtime::config::RuntimeConfig config;
    config.mutable_worker()->set_worker_id("worker-test");
    config.mutable_worker()->set_job_lock_timeout_seconds(lock_timeout_seconds);
    research::config::ResolveDefaults(config);

    fetcher = std::make_shared<StatusFetcher>(fetch_status);
    pdf     = std::make_shared<NoPdf>();
    jobs    = std::make_shared<research::pipeline::JobQueue>(repo, config.worker());

    research::pipeline::PipelineServices services;
    services.acquisition = std::make_shared<research::acquisition::SourceAcquisition>(fetcher, pdf, config.fetch());
    services.worker      = config.worker();
    services.ranking     = config.ranking();
    worker               = std::make_unique<ResearchWorker>(repo, jobs, services);

    research::service::ServiceContext ctx;
    ctx.repository = repo;
    ctx.jobs       = jobs;
    ctx.worker     = config.worker();
    ctx.ranking    = config.ranking();
    runs           = std::make_unique<research::service::RunService>(ctx);
  }

  std::shared_ptr<research::db::memory::MemoryRepository> repo;
  std::shared_ptr<StatusFetcher>                          fetcher;
  std::shared_ptr<NoPdf>                                  pdf;
  std::shared_ptr<research::pipeline::JobQueue>           jobs;
  std::unique_ptr<ResearchWorker>                         worker;
  std::unique_ptr<research::service::RunService>          runs;
};

SourceInput ListSource(const std::string& text) {
  SourceInput input;
  input.source_type  = SourceType::kList;
  input.title        = "shortlist";
  input.content_text = text;
  return input;
}

SourceInput UrlSource(const std::string& url) {
  SourceInput input;
  input.source_type = SourceType::kUrl;
  input.url         = url;
  return input;
}

research::db::model::JobRecord JobOf(Harness& h, const std::string& job_id) {
  auto tx  = h.repo->Begin();
  auto job = h.repo->GetJob(*tx, job_id);
  tx->Commit();
  assert(job);
  return *job;
}

// Applies fn to the named step of the run in a transaction of its own.
void EditStep(Harness& h, const std::string& run_id, const std::string& key, const std::function<void(research::db::model::StepRecord&)>& fn) {
  auto tx = h.repo->Begin();
  for (auto step : h.repo->ListSteps(*tx, kTenant, run_id)) {
    if (step.step_key != key) continue;
    fn(step);
    assert(h.repo->UpdateStep(*tx, step));
  }
  tx->Commit();
}

const research::db::model::EventRecord* FindEvent(const std::vector<research::db::model::EventRecord>& events, const std::string& type) {
  for (const auto& event : events) {
    if (event.event_type == type) return &event;
  }
  return nullptr;
}

research::v1::EventDetail DetailOf(const research::db::model::EventRecord& event) {
  research::v1::EventDetail detail;
  research::util::FromJson(event.input_json, &detail);
  return detail;
}

bool HasEvent(const std::vector<research::db::model::EventRecord>& events, const std::string& type) {
  return std::any_of(events.begin(), events.end(), [&](const auto& event) { return event.event_type == type; });
}

StepStatus StatusOf(const std::vector<research::db::model::StepRecord>& steps, const std::string& key) {
  for (const auto& step : steps) {
    if (step.step_key == key) return step.status;
  }
  assert(false && "step missing");
  return StepStatus::kPending;
}

void TestIdleWithoutJobs() {
  Harness h;
  assert(h.worker->RunOnce() == WorkerOutcome::kIdle);
  assert(h.worker->WorkerId() == "worker-test");
}

void TestListRunCompletes() {
  Harness    h;
  const auto run = h.runs->CreateRun(kTenant, "list run");
  h.runs->AttachSource(kTenant, run.id, ListSource("1. Acme Robotics GmbH\n2) Borealis Systems\n- Cobalt Analytics\n"));
  h.runs->StartRun(kTenant, run.id);

  assert(h.worker->RunOnce() == WorkerOutcome::kCompleted);

  const auto finished = h.runs->GetRun(kTenant, run.id);
  assert(finished.status == RunStatus::kSucceeded);
  assert(finished.started_at_ms != 0);
  assert(finished.finished_at_ms != 0);

  const auto steps = h.runs->ListSteps(kTenant, run.id);
  assert(StatusOf(steps, "fetch_url_sources") == StepStatus::kSkipped);
  assert(StatusOf(steps, "ingest_lists") == StepStatus::kSucceeded);
  assert(StatusOf(steps, "ingest_proposal") == StepStatus::kSkipped);
  assert(StatusOf(steps, "finalize") == StepStatus::kSucceeded);

  const auto events = h.runs->ListEvents(kTenant, run.id);
  assert(HasEvent(events, "worker_claimed"));
  assert(HasEvent(events, "step_skipped"));
  assert(HasEvent(events, "worker_completed"));

  const auto report = h.runs->RankedProspects(kTenant, run.id);
  assert(report.prospects_size() == 3);
  assert(report.prospects(0).rank() == 1);

  const auto sources = h.runs->ListSources(kTenant, run.id);
  assert(sources.size() == 1);
  assert(sources[0].status == research::model::SourceStatus::kProcessed);

  // the job is done; nothing left to claim
  assert(h.worker->RunOnce() == WorkerOutcome::kIdle);
  assert(h.fetcher->calls == 0);
}

void TestCancelBeforeFirstStep() {
  Harness    h;
  const auto run = h.runs->CreateRun(kTenant, "cancelled");
  h.runs->AttachSource(kTenant, run.id, ListSource("Acme Robotics\nBorealis Systems\n"));
  h.runs->StartRun(kTenant, run.id);
  assert(h.runs->CancelRun(kTenant, run.id) == CancelOutcome::kRequested);

  assert(h.worker->RunOnce() == WorkerOutcome::kCancelled);
  assert(h.runs->GetRun(kTenant, run.id).status == RunStatus::kCancelled);

  for (const auto& step : h.runs->ListSteps(kTenant, run.id)) {
    assert(step.status == StepStatus::kCancelled);
  }
  assert(HasEvent(h.runs->ListEvents(kTenant, run.id), "worker_cancelled"));

  auto tx  = h.repo->Begin();
  auto job = h.repo->FindActiveJob(*tx, kTenant, run.id, research::db::model::kCompanyResearchJobType);
  assert(!job);
  tx->Commit();
}

void TestTransientFetchDefersJob() {
  Harness h(503);

  const auto  run = h.runs->CreateRun(kTenant, "flaky");
  SourceInput url;
  url.source_type = SourceType::kUrl;
  url.url         = "https://example.com/companies";
  h.runs->AttachSource(kTenant, run.id, url);
  const auto job = h.runs->StartRun(kTenant, run.id);

  assert(h.worker->RunOnce() == WorkerOutcome::kDeferred);
  assert(h.fetcher->calls == 1);
  assert(h.runs->GetRun(kTenant, run.id).status == RunStatus::kRunning);

  const auto sources = h.runs->ListSources(kTenant, run.id);
  assert(sources[0].status == research::model::SourceStatus::kFetchFailed);
  assert(sources[0].attempt_count == 1);
  assert(sources[0].next_retry_at_ms != 0);

  const auto events = h.runs->ListEvents(kTenant, run.id);
  assert(HasEvent(events, "fetch_failed"));
  assert(HasEvent(events, "retry_scheduled"));
  assert(HasEvent(events, "worker_deferred"));

  {
    auto tx      = h.repo->Begin();
    auto current = h.repo->GetJob(*tx, job.id);
    assert(current);
    assert(current->status == JobStatus::kQueued);
    assert(current->attempt_count == 0);
    assert(current->locked_by.empty());
    tx->Commit();
  }

  // the retry is not due yet
  assert(h.worker->RunOnce() == WorkerOutcome::kIdle);
  assert(h.fetcher->calls == 1);
}

void TestIdleAfterCompletionWritesNothing() {
  Harness    h;
  const auto run = h.runs->CreateRun(kTenant, "done");
  h.runs->AttachSource(kTenant, run.id, ListSource("Acme Robotics\nBorealis Systems\n"));
  const auto job = h.runs->StartRun(kTenant, run.id);
  assert(h.worker->RunOnce() == WorkerOutcome::kCompleted);

  const auto events_before = h.runs->ListEvents(kTenant, run.id).size();
  const auto run_before    = h.runs->GetRun(kTenant, run.id);
  const auto job_before    = JobOf(h, job.id);
  assert(job_before.status == JobStatus::kSucceeded);

  assert(h.worker->RunOnce() == WorkerOutcome::kIdle);

  assert(h.runs->ListEvents(kTenant, run.id).size() == events_before);
  const auto run_after = h.runs->GetRun(kTenant, run.id);
  assert(run_after.status == RunStatus::kSucceeded);
  assert(run_after.updated_at_ms == run_before.updated_at_ms);
  assert(run_after.finished_at_ms == run_before.finished_at_ms);
  const auto job_after = JobOf(h, job.id);
  assert(job_after.status == job_before.status);
  assert(job_after.updated_at_ms == job_before.updated_at_ms);
  assert(job_after.locked_by.empty());
}

void TestCancelAfterFirstStepCommitted() {
  Harness h;

  const auto run = h.runs->CreateRun(kTenant, "cancel mid-run");
  h.runs->AttachSource(kTenant, run.id, UrlSource("https://example.com/about"));
  SourceInput pdf;
  pdf.source_type   = SourceType::kPdf;
  pdf.title         = "brochure";
  pdf.content_bytes = "%PDF-1.4 brochure";
  h.runs->AttachSource(kTenant, run.id, pdf);
  h.runs->StartRun(kTenant, run.id);

  // extract_url_sources is the second step; fetch_url_sources has committed by now
  std::optional<CancelOutcome> cancel;
  h.pdf->on_extract = [&] { cancel = h.runs->CancelRun(kTenant, run.id); };

  assert(h.worker->RunOnce() == WorkerOutcome::kCancelled);
  assert(cancel == CancelOutcome::kRequested);
  assert(h.fetcher->calls == 1);
  assert(h.runs->GetRun(kTenant, run.id).status == RunStatus::kCancelled);

  const auto steps = h.runs->ListSteps(kTenant, run.id);
  assert(StatusOf(steps, "fetch_url_sources") == StepStatus::kSucceeded);
  assert(StatusOf(steps, "extract_url_sources") == StepStatus::kCancelled);
  assert(StatusOf(steps, "finalize") == StepStatus::kCancelled);

  // the fetched page survived; the pdf was never written
  for (const auto& doc : h.runs->ListSources(kTenant, run.id)) {
    if (doc.source_type == SourceType::kUrl) {
      assert(doc.status == research::model::SourceStatus::kFetched);
    } else {
      assert(doc.content_text.empty());
      assert(doc.attempt_count == 0);
    }
  }

  const auto events = h.runs->ListEvents(kTenant, run.id);
  assert(HasEvent(events, "fetch_succeeded"));
  assert(HasEvent(events, "worker_cancelled"));
  assert(!HasEvent(events, "extract_failed"));
}

void TestCancelDuringFetch() {
  Harness    h;
  const auto run = h.runs->CreateRun(kTenant, "cancel while fetching");
  h.runs->AttachSource(kTenant, run.id, UrlSource("https://example.com/a"));
  h.runs->AttachSource(kTenant, run.id, UrlSource("https://example.com/b"));
  h.runs->StartRun(kTenant, run.id);

  // no transaction is open while the request is in flight, so the cancel commits
  std::optional<CancelOutcome> cancel;
  h.fetcher->on_get = [&](int call) {
    if (call == 1) cancel = h.runs->CancelRun(kTenant, run.id);
  };

  assert(h.worker->RunOnce() == WorkerOutcome::kCancelled);
  assert(cancel == CancelOutcome::kRequested);
  assert(h.fetcher->calls == 1);
  assert(h.runs->GetRun(kTenant, run.id).status == RunStatus::kCancelled);

  for (const auto& step : h.runs->ListSteps(kTenant, run.id)) {
    assert(step.status == StepStatus::kCancelled);
  }
  for (const auto& doc : h.runs->ListSources(kTenant, run.id)) {
    assert(doc.status != research::model::SourceStatus::kFetched);
  }
  const auto events = h.runs->ListEvents(kTenant, run.id);
  const auto* cancelled = FindEvent(events, "worker_cancelled");
  assert(cancelled && DetailOf(*cancelled).step_key() == "fetch_url_sources");
  assert(!HasEvent(events, "fetch_succeeded"));
}

void TestSlowFetchLosesExpiredLease() {
  Harness    h(200, 1);
  const auto run = h.runs->CreateRun(kTenant, "slow fetch");
  h.runs->AttachSource(kTenant, run.id, UrlSource("https://example.com/slow"));
  const auto job = h.runs->StartRun(kTenant, run.id);

  // the lock expires mid-request and a second worker takes the job
  std::optional<research::db::model::JobRecord> taken;
  h.fetcher->on_get = [&](int) {
    std::this_thread::sleep_for(std::chrono::milliseconds(1300));
    taken = h.jobs->ClaimNextJob("worker-b");
  };

  assert(h.worker->RunOnce() == WorkerOutcome::kLeaseLost);
  assert(taken && taken->id == job.id);

  const auto current = JobOf(h, job.id);
  assert(current.status == JobStatus::kRunning);
  assert(current.locked_by == "worker-b");
  assert(current.attempt_count == 0);

  // the first worker wrote nothing after losing the job
  assert(h.runs->GetRun(kTenant, run.id).status == RunStatus::kRunning);
  const auto steps = h.runs->ListSteps(kTenant, run.id);
  assert(StatusOf(steps, "fetch_url_sources") == StepStatus::kRunning);
  const auto sources = h.runs->ListSources(kTenant, run.id);
  assert(sources[0].status != research::model::SourceStatus::kFetched);
  assert(sources[0].content_text.empty());
  const auto events = h.runs->ListEvents(kTenant, run.id);
  assert(!HasEvent(events, "fetch_succeeded"));
  assert(!HasEvent(events, "worker_failed"));
}

void TestHeartbeatKeepsLeaseAcrossSlowFetches() {
  Harness    h(200, 1);
  const auto run = h.runs->CreateRun(kTenant, "many slow fetches");
  for (const char* url : {"https://example.com/1", "https://example.com/2", "https://example.com/3"}) {
    h.runs->AttachSource(kTenant, run.id, UrlSource(url));
  }
  h.runs->StartRun(kTenant, run.id);

  // each request stays under the lock timeout; together they exceed it
  int steals = 0;
  h.fetcher->on_get = [&](int) {
    std::this_thread::sleep_for(std::chrono::milliseconds(600));
    if (h.jobs->ClaimNextJob("worker-b")) ++steals;
  };

  assert(h.worker->RunOnce() == WorkerOutcome::kCompleted);
  assert(h.fetcher->calls == 3);
  assert(steals == 0);
  assert(h.runs->GetRun(kTenant, run.id).status == RunStatus::kSucceeded);
}

void TestBlockedFinalizeFailsRun() {
  Harness    h;
  const auto run = h.runs->CreateRun(kTenant, "blocked");
  h.runs->AttachSource(kTenant, run.id, ListSource("Acme Robotics\nBorealis Systems\n"));
  const auto job = h.runs->StartRun(kTenant, run.id);

  // classify_sources already used up its attempts without settling
  EditStep(h, run.id, "classify_sources", [](auto& step) {
    step.status        = StepStatus::kFailed;
    step.attempt_count = step.max_attempts;
    step.last_error    = "classifier crashed";
  });

  assert(h.worker->RunOnce() == WorkerOutcome::kFailed);

  const auto failed = h.runs->GetRun(kTenant, run.id);
  assert(failed.status == RunStatus::kFailed);
  assert(failed.last_error == "blocked by: classify_sources");

  const auto steps = h.runs->ListSteps(kTenant, run.id);
  assert(StatusOf(steps, "ingest_lists") == StepStatus::kSucceeded);
  assert(StatusOf(steps, "finalize") == StepStatus::kFailed);

  const auto  events  = h.runs->ListEvents(kTenant, run.id);
  const auto* blocked = FindEvent(events, "run_blocked");
  assert(blocked);
  const auto detail = DetailOf(*blocked);
  assert(detail.step_key() == "finalize");
  assert(detail.blockers_size() == 1);
  assert(detail.blockers(0) == "classify_sources");

  assert(JobOf(h, job.id).status == JobStatus::kFailed);
}

void TestUnknownStepFailsRun() {
  Harness    h;
  const auto run = h.runs->CreateRun(kTenant, "unknown step");
  h.runs->AttachSource(kTenant, run.id, ListSource("Acme Robotics\n"));
  const auto job = h.runs->StartRun(kTenant, run.id);

  EditStep(h, run.id, "ingest_proposal", [](auto& step) { step.step_key = "mystery_step"; });

  assert(h.worker->RunOnce() == WorkerOutcome::kFailed);

  const auto failed = h.runs->GetRun(kTenant, run.id);
  assert(failed.status == RunStatus::kFailed);
  assert(failed.last_error == "unknown step: mystery_step");

  const auto steps = h.runs->ListSteps(kTenant, run.id);
  assert(StatusOf(steps, "ingest_lists") == StepStatus::kSucceeded);
  assert(StatusOf(steps, "mystery_step") == StepStatus::kFailed);
  assert(StatusOf(steps, "finalize") == StepStatus::kPending);

  const auto  events = h.runs->ListEvents(kTenant, run.id);
  const auto* event  = FindEvent(events, "run_failed");
  assert(event && DetailOf(*event).step_key() == "mystery_step");
  assert(!HasEvent(events, "worker_completed"));

  assert(JobOf(h, job.id).status == JobStatus::kFailed);
}

void TestWorkerOutcomeNames() {
  assert(research::pipeline::ToString(WorkerOutcome::kIdle) == "idle");
  assert(research::pipeline::ToString(WorkerOutcome::kCompleted) == "completed");
  assert(research::pipeline::ToString(WorkerOutcome::kDeferred) == "deferred");
  assert(research::pipeline::ToString(WorkerOutcome::kCancelled) == "cancelled");
  assert(research::pipeline::ToString(WorkerOutcome::kFailed) == "failed");
  assert(research::pipeline::ToString(WorkerOutcome::kNoop) == "noop");
  assert(research::pipeline::ToString(WorkerOutcome::kLeaseLost) == "lease_lost");
}

} // namespace

int main() {
  TestIdleWithoutJobs();
  TestListRunCompletes();
  TestCancelBeforeFirstStep();
  TestTransientFetchDefersJob();
  TestIdleAfterCompletionWritesNothing();
  TestCancelAfterFirstStepCommitted();
  TestCancelDuringFetch();
  TestSlowFetchLosesExpiredLease();
  TestHeartbeatKeepsLeaseAcrossSlowFetches();
  TestBlockedFinalizeFailsRun();
  TestUnknownStepFailsRun();
  TestWorkerOutcomeNames();

  std::cout << "research_unit_research_worker: pass\n";
  return 0;
}
