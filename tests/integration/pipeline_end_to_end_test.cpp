#include <algorithm>
#include <cassert>
#include <iostream>
#include <map>
#include <memory>
#include <string>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/ranking/ranking_export.hpp"

namespace {

using research::acquisition::FetchRequest;
using research::acquisition::FetchResponse;
using research::acquisition::HttpFetcher;
using research::model::RunStatus;
using research::model::SourceStatus;
using research::model::SourceType;
using research::model::StepStatus;
using research::pipeline::WorkerOutcome;
using research::service::SourceInput;

constexpr const char* kTenant = "tenant-e2e";

class ScriptedFetcher final : public HttpFetcher {
 public:
  FetchResponse Get(const FetchRequest& request) override {
    ++calls;
    FetchResponse response;
    auto          it = pages.find(request.url);
    if (it == pages.end()) {
      response.status_code = 404;
      response.final_url   = request.url;
      return response;
    }
    response.status_code  = 200;
    response.final_url    = request.url;
    response.content_type = "text/html; charset=utf-8";
    response.body         = it->second;
    return response;
  }

  std::map<std::string, std::string> pages;
  int                                calls = 0;
};

constexpr const char* kListPage = R"(<html><head><title>Robotics Suppliers 2024</title></head><body>
<nav><ul><li>Home</li><li>Careers Portal</li></ul></nav>
<ul>
  <li>Acme Robotics</li>
  <li>Borealis Systems GmbH</li>
  <li>Cobalt Analytics</li>
</ul>
</body></html>)";

constexpr const char* kProposal = R"({
  "query": "robotics suppliers in DACH",
  "companies": [
    {
      "name": "Acme Robotics GmbH",
      "website_url": "https://www.acme.example/about",
      "hq_country": "DE",
      "ai_score": 0.9,
      "evidence_snippets": ["family-owned since 1952"],
      "executives": [{"name": "Jane Roe", "title": "CEO", "email": "Jane.Roe@acme.example"}]
    }
  ]
})";

SourceInput Url(const std::string& url) {
  SourceInput input;
  input.source_type = SourceType::kUrl;
  input.url         = url;
  return input;
}

SourceInput Content(SourceType type, const std::string& title, const std::string& text) {
  SourceInput input;
  input.source_type  = type;
  input.title        = title;
  input.content_text = text;
  return input;
}

research::runtime::config::RuntimeConfig Config() {
  research::runtime::config::RuntimeConfig config;
  config.mutable_database()->mutable_memory();
  config.mutable_worker()->set_worker_id("worker-e2e");
  research::config::ResolveDefaults(config);
  return config;
}

const research::v1::RankedProspect* FindRanked(const research::v1::RankingReport& report, const std::string& name_normalized) {
  for (const auto& prospect : report.prospects()) {
    if (prospect.name_normalized() == name_normalized) return &prospect;
  }
  return nullptr;
}

void TestFullRun() {
  auto fetcher = std::make_shared<ScriptedFetcher>();
  fetcher->pages["https://lists.example/robotics"] = kListPage;

  auto  deps = research::factory::BuildRuntime(Config(), fetcher);
  auto& runs = *deps.run_service;

  const auto run = runs.CreateRun(kTenant, "robotics suppliers");
  runs.AttachSource(kTenant, run.id, Url("https://lists.example/robotics"));
  runs.AttachSource(kTenant, run.id,
                    Content(SourceType::kText, "call notes",
                            "Acme Robotics\n"
                            "Acme Robotics is headquartered in Munich, Germany. The company is privately held and builds robotics and "
                            "automation systems for factories.\n"));
  runs.AttachSource(kTenant, run.id, Content(SourceType::kList, "shortlist", "1. Acme Robotics GmbH\n2) Delta Freight Ltd\n"));
  runs.AttachSource(kTenant, run.id, Content(SourceType::kProposal, "", kProposal));
  runs.StartRun(kTenant, run.id);

  assert(deps.worker->RunOnce() == WorkerOutcome::kCompleted);
  assert(fetcher->calls == 1);
  assert(runs.GetRun(kTenant, run.id).status == RunStatus::kSucceeded);

  for (const auto& step : runs.ListSteps(kTenant, run.id)) {
    assert(step.status == StepStatus::kSucceeded);
    assert(step.attempt_count == 1);
  }

  for (const auto& doc : runs.ListSources(kTenant, run.id)) {
    assert(doc.status == SourceStatus::kProcessed);
    assert(!doc.content_hash.empty());
  }

  const auto report = runs.RankedProspects(kTenant, run.id);
  assert(report.run_id() == run.id);
  assert(report.prospects_size() == 4);

  const auto& top = report.prospects(0);
  assert(top.rank() == 1);
  assert(top.name_normalized() == "acme robotics");
  assert(top.relevance_score() == 0.9);
  assert(top.website_url() == "https://www.acme.example/about");
  assert(top.hq_country() == "Germany");
  assert(top.ownership_signal() == "private_company");
  assert(!top.industry_keywords().empty());
  assert(top.evidence_source_document_ids_size() == 4);
  assert(top.why_included_size() == 3);
  assert(!top.canonical_company_id().empty());

  for (const auto* name : {"borealis systems", "cobalt analytics", "delta freight"}) {
    const auto* prospect = FindRanked(report, name);
    assert(prospect);
    assert(prospect->computed_score() < top.computed_score());
    assert(prospect->why_included_size() == 0);
  }

  // identical inputs print identical exports
  assert(research::ranking::ToJsonExport(report) == research::ranking::ToJsonExport(runs.RankedProspects(kTenant, run.id)));

  const auto csv = research::ranking::ToCsvExport(report);
  assert(csv.rfind(std::string(research::ranking::kCsvHeader) + "\r\n", 0) == 0);
  assert(csv.find("\r\n1,Acme Robotics,") != std::string::npos);

  research::ranking::RankingFilters with_hq;
  with_hq.has_hq = true;
  const auto filtered = runs.RankedProspects(kTenant, run.id, with_hq);
  assert(filtered.prospects_size() == 1);
  assert(filtered.prospects(0).rank() == 1);

  const auto assignments = runs.ListAssignments(kTenant, "company", top.canonical_company_id());
  assert(assignments.size() == 3);
  assert(assignments[0].field_key == "hq_country");
  assert(assignments[1].field_key == "industry_keywords");
  assert(assignments[2].field_key == "ownership_signal");

  const auto events = runs.ListEvents(kTenant, run.id);
  assert(events.front().event_type == "run_created");
  assert(events.back().event_type == "worker_completed");
  assert(std::any_of(events.begin(), events.end(), [](const auto& e) { return e.event_type == "fetch_succeeded"; }));

  // nothing left to do
  assert(deps.worker->RunOnce() == WorkerOutcome::kIdle);

  // A second run of the tenant reuses the canonical company and adds no
  // enrichment: proposal documents never feed it.
  const auto second = runs.CreateRun(kTenant, "follow-up");
  runs.AttachSource(kTenant, second.id, Content(SourceType::kProposal, "", kProposal));
  runs.StartRun(kTenant, second.id);
  assert(deps.worker->RunOnce() == WorkerOutcome::kCompleted);

  const auto second_report = runs.RankedProspects(kTenant, second.id);
  assert(second_report.prospects_size() == 1);
  assert(second_report.prospects(0).canonical_company_id() == top.canonical_company_id());
  assert(second_report.prospects(0).hq_country() == "Germany");
  assert(runs.ListAssignments(kTenant, "company", top.canonical_company_id()).size() == 3);

  // the first run's ranking is unchanged by the second run
  assert(research::ranking::ToJsonExport(runs.RankedProspects(kTenant, run.id)) == research::ranking::ToJsonExport(report));
}

void TestFailedFetchDoesNotFailRun() {
  auto fetcher = std::make_shared<ScriptedFetcher>();

  auto  deps = research::factory::BuildRuntime(Config(), fetcher);
  auto& runs = *deps.run_service;

  const auto run = runs.CreateRun(kTenant, "dead link");
  runs.AttachSource(kTenant, run.id, Url("https://lists.example/gone"));
  runs.AttachSource(kTenant, run.id, Content(SourceType::kList, "shortlist", "Acme Robotics\nBorealis Systems\n"));
  runs.StartRun(kTenant, run.id);

  // 404 is transient: the fetch step waits for its retry
  assert(deps.worker->RunOnce() == WorkerOutcome::kDeferred);
  assert(runs.GetRun(kTenant, run.id).status == RunStatus::kRunning);

  const auto sources = runs.ListSources(kTenant, run.id);
  assert(sources[0].status == SourceStatus::kFetchFailed);
  assert(sources[0].last_error.find("HTTP 404") != std::string::npos);
  assert(sources[0].meta.fetch().http_status_code() == 404);
}

} // namespace

int main() {
  TestFullRun();
  TestFailedFetchDoesNotFailRun();

  std::cout << "research_integration_pipeline_end_to_end: pass\n";
  return 0;
}
