#include <cassert>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <functional>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "internal/config/config_loader.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/factory.hpp"
#include "internal/util/errors.hpp"

namespace {

using research::db::ErrorCode;
using research::db::Repository;
using research::db::memory::MemoryRepository;
using research::db::model::CanonicalCompanyRecord;
using research::db::model::CanonicalLinkRecord;
using research::db::model::EnrichmentAssignmentRecord;
using research::db::model::EventRecord;
using research::db::model::EvidenceRecord;
using research::db::model::JobRecord;
using research::db::model::PlanRecord;
using research::db::model::ProspectRecord;
using research::db::model::RunRecord;
using research::db::model::SourceDocumentRecord;
using research::db::model::StepRecord;
using research::model::EntityKind;
using research::model::EvidenceSubject;
using research::model::JobStatus;
using research::model::RunStatus;
using research::model::SourceStatus;
using research::model::SourceType;
using research::model::StepStatus;

constexpr const char* kTenant = "tenant-parity";

uint64_t NowMs() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::system_clock::now().time_since_epoch()).count();
}

struct BackendFactory {
  std::string                                       name;
  std::function<std::shared_ptr<Repository>()>      make_repository;
  std::function<bool()>                             supports_restart;
  std::function<void(std::shared_ptr<Repository>&)> restart;
  std::function<void()>                             cleanup;
  bool                                              supports_parallel_transactions = true;
};

RunRecord MakeRun(const std::string& id) {
  RunRecord run;
  run.id            = id;
  run.tenant_id     = kTenant;
  run.name          = "parity " + id;
  run.created_at_ms = 1000;
  run.updated_at_ms = 1000;
  return run;
}

SourceDocumentRecord MakeSource(const std::string& id, const std::string& run_id, uint64_t created_at_ms) {
  SourceDocumentRecord doc;
  doc.id            = id;
  doc.tenant_id     = kTenant;
  doc.run_id        = run_id;
  doc.source_type   = SourceType::kText;
  doc.title         = "notes " + id;
  doc.content_text  = "Acme Robotics is headquartered in Munich, Germany.";
  doc.max_attempts  = 3;
  doc.created_at_ms = created_at_ms;
  doc.updated_at_ms = created_at_ms;
  return doc;
}

void VerifyRunAndJobLifecycle(Repository& repo, const std::string& id) {
  auto tx = repo.Begin();

  assert(repo.InsertRun(*tx, MakeRun(id)));
  assert(repo.InsertRun(*tx, MakeRun(id)).code == ErrorCode::AlreadyExists);
  assert(!repo.GetRun(*tx, "other-tenant", id));

  auto run          = *repo.GetRun(*tx, kTenant, id);
  run.status        = RunStatus::kRunning;
  run.started_at_ms = 2000;
  run.last_error    = "transient";
  run.updated_at_ms = 2000;
  assert(repo.UpdateRun(*tx, run));

  auto loaded = repo.GetRun(*tx, kTenant, id);
  assert(loaded.has_value());
  assert(loaded->status == RunStatus::kRunning);
  assert(loaded->started_at_ms == 2000);
  assert(loaded->last_error == "transient");

  JobRecord job;
  job.id            = id + "-job";
  job.tenant_id     = kTenant;
  job.run_id        = id;
  job.max_attempts  = 10;
  job.created_at_ms = 1;
  job.updated_at_ms = 1;
  assert(repo.InsertJob(*tx, job));

  JobRecord second = job;
  second.id        = id + "-job-2";
  assert(repo.InsertJob(*tx, second).code == ErrorCode::AlreadyExists);

  auto active = repo.FindActiveJob(*tx, kTenant, id, research::db::model::kCompanyResearchJobType);
  assert(active.has_value());
  assert(active->id == job.id);

  auto claimed = repo.ClaimNextJob(*tx, "worker-parity", 5000, 0);
  assert(claimed.has_value());
  assert(claimed->id == job.id);
  assert(claimed->status == JobStatus::kRunning);
  assert(claimed->locked_by == "worker-parity");
  assert(claimed->locked_at_ms == 5000);

  // a freshly locked job is not stale
  assert(!repo.ClaimNextJob(*tx, "worker-other", 5001, 4000));

  claimed->status           = JobStatus::kSucceeded;
  claimed->cancel_requested = true;
  assert(repo.UpdateJob(*tx, *claimed));
  assert(!repo.FindActiveJob(*tx, kTenant, id, research::db::model::kCompanyResearchJobType));

  // the run may get a new active job once the old one is terminal
  assert(repo.InsertJob(*tx, second));
  assert(repo.ListJobs(*tx, kTenant, id).size() == 2);
  assert(repo.GetJob(*tx, job.id)->cancel_requested);

  // leave nothing claimable behind for later scenarios
  second.status = JobStatus::kCancelled;
  assert(repo.UpdateJob(*tx, second));

  tx->Commit();
}

void VerifyPlanAndSteps(Repository& repo, const std::string& id) {
  auto tx = repo.Begin();
  assert(repo.InsertRun(*tx, MakeRun(id)));

  PlanRecord plan;
  plan.id            = id + "-plan";
  plan.tenant_id     = kTenant;
  plan.run_id        = id;
  plan.created_at_ms = 1;
  assert(repo.InsertPlan(*tx, plan));

  PlanRecord duplicate = plan;
  duplicate.id         = id + "-plan-2";
  assert(repo.InsertPlan(*tx, duplicate).code == ErrorCode::AlreadyExists);

  plan.locked_at_ms = 77;
  assert(repo.UpdatePlan(*tx, plan));
  assert(repo.GetPlan(*tx, kTenant, id)->locked_at_ms == 77);

  // inserted out of order; listed by step_order
  const std::vector<std::pair<std::string, uint32_t>> keys = {{"finalize", 7}, {"fetch_url_sources", 1}, {"ingest_lists", 5}};
  for (const auto& [key, order] : keys) {
    StepRecord step;
    step.id            = id + "-" + key;
    step.tenant_id     = kTenant;
    step.run_id        = id;
    step.plan_id       = plan.id;
    step.step_key      = key;
    step.step_order    = order;
    step.max_attempts  = 5;
    step.created_at_ms = 1;
    assert(repo.InsertStep(*tx, step));
  }

  StepRecord clash;
  clash.id         = id + "-clash";
  clash.tenant_id  = kTenant;
  clash.run_id     = id;
  clash.plan_id    = plan.id;
  clash.step_key   = "finalize";
  clash.step_order = 7;
  assert(repo.InsertStep(*tx, clash).code == ErrorCode::AlreadyExists);

  auto steps = repo.ListSteps(*tx, kTenant, id);
  assert(steps.size() == 3);
  assert(steps[0].step_key == "fetch_url_sources");
  assert(steps[1].step_key == "ingest_lists");
  assert(steps[2].step_key == "finalize");

  steps[1].status        = StepStatus::kFailed;
  steps[1].attempt_count = 2;
  steps[1].output_json   = R"({"discovery":{"sourcesProcessed":1}})";
  steps[1].last_error    = "boom";
  assert(repo.UpdateStep(*tx, steps[1]));

  const auto reloaded = repo.ListSteps(*tx, kTenant, id);
  assert(reloaded[1].status == StepStatus::kFailed);
  assert(reloaded[1].attempt_count == 2);
  assert(reloaded[1].output_json == steps[1].output_json);
  assert(reloaded[1].last_error == "boom");

  tx->Commit();
}

void VerifySourcesAndEvidence(Repository& repo, const std::string& id) {
  auto tx = repo.Begin();
  assert(repo.InsertRun(*tx, MakeRun(id)));

  auto later   = MakeSource(id + "-b", id, 20);
  auto earlier = MakeSource(id + "-a", id, 10);
  assert(repo.InsertSource(*tx, later));
  assert(repo.InsertSource(*tx, earlier));

  // typed metadata survives the round trip
  earlier.status       = SourceStatus::kFetched;
  earlier.content_hash = "abc123";
  earlier.meta.mutable_fetch()->set_canonical_url("https://example.com/a");
  earlier.meta.mutable_fetch()->set_http_status_code(200);
  earlier.meta.mutable_extraction()->set_decision(research::v1::QUALITY_DECISION_FLAG);
  earlier.meta.mutable_extraction()->add_reason_codes("FLAG_THIN_CONTENT");
  earlier.meta.mutable_extraction()->mutable_quality_flags()->set_is_thin(true);
  assert(repo.UpdateSource(*tx, earlier));

  const auto sources = repo.ListSources(*tx, kTenant, id);
  assert(sources.size() == 2);
  assert(sources[0].id == earlier.id);
  assert(sources[1].id == later.id);
  assert(sources[0].status == SourceStatus::kFetched);
  assert(sources[0].content_hash == "abc123");
  assert(sources[0].meta.fetch().canonical_url() == "https://example.com/a");
  assert(sources[0].meta.fetch().http_status_code() == 200);
  assert(sources[0].meta.extraction().decision() == research::v1::QUALITY_DECISION_FLAG);
  assert(sources[0].meta.extraction().reason_codes_size() == 1);
  assert(sources[0].meta.extraction().quality_flags().is_thin());

  ProspectRecord prospect;
  prospect.id              = id + "-p1";
  prospect.tenant_id       = kTenant;
  prospect.run_id          = id;
  prospect.name_raw        = "Acme Robotics GmbH";
  prospect.name_normalized = "acme robotics";
  prospect.relevance_score = 0.5;
  prospect.discovered_by   = "list";
  prospect.created_at_ms   = 30;
  assert(repo.InsertProspect(*tx, prospect));

  ProspectRecord same_name = prospect;
  same_name.id             = id + "-p2";
  assert(repo.InsertProspect(*tx, same_name).code == ErrorCode::AlreadyExists);

  auto found = repo.FindProspectByName(*tx, kTenant, id, "acme robotics");
  assert(found.has_value());
  assert(found->id == prospect.id);
  assert(found->relevance_score == 0.5);

  for (const auto& source_id : {later.id, earlier.id}) {
    EvidenceRecord evidence;
    evidence.id                 = id + "-ev-" + source_id;
    evidence.tenant_id          = kTenant;
    evidence.run_id             = id;
    evidence.subject_type       = EvidenceSubject::kProspect;
    evidence.subject_id         = prospect.id;
    evidence.source_document_id = source_id;
    evidence.source_type        = "text";
    evidence.weight             = 0.6;
    evidence.snippet            = "Acme Robotics";
    evidence.created_at_ms      = 40;
    assert(repo.InsertEvidence(*tx, evidence));
  }

  EvidenceRecord twice;
  twice.id                 = id + "-ev-dup";
  twice.tenant_id          = kTenant;
  twice.run_id             = id;
  twice.subject_type       = EvidenceSubject::kProspect;
  twice.subject_id         = prospect.id;
  twice.source_document_id = earlier.id;
  twice.created_at_ms      = 41;
  assert(repo.InsertEvidence(*tx, twice).code == ErrorCode::AlreadyExists);

  const auto evidence = repo.ListEvidence(*tx, kTenant, EvidenceSubject::kProspect, prospect.id);
  assert(evidence.size() == 2);
  assert(evidence[0].source_document_id == earlier.id);
  assert(evidence[1].source_document_id == later.id);

  tx->Commit();

  // A dangling document reference is rejected; some backends abort the
  // transaction on it, so it runs alone.
  auto dangling_tx         = repo.Begin();
  twice.id                 = id + "-ev-dangling";
  twice.source_document_id = id + "-missing";
  const auto dangling      = repo.InsertEvidence(*dangling_tx, twice);
  assert(!dangling);
  assert(dangling.code == ErrorCode::ConstraintViolation);
  dangling_tx->Rollback();
}

void VerifyCanonicalLinksAndAssignments(Repository& repo, const std::string& id) {
  auto tx = repo.Begin();

  CanonicalCompanyRecord company;
  company.id              = id + "-co";
  company.tenant_id       = kTenant;
  company.canonical_name  = "Acme Robotics GmbH";
  company.name_normalized = id + " acme robotics";
  company.primary_domain  = id + ".acme.example";
  company.country_code    = "DE";
  company.created_at_ms   = 1;
  assert(repo.InsertCanonicalCompany(*tx, company));

  assert(repo.FindCompanyByDomain(*tx, kTenant, company.primary_domain)->id == company.id);
  assert(repo.FindCompanyByNameCountry(*tx, kTenant, company.name_normalized, "DE")->id == company.id);
  assert(!repo.FindCompanyByNameCountry(*tx, kTenant, company.name_normalized, "FR"));
  assert(!repo.FindCompanyByDomain(*tx, "other-tenant", company.primary_domain));

  CanonicalLinkRecord link;
  link.tenant_id                   = kTenant;
  link.entity_kind                 = EntityKind::kCompany;
  link.canonical_id                = company.id;
  link.raw_entity_id               = id + "-prospect";
  link.match_rule                  = "domain";
  link.evidence_source_document_id = id + "-doc";
  link.run_id                      = id;
  link.created_at_ms               = 2;
  assert(repo.InsertLink(*tx, link));
  assert(repo.InsertLink(*tx, link).code == ErrorCode::AlreadyExists);

  auto loaded = repo.GetLink(*tx, kTenant, EntityKind::kCompany, link.raw_entity_id);
  assert(loaded.has_value());
  assert(loaded->canonical_id == company.id);
  assert(loaded->match_rule == "domain");
  assert(!repo.GetLink(*tx, kTenant, EntityKind::kPerson, link.raw_entity_id));

  EnrichmentAssignmentRecord assignment;
  assignment.id                  = id + "-as-1";
  assignment.tenant_id           = kTenant;
  assignment.target_entity_type  = "company";
  assignment.target_canonical_id = company.id;
  assignment.field_key           = "hq_country";
  assignment.value               = R"("Germany")";
  assignment.value_normalized    = "Germany";
  assignment.confidence          = 0.7;
  assignment.derived_by          = "rules_v1";
  assignment.source_document_id  = id + "-doc";
  assignment.input_scope_hash    = "scope-1";
  assignment.content_hash        = "hash-germany";
  assignment.created_at_ms       = 10;
  assignment.updated_at_ms       = 10;
  assert(repo.UpsertAssignment(*tx, assignment));

  // same idempotency tuple: updated in place, id and created_at kept
  auto again          = assignment;
  again.id            = id + "-as-2";
  again.confidence    = 0.9;
  again.created_at_ms = 20;
  again.updated_at_ms = 20;
  assert(repo.UpsertAssignment(*tx, again));

  auto other_field             = assignment;
  other_field.id               = id + "-as-3";
  other_field.field_key        = "industry_keywords";
  other_field.value            = R"(["robotics"])";
  other_field.value_normalized = "robotics";
  other_field.content_hash     = "hash-robotics";
  assert(repo.UpsertAssignment(*tx, other_field));

  const auto assignments = repo.ListAssignments(*tx, kTenant, "company", company.id);
  assert(assignments.size() == 2);
  assert(assignments[0].field_key == "hq_country");
  assert(assignments[0].id == assignment.id);
  assert(assignments[0].confidence == 0.9);
  assert(assignments[0].created_at_ms == 10);
  assert(assignments[0].updated_at_ms == 20);
  assert(assignments[1].field_key == "industry_keywords");

  tx->Commit();
}

void VerifyEventsInInsertionOrder(Repository& repo, const std::string& id) {
  auto tx = repo.Begin();
  assert(repo.InsertRun(*tx, MakeRun(id)));

  const std::vector<std::string> types = {"run_created", "source_attached", "run_started", "worker_claimed"};
  for (size_t i = 0; i < types.size(); ++i) {
    EventRecord event;
    event.id            = id + "-ev-" + std::to_string(types.size() - i);
    event.tenant_id     = kTenant;
    event.run_id        = id;
    event.event_type    = types[i];
    event.input_json    = R"({"message":"m"})";
    event.created_at_ms = 100;
    assert(repo.InsertEvent(*tx, event));
  }

  const auto events = repo.ListEvents(*tx, kTenant, id);
  assert(events.size() == types.size());
  for (size_t i = 0; i < types.size(); ++i) {
    assert(events[i].event_type == types[i]);
  }
  tx->Commit();
}

void VerifyRollbackBehavior(Repository& repo, const std::string& id) {
  {
    auto tx = repo.Begin();
    assert(repo.InsertRun(*tx, MakeRun(id)));
    tx->Rollback();
  }

  auto tx = repo.Begin();
  assert(!repo.GetRun(*tx, kTenant, id).has_value());
  tx->Commit();
}

void VerifyConcurrentCommit(Repository& repo, const std::string& id, bool supports_parallel_transactions) {
  {
    auto tx = repo.Begin();
    assert(repo.InsertRun(*tx, MakeRun(id)));
    tx->Commit();
  }
  if (!supports_parallel_transactions) {
    return;
  }

  auto tx1 = repo.Begin();
  auto tx2 = repo.Begin();

  auto r1 = repo.GetRun(*tx1, kTenant, id);
  auto r2 = repo.GetRun(*tx2, kTenant, id);
  assert(r1.has_value() && r2.has_value());

  r1->status = RunStatus::kRunning;
  r2->status = RunStatus::kCancelled;
  assert(repo.UpdateRun(*tx1, *r1));
  tx1->Commit();

  // the second writer saw a stale snapshot
  assert(repo.UpdateRun(*tx2, *r2));
  bool conflicted = false;
  try {
    tx2->Commit();
  } catch (const research::util::TransactionConflict&) {
    conflicted = true;
  }
  assert(conflicted);

  auto verify_tx = repo.Begin();
  assert(repo.GetRun(*verify_tx, kTenant, id)->status == RunStatus::kRunning);
  verify_tx->Commit();
}

void VerifyRestartDurability(BackendFactory& backend, const std::string& id) {
  if (!backend.supports_restart()) {
    return;
  }

  auto repo = backend.make_repository();
  {
    auto tx = repo->Begin();
    assert(repo->InsertRun(*tx, MakeRun(id)));

    auto doc = MakeSource(id + "-doc", id, 5);
    doc.meta.mutable_processing()->set_prospects_created(3);
    assert(repo->InsertSource(*tx, doc));
    tx->Commit();
  }

  backend.restart(repo);

  auto tx  = repo->Begin();
  auto run = repo->GetRun(*tx, kTenant, id);
  assert(run.has_value());
  assert(run->name == "parity " + id);

  auto doc = repo->GetSource(*tx, kTenant, id + "-doc");
  assert(doc.has_value());
  assert(doc->meta.processing().prospects_created() == 3);
  tx->Commit();
}

BackendFactory MakeMemoryFactory() {
  return BackendFactory{
      .name                           = "memory",
      .make_repository                = []() { return std::make_shared<MemoryRepository>(); },
      .supports_restart               = []() { return false; },
      .restart                        = [](std::shared_ptr<Repository>&) {},
      .cleanup                        = []() {},
      .supports_parallel_transactions = true,
  };
}

#if RESEARCH_DB_SQLITE
BackendFactory MakeSqliteFactory() {
  auto db_path = (std::filesystem::temp_directory_path() / ("research_integration_sqlite_" + std::to_string(NowMs()) + ".db")).string();

  auto make_repo = [db_path]() {
    research::runtime::config::RuntimeConfig config;
    config.mutable_database()->mutable_sqlite()->set_path(db_path);
    research::config::ResolveDefaults(config);
    return research::factory::BuildRepository(config);
  };

  return BackendFactory{
      .name                           = "sqlite",
      .make_repository                = make_repo,
      .supports_restart               = []() { return true; },
      .restart                        = [make_repo](std::shared_ptr<Repository>& repo) { repo = make_repo(); },
      .cleanup                        = [db_path]() { std::filesystem::remove(db_path); },
      .supports_parallel_transactions = false,
  };
}
#endif

#if RESEARCH_DB_POSTGRES
BackendFactory MakePostgresFactory() {
  const char* uri = std::getenv("RESEARCH_TEST_POSTGRES_URI");
  if (uri == nullptr || std::string(uri).empty()) {
    throw std::runtime_error("RESEARCH_TEST_POSTGRES_URI is not set");
  }

  auto make_repo = [conninfo = std::string(uri)]() {
    research::runtime::config::RuntimeConfig config;
    config.mutable_database()->mutable_postgres()->set_connection_uri(conninfo);
    config.mutable_database()->mutable_postgres()->set_max_connections(4);
    research::config::ResolveDefaults(config);
    return research::factory::BuildRepository(config);
  };

  return BackendFactory{
      .name                           = "postgres",
      .make_repository                = make_repo,
      .supports_restart               = []() { return true; },
      .restart                        = [make_repo](std::shared_ptr<Repository>& repo) { repo = make_repo(); },
      .cleanup                        = []() {},
      .supports_parallel_transactions = false,
  };
}
#endif

void RunBackendSuite(BackendFactory& backend) {
  std::cout << "running backend suite: " << backend.name << "\n";
  auto repo = backend.make_repository();

  // rows persist across runs on a shared server
  const auto prefix = backend.name + "-" + std::to_string(NowMs());

  VerifyRunAndJobLifecycle(*repo, prefix + "-lifecycle");
  VerifyPlanAndSteps(*repo, prefix + "-plan");
  VerifySourcesAndEvidence(*repo, prefix + "-sources");
  VerifyCanonicalLinksAndAssignments(*repo, prefix + "-canonical");
  VerifyEventsInInsertionOrder(*repo, prefix + "-events");
  VerifyRollbackBehavior(*repo, prefix + "-rollback");
  VerifyConcurrentCommit(*repo, prefix + "-concurrency", backend.supports_parallel_transactions);

  repo.reset();
  VerifyRestartDurability(backend, prefix + "-durable");

  backend.cleanup();
}

} // namespace

int main() {
  std::vector<BackendFactory> backends;
  backends.push_back(MakeMemoryFactory());

#if RESEARCH_DB_SQLITE
  backends.push_back(MakeSqliteFactory());
#endif

#if RESEARCH_DB_POSTGRES
  try {
    backends.push_back(MakePostgresFactory());
  } catch (const std::exception& ex) {
    std::cout << "skipping postgres integration suite: " << ex.what() << "\n";
  }
#endif

  for (auto& backend : backends) {
    RunBackendSuite(backend);
  }

  std::cout << "research_integration_repository_parity: pass\n";
  return 0;
}
