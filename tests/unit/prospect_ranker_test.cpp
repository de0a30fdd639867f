#include "internal/ranking/prospect_ranker.hpp"

#include <cassert>
#include <cmath>
#include <iostream>
#include <string>

#include "internal/config/config_loader.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/enrichment/assignment_store.hpp"
#include "internal/ranking/ranking_export.hpp"

namespace {

using research::db::memory::MemoryRepository;
using research::ranking::ProspectRanker;
using research::ranking::RankingFilters;

namespace dbm = research::db::model;

constexpr const char* kTenant = "tenant-a";
constexpr const char* kRun    = "run-1";

bool Near(double a, double b) {
  return std::fabs(a - b) < 1e-9;
}

research::runtime::config::RankingConfig DefaultWeights() {
  research::runtime::config::RuntimeConfig config;
  research::config::ResolveDefaults(config);
  return config.ranking();
}

void AddProspect(MemoryRepository& repo, research::db::Transaction& tx, const std::string& id, const std::string& name,
                 const std::string& hq_country) {
  dbm::ProspectRecord prospect;
  prospect.id              = id;
  prospect.tenant_id       = kTenant;
  prospect.run_id          = kRun;
  prospect.name_raw        = name;
  prospect.name_normalized = id;
  prospect.hq_country      = hq_country;
  prospect.relevance_score = 0.5;
  prospect.evidence_score  = 0.5;
  assert(repo.InsertProspect(tx, prospect));
}

void AddEvidence(MemoryRepository& repo, research::db::Transaction& tx, const std::string& prospect_id, const std::string& doc_id) {
  dbm::EvidenceRecord evidence;
  evidence.id                 = prospect_id + ":" + doc_id;
  evidence.tenant_id          = kTenant;
  evidence.run_id             = kRun;
  evidence.subject_id         = prospect_id;
  evidence.source_document_id = doc_id;
  evidence.weight             = 0.5;
  assert(repo.InsertEvidence(tx, evidence));
}

void Record(research::enrichment::AssignmentStore& store, research::db::Transaction& tx, const std::string& field,
            const std::string& value_normalized, double confidence, const std::string& doc_id) {
  research::enrichment::AssignmentInput input;
  input.tenant_id           = kTenant;
  input.target_entity_type  = "company";
  input.target_canonical_id = "company-1";
  input.field_key           = field;
  input.value               = "\"" + value_normalized + "\"";
  input.value_normalized    = value_normalized;
  input.confidence          = confidence;
  input.derived_by          = "test";
  input.source_document_id  = doc_id;
  store.Record(tx, input, 1);
}

// p-a: linked and enriched, two documents. p-b and p-c: plain prospects
// with identical scores.
void Seed(MemoryRepository& repo) {
  auto tx = repo.Begin();

  dbm::RunRecord run;
  run.id        = kRun;
  run.tenant_id = kTenant;
  assert(repo.InsertRun(*tx, run));

  for (const char* id : {"doc-1", "doc-2"}) {
    dbm::SourceDocumentRecord doc;
    doc.id        = id;
    doc.tenant_id = kTenant;
    doc.run_id    = kRun;
    assert(repo.InsertSource(*tx, doc));
  }

  AddProspect(repo, *tx, "p-c", "Cobalt Analytics", "");
  AddProspect(repo, *tx, "p-b", "Borealis Systems", "FR");
  AddProspect(repo, *tx, "p-a", "Acme Robotics, Inc", "");
  AddEvidence(repo, *tx, "p-a", "doc-2");
  AddEvidence(repo, *tx, "p-a", "doc-1");
  AddEvidence(repo, *tx, "p-b", "doc-1");
  AddEvidence(repo, *tx, "p-c", "doc-1");

  dbm::CanonicalCompanyRecord company;
  company.id        = "company-1";
  company.tenant_id = kTenant;
  assert(repo.InsertCanonicalCompany(*tx, company));

  dbm::CanonicalLinkRecord link;
  link.tenant_id                   = kTenant;
  link.entity_kind                 = research::model::EntityKind::kCompany;
  link.canonical_id                = company.id;
  link.raw_entity_id               = "p-a";
  link.evidence_source_document_id = "doc-1";
  link.run_id                      = kRun;
  assert(repo.InsertLink(*tx, link));

  research::enrichment::AssignmentStore store(repo);
  Record(store, *tx, "hq_country", "Austria", 0.7, "doc-2");
  Record(store, *tx, "hq_country", "Germany", 0.9, "doc-1");
  Record(store, *tx, "ownership_signal", "private_company", 0.8, "doc-1");
  Record(store, *tx, "industry_keywords", "robotics, automation", 0.7, "doc-2");

  tx->Commit();
}

void TestScoresAndOrdering() {
  MemoryRepository repo;
  Seed(repo);

  auto tx     = repo.Begin();
  auto report = ProspectRanker(repo, DefaultWeights()).Rank(*tx, kTenant, kRun);

  assert(report.run_id() == kRun);
  assert(report.prospects_size() == 3);

  const auto& top = report.prospects(0);
  assert(top.id() == "p-a");
  assert(top.rank() == 1);
  assert(top.canonical_company_id() == "company-1");
  assert(top.hq_country() == "Germany");
  assert(top.ownership_signal() == "private_company");
  assert(top.industry_keywords() == "robotics, automation");

  assert(top.score_components_size() == 6);
  assert(top.score_components(0).name() == "evidence" && Near(top.score_components(0).value(), 0.1));
  assert(top.score_components(1).name() == "hq_country" && Near(top.score_components(1).value(), 0.09));
  assert(top.score_components(2).name() == "industry_keywords" && Near(top.score_components(2).value(), 0.028));
  assert(top.score_components(3).name() == "ownership_signal" && Near(top.score_components(3).value(), 0.08));
  assert(top.score_components(4).name() == "relevance" && Near(top.score_components(4).value(), 0.2));
  assert(top.score_components(5).name() == "source_coverage" && Near(top.score_components(5).value(), 0.04));
  assert(Near(top.computed_score(), 0.538));

  assert(top.why_included_size() == 3);
  assert(top.why_included(0).field_key() == "hq_country");
  assert(top.why_included(0).source_document_id() == "doc-1");
  assert(top.why_included(1).field_key() == "industry_keywords");
  assert(top.why_included(2).field_key() == "ownership_signal");

  assert(top.evidence_source_document_ids_size() == 2);
  assert(top.evidence_source_document_ids(0) == "doc-1");

  // tie on score: id order
  assert(report.prospects(1).id() == "p-b");
  assert(report.prospects(2).id() == "p-c");
  assert(Near(report.prospects(1).computed_score(), 0.32));
  assert(report.prospects(1).hq_country() == "FR");
  assert(report.prospects(1).why_included_size() == 0);
}

void TestFiltersKeepRanks() {
  MemoryRepository repo;
  Seed(repo);
  auto           tx = repo.Begin();
  ProspectRanker ranker(repo, DefaultWeights());

  RankingFilters with_hq;
  with_hq.has_hq = true;
  auto hq        = ranker.Rank(*tx, kTenant, kRun, with_hq);
  assert(hq.prospects_size() == 2);
  assert(hq.prospects(1).id() == "p-b" && hq.prospects(1).rank() == 2);

  RankingFilters min_score;
  min_score.min_score = 0.4;
  assert(ranker.Rank(*tx, kTenant, kRun, min_score).prospects_size() == 1);

  RankingFilters ownership;
  ownership.has_ownership = true;
  ownership.has_industry  = true;
  const auto signals      = ranker.Rank(*tx, kTenant, kRun, ownership);
  assert(signals.prospects_size() == 1 && signals.prospects(0).id() == "p-a");
}

void TestReportIsReproducible() {
  MemoryRepository repo;
  Seed(repo);
  auto           tx = repo.Begin();
  ProspectRanker ranker(repo, DefaultWeights());

  const auto first  = research::ranking::ToJsonExport(ranker.Rank(*tx, kTenant, kRun));
  const auto second = research::ranking::ToJsonExport(ranker.Rank(*tx, kTenant, kRun));
  assert(first == second);
  assert(first.find("\"computed_score\":0.538") != std::string::npos);
}

void TestCsvExport() {
  MemoryRepository repo;
  Seed(repo);
  auto tx  = repo.Begin();
  auto csv = research::ranking::ToCsvExport(ProspectRanker(repo, DefaultWeights()).Rank(*tx, kTenant, kRun));

  const std::string expected =
      std::string(research::ranking::kCsvHeader) + "\r\n" +
      "1,\"Acme Robotics, Inc\",0.5380,Germany,private_company,robotics; automation,"
      "\"hq_country=Germany; industry_keywords=robotics, automation; ownership_signal=private_company\",doc-1; doc-2\r\n"
      "2,Borealis Systems,0.3200,FR,,,,doc-1\r\n"
      "3,Cobalt Analytics,0.3200,,,,,doc-1\r\n";
  assert(csv == expected);

  research::v1::RankingReport quoted;
  quoted.add_prospects()->set_name("Say \"hi\"");
  assert(research::ranking::ToCsvExport(quoted).find("\"Say \"\"hi\"\"\"") != std::string::npos);
}

void TestRound4() {
  assert(Near(research::ranking::Round4(0.56789), 0.5679));
  assert(Near(research::ranking::Round4(0.00004), 0.0));
  assert(Near(research::ranking::Round4(1.99996), 2.0));
}

} // namespace

int main() {
  TestScoresAndOrdering();
  TestFiltersKeepRanks();
  TestReportIsReproducible();
  TestCsvExport();
  TestRound4();

  std::cout << "research_unit_prospect_ranker: pass\n";
  return 0;
}
