#include "internal/resolution/entity_resolver.hpp"

#include <cassert>
#include <iostream>
#include <string>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/resolution/identity.hpp"

namespace {

using research::db::memory::MemoryRepository;
using research::model::EntityKind;
using research::model::EvidenceSubject;
using research::resolution::EntityResolver;

namespace dbm = research::db::model;

constexpr const char* kTenant = "tenant-a";

void AddRun(MemoryRepository& repo, research::db::Transaction& tx, const std::string& run_id) {
  dbm::RunRecord run;
  run.id        = run_id;
  run.tenant_id = kTenant;
  run.name      = run_id;
  assert(repo.InsertRun(tx, run));

  for (const char* suffix : {"-doc-1", "-doc-2"}) {
    dbm::SourceDocumentRecord doc;
    doc.id          = run_id + suffix;
    doc.tenant_id   = kTenant;
    doc.run_id      = run_id;
    doc.source_type = research::model::SourceType::kText;
    assert(repo.InsertSource(tx, doc));
  }
}

void AddProspect(MemoryRepository& repo, research::db::Transaction& tx, const std::string& run_id, const std::string& id,
                 const std::string& name, const std::string& website, const std::string& country) {
  dbm::ProspectRecord prospect;
  prospect.id              = id;
  prospect.tenant_id       = kTenant;
  prospect.run_id          = run_id;
  prospect.name_raw        = name;
  prospect.name_normalized = research::resolution::NormalizeEntityName(name);
  prospect.website_url     = website;
  prospect.hq_country      = country;
  assert(repo.InsertProspect(tx, prospect));
}

void AddEvidence(MemoryRepository& repo, research::db::Transaction& tx, const std::string& run_id, EvidenceSubject subject,
                 const std::string& subject_id, const std::string& doc_id) {
  dbm::EvidenceRecord evidence;
  evidence.id                 = subject_id + ":" + doc_id;
  evidence.tenant_id          = kTenant;
  evidence.run_id             = run_id;
  evidence.subject_type       = subject;
  evidence.subject_id         = subject_id;
  evidence.source_document_id = doc_id;
  evidence.source_type        = "text";
  evidence.weight             = 0.5;
  assert(repo.InsertEvidence(tx, evidence));
}

void AddExecutive(MemoryRepository& repo, research::db::Transaction& tx, const std::string& run_id, const std::string& id,
                  const std::string& prospect_id, const std::string& name, const std::string& email, const std::string& linkedin) {
  dbm::ExecutiveRecord executive;
  executive.id                  = id;
  executive.tenant_id           = kTenant;
  executive.run_id              = run_id;
  executive.company_prospect_id = prospect_id;
  executive.name_raw            = name;
  executive.name_normalized     = research::resolution::NormalizePersonName(name);
  executive.email               = email;
  executive.linkedin_url        = linkedin;
  executive.source_document_id  = run_id + "-doc-1";
  assert(repo.InsertExecutive(tx, executive));
}

void TestCompaniesResolveByDomainAndNameCountry() {
  MemoryRepository repo;
  auto             tx = repo.Begin();
  AddRun(repo, *tx, "run-1");

  AddProspect(repo, *tx, "run-1", "p-a", "Acme  Robotics", "https://www.Acme.example/", "DE");
  AddEvidence(repo, *tx, "run-1", EvidenceSubject::kProspect, "p-a", "run-1-doc-2");
  AddEvidence(repo, *tx, "run-1", EvidenceSubject::kProspect, "p-a", "run-1-doc-1");

  AddProspect(repo, *tx, "run-1", "p-b", "Borealis Systems", "", "at");
  AddEvidence(repo, *tx, "run-1", EvidenceSubject::kProspect, "p-b", "run-1-doc-2");

  AddProspect(repo, *tx, "run-1", "p-c", "Ghost Holdings", "", "");

  EntityResolver resolver(repo, *tx, 10);
  const auto     summary = resolver.ResolveCompanies(kTenant, "run-1");

  assert(summary.scanned() == 3);
  assert(summary.created() == 2);
  assert(summary.links_created() == 2);
  assert(summary.evidence_missing_skipped() == 1);
  assert(summary.warnings_multi_evidence() == 1);
  assert(summary.multi_evidence_deterministic_choice() == 1);

  const auto link_a = repo.GetLink(*tx, kTenant, EntityKind::kCompany, "p-a");
  assert(link_a);
  assert(link_a->match_rule == "domain");
  assert(link_a->evidence_source_document_id == "run-1-doc-1");

  const auto acme = repo.FindCompanyByDomain(*tx, kTenant, "acme.example");
  assert(acme);
  assert(acme->id == link_a->canonical_id);
  assert(acme->canonical_name == "Acme Robotics");

  const auto link_b = repo.GetLink(*tx, kTenant, EntityKind::kCompany, "p-b");
  assert(link_b && link_b->match_rule == "name_country");
  assert(repo.FindCompanyByNameCountry(*tx, kTenant, "borealis systems", "AT"));

  assert(!repo.GetLink(*tx, kTenant, EntityKind::kCompany, "p-c"));
  tx->Commit();
}

void TestSecondPassCreatesNothing() {
  MemoryRepository repo;
  auto             tx = repo.Begin();
  AddRun(repo, *tx, "run-1");
  AddProspect(repo, *tx, "run-1", "p-a", "Acme Robotics", "https://acme.example", "");
  AddEvidence(repo, *tx, "run-1", EvidenceSubject::kProspect, "p-a", "run-1-doc-1");

  EntityResolver(repo, *tx, 1).ResolveCompanies(kTenant, "run-1");
  const auto again = EntityResolver(repo, *tx, 2).ResolveCompanies(kTenant, "run-1");
  assert(again.created() == 0);
  assert(again.links_created() == 0);
  assert(again.links_existing() == 1);
}

void TestCanonicalSharedAcrossRuns() {
  MemoryRepository repo;
  auto             tx = repo.Begin();
  AddRun(repo, *tx, "run-1");
  AddRun(repo, *tx, "run-2");

  AddProspect(repo, *tx, "run-1", "p-a", "Acme Robotics", "https://acme.example", "");
  AddEvidence(repo, *tx, "run-1", EvidenceSubject::kProspect, "p-a", "run-1-doc-1");
  AddProspect(repo, *tx, "run-2", "p-z", "ACME Robotics GmbH", "http://www.acme.example/about", "");
  AddEvidence(repo, *tx, "run-2", EvidenceSubject::kProspect, "p-z", "run-2-doc-1");

  EntityResolver(repo, *tx, 1).ResolveCompanies(kTenant, "run-1");
  const auto second = EntityResolver(repo, *tx, 2).ResolveCompanies(kTenant, "run-2");
  assert(second.created() == 0);
  assert(second.matched() == 1);

  const auto a = repo.GetLink(*tx, kTenant, EntityKind::kCompany, "p-a");
  const auto z = repo.GetLink(*tx, kTenant, EntityKind::kCompany, "p-z");
  assert(a && z && a->canonical_id == z->canonical_id);
  assert(z->run_id == "run-2");
}

void TestPeopleMatchingAndConflicts() {
  MemoryRepository repo;
  auto             tx = repo.Begin();
  AddRun(repo, *tx, "run-1");
  AddProspect(repo, *tx, "run-1", "p-a", "Acme Robotics", "https://acme.example", "");

  AddExecutive(repo, *tx, "run-1", "exec-1", "p-a", "Jane Roe", "Jane.Roe@Acme.example", "");
  AddExecutive(repo, *tx, "run-1", "exec-2", "p-a", "J. Roe", " jane.roe@acme.example ", "");
  AddExecutive(repo, *tx, "run-1", "exec-3", "p-a", "John Smith", "", "");
  AddExecutive(repo, *tx, "run-1", "exec-4", "p-a", "John  Smith", "", "");
  AddExecutive(repo, *tx, "run-1", "exec-5", "p-a", "Ann Lee", "ann@acme.example", "");
  AddExecutive(repo, *tx, "run-1", "exec-6", "p-a", "Ann Lee", "", "linkedin.com/in/annlee/");
  AddExecutive(repo, *tx, "run-1", "exec-7", "p-a", "Ann Lee", "", "");

  const auto summary = EntityResolver(repo, *tx, 1).ResolvePeople(kTenant, "run-1");
  assert(summary.scanned() == 7);
  assert(summary.conflicts_skipped() == 1);
  assert(summary.links_created() == 6);

  const auto e1 = repo.GetLink(*tx, kTenant, EntityKind::kPerson, "exec-1");
  const auto e2 = repo.GetLink(*tx, kTenant, EntityKind::kPerson, "exec-2");
  assert(e1 && e2 && e1->canonical_id == e2->canonical_id);
  assert(e2->match_rule == "email");

  const auto e3 = repo.GetLink(*tx, kTenant, EntityKind::kPerson, "exec-3");
  const auto e4 = repo.GetLink(*tx, kTenant, EntityKind::kPerson, "exec-4");
  assert(e3 && e4 && e3->canonical_id == e4->canonical_id);
  assert(e4->match_rule == "name_company");

  const auto e6 = repo.GetLink(*tx, kTenant, EntityKind::kPerson, "exec-6");
  assert(e6 && e6->match_rule == "linkedin");
  assert(repo.FindPersonByLinkedin(*tx, kTenant, "https://linkedin.com/in/annlee"));

  // exec-5 and exec-6 resolved to different people with the same name
  assert(!repo.GetLink(*tx, kTenant, EntityKind::kPerson, "exec-7"));
}

void TestCanonicalPersonNameStoredNormalized() {
  MemoryRepository repo;
  auto             tx = repo.Begin();
  AddRun(repo, *tx, "run-1");
  AddProspect(repo, *tx, "run-1", "p-a", "Acme Robotics", "https://acme.example", "");
  AddExecutive(repo, *tx, "run-1", "exec-1", "p-a", "  Jane   ROE-Smith ", "", "");

  const auto summary = EntityResolver(repo, *tx, 1).ResolvePeople(kTenant, "run-1");
  assert(summary.created() == 1);

  const auto link = repo.GetLink(*tx, kTenant, EntityKind::kPerson, "exec-1");
  assert(link);
  const auto person = repo.GetCanonicalPerson(*tx, kTenant, link->canonical_id);
  assert(person);
  assert(person->canonical_full_name == "jane roe smith");
  assert(person->canonical_full_name == person->name_normalized);
}

void TestNonAsciiNamesFoldCase() {
  using research::resolution::NormalizeEntityName;
  using research::resolution::NormalizePersonName;

  assert(NormalizePersonName("ÉLISE  Dubois-Ødegård") == "élise dubois ødegård");
  assert(NormalizePersonName("José") != NormalizePersonName("Josà"));
  assert(NormalizePersonName("ИВАН Петров") == "иван петров");
  assert(NormalizePersonName("Anne\xC3") == "anne");
  assert(NormalizeEntityName("ÖKO   Energie GmbH") == "öko energie gmbh");
  assert(NormalizeEntityName("Straße Logistik") == NormalizeEntityName("STRASSE LOGISTIK"));
  // precomposed and combining forms share a key
  assert(NormalizePersonName("Ren\xC3\xA9 Roux") == NormalizePersonName("Rene\xCC\x81 Roux"));

  MemoryRepository repo;
  auto             tx = repo.Begin();
  AddRun(repo, *tx, "run-1");
  AddProspect(repo, *tx, "run-1", "p-a", "Öko Energie", "https://oko.example", "");
  AddExecutive(repo, *tx, "run-1", "exec-1", "p-a", "ÉLISE DUBOIS", "", "");
  AddExecutive(repo, *tx, "run-1", "exec-2", "p-a", "Élise Dubois", "", "");
  AddExecutive(repo, *tx, "run-1", "exec-3", "p-a", "Elise Dubois", "", "");

  const auto summary = EntityResolver(repo, *tx, 1).ResolvePeople(kTenant, "run-1");
  assert(summary.created() == 2);

  const auto e1 = repo.GetLink(*tx, kTenant, EntityKind::kPerson, "exec-1");
  const auto e2 = repo.GetLink(*tx, kTenant, EntityKind::kPerson, "exec-2");
  const auto e3 = repo.GetLink(*tx, kTenant, EntityKind::kPerson, "exec-3");
  assert(e1 && e2 && e3);
  assert(e1->canonical_id == e2->canonical_id);
  assert(e3->canonical_id != e1->canonical_id);
}

} // namespace

int main() {
  TestCompaniesResolveByDomainAndNameCountry();
  TestSecondPassCreatesNothing();
  TestCanonicalSharedAcrossRuns();
  TestPeopleMatchingAndConflicts();
  TestCanonicalPersonNameStoredNormalized();
  TestNonAsciiNamesFoldCase();

  std::cout << "research_unit_entity_resolver: pass\n";
  return 0;
}
