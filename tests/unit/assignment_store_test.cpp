#include "internal/enrichment/assignment_store.hpp"

#include <cassert>
#include <iostream>
#include <string>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/enrichment/enrichment_extractor.hpp"
#include "internal/util/errors.hpp"

namespace {

using research::db::memory::MemoryRepository;
using research::enrichment::AssignmentInput;
using research::enrichment::AssignmentStore;

constexpr const char* kTenant = "tenant-a";

void Seed(MemoryRepository& repo) {
  auto tx = repo.Begin();

  research::db::model::RunRecord run;
  run.id        = "run-1";
  run.tenant_id = kTenant;
  run.name      = "seed";
  assert(repo.InsertRun(*tx, run));

  for (const char* id : {"doc-1", "doc-2"}) {
    research::db::model::SourceDocumentRecord doc;
    doc.id           = id;
    doc.tenant_id    = kTenant;
    doc.run_id       = run.id;
    doc.source_type  = research::model::SourceType::kText;
    doc.content_text = "Acme Robotics is headquartered in Germany.";
    assert(repo.InsertSource(*tx, doc));
  }
  tx->Commit();
}

AssignmentInput Fact(const std::string& doc_id, double confidence) {
  AssignmentInput input;
  input.tenant_id           = kTenant;
  input.target_entity_type  = std::string(research::enrichment::kTargetCompany);
  input.target_canonical_id = "company-1";
  input.field_key           = "hq_country";
  input.value               = "\"Germany\"";
  input.value_normalized    = "Germany";
  input.confidence          = confidence;
  input.derived_by          = std::string(research::enrichment::kDerivedBy);
  input.source_document_id  = doc_id;
  input.input_scope_hash    = research::enrichment::InputScopeHash(doc_id, "hq_country");
  return input;
}

void TestRepeatedWriteIsIdempotent() {
  MemoryRepository repo;
  Seed(repo);
  AssignmentStore store(repo);

  {
    auto tx = repo.Begin();
    const auto first = store.Record(*tx, Fact("doc-1", 0.7), 100);
    const auto again = store.Record(*tx, Fact("doc-1", 0.9), 200);
    assert(first.content_hash == again.content_hash);
    tx->Commit();
  }

  auto tx    = repo.Begin();
  auto reads = store.ListForTarget(*tx, kTenant, "company", "company-1");
  assert(reads.size() == 1);
  assert(reads[0].confidence == 0.9);
  assert(reads[0].source_document_id == "doc-1");

  auto rows = repo.ListAssignments(*tx, kTenant, "company", "company-1");
  assert(rows.size() == 1);
  assert(rows[0].created_at_ms == 100);
  assert(rows[0].updated_at_ms == 200);
}

void TestSameFactFromTwoDocumentsKeepsBoth() {
  MemoryRepository repo;
  Seed(repo);
  AssignmentStore store(repo);

  auto tx = repo.Begin();
  store.Record(*tx, Fact("doc-2", 0.9), 1);
  store.Record(*tx, Fact("doc-1", 0.9), 1);

  const auto reads = store.ListForTarget(*tx, kTenant, "company", "company-1");
  assert(reads.size() == 2);
  assert(reads[0].source_document_id == "doc-1");
  assert(reads[1].source_document_id == "doc-2");
  assert(reads[0].content_hash != reads[1].content_hash);
}

void TestContentHashCoversValue() {
  auto a = Fact("doc-1", 0.9);
  auto b = Fact("doc-1", 0.1);
  assert(AssignmentStore::ContentHash(a) == AssignmentStore::ContentHash(b));

  b.value_normalized = "Austria";
  assert(AssignmentStore::ContentHash(a) != AssignmentStore::ContentHash(b));
  assert(AssignmentStore::ContentHash(a).size() == 64);
}

void TestEvidenceIsRequired() {
  MemoryRepository repo;
  Seed(repo);
  AssignmentStore store(repo);
  auto            tx = repo.Begin();

  auto expect_invalid = [&](const AssignmentInput& input) {
    try {
      store.Record(*tx, input, 1);
    } catch (const research::util::InvalidArgument&) {
      return true;
    }
    return false;
  };

  assert(expect_invalid(Fact("", 0.5)));
  assert(expect_invalid(Fact("doc-missing", 0.5)));
  assert(expect_invalid(Fact("doc-1", 1.5)));
  assert(expect_invalid(Fact("doc-1", -0.01)));

  auto other_tenant      = Fact("doc-1", 0.5);
  other_tenant.tenant_id = "tenant-b";
  assert(expect_invalid(other_tenant));

  assert(store.ListForTarget(*tx, kTenant, "company", "company-1").empty());
}

} // namespace

int main() {
  TestRepeatedWriteIsIdempotent();
  TestSameFactFromTwoDocumentsKeepsBoth();
  TestContentHashCoversValue();
  TestEvidenceIsRequired();

  std::cout << "research_unit_assignment_store: pass\n";
  return 0;
}
