#include "internal/quality/dedup_detector.hpp"

#include <cassert>
#include <iostream>
#include <string>
#include <vector>

#include "internal/quality/quality_classifier.hpp"

namespace {

namespace quality = research::quality;
using research::db::model::SourceDocumentRecord;

SourceDocumentRecord Classified(const std::string& id, const std::string& text) {
  SourceDocumentRecord doc;
  doc.id           = id;
  doc.content_text = text;

  quality::ClassifyInput input;
  input.mime_type     = "text/html";
  input.text          = doc.content_text;
  input.material_hash = quality::MaterialHash(doc);
  *doc.meta.mutable_extraction() = quality::Classify(input, 0);
  return doc;
}

std::string Body(const std::string& seed, size_t words) {
  std::string out;
  for (size_t i = 0; i < words; ++i) {
    out += seed + std::to_string(i) + " ";
  }
  return out;
}

bool HasCode(const SourceDocumentRecord& doc, std::string_view code) {
  for (const auto& c : doc.meta.extraction().reason_codes()) {
    if (c == code) return true;
  }
  return false;
}

void TestIdenticalTemplatesFlagged() {
  const auto shared = Body("shared", 200);

  std::vector<SourceDocumentRecord> docs = {
      Classified("doc-b", shared),
      Classified("doc-a", shared),
      Classified("doc-c", Body("unique", 200)),
  };

  const auto result = quality::DetectTemplateDuplicates(docs);
  assert(result.summary.count() == 3);
  assert(result.summary.duplicates() == 1);
  assert(result.summary.processed() == 2);

  // equal word counts: lowest id is primary
  const auto& a = docs[1].meta.extraction().quality_flags();
  const auto& b = docs[0].meta.extraction().quality_flags();
  assert(!a.is_duplicate_template());
  assert(b.is_duplicate_template());
  assert(b.duplicate_primary_source_id() == "doc-a");
  assert(a.duplicate_primary_source_id() == "doc-a");
  assert(HasCode(docs[0], quality::kFlagDuplicateTemplate));
  assert(docs[0].meta.extraction().decision() == research::v1::QUALITY_DECISION_FLAG);
  assert(!docs[2].meta.extraction().quality_flags().is_duplicate_template());
  assert(docs[2].meta.extraction().quality_flags().duplicate_group_key().empty());
}

void TestLongestDocumentIsPrimary() {
  // same 2k prefix, different lengths
  const auto prefix = Body("lead", 400);
  std::vector<SourceDocumentRecord> docs = {
      Classified("doc-a", prefix),
      Classified("doc-z", prefix + Body("tail", 50)),
  };

  quality::DetectTemplateDuplicates(docs);
  assert(docs[0].meta.extraction().quality_flags().is_duplicate_template());
  assert(!docs[1].meta.extraction().quality_flags().is_duplicate_template());
  assert(docs[0].meta.extraction().quality_flags().duplicate_primary_source_id() == "doc-z");
}

void TestRerunIsStable() {
  const auto shared = Body("shared", 200);
  std::vector<SourceDocumentRecord> docs = {Classified("doc-a", shared), Classified("doc-b", shared)};

  const auto first = quality::DetectTemplateDuplicates(docs);
  assert(first.changed.size() == 2);

  const auto second = quality::DetectTemplateDuplicates(docs);
  assert(second.changed.empty());
  assert(second.summary.updated() == 0);
  assert(second.summary.duplicates() == 1);
}

void TestPrimaryFlagCleared() {
  const auto shared = Body("shared", 200);
  std::vector<SourceDocumentRecord> docs = {Classified("doc-a", shared), Classified("doc-b", shared)};

  auto* flags = docs[0].meta.mutable_extraction()->mutable_quality_flags();
  flags->set_is_duplicate_template(true);
  docs[0].meta.mutable_extraction()->add_reason_codes(std::string(quality::kFlagDuplicateTemplate));

  quality::DetectTemplateDuplicates(docs);
  assert(!docs[0].meta.extraction().quality_flags().is_duplicate_template());
  assert(!HasCode(docs[0], quality::kFlagDuplicateTemplate));
  assert(docs[0].meta.extraction().decision() == research::v1::QUALITY_DECISION_ACCEPT);
}

void TestUnclassifiedSkipped() {
  std::vector<SourceDocumentRecord> docs(2);
  docs[0].id = "doc-a";
  docs[1].id = "doc-b";

  const auto result = quality::DetectTemplateDuplicates(docs);
  assert(result.summary.skipped() == 2);
  assert(result.changed.empty());
}

} // namespace

int main() {
  TestIdenticalTemplatesFlagged();
  TestLongestDocumentIsPrimary();
  TestRerunIsStable();
  TestPrimaryFlagCleared();
  TestUnclassifiedSkipped();

  std::cout << "research_unit_dedup_detector: pass\n";
  return 0;
}
