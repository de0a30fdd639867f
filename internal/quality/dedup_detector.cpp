#include "dedup_detector.hpp"

#include <google/protobuf/util/message_differencer.h>

#include <algorithm>
#include <map>
#include <string>

#include "quality_classifier.hpp"

namespace research::quality {

namespace {

void SetReasonCodes(research::v1::ExtractionInfo* extraction, std::vector<std::string> codes) {
  std::sort(codes.begin(), codes.end());
  codes.erase(std::unique(codes.begin(), codes.end()), codes.end());

  extraction->clear_reason_codes();
  for (const auto& code : codes) {
    extraction->add_reason_codes(code);
  }
  extraction->set_decision(DecisionFor(codes));
}

std::vector<std::string> ReasonCodes(const research::v1::ExtractionInfo& extraction) {
  return {extraction.reason_codes().begin(), extraction.reason_codes().end()};
}

} // namespace

DedupResult DetectTemplateDuplicates(std::vector<db::model::SourceDocumentRecord>& docs) {
  DedupResult result;
  result.summary.set_count(static_cast<uint32_t>(docs.size()));

  std::map<std::string, std::vector<size_t>> groups;
  for (size_t i = 0; i < docs.size(); ++i) {
    const auto& extraction = docs[i].meta.extraction();
    if (extraction.extractor_version() != kExtractorVersion || extraction.word_count() == 0) {
      result.summary.set_skipped(result.summary.skipped() + 1);
      continue;
    }
    const auto& signatures = extraction.signatures();
    const auto& key = signatures.signature_prefix_2k().empty() ? signatures.text_hash() : signatures.signature_prefix_2k();
    if (key.empty()) {
      result.summary.set_skipped(result.summary.skipped() + 1);
      continue;
    }
    groups[key].push_back(i);
  }

  for (auto& [key, members] : groups) {
    if (members.size() < 2) continue;

    std::sort(members.begin(), members.end(), [&docs](size_t a, size_t b) {
      const auto wa = docs[a].meta.extraction().word_count();
      const auto wb = docs[b].meta.extraction().word_count();
      if (wa != wb) return wa > wb;
      return docs[a].id < docs[b].id;
    });

    const auto& primary_id = docs[members.front()].id;

    for (size_t rank = 0; rank < members.size(); ++rank) {
      auto&      doc    = docs[members[rank]];
      const auto before = doc.meta.extraction();

      auto* extraction = doc.meta.mutable_extraction();
      auto* flags      = extraction->mutable_quality_flags();
      auto  codes      = ReasonCodes(*extraction);

      flags->set_duplicate_group_key(key);
      flags->set_duplicate_primary_source_id(primary_id);

      if (rank == 0) {
        flags->set_is_duplicate_template(false);
        codes.erase(std::remove(codes.begin(), codes.end(), std::string(kFlagDuplicateTemplate)), codes.end());
      } else {
        flags->set_is_duplicate_template(true);
        codes.emplace_back(kFlagDuplicateTemplate);
        result.summary.set_duplicates(result.summary.duplicates() + 1);
      }
      SetReasonCodes(extraction, std::move(codes));

      result.summary.set_processed(result.summary.processed() + 1);
      if (!google::protobuf::util::MessageDifferencer::Equals(before, *extraction)) {
        result.changed.push_back(members[rank]);
        result.summary.set_updated(result.summary.updated() + 1);
      }
    }
  }

  std::sort(result.changed.begin(), result.changed.end());
  return result;
}

} // namespace research::quality
