#include "prospect_ranker.hpp"

#include <algorithm>
#include <cmath>
#include <map>
#include <set>

#include "internal/enrichment/assignment_store.hpp"
#include "internal/enrichment/enrichment_extractor.hpp"
#include "internal/util/text.hpp"

namespace research::ranking {

namespace {

constexpr size_t kMaxKeywordCredit  = 5;
constexpr size_t kMaxSourceCoverage = 5;

// Highest confidence, then lowest source document id, then lowest content hash.
bool Preferred(const enrichment::AssignmentRead& a, const enrichment::AssignmentRead& b) {
  if (a.confidence != b.confidence) return a.confidence > b.confidence;
  if (a.source_document_id != b.source_document_id) return a.source_document_id < b.source_document_id;
  return a.content_hash < b.content_hash;
}

size_t KeywordCount(const std::string& value_normalized) {
  if (value_normalized.empty()) return 0;
  size_t count = 1;
  for (size_t pos = value_normalized.find(", "); pos != std::string::npos; pos = value_normalized.find(", ", pos + 2)) {
    ++count;
  }
  return count;
}

void AddComponent(research::v1::RankedProspect& ranked, const char* name, double value) {
  auto* component = ranked.add_score_components();
  component->set_name(name);
  component->set_value(Round4(value));
}

} // namespace

double Round4(double value) {
  return std::round(value * 10000.0) / 10000.0;
}

ProspectRanker::ProspectRanker(db::Repository& repo, research::runtime::config::RankingConfig weights)
    : repo_(repo), weights_(std::move(weights)) {
}

research::v1::RankedProspect ProspectRanker::Score(db::Transaction& tx, const db::model::ProspectRecord& prospect) {
  research::v1::RankedProspect ranked;
  ranked.set_id(prospect.id);
  ranked.set_name(prospect.name_raw);
  ranked.set_name_normalized(prospect.name_normalized);
  ranked.set_website_url(prospect.website_url);
  ranked.set_relevance_score(prospect.relevance_score);
  ranked.set_evidence_score(prospect.evidence_score);

  std::map<std::string, enrichment::AssignmentRead> chosen;
  if (auto link = repo_.GetLink(tx, prospect.tenant_id, research::model::EntityKind::kCompany, prospect.id)) {
    ranked.set_canonical_company_id(link->canonical_id);

    enrichment::AssignmentStore store(repo_);
    for (auto& assignment : store.ListForTarget(tx, prospect.tenant_id, std::string(enrichment::kTargetCompany), link->canonical_id)) {
      auto it = chosen.find(assignment.field_key);
      if (it == chosen.end()) {
        chosen.emplace(assignment.field_key, std::move(assignment));
      } else if (Preferred(assignment, it->second)) {
        it->second = std::move(assignment);
      }
    }
  }

  auto confidence_of = [&chosen](std::string_view field) {
    auto it = chosen.find(std::string(field));
    return it == chosen.end() ? 0.0 : it->second.confidence;
  };

  const auto hq        = chosen.find(std::string(enrichment::kFieldHqCountry));
  const auto ownership = chosen.find(std::string(enrichment::kFieldOwnership));
  const auto industry  = chosen.find(std::string(enrichment::kFieldIndustry));

  ranked.set_hq_country(hq != chosen.end() ? hq->second.value_normalized : prospect.hq_country);
  if (ownership != chosen.end()) ranked.set_ownership_signal(ownership->second.value_normalized);
  if (industry != chosen.end()) ranked.set_industry_keywords(industry->second.value_normalized);

  std::set<std::string> documents;
  for (const auto& evidence : repo_.ListEvidence(tx, prospect.tenant_id, research::model::EvidenceSubject::kProspect, prospect.id)) {
    documents.insert(evidence.source_document_id);
  }
  for (const auto& id : documents) {
    ranked.add_evidence_source_document_ids(id);
  }

  const size_t keywords = industry != chosen.end() ? KeywordCount(industry->second.value_normalized) : 0;

  // Name order.
  AddComponent(ranked, "evidence", weights_.evidence_weight() * prospect.evidence_score);
  AddComponent(ranked, "hq_country", weights_.hq_weight() * confidence_of(enrichment::kFieldHqCountry));
  AddComponent(ranked, "industry_keywords",
               weights_.industry_weight() * static_cast<double>(std::min(keywords, kMaxKeywordCredit)) / static_cast<double>(kMaxKeywordCredit) *
                   confidence_of(enrichment::kFieldIndustry));
  AddComponent(ranked, "ownership_signal", weights_.ownership_weight() * confidence_of(enrichment::kFieldOwnership));
  AddComponent(ranked, "relevance", weights_.relevance_weight() * prospect.relevance_score);
  AddComponent(ranked, "source_coverage", weights_.source_weight() * static_cast<double>(std::min(documents.size(), kMaxSourceCoverage)));

  double total = 0.0;
  for (const auto& component : ranked.score_components()) {
    total += component.value();
  }
  ranked.set_computed_score(Round4(total));

  // chosen is keyed by field, one signal per field, so field order is the required order.
  for (const auto& [field, assignment] : chosen) {
    auto* signal = ranked.add_why_included();
    signal->set_field_key(field);
    signal->set_value(assignment.value);
    signal->set_value_normalized(assignment.value_normalized);
    signal->set_confidence(assignment.confidence);
    signal->set_source_document_id(assignment.source_document_id);
  }

  return ranked;
}

research::v1::RankingReport ProspectRanker::Rank(db::Transaction& tx, const std::string& tenant_id, const std::string& run_id,
                                                 const RankingFilters& filters) {
  std::vector<research::v1::RankedProspect> ranked;
  for (const auto& prospect : repo_.ListProspects(tx, tenant_id, run_id)) {
    ranked.push_back(Score(tx, prospect));
  }

  std::sort(ranked.begin(), ranked.end(), [](const auto& a, const auto& b) {
    if (a.computed_score() != b.computed_score()) return a.computed_score() > b.computed_score();
    return a.id() < b.id();
  });

  research::v1::RankingReport report;
  report.set_run_id(run_id);

  for (size_t i = 0; i < ranked.size(); ++i) {
    auto& prospect = ranked[i];
    prospect.set_rank(static_cast<uint32_t>(i + 1));

    if (filters.min_score && prospect.computed_score() < *filters.min_score) continue;
    if (filters.has_hq && prospect.hq_country().empty()) continue;
    if (filters.has_ownership && prospect.ownership_signal().empty()) continue;
    if (filters.has_industry && prospect.industry_keywords().empty()) continue;

    *report.add_prospects() = std::move(prospect);
  }
  return report;
}

} // namespace research::ranking
