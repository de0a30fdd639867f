#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace research::enrichment {

inline constexpr std::string_view kDerivedBy        = "company_enrichment_rules_v1";
inline constexpr std::string_view kInputScopeSalt   = "enrichment_rules_v1";
inline constexpr std::string_view kFieldHqCountry   = "hq_country";
inline constexpr std::string_view kFieldOwnership   = "ownership_signal";
inline constexpr std::string_view kFieldIndustry    = "industry_keywords";
inline constexpr size_t           kMaxIndustryTerms = 10;

struct EnrichmentFact {
  std::string field_key;
  std::string value; // JSON text
  std::string value_normalized;
  double      confidence = 0.0;
};

/*
  Rules-only company enrichment from document text.

  hq_country       explicit location phrases matched against a closed
                   country synonym table
  ownership_signal phrase rules; higher confidence wins, ties follow
                   state_owned > public_company > subsidiary > private_company
  industry_keywords whole-word counts over a closed vocabulary, top 10

  Facts come out in the order above; a field with no hit is omitted.
*/
std::vector<EnrichmentFact> ExtractEnrichmentFacts(std::string_view text);

// sha256("<salt>:<source_document_id>:<field_key>")
std::string InputScopeHash(std::string_view source_document_id, std::string_view field_key);

// Canonical country for a free-text location fragment, empty when none.
std::string MatchCountry(std::string_view location_fragment);

} // namespace research::enrichment
