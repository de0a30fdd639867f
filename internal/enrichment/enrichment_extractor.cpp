#include "enrichment_extractor.hpp"

#include <google/protobuf/struct.pb.h>

#include <algorithm>
#include <array>
#include <map>
#include <optional>
#include <utility>

#include "internal/util/hash.hpp"
#include "internal/util/json.hpp"
#include "internal/util/text.hpp"

namespace research::enrichment {

namespace {

const std::map<std::string, std::vector<std::string>>& CountrySynonyms() {
  static const std::map<std::string, std::vector<std::string>> kCountries = {
      {"United States", {"united states", "usa", "u.s.a", "us", "u.s"}},
      {"United Kingdom", {"united kingdom", "uk", "u.k", "great britain", "britain"}},
      {"United Arab Emirates", {"united arab emirates", "uae"}},
      {"Saudi Arabia", {"saudi arabia", "saudi", "ksa"}},
      {"Qatar", {"qatar"}},
      {"Kuwait", {"kuwait"}},
      {"Oman", {"oman"}},
      {"Bahrain", {"bahrain"}},
      {"Romania", {"romania"}},
      {"Republic of Moldova", {"moldova", "republic of moldova"}},
      {"India", {"india"}},
      {"Pakistan", {"pakistan"}},
      {"Singapore", {"singapore"}},
      {"China", {"china", "prc"}},
      {"Japan", {"japan"}},
      {"South Korea", {"south korea", "korea"}},
      {"Vietnam", {"vietnam"}},
      {"Thailand", {"thailand"}},
      {"Indonesia", {"indonesia"}},
      {"Malaysia", {"malaysia"}},
      {"Philippines", {"philippines", "philippine"}},
      {"Australia", {"australia"}},
      {"New Zealand", {"new zealand"}},
      {"Canada", {"canada"}},
      {"Mexico", {"mexico"}},
      {"Brazil", {"brazil"}},
      {"Argentina", {"argentina"}},
      {"Chile", {"chile"}},
      {"Colombia", {"colombia"}},
      {"Peru", {"peru"}},
      {"Germany", {"germany"}},
      {"France", {"france"}},
      {"Spain", {"spain"}},
      {"Portugal", {"portugal"}},
      {"Italy", {"italy"}},
      {"Switzerland", {"switzerland"}},
      {"Netherlands", {"netherlands", "holland"}},
      {"Belgium", {"belgium"}},
      {"Sweden", {"sweden"}},
      {"Norway", {"norway"}},
      {"Denmark", {"denmark"}},
      {"Finland", {"finland"}},
      {"Poland", {"poland"}},
      {"Czech Republic", {"czech republic", "czechia"}},
      {"Hungary", {"hungary"}},
      {"Greece", {"greece"}},
      {"Turkey", {"turkey", "turkiye"}},
      {"Ireland", {"ireland"}},
      {"Israel", {"israel"}},
      {"Egypt", {"egypt"}},
      {"Kenya", {"kenya"}},
      {"Nigeria", {"nigeria"}},
      {"South Africa", {"south africa"}},
  };
  return kCountries;
}

struct HqPattern {
  std::string_view keyword;
  bool             optional_plural_colon; // "headquarters?:?" / "hq:?"
  bool             needs_space;           // "based in\s+"
  double           confidence;
};

constexpr std::array<HqPattern, 4> kHqPatterns = {{
    {"headquarter", true, false, 0.90},
    {"hq", true, false, 0.90},
    {"based in", false, true, 0.70},
    {"located in", false, true, 0.70},
}};

struct OwnershipRule {
  std::string_view                signal;
  double                          confidence;
  std::vector<std::string_view>   phrases;
};

const std::vector<OwnershipRule>& OwnershipRules() {
  static const std::vector<OwnershipRule> kRules = {
      {"public_company", 0.80, {"listed on", "traded on", "ticker", "nyse", "nasdaq", "lse"}},
      {"subsidiary", 0.80, {"subsidiary of", "wholly owned subsidiary"}},
      {"subsidiary", 0.60, {"part of the"}},
      {"private_company", 0.80, {"privately held", "private company"}},
      {"state_owned", 0.80, {"state-owned", "state owned", "government-owned", "government owned", "soe"}},
  };
  return kRules;
}

constexpr std::array<std::string_view, 4> kOwnershipPriority = {"state_owned", "public_company", "subsidiary", "private_company"};

constexpr std::string_view kIndustryKeywords[] = {
    "renewable energy", "solar",          "wind",           "hydrogen",      "battery",          "energy storage",
    "grid",             "power generation", "oil",          "gas",           "lng",              "petrochemical",
    "mining",           "metals",         "steel",          "construction",  "cement",           "real estate",
    "infrastructure",   "logistics",      "supply chain",   "shipping",      "aviation",         "aerospace",
    "defense",          "automotive",     "mobility",       "transportation", "rail",            "semiconductor",
    "electronics",      "hardware",       "robotics",       "automation",    "manufacturing",    "industrial equipment",
    "chemicals",        "fertilizer",     "agriculture",    "food processing", "beverage",       "retail",
    "ecommerce",        "fintech",        "payments",       "banking",       "insurance",        "investment",
    "asset management", "healthcare",     "hospital",       "pharma",        "biotech",          "medtech",
    "life sciences",    "education",      "media",          "entertainment", "gaming",           "sports",
    "telecom",          "iot",            "smart city",     "cloud",         "saas",             "data analytics",
    "ai",               "machine learning", "cybersecurity", "blockchain",   "water treatment",  "waste management",
};

bool IsLocationChar(char c) {
  return (c >= 'a' && c <= 'z') || c == ' ' || c == '.' || c == ',' || c == '\'' || c == '-';
}

bool IsSpace(char c) {
  return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
}

// Fragment following the first occurrence of the pattern that has one.
std::optional<std::string> LocationAfter(std::string_view lower, const HqPattern& pattern) {
  size_t from = 0;
  while (true) {
    const auto at = lower.find(pattern.keyword, from);
    if (at == std::string_view::npos) return std::nullopt;
    from = at + 1;

    if (at > 0 && util::IsWordByte(static_cast<unsigned char>(lower[at - 1]))) continue;

    size_t pos = at + pattern.keyword.size();
    if (pattern.optional_plural_colon) {
      if (pattern.keyword == "headquarter" && pos < lower.size() && lower[pos] == 's') ++pos;
      if (pos < lower.size() && lower[pos] == ':') ++pos;
    }

    const size_t ws_begin = pos;
    while (pos < lower.size() && IsSpace(lower[pos]))
      ++pos;
    if (pattern.needs_space && pos == ws_begin) continue;

    const size_t loc_begin = pos;
    while (pos < lower.size() && IsLocationChar(lower[pos]))
      ++pos;
    if (pos == loc_begin) continue;

    return std::string(lower.substr(loc_begin, pos - loc_begin));
  }
}

std::string JsonString(const std::string& value) {
  google::protobuf::Value json;
  json.set_string_value(value);
  return util::ToJson(json);
}

std::string JsonList(const std::vector<std::string>& values) {
  google::protobuf::Value json;
  auto*                   list = json.mutable_list_value();
  for (const auto& value : values) {
    list->add_values()->set_string_value(value);
  }
  return util::ToJson(json);
}

std::optional<EnrichmentFact> ExtractHqCountry(std::string_view lower) {
  for (const auto& pattern : kHqPatterns) {
    const auto fragment = LocationAfter(lower, pattern);
    if (!fragment) continue;

    const auto country = MatchCountry(*fragment);
    if (!country.empty()) {
      return EnrichmentFact{std::string(kFieldHqCountry), JsonString(country), country, pattern.confidence};
    }
  }
  return std::nullopt;
}

size_t PriorityRank(std::string_view signal) {
  return static_cast<size_t>(std::find(kOwnershipPriority.begin(), kOwnershipPriority.end(), signal) - kOwnershipPriority.begin());
}

std::optional<EnrichmentFact> ExtractOwnership(std::string_view lower) {
  const OwnershipRule* best = nullptr;
  for (const auto& rule : OwnershipRules()) {
    const bool hit = std::any_of(rule.phrases.begin(), rule.phrases.end(),
                                 [lower](std::string_view phrase) { return util::ContainsWholeWord(lower, phrase); });
    if (!hit) continue;

    if (!best || rule.confidence > best->confidence ||
        (rule.confidence == best->confidence && PriorityRank(rule.signal) < PriorityRank(best->signal))) {
      best = &rule;
    }
  }
  if (!best) return std::nullopt;

  const std::string signal(best->signal);
  return EnrichmentFact{std::string(kFieldOwnership), JsonString(signal), signal, best->confidence};
}

std::optional<EnrichmentFact> ExtractIndustry(std::string_view lower) {
  std::vector<std::pair<std::string, size_t>> matches;
  for (auto keyword : kIndustryKeywords) {
    const auto count = util::CountWholeWord(lower, keyword);
    if (count > 0) matches.emplace_back(std::string(keyword), count);
  }
  if (matches.empty()) return std::nullopt;

  std::sort(matches.begin(), matches.end(), [](const auto& a, const auto& b) {
    if (a.second != b.second) return a.second > b.second;
    return a.first < b.first;
  });

  const size_t max_count = matches.front().second;

  std::vector<std::string> top;
  for (size_t i = 0; i < matches.size() && i < kMaxIndustryTerms; ++i) {
    top.push_back(matches[i].first);
  }

  return EnrichmentFact{std::string(kFieldIndustry), JsonList(top), util::Join(top, ", "), max_count >= 2 ? 0.70 : 0.60};
}

} // namespace

std::string MatchCountry(std::string_view location_fragment) {
  std::string cleaned;
  cleaned.reserve(location_fragment.size());
  for (char c : util::ToLower(location_fragment)) {
    cleaned.push_back(c >= 'a' && c <= 'z' ? c : ' ');
  }
  cleaned = util::CollapseWhitespace(cleaned);

  for (const auto& [country, synonyms] : CountrySynonyms()) {
    for (const auto& synonym : synonyms) {
      if (util::ContainsWholeWord(cleaned, synonym)) return country;
    }
  }
  return {};
}

std::string InputScopeHash(std::string_view source_document_id, std::string_view field_key) {
  std::string base(kInputScopeSalt);
  base += ":";
  base += source_document_id;
  base += ":";
  base += field_key;
  return util::Sha256Hex(base);
}

std::vector<EnrichmentFact> ExtractEnrichmentFacts(std::string_view text) {
  const auto trimmed = util::Trim(text);
  if (trimmed.empty()) return {};

  const auto lower = util::ToLower(trimmed);

  std::vector<EnrichmentFact> facts;
  if (auto hq = ExtractHqCountry(lower)) facts.push_back(std::move(*hq));
  if (auto ownership = ExtractOwnership(lower)) facts.push_back(std::move(*ownership));
  if (auto industry = ExtractIndustry(lower)) facts.push_back(std::move(*industry));
  return facts;
}

} // namespace research::enrichment
