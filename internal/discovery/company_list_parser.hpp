#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace research::discovery {

inline constexpr size_t kMaxCompanyMentions = 500;

struct CompanyMention {
  std::string name;
  std::string name_normalized;
  std::string snippet;
};

// Lower-case, corporate suffixes removed, whitespace collapsed.
std::string NormalizeCompanyName(std::string_view name);

/*
  Line-oriented company name extraction for pasted lists and distilled pages.

  Each cleaned line is a candidate unless it looks like a heading, sentence,
  amount or note. Mentions are deduplicated by normalised name in line order.
  When most candidates are short single words the text is navigation noise
  and nothing is returned.
*/
std::vector<CompanyMention> ExtractCompanyNames(std::string_view text);

} // namespace research::discovery
