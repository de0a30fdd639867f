#include "company_list_parser.hpp"

#include <array>
#include <cctype>
#include <set>

#include "internal/util/text.hpp"

namespace research::discovery {

namespace {

constexpr std::array<std::string_view, 15> kCorporateSuffixes = {
    " ltd", " llc", " plc",     " saog",        " sa",      " gmbh",  " ag", " inc",
    " corp", " corporation", " limited", " group", " holdings", ".", ",",
};

constexpr std::array<std::string_view, 9> kNonCompanyPhrases = {
    "top nbfc", "sample list", "notes", "company list", "here are", "interesting", "sample", "following", "these are",
};

constexpr size_t kMinNameChars        = 3;
constexpr size_t kMaxNameChars        = 150;
constexpr size_t kPhraseCheckMaxChars = 60;
constexpr size_t kSentenceMinWords    = 6;
constexpr size_t kNextLineChars       = 100;
constexpr size_t kMaxSnippetChars     = 500;
constexpr size_t kShortWordChars      = 15;
constexpr double kMaxShortWordShare   = 0.7;

bool IsDigit(char c) {
  return std::isdigit(static_cast<unsigned char>(c)) != 0;
}

bool IsSpace(char c) {
  return std::isspace(static_cast<unsigned char>(c)) != 0;
}

// "- ", "• ", "** " ...
std::string_view StripBullet(std::string_view line) {
  size_t pos = 0;
  while (pos < line.size()) {
    if (line[pos] == '-' || line[pos] == '*') {
      ++pos;
    } else if (line.substr(pos, 3) == "\xE2\x80\xA2") {
      pos += 3;
    } else {
      break;
    }
  }
  if (pos == 0 || pos >= line.size() || !IsSpace(line[pos])) return line;
  while (pos < line.size() && IsSpace(line[pos]))
    ++pos;
  return line.substr(pos);
}

// "1. ", "12) "
std::string_view StripNumbering(std::string_view line) {
  size_t pos = 0;
  while (pos < line.size() && IsDigit(line[pos]))
    ++pos;
  if (pos == 0 || pos + 1 >= line.size() || (line[pos] != '.' && line[pos] != ')') || !IsSpace(line[pos + 1])) return line;
  ++pos;
  while (pos < line.size() && IsSpace(line[pos]))
    ++pos;
  return line.substr(pos);
}

bool HasAsciiLetter(std::string_view s) {
  for (char c : s) {
    if (std::isalpha(static_cast<unsigned char>(c)) && static_cast<unsigned char>(c) < 0x80) return true;
  }
  return false;
}

// Headings such as "top 10 (sample)", "here are some...", "sample list".
bool IsHeading(std::string_view lower) {
  const auto words = util::WordTokens(lower);

  if (util::StartsWith(lower, "top ")) {
    const auto open = lower.find('(');
    if (open != std::string_view::npos && lower.find(')', open) != std::string_view::npos) {
      const auto between = util::Trim(lower.substr(4, open - 4));
      bool       one_word = !between.empty();
      for (char c : between) {
        one_word = one_word && util::IsWordByte(static_cast<unsigned char>(c));
      }
      if (one_word) return true;
    }
  }
  if (util::StartsWith(lower, "here are ")) return true;

  const auto space = lower.find(' ');
  if (space != std::string_view::npos && lower.substr(space) == " list" && words.size() == 2 && words[0].size() == space) return true;
  return false;
}

size_t WordCount(std::string_view s) {
  size_t count   = 0;
  bool   in_word = false;
  for (char c : s) {
    if (IsSpace(c)) {
      in_word = false;
    } else if (!in_word) {
      in_word = true;
      ++count;
    }
  }
  return count;
}

} // namespace

std::string NormalizeCompanyName(std::string_view name) {
  auto normalized = util::ToLower(name);
  for (auto suffix : kCorporateSuffixes) {
    if (util::EndsWith(normalized, suffix)) {
      normalized.resize(normalized.size() - suffix.size());
    }
  }
  return util::CollapseWhitespace(normalized);
}

std::vector<CompanyMention> ExtractCompanyNames(std::string_view text) {
  const auto lines = util::SplitLines(util::NormalizeLineEndings(text));

  std::vector<CompanyMention> mentions;
  std::set<std::string>       seen;

  for (size_t i = 0; i < lines.size() && mentions.size() < kMaxCompanyMentions; ++i) {
    const auto line = util::Trim(lines[i]);
    if (line.empty()) continue;

    const auto cleaned = util::CollapseWhitespace(StripNumbering(StripBullet(line)));
    if (cleaned.empty()) continue;

    const auto chars = util::Utf8Length(cleaned);
    if (chars < kMinNameChars || chars > kMaxNameChars || !HasAsciiLetter(cleaned)) continue;
    if (util::EndsWith(cleaned, ".") && WordCount(cleaned) > kSentenceMinWords) continue;
    if (util::IsFinancialValue(cleaned)) continue;

    const auto lower = util::ToLower(cleaned);
    if (IsHeading(lower)) continue;

    bool note = false;
    if (chars < kPhraseCheckMaxChars) {
      for (auto phrase : kNonCompanyPhrases) {
        if (util::Contains(lower, phrase)) {
          note = true;
          break;
        }
      }
    }
    if (note) continue;

    auto normalized = NormalizeCompanyName(cleaned);
    if (normalized.empty() || !seen.insert(normalized).second) continue;

    std::string snippet = cleaned;
    if (i + 1 < lines.size()) {
      const auto next = util::Trim(lines[i + 1]);
      if (!next.empty()) {
        snippet += " | " + util::Utf8Prefix(next, kNextLineChars);
      }
    }

    mentions.push_back({cleaned, std::move(normalized), util::Utf8Prefix(snippet, kMaxSnippetChars)});
  }

  if (!mentions.empty()) {
    size_t short_single = 0;
    for (const auto& mention : mentions) {
      if (mention.name.find(' ') == std::string::npos && util::Utf8Length(mention.name) < kShortWordChars) ++short_single;
    }
    if (static_cast<double>(short_single) / static_cast<double>(mentions.size()) > kMaxShortWordShare) {
      return {};
    }
  }
  return mentions;
}

} // namespace research::discovery
