#include "text.hpp"

#include <cctype>

namespace research::util {

namespace {

bool IsSpace(unsigned char c) {
  return std::isspace(c) != 0;
}

constexpr std::string_view kCurrencySymbols[] = {"$", "\xE2\x82\xAC", "\xC2\xA3", "\xC2\xA5"};

size_t CurrencyPrefix(std::string_view s) {
  for (auto symbol : kCurrencySymbols) {
    if (s.substr(0, symbol.size()) == symbol) return symbol.size();
  }
  return 0;
}

} // namespace

std::string ToLower(std::string_view s) {
  std::string out(s);
  for (auto& c : out)
    c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  return out;
}

std::string ToUpper(std::string_view s) {
  std::string out(s);
  for (auto& c : out)
    c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
  return out;
}

std::string Trim(std::string_view s) {
  size_t begin = 0;
  size_t end   = s.size();
  while (begin < end && IsSpace(static_cast<unsigned char>(s[begin])))
    ++begin;
  while (end > begin && IsSpace(static_cast<unsigned char>(s[end - 1])))
    --end;
  return std::string(s.substr(begin, end - begin));
}

std::string RightTrim(std::string_view s) {
  size_t end = s.size();
  while (end > 0 && IsSpace(static_cast<unsigned char>(s[end - 1])))
    --end;
  return std::string(s.substr(0, end));
}

std::string CollapseWhitespace(std::string_view s) {
  std::string out;
  out.reserve(s.size());
  bool pending_space = false;
  for (char c : s) {
    if (IsSpace(static_cast<unsigned char>(c))) {
      pending_space = !out.empty();
      continue;
    }
    if (pending_space) out.push_back(' ');
    pending_space = false;
    out.push_back(c);
  }
  return out;
}

bool StartsWith(std::string_view s, std::string_view prefix) {
  return s.substr(0, prefix.size()) == prefix;
}

bool EndsWith(std::string_view s, std::string_view suffix) {
  return s.size() >= suffix.size() && s.substr(s.size() - suffix.size()) == suffix;
}

bool Contains(std::string_view haystack, std::string_view needle) {
  return haystack.find(needle) != std::string_view::npos;
}

std::vector<std::string> SplitLines(std::string_view s) {
  std::vector<std::string> lines;
  size_t                   start = 0;
  while (start <= s.size()) {
    auto pos = s.find('\n', start);
    if (pos == std::string_view::npos) {
      lines.emplace_back(s.substr(start));
      break;
    }
    lines.emplace_back(s.substr(start, pos - start));
    start = pos + 1;
  }
  return lines;
}

std::string Join(const std::vector<std::string>& parts, std::string_view separator) {
  std::string out;
  for (size_t i = 0; i < parts.size(); ++i) {
    if (i > 0) out.append(separator);
    out.append(parts[i]);
  }
  return out;
}

std::string NormalizeLineEndings(std::string_view s) {
  std::string unified;
  unified.reserve(s.size());
  for (size_t i = 0; i < s.size(); ++i) {
    if (s[i] == '\r') {
      unified.push_back('\n');
      if (i + 1 < s.size() && s[i + 1] == '\n') ++i;
      continue;
    }
    unified.push_back(s[i]);
  }

  auto lines = SplitLines(unified);
  for (auto& line : lines)
    line = RightTrim(line);
  return Join(lines, "\n");
}

bool IsWordByte(unsigned char c) {
  return std::isalnum(c) != 0 || c == '_' || c >= 0x80;
}

bool HasLetter(std::string_view s) {
  for (char c : s) {
    auto uc = static_cast<unsigned char>(c);
    if (std::isalpha(uc) || uc >= 0x80) return true;
  }
  return false;
}

std::vector<std::string> WordTokens(std::string_view s) {
  std::vector<std::string> tokens;
  std::string              current;
  for (char c : s) {
    auto uc = static_cast<unsigned char>(c);
    if (IsWordByte(uc)) {
      current.push_back(static_cast<char>(std::tolower(uc)));
      continue;
    }
    if (!current.empty()) {
      tokens.push_back(std::move(current));
      current.clear();
    }
  }
  if (!current.empty()) tokens.push_back(std::move(current));
  return tokens;
}

size_t CountWholeWord(std::string_view text, std::string_view phrase) {
  if (phrase.empty()) return 0;
  size_t count = 0;
  size_t pos   = text.find(phrase);
  while (pos != std::string_view::npos) {
    const bool left_ok  = pos == 0 || !IsWordByte(static_cast<unsigned char>(text[pos - 1])) ||
                         !IsWordByte(static_cast<unsigned char>(phrase.front()));
    const size_t end      = pos + phrase.size();
    const bool   right_ok = end >= text.size() || !IsWordByte(static_cast<unsigned char>(text[end])) ||
                          !IsWordByte(static_cast<unsigned char>(phrase.back()));
    if (left_ok && right_ok) {
      ++count;
      pos = text.find(phrase, end);
    } else {
      pos = text.find(phrase, pos + 1);
    }
  }
  return count;
}

bool ContainsWholeWord(std::string_view text, std::string_view phrase) {
  return CountWholeWord(text, phrase) > 0;
}

std::string Utf8Prefix(std::string_view s, size_t n) {
  size_t points = 0;
  size_t i      = 0;
  for (; i < s.size(); ++i) {
    auto uc = static_cast<unsigned char>(s[i]);
    if ((uc & 0xC0) != 0x80) {
      if (points == n) break;
      ++points;
    }
  }
  return std::string(s.substr(0, i));
}

size_t Utf8Length(std::string_view s) {
  size_t points = 0;
  for (char c : s) {
    if ((static_cast<unsigned char>(c) & 0xC0) != 0x80) ++points;
  }
  return points;
}

// [$€£¥]? digits-with-separators [BMK%]? [$€£¥]?
bool IsFinancialValue(std::string_view s) {
  size_t pos = CurrencyPrefix(s);
  while (pos < s.size() && s[pos] == ' ')
    ++pos;

  const size_t digits_begin = pos;
  while (pos < s.size() && (std::isdigit(static_cast<unsigned char>(s[pos])) || s[pos] == ',' || s[pos] == '.'))
    ++pos;
  if (pos == digits_begin) return false;

  while (pos < s.size() && s[pos] == ' ')
    ++pos;
  if (pos < s.size()) {
    const char unit = static_cast<char>(std::toupper(static_cast<unsigned char>(s[pos])));
    if (unit == 'B' || unit == 'M' || unit == 'K' || unit == '%') ++pos;
  }
  while (pos < s.size() && s[pos] == ' ')
    ++pos;
  pos += CurrencyPrefix(s.substr(pos));
  return pos == s.size();
}

} // namespace research::util
