#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace research::util {

/*
  Byte-oriented text helpers shared by acquisition, classification and
  extraction. Non-ASCII bytes are treated as word characters so UTF-8 letters
  stay inside tokens.
*/

std::string ToLower(std::string_view s);
std::string ToUpper(std::string_view s);
std::string Trim(std::string_view s);
std::string RightTrim(std::string_view s);

// Collapse every whitespace run into a single space and trim.
std::string CollapseWhitespace(std::string_view s);

bool StartsWith(std::string_view s, std::string_view prefix);
bool EndsWith(std::string_view s, std::string_view suffix);
bool Contains(std::string_view haystack, std::string_view needle);

std::vector<std::string> SplitLines(std::string_view s);
std::string              Join(const std::vector<std::string>& parts, std::string_view separator);

// \r\n and \r become \n; trailing whitespace of every line is removed.
std::string NormalizeLineEndings(std::string_view s);

bool IsWordByte(unsigned char c);
bool HasLetter(std::string_view s);

// Lower-cased maximal runs of word characters.
std::vector<std::string> WordTokens(std::string_view s);

// Whole-word occurrence count of a lower-case phrase in lower-case text.
size_t CountWholeWord(std::string_view text, std::string_view phrase);
bool   ContainsWholeWord(std::string_view text, std::string_view phrase);

// First n UTF-8 code points of s.
std::string Utf8Prefix(std::string_view s, size_t n);

// Number of UTF-8 code points in s.
size_t Utf8Length(std::string_view s);

// Amounts such as "$1.2B", "450 M", "12%" or "3,000 €".
bool IsFinancialValue(std::string_view s);

} // namespace research::util
