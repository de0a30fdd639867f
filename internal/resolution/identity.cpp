#include "identity.hpp"

#include <unicode/normalizer2.h>
#include <unicode/uchar.h>
#include <unicode/unistr.h>

#include "internal/util/errors.hpp"
#include "internal/util/text.hpp"

namespace research::resolution {

namespace {

// NFKC with full case folding; malformed UTF-8 decodes to U+FFFD.
icu::UnicodeString Fold(std::string_view text) {
  UErrorCode              status = U_ZERO_ERROR;
  const icu::Normalizer2* norm   = icu::Normalizer2::getNFKCCasefoldInstance(status);
  if (U_FAILURE(status) || norm == nullptr) {
    throw util::InvalidState(std::string("ICU: NFKC_Casefold unavailable: ") + u_errorName(status));
  }

  const auto         input = icu::UnicodeString::fromUTF8(icu::StringPiece(text.data(), static_cast<int32_t>(text.size())));
  icu::UnicodeString folded;
  norm->normalize(input, folded, status);
  if (U_FAILURE(status)) {
    throw util::InvalidState(std::string("ICU: case folding failed: ") + u_errorName(status));
  }
  return folded;
}

bool IsNameCodePoint(UChar32 c) {
  return (U_GET_GC_MASK(c) & (U_GC_L_MASK | U_GC_N_MASK | U_GC_M_MASK)) != 0;
}

} // namespace

std::string NormalizeDomain(std::string_view url) {
  auto trimmed = util::Trim(url);
  if (trimmed.empty()) return {};

  std::string_view rest = trimmed;
  const auto       scheme_end = rest.find("://");
  if (scheme_end != std::string_view::npos) {
    rest.remove_prefix(scheme_end + 3);
  }

  const auto authority_end = rest.find_first_of("/?#");
  auto       authority     = rest.substr(0, authority_end);

  const auto at = authority.rfind('@');
  if (at != std::string_view::npos) authority.remove_prefix(at + 1);

  std::string_view host = authority;
  if (!host.empty() && host.front() == '[') {
    const auto close = host.find(']');
    host             = close == std::string_view::npos ? std::string_view{} : host.substr(1, close - 1);
  } else {
    host = host.substr(0, host.find(':'));
  }

  auto normalized = util::ToLower(util::Trim(host));
  while (!normalized.empty() && normalized.back() == '.') {
    normalized.pop_back();
  }
  if (util::StartsWith(normalized, "www.")) {
    normalized.erase(0, 4);
  }
  return normalized;
}

std::string NormalizeEntityName(std::string_view name) {
  std::string folded;
  Fold(name).toUTF8String(folded);
  return util::CollapseWhitespace(folded);
}

std::string NormalizeEmail(std::string_view email) {
  return util::ToLower(util::Trim(email));
}

std::string NormalizeLinkedinUrl(std::string_view url) {
  auto trimmed = util::Trim(url);
  if (trimmed.empty()) return {};

  std::string_view rest = trimmed;
  std::string      scheme = "https";
  const auto       scheme_end = rest.find("://");
  if (scheme_end != std::string_view::npos) {
    scheme = util::ToLower(rest.substr(0, scheme_end));
    rest.remove_prefix(scheme_end + 3);
  } else if (util::StartsWith(rest, "//")) {
    rest.remove_prefix(2);
  }

  rest = rest.substr(0, rest.find_first_of("?#;"));

  const auto slash = rest.find('/');
  const auto host  = rest.substr(0, slash);
  auto       path  = slash == std::string_view::npos ? std::string_view{} : rest.substr(slash);
  while (!path.empty() && path.back() == '/') {
    path.remove_suffix(1);
  }

  return util::ToLower(scheme + "://" + std::string(host) + std::string(path));
}

std::string NormalizePersonName(std::string_view name) {
  const auto         folded = Fold(name);
  icu::UnicodeString out;
  bool               pending_space = false;
  for (int32_t i = 0; i < folded.length();) {
    const UChar32 c = folded.char32At(i);
    i += U16_LENGTH(c);
    if (!IsNameCodePoint(c)) {
      pending_space = true;
      continue;
    }
    if (pending_space && !out.isEmpty()) out.append(static_cast<UChar>(' '));
    pending_space = false;
    out.append(c);
  }

  std::string result;
  out.toUTF8String(result);
  return result;
}

} // namespace research::resolution
