#include "quality_classifier.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <set>

#include "internal/util/hash.hpp"
#include "internal/util/text.hpp"

namespace research::quality {

namespace {

constexpr std::array<std::string_view, 6> kPaywallKeywords = {
    "subscribe", "sign in", "log in", "access denied", "registration", "paywall",
};

constexpr std::array<std::string_view, 4> kErrorKeywords = {
    "page not found", "404", "service unavailable", "temporarily unavailable",
};

template <size_t N>
bool ContainsAny(std::string_view haystack, const std::array<std::string_view, N>& needles) {
  return std::any_of(needles.begin(), needles.end(), [haystack](std::string_view n) { return util::Contains(haystack, n); });
}

double AlphaRatio(std::string_view text) {
  size_t alpha     = 0;
  size_t non_space = 0;
  for (unsigned char c : text) {
    if (std::isspace(c)) continue;
    // UTF-8 continuation bytes belong to the preceding character.
    if ((c & 0xC0) == 0x80) continue;
    ++non_space;
    if (std::isalpha(c) || c >= 0xC0) ++alpha;
  }
  return non_space == 0 ? 0.0 : static_cast<double>(alpha) / static_cast<double>(non_space);
}

uint32_t PageCount(std::string_view text) {
  uint32_t pages = 0;
  for (const auto& line : util::SplitLines(text)) {
    if (util::StartsWith(line, "--- page ")) ++pages;
  }
  return pages;
}

} // namespace

std::string NormalizeForQuality(std::string_view text) {
  std::string out;
  out.reserve(text.size());

  for (size_t i = 0; i < text.size(); ++i) {
    char c = text[i];
    if (c == '\r') {
      if (i + 1 < text.size() && text[i + 1] == '\n') continue;
      c = '\n';
    }
    if (c == ' ' || c == '\t') {
      if (!out.empty() && out.back() == ' ') continue;
      out.push_back(' ');
      continue;
    }
    if (c == '\n' && !out.empty() && out.back() == '\n') continue;
    out.push_back(c);
  }
  return util::Trim(out);
}

std::string MaterialHash(const db::model::SourceDocumentRecord& doc) {
  return util::Sha256Hex(doc.content_bytes.empty() ? doc.content_text : doc.content_bytes);
}

bool IsCurrent(const research::v1::ExtractionInfo& stored, std::string_view material_hash, std::string_view text) {
  if (stored.extractor_version() != kExtractorVersion || stored.material_hash() != material_hash) return false;
  const auto& text_hash = stored.signatures().text_hash();
  return !text_hash.empty() && text_hash == util::Sha256Hex(NormalizeForQuality(text));
}

research::v1::QualityDecision DecisionFor(const std::vector<std::string>& reason_codes) {
  bool flagged = false;
  for (const auto& code : reason_codes) {
    if (util::StartsWith(code, "REJECT_")) return research::v1::QUALITY_DECISION_REJECT;
    if (util::StartsWith(code, "FLAG_")) flagged = true;
  }
  return flagged ? research::v1::QUALITY_DECISION_FLAG : research::v1::QUALITY_DECISION_ACCEPT;
}

research::v1::ExtractionInfo Classify(const ClassifyInput& input, uint64_t now_ms) {
  const auto mime   = util::ToLower(input.mime_type);
  const bool is_pdf = util::Contains(mime, "pdf") || input.source_type == research::model::SourceType::kPdf;
  const bool html_like =
      !is_pdf && (util::Contains(mime, "html") || util::Contains(mime, "text") || mime.empty());
  const bool unsupported = !is_pdf && !html_like;

  const auto normalized = NormalizeForQuality(input.text);
  const auto tokens     = util::WordTokens(normalized);
  const auto word_count = static_cast<uint32_t>(tokens.size());

  const std::set<std::string> unique(tokens.begin(), tokens.end());

  research::v1::ExtractionInfo info;
  info.set_extractor_version(std::string(kExtractorVersion));
  info.set_material_hash(std::string(input.material_hash));
  info.set_word_count(word_count);
  info.set_unique_token_ratio(static_cast<double>(unique.size()) / static_cast<double>(std::max<size_t>(tokens.size(), 1)));
  info.set_alpha_ratio(AlphaRatio(normalized));
  info.set_extracted_at_ms(static_cast<int64_t>(now_ms));
  if (is_pdf) {
    info.set_page_count(PageCount(normalized));
  }

  auto*                    flags = info.mutable_quality_flags();
  std::vector<std::string> codes;

  if (unsupported) {
    flags->set_is_unsupported_type(true);
    codes.emplace_back(kFlagUnsupportedType);
  }
  if (input.pdf_bytes_missing) {
    flags->set_is_pdf_bytes_missing(true);
    codes.emplace_back(kFlagPdfBytesMissing);
  }
  if (input.unextractable_pdf) {
    flags->set_is_unextractable_pdf(true);
    codes.emplace_back(kFlagUnextractablePdf);
  }

  if (word_count == 0) {
    codes.emplace_back(kRejectEmptyText);
  } else {
    const uint32_t min_words = is_pdf ? kMinWordsPdf : kMinWordsHtml;
    if (word_count < kExtremeMinWords) {
      flags->set_is_thin(true);
      codes.emplace_back(kRejectExtremeThin);
    } else if (word_count < min_words) {
      flags->set_is_thin(true);
      codes.emplace_back(kFlagThinContent);
    }

    std::string head_text(input.title);
    head_text += " ";
    head_text += util::Utf8Prefix(normalized, kSignaturePrefixChars);
    head_text = util::ToLower(head_text);

    if (ContainsAny(head_text, kPaywallKeywords)) {
      flags->set_is_paywall_or_login(true);
      codes.emplace_back(kFlagPaywallOrLogin);
    }
    if (ContainsAny(head_text, kErrorKeywords)) {
      flags->set_is_error_page(true);
      codes.emplace_back(kFlagErrorPage);
    }

    const bool boilerplate = (info.unique_token_ratio() < kUniqueTokenRatioMin || info.alpha_ratio() < kAlphaRatioMin) &&
                             word_count >= kMinWordsHtml;
    if (boilerplate) {
      flags->set_is_boilerplate_dominant(true);
      codes.emplace_back(kFlagBoilerplate);
    }
  }

  std::sort(codes.begin(), codes.end());
  for (const auto& code : codes) {
    info.add_reason_codes(code);
  }
  info.set_decision(DecisionFor(codes));

  std::vector<std::string> token_prefix(tokens.begin(), tokens.begin() + std::min(tokens.size(), kSignatureTokenCount));

  auto* signatures = info.mutable_signatures();
  signatures->set_text_hash(util::Sha256Hex(normalized));
  signatures->set_signature_prefix_2k(util::Sha256Hex(util::Utf8Prefix(normalized, kSignaturePrefixChars)));
  signatures->set_signature_tokens(util::Sha256Hex(util::Join(token_prefix, " ")));

  return info;
}

} // namespace research::quality
