#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "internal/db/model/source_record.hpp"
#include "research/v1/source_meta.pb.h"

namespace research::quality {

inline constexpr std::string_view kExtractorVersion = "5.2.0";

inline constexpr uint32_t kMinWordsHtml        = 150;
inline constexpr uint32_t kMinWordsPdf         = 50;
inline constexpr uint32_t kExtremeMinWords     = 5;
inline constexpr size_t   kSignaturePrefixChars = 2000;
inline constexpr size_t   kSignatureTokenCount  = 500;
inline constexpr double   kUniqueTokenRatioMin  = 0.12;
inline constexpr double   kAlphaRatioMin        = 0.55;

inline constexpr std::string_view kRejectEmptyText        = "REJECT_EMPTY_TEXT";
inline constexpr std::string_view kRejectExtremeThin      = "REJECT_EXTREME_THIN";
inline constexpr std::string_view kFlagThinContent        = "FLAG_THIN_CONTENT";
inline constexpr std::string_view kFlagPaywallOrLogin     = "FLAG_PAYWALL_OR_LOGIN";
inline constexpr std::string_view kFlagErrorPage          = "FLAG_ERROR_PAGE";
inline constexpr std::string_view kFlagBoilerplate        = "FLAG_BOILERPLATE_DOMINANT";
inline constexpr std::string_view kFlagUnextractablePdf   = "FLAG_UNEXTRACTABLE_PDF";
inline constexpr std::string_view kFlagPdfBytesMissing    = "FLAG_PDF_BYTES_MISSING";
inline constexpr std::string_view kFlagUnsupportedType    = "FLAG_UNSUPPORTED_TYPE";
inline constexpr std::string_view kFlagDuplicateTemplate  = "FLAG_DUPLICATE_TEMPLATE";

struct ClassifyInput {
  research::model::SourceType source_type = research::model::SourceType::kUrl;
  std::string_view            mime_type;
  std::string_view            title;
  std::string_view            text;
  std::string_view            material_hash;
  bool                        unextractable_pdf = false;
  bool                        pdf_bytes_missing = false;
};

// \r to \n, blank/space runs collapsed, newline runs collapsed, trimmed.
std::string NormalizeForQuality(std::string_view text);

// Hash of the raw input: uploaded bytes when present, otherwise the text.
std::string MaterialHash(const db::model::SourceDocumentRecord& doc);

// True when a stored extraction was computed by this version from the same input.
bool IsCurrent(const research::v1::ExtractionInfo& stored, std::string_view material_hash, std::string_view text);

// REJECT_* wins over FLAG_*, otherwise accept.
research::v1::QualityDecision DecisionFor(const std::vector<std::string>& reason_codes);

/*
  Deterministic quality gate.

  Produces metrics, sorted reason codes, flags, signatures and the decision.
  Pure function of the input except for extracted_at_ms.
*/
research::v1::ExtractionInfo Classify(const ClassifyInput& input, uint64_t now_ms);

} // namespace research::quality
