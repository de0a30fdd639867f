#pragma once

#include <string>

#include "research/v1/ranking.pb.h"

namespace research::ranking {

inline constexpr const char* kCsvHeader =
    "rank,company_name,score_total,hq_country,ownership_signal,industry_keywords,why_included,evidence_source_document_ids";

// Protobuf JSON of the report; equal reports print equal bytes.
std::string ToJsonExport(const research::v1::RankingReport& report);

/*
  RFC 4180 CSV, CRLF line endings, fixed header. Scores print with 4
  decimals and multi-valued cells are joined with "; ".
*/
std::string ToCsvExport(const research::v1::RankingReport& report);

} // namespace research::ranking
