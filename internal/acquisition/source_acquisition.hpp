#pragma once

#include <memory>
#include <stdexcept>
#include <string>
#include <string_view>

#include "config/config.pb.h"
#include "http_fetcher.hpp"
#include "internal/db/model/source_record.hpp"
#include "pdf_text_extractor.hpp"

namespace research::acquisition {

enum class AcquisitionOutcome {
  kFetched,
  kCached,
};

inline constexpr std::string_view kRetryReasonDns  = "dns_or_invalid_host";
inline constexpr std::string_view kRetryReasonHttp = "http_error_or_status";

inline constexpr std::string_view kFlagPdfBytesMissing  = "FLAG_PDF_BYTES_MISSING";
inline constexpr std::string_view kFlagUnextractablePdf = "FLAG_UNEXTRACTABLE_PDF";

/*
  Per-document acquisition failure.

  terminal failures are never retried. reason is the retry reason for
  transient failures and the quality flag for terminal PDF failures.
*/
class AcquisitionError : public std::runtime_error {
 public:
  AcquisitionError(const std::string& message, bool terminal, std::string reason = {})
      : std::runtime_error(message), terminal_(terminal), reason_(std::move(reason)) {
  }

  bool Terminal() const {
    return terminal_;
  }

  const std::string& Reason() const {
    return reason_;
  }

 private:
  bool        terminal_;
  std::string reason_;
};

std::string ClassifyRetryReason(std::string_view error_message);

// Lower-cased media type without parameters; empty stays empty.
std::string MediaType(std::string_view content_type);

/*
  Turns a source document into text.

  Every operation updates the document in place (content, hash, title, mime
  type and meta.fetch) and is a no-op returning kCached once the document
  already carries content text and a content hash. Failures throw
  AcquisitionError after the fetch metadata has been recorded on the document.
*/
class SourceAcquisition {
 public:
  SourceAcquisition(std::shared_ptr<HttpFetcher> fetcher, std::shared_ptr<PdfTextExtractor> pdf,
                    research::runtime::config::FetchConfig config);

  AcquisitionOutcome FetchUrl(db::model::SourceDocumentRecord& doc, uint64_t now_ms);
  AcquisitionOutcome LoadText(db::model::SourceDocumentRecord& doc);
  AcquisitionOutcome ExtractPdf(db::model::SourceDocumentRecord& doc);

  static bool IsCached(const db::model::SourceDocumentRecord& doc);

 private:
  bool        IsAllowed(std::string_view media_type) const;
  std::string PdfToText(db::model::SourceDocumentRecord& doc);

  std::shared_ptr<HttpFetcher>           fetcher_;
  std::shared_ptr<PdfTextExtractor>      pdf_;
  research::runtime::config::FetchConfig config_;
};

} // namespace research::acquisition
