#include "source_acquisition.hpp"

#include <array>

#include "html_distiller.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/hash.hpp"
#include "internal/util/text.hpp"
#include "url_canonicalizer.hpp"

namespace research::acquisition {

namespace {

constexpr std::array<std::string_view, 6> kDnsMarkers = {
    "getaddrinfo",      "name or service not known", "temporary failure in name resolution",
    "nodename nor servname", "could not resolve host", "invalid host",
};

void SetContent(db::model::SourceDocumentRecord& doc, std::string text, std::string_view media_type) {
  doc.content_hash = util::Sha256Hex(text);
  doc.content_text = std::move(text);
  if (!media_type.empty()) {
    doc.mime_type = std::string(media_type);
  }
}

} // namespace

std::string ClassifyRetryReason(std::string_view error_message) {
  const auto lower = util::ToLower(error_message);
  for (auto marker : kDnsMarkers) {
    if (util::Contains(lower, marker)) return std::string(kRetryReasonDns);
  }
  return std::string(kRetryReasonHttp);
}

std::string MediaType(std::string_view content_type) {
  const auto semicolon = content_type.find(';');
  return util::ToLower(util::Trim(content_type.substr(0, semicolon)));
}

SourceAcquisition::SourceAcquisition(std::shared_ptr<HttpFetcher> fetcher, std::shared_ptr<PdfTextExtractor> pdf,
                                     research::runtime::config::FetchConfig config)
    : fetcher_(std::move(fetcher)), pdf_(std::move(pdf)), config_(std::move(config)) {
}

bool SourceAcquisition::IsCached(const db::model::SourceDocumentRecord& doc) {
  return !doc.content_text.empty() && !doc.content_hash.empty();
}

bool SourceAcquisition::IsAllowed(std::string_view media_type) const {
  for (const auto& allowed : config_.allowed_content_types()) {
    if (MediaType(allowed) == media_type) return true;
  }
  return false;
}

// ------------------------------------------------------------

AcquisitionOutcome SourceAcquisition::FetchUrl(db::model::SourceDocumentRecord& doc, uint64_t now_ms) {
  auto* fetch = doc.meta.mutable_fetch();

  if (IsCached(doc)) {
    fetch->set_outcome("cached");
    return AcquisitionOutcome::kCached;
  }

  std::string canonical;
  try {
    canonical = CanonicalizeUrl(doc.url);
  } catch (const util::InvalidArgument& e) {
    fetch->set_outcome("failed");
    fetch->set_retry_reason(std::string(kRetryReasonDns));
    throw AcquisitionError(e.what(), true, std::string(kRetryReasonDns));
  }
  fetch->set_canonical_url(canonical);

  FetchRequest request;
  request.url             = canonical;
  request.timeout_seconds = config_.timeout_seconds();
  request.max_bytes       = config_.max_bytes();
  request.user_agent      = config_.user_agent();

  FetchResponse response;
  try {
    response = fetcher_->Get(request);
  } catch (const std::runtime_error& e) {
    const auto reason = ClassifyRetryReason(e.what());
    fetch->set_outcome("failed");
    fetch->set_retry_reason(reason);
    fetch->set_fetched_at_ms(static_cast<int64_t>(now_ms));
    throw AcquisitionError(e.what(), false, reason);
  }

  fetch->set_http_status_code(static_cast<int32_t>(response.status_code));
  fetch->set_final_url(response.final_url);
  fetch->set_content_type(response.content_type);
  fetch->set_content_bytes(response.body.size());
  fetch->set_fetched_at_ms(static_cast<int64_t>(now_ms));
  fetch->clear_headers();
  for (const auto& [name, value] : response.headers) {
    auto* header = fetch->add_headers();
    header->set_name(name);
    header->set_value(value);
  }

  auto fail = [&](const std::string& message) {
    const auto reason = ClassifyRetryReason(message);
    fetch->set_outcome("failed");
    fetch->set_retry_reason(reason);
    return AcquisitionError(message, false, reason);
  };

  if (response.status_code >= 400) {
    throw fail("HTTP " + std::to_string(response.status_code));
  }

  auto media_type = MediaType(response.content_type);
  if (media_type.empty()) {
    media_type = "text/html";
  }
  if (!IsAllowed(media_type)) {
    throw fail("unsupported content type: " + media_type);
  }

  std::string text;
  if (media_type == "application/pdf") {
    doc.content_bytes = std::move(response.body);
    text              = PdfToText(doc);
  } else if (media_type == "text/html") {
    auto distilled = DistillHtml(response.body);
    if (doc.title.empty()) {
      doc.title = distilled.title;
    }
    text = std::move(distilled.text);
  } else {
    text = util::NormalizeLineEndings(response.body);
  }

  if (util::Trim(text).empty()) {
    throw fail("empty extraction");
  }

  SetContent(doc, std::move(text), media_type);
  fetch->set_outcome("fetched");
  fetch->clear_retry_reason();

  RESEARCH_LOG_DEBUG("source fetched", {observability::StringField("source_id", doc.id), observability::StringField("url", canonical),
                                        observability::IntField("status", response.status_code),
                                        observability::IntField("bytes", static_cast<int64_t>(fetch->content_bytes()))});
  return AcquisitionOutcome::kFetched;
}

// ------------------------------------------------------------

AcquisitionOutcome SourceAcquisition::LoadText(db::model::SourceDocumentRecord& doc) {
  if (IsCached(doc)) {
    return AcquisitionOutcome::kCached;
  }

  auto text = util::NormalizeLineEndings(doc.content_text);
  if (util::Trim(text).empty()) {
    throw AcquisitionError("empty extraction", true);
  }

  SetContent(doc, std::move(text), doc.mime_type.empty() ? "text/plain" : "");
  return AcquisitionOutcome::kFetched;
}

// ------------------------------------------------------------

AcquisitionOutcome SourceAcquisition::ExtractPdf(db::model::SourceDocumentRecord& doc) {
  if (IsCached(doc)) {
    return AcquisitionOutcome::kCached;
  }

  auto text = PdfToText(doc);
  SetContent(doc, std::move(text), "application/pdf");
  return AcquisitionOutcome::kFetched;
}

std::string SourceAcquisition::PdfToText(db::model::SourceDocumentRecord& doc) {
  if (doc.content_bytes.empty()) {
    throw AcquisitionError("pdf bytes missing", true, std::string(kFlagPdfBytesMissing));
  }

  PdfText pdf;
  try {
    pdf = pdf_->Extract(doc.content_bytes);
  } catch (const std::runtime_error& e) {
    throw AcquisitionError(std::string("unextractable pdf: ") + e.what(), true, std::string(kFlagUnextractablePdf));
  }

  if (util::Trim(pdf.text).empty()) {
    throw AcquisitionError("unextractable pdf: no text", true, std::string(kFlagUnextractablePdf));
  }
  return std::move(pdf.text);
}

} // namespace research::acquisition
