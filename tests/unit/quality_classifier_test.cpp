#include "internal/quality/quality_classifier.hpp"

#include <cassert>
#include <iostream>
#include <string>

#include "internal/util/hash.hpp"

namespace {

namespace quality = research::quality;
namespace v1      = research::v1;

// n distinct words so the unique-token ratio stays high.
std::string Words(size_t n, const std::string& prefix = "word") {
  std::string out;
  for (size_t i = 0; i < n; ++i) {
    if (!out.empty()) out += ' ';
    out += prefix + std::to_string(i) + "x";
  }
  return out;
}

bool HasCode(const v1::ExtractionInfo& info, std::string_view code) {
  for (const auto& c : info.reason_codes()) {
    if (c == code) return true;
  }
  return false;
}

quality::ClassifyInput HtmlInput(std::string_view text) {
  quality::ClassifyInput input;
  input.source_type = research::model::SourceType::kUrl;
  input.mime_type   = "text/html";
  input.text        = text;
  return input;
}

void TestNormalizeForQuality() {
  assert(quality::NormalizeForQuality("  a \t\t b\r\n\r\n\nc  ") == "a b\nc");
  assert(quality::NormalizeForQuality("") == "");
}

void TestLongHtmlIsAccepted() {
  const auto text = Words(200);
  const auto info = quality::Classify(HtmlInput(text), 42);

  assert(info.extractor_version() == quality::kExtractorVersion);
  assert(info.word_count() == 200);
  assert(info.decision() == v1::QUALITY_DECISION_ACCEPT);
  assert(info.reason_codes_size() == 0);
  assert(info.extracted_at_ms() == 42);
  assert(info.signatures().text_hash() == research::util::Sha256Hex(text));
}

void TestEmptyAndExtremeThinRejected() {
  const auto empty = quality::Classify(HtmlInput("   "), 0);
  assert(empty.decision() == v1::QUALITY_DECISION_REJECT);
  assert(HasCode(empty, quality::kRejectEmptyText));

  const auto thin = quality::Classify(HtmlInput("only three words"), 0);
  assert(thin.decision() == v1::QUALITY_DECISION_REJECT);
  assert(HasCode(thin, quality::kRejectExtremeThin));
  assert(thin.quality_flags().is_thin());
}

void TestThinThresholdDependsOnType() {
  const auto text = Words(60);

  const auto html = quality::Classify(HtmlInput(text), 0);
  assert(html.decision() == v1::QUALITY_DECISION_FLAG);
  assert(HasCode(html, quality::kFlagThinContent));

  auto pdf_input        = HtmlInput(text);
  pdf_input.source_type = research::model::SourceType::kPdf;
  pdf_input.mime_type   = "application/pdf";
  const auto pdf        = quality::Classify(pdf_input, 0);
  assert(pdf.decision() == v1::QUALITY_DECISION_ACCEPT);
}

void TestPaywallAndErrorKeywords() {
  auto input  = HtmlInput(Words(200));
  input.title = "Please Sign In to continue";
  const auto paywall = quality::Classify(input, 0);
  assert(paywall.quality_flags().is_paywall_or_login());
  assert(HasCode(paywall, quality::kFlagPaywallOrLogin));

  const auto error_text = "Page Not Found " + Words(200);
  const auto error      = quality::Classify(HtmlInput(error_text), 0);
  assert(error.quality_flags().is_error_page());
  assert(error.decision() == v1::QUALITY_DECISION_FLAG);
}

void TestBoilerplateDominant() {
  std::string repeated;
  for (int i = 0; i < 200; ++i) repeated += "menu item ";
  const auto info = quality::Classify(HtmlInput(repeated), 0);
  assert(info.quality_flags().is_boilerplate_dominant());
  assert(HasCode(info, quality::kFlagBoilerplate));
}

void TestUnsupportedTypeAndPdfFlags() {
  auto input      = HtmlInput(Words(200));
  input.mime_type = "image/png";
  const auto unsupported = quality::Classify(input, 0);
  assert(HasCode(unsupported, quality::kFlagUnsupportedType));

  quality::ClassifyInput pdf;
  pdf.source_type       = research::model::SourceType::kPdf;
  pdf.pdf_bytes_missing = true;
  const auto missing    = quality::Classify(pdf, 0);
  assert(HasCode(missing, quality::kFlagPdfBytesMissing));
  assert(HasCode(missing, quality::kRejectEmptyText));
  assert(missing.decision() == v1::QUALITY_DECISION_REJECT);
}

void TestReasonCodesSorted() {
  auto input  = HtmlInput(Words(60));
  input.title = "404 subscribe";
  const auto info = quality::Classify(input, 0);
  for (int i = 1; i < info.reason_codes_size(); ++i) {
    assert(info.reason_codes(i - 1) < info.reason_codes(i));
  }
  assert(info.reason_codes_size() == 3);
}

void TestIsCurrent() {
  const auto text  = Words(200);
  auto       input = HtmlInput(text);
  const auto material = research::util::Sha256Hex(text);
  input.material_hash = material;
  const auto info     = quality::Classify(input, 0);

  assert(quality::IsCurrent(info, material, text));
  assert(!quality::IsCurrent(info, "other", text));
  assert(!quality::IsCurrent(info, material, text + " extra"));

  auto stale = info;
  stale.set_extractor_version("1.0.0");
  assert(!quality::IsCurrent(stale, material, text));
}

void TestDeterministic() {
  const auto text = Words(120);
  const auto a    = quality::Classify(HtmlInput(text), 1);
  const auto b    = quality::Classify(HtmlInput(text), 1);
  assert(a.SerializeAsString() == b.SerializeAsString());
}

} // namespace

int main() {
  TestNormalizeForQuality();
  TestLongHtmlIsAccepted();
  TestEmptyAndExtremeThinRejected();
  TestThinThresholdDependsOnType();
  TestPaywallAndErrorKeywords();
  TestBoilerplateDominant();
  TestUnsupportedTypeAndPdfFlags();
  TestReasonCodesSorted();
  TestIsCurrent();
  TestDeterministic();

  std::cout << "research_unit_quality_classifier: pass\n";
  return 0;
}
