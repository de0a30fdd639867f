#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace research::acquisition {

struct PdfText {
  std::string text;       // "--- page N ---" blocks joined by a blank line
  uint32_t    page_count = 0;
};

/*
  PDF to text conversion seam.

  Implementations throw std::runtime_error when the document cannot be
  converted at all; an empty result is returned as-is and judged by the caller.
*/
class PdfTextExtractor {
 public:
  virtual ~PdfTextExtractor() = default;

  virtual PdfText Extract(std::string_view pdf_bytes) = 0;
};

// Runs poppler's pdftotext in a subprocess over a temporary file.
class PdftotextExtractor final : public PdfTextExtractor {
 public:
  explicit PdftotextExtractor(std::string tool_path = "pdftotext");

  PdfText Extract(std::string_view pdf_bytes) override;

 private:
  std::string tool_path_;
};

// Splits form-feed separated page text into numbered page blocks.
PdfText FormatPages(std::string_view raw_text);

} // namespace research::acquisition
