#include "ranking_export.hpp"

#include <cstdio>
#include <vector>

#include "internal/util/json.hpp"
#include "internal/util/text.hpp"

namespace research::ranking {

namespace {

std::string CsvCell(const std::string& value) {
  if (value.find_first_of(",\"\r\n") == std::string::npos) {
    return value;
  }
  std::string quoted = "\"";
  for (char c : value) {
    if (c == '"') quoted.push_back('"');
    quoted.push_back(c);
  }
  quoted.push_back('"');
  return quoted;
}

std::string Score(double value) {
  char buffer[32];
  std::snprintf(buffer, sizeof(buffer), "%.4f", value);
  return buffer;
}

std::string Keywords(const std::string& value_normalized) {
  std::vector<std::string> keywords;
  size_t                   begin = 0;
  while (begin < value_normalized.size()) {
    auto end = value_normalized.find(", ", begin);
    if (end == std::string::npos) end = value_normalized.size();
    keywords.push_back(value_normalized.substr(begin, end - begin));
    begin = end + 2;
  }
  return util::Join(keywords, "; ");
}

} // namespace

std::string ToJsonExport(const research::v1::RankingReport& report) {
  return util::ToJson(report);
}

std::string ToCsvExport(const research::v1::RankingReport& report) {
  std::string out = kCsvHeader;
  out += "\r\n";

  for (const auto& prospect : report.prospects()) {
    std::vector<std::string> why;
    for (const auto& signal : prospect.why_included()) {
      why.push_back(signal.field_key() + "=" + signal.value_normalized());
    }
    std::vector<std::string> documents(prospect.evidence_source_document_ids().begin(), prospect.evidence_source_document_ids().end());

    const std::vector<std::string> cells = {
        std::to_string(prospect.rank()),
        prospect.name(),
        Score(prospect.computed_score()),
        prospect.hq_country(),
        prospect.ownership_signal(),
        Keywords(prospect.industry_keywords()),
        util::Join(why, "; "),
        util::Join(documents, "; "),
    };

    for (size_t i = 0; i < cells.size(); ++i) {
      if (i > 0) out += ",";
      out += CsvCell(cells[i]);
    }
    out += "\r\n";
  }
  return out;
}

} // namespace research::ranking
