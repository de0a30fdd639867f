#include "step_key.hpp"

namespace research::model {

namespace {

constexpr std::array<std::string_view, kStepCount> kStepNames = {
    "fetch_url_sources", "extract_url_sources", "classify_sources", "process_sources",
    "ingest_lists",      "ingest_proposal",     "finalize",
};

} // namespace

std::string_view ToString(StepKey key) {
  return kStepNames[Index(key)];
}

std::optional<StepKey> ParseStepKey(std::string_view text) {
  for (std::size_t i = 0; i < kStepNames.size(); ++i) {
    if (kStepNames[i] == text) return static_cast<StepKey>(i);
  }
  return std::nullopt;
}

} // namespace research::model
