#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>

namespace research::model {

/*
  Fixed, ordered plan of a research run. The enumerator value is the index into
  the handler dispatch table; step_order is value + 1.
*/
enum class StepKey : std::uint8_t {
  kFetchUrlSources   = 0,
  kExtractUrlSources = 1,
  kClassifySources   = 2,
  kProcessSources    = 3,
  kIngestLists       = 4,
  kIngestProposal    = 5,
  kFinalize          = 6,
};

inline constexpr std::size_t kStepCount = 7;

inline constexpr std::array<StepKey, kStepCount> kPlanSteps = {
    StepKey::kFetchUrlSources, StepKey::kExtractUrlSources, StepKey::kClassifySources, StepKey::kProcessSources,
    StepKey::kIngestLists,     StepKey::kIngestProposal,    StepKey::kFinalize,
};

constexpr std::size_t Index(StepKey key) {
  return static_cast<std::size_t>(key);
}

constexpr std::uint32_t StepOrder(StepKey key) {
  return static_cast<std::uint32_t>(key) + 1;
}

std::string_view         ToString(StepKey key);
std::optional<StepKey>   ParseStepKey(std::string_view text);

} // namespace research::model
