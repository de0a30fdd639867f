#pragma once

#include <array>

#include "internal/model/step_key.hpp"
#include "step_context.hpp"

namespace research::pipeline {

using StepHandler  = StepResult (*)(StepContext&);
using StepPreparer = PreparedSources (*)(PrepareContext&);

PreparedSources PrepareFetch(PrepareContext& ctx);
PreparedSources PrepareExtract(PrepareContext& ctx);

StepResult FetchUrlSources(StepContext& ctx);
StepResult ExtractUrlSources(StepContext& ctx);
StepResult ClassifySources(StepContext& ctx);
StepResult ProcessSources(StepContext& ctx);
StepResult IngestLists(StepContext& ctx);
StepResult IngestProposal(StepContext& ctx);
StepResult Finalize(StepContext& ctx);

// Indexed by research::model::Index(StepKey).
inline constexpr std::array<StepHandler, research::model::kStepCount> kStepHandlers = {
    &FetchUrlSources, &ExtractUrlSources, &ClassifySources, &ProcessSources, &IngestLists, &IngestProposal, &Finalize,
};

inline StepHandler HandlerFor(research::model::StepKey key) {
  return kStepHandlers[research::model::Index(key)];
}

// Steps without network or subprocess work have no preparer.
inline constexpr std::array<StepPreparer, research::model::kStepCount> kStepPreparers = {
    &PrepareFetch, &PrepareExtract, nullptr, nullptr, nullptr, nullptr, nullptr,
};

inline StepPreparer PreparerFor(research::model::StepKey key) {
  return kStepPreparers[research::model::Index(key)];
}

} // namespace research::pipeline
