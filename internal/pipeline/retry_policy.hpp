#pragma once

#include <cstdint>

namespace research::pipeline {

// Linear backoff with a ceiling: min(cap, base * attempt). attempt is 1-based.
uint64_t BackoffSeconds(uint32_t base_seconds, uint32_t cap_seconds, uint32_t attempt);

} // namespace research::pipeline
