#include "retry_policy.hpp"

#include <algorithm>

namespace research::pipeline {

uint64_t BackoffSeconds(uint32_t base_seconds, uint32_t cap_seconds, uint32_t attempt) {
  const uint64_t linear = static_cast<uint64_t>(base_seconds) * std::max<uint32_t>(attempt, 1);
  return std::min<uint64_t>(cap_seconds, linear);
}

} // namespace research::pipeline
