#include "pipeline_errors.hpp"

#include "internal/util/text.hpp"

namespace research::pipeline {

RunBlocked::RunBlocked(std::vector<std::string> blockers)
    : std::runtime_error("blocked by: " + util::Join(blockers, ", ")), blockers_(std::move(blockers)) {
}

} // namespace research::pipeline
