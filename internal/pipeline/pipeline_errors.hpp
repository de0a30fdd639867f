#pragma once

#include <stdexcept>
#include <string>
#include <vector>

namespace research::pipeline {

// Cancellation observed at a checkpoint; the step transaction is rolled back.
class StepCancelled : public std::runtime_error {
 public:
  explicit StepCancelled(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Another worker holds the job lock; nothing more may be written for the job.
class LeaseLost : public std::runtime_error {
 public:
  explicit LeaseLost(const std::string& msg) : std::runtime_error(msg) {
  }
};

// finalize found steps that can no longer settle.
class RunBlocked : public std::runtime_error {
 public:
  explicit RunBlocked(std::vector<std::string> blockers);

  const std::vector<std::string>& Blockers() const {
    return blockers_;
  }

 private:
  std::vector<std::string> blockers_;
};

// A stored step key this build has no handler for.
class UnknownStep : public std::runtime_error {
 public:
  explicit UnknownStep(const std::string& step_key) : std::runtime_error("unknown step: " + step_key) {
  }
};

} // namespace research::pipeline
