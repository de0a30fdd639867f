#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

namespace research::model {

// -----------------------------------------------------------------------------
// Run
// -----------------------------------------------------------------------------

enum class RunStatus : std::uint8_t {
  kQueued          = 0,
  kRunning         = 1,
  kCancelRequested = 2,
  kCancelled       = 3,
  kSucceeded       = 4,
  kFailed          = 5,
};

constexpr bool IsTerminal(RunStatus status) {
  return status == RunStatus::kCancelled || status == RunStatus::kSucceeded || status == RunStatus::kFailed;
}

constexpr bool CanTransition(RunStatus from, RunStatus to) {
  if (from == to) {
    return true;
  }
  if (IsTerminal(from)) {
    return false;
  }
  switch (to) {
    case RunStatus::kQueued:
      return false;
    case RunStatus::kRunning:
      return from == RunStatus::kQueued;
    case RunStatus::kCancelRequested:
      return true;
    case RunStatus::kCancelled:
      return true;
    case RunStatus::kSucceeded:
    case RunStatus::kFailed:
      return from == RunStatus::kRunning || from == RunStatus::kCancelRequested;
  }
  return false;
}

// Explicit retry is the only way out of a terminal run state.
constexpr bool CanRetry(RunStatus status) {
  return status == RunStatus::kFailed;
}

// -----------------------------------------------------------------------------
// Job
// -----------------------------------------------------------------------------

enum class JobStatus : std::uint8_t {
  kQueued    = 0,
  kRunning   = 1,
  kSucceeded = 2,
  kFailed    = 3,
  kCancelled = 4,
};

constexpr bool IsTerminal(JobStatus status) {
  return status == JobStatus::kSucceeded || status == JobStatus::kFailed || status == JobStatus::kCancelled;
}

constexpr bool IsActive(JobStatus status) {
  return status == JobStatus::kQueued || status == JobStatus::kRunning;
}

// -----------------------------------------------------------------------------
// Step
// -----------------------------------------------------------------------------

enum class StepStatus : std::uint8_t {
  kPending   = 0,
  kRunning   = 1,
  kSucceeded = 2,
  kFailed    = 3,
  kSkipped   = 4,
  kCancelled = 5,
};

// A failed step is terminal only once its attempts are exhausted.
constexpr bool IsTerminal(StepStatus status, std::uint32_t attempt_count, std::uint32_t max_attempts) {
  switch (status) {
    case StepStatus::kSucceeded:
    case StepStatus::kSkipped:
    case StepStatus::kCancelled:
      return true;
    case StepStatus::kFailed:
      return attempt_count >= max_attempts;
    default:
      return false;
  }
}

constexpr bool IsSettled(StepStatus status) {
  return status == StepStatus::kSucceeded || status == StepStatus::kSkipped || status == StepStatus::kCancelled;
}

// -----------------------------------------------------------------------------
// Source documents
// -----------------------------------------------------------------------------

enum class SourceType : std::uint8_t {
  kUrl      = 0,
  kText     = 1,
  kPdf      = 2,
  kList     = 3,
  kProposal = 4,
};

enum class SourceStatus : std::uint8_t {
  kNew         = 0,
  kQueued      = 1,
  kFetching    = 2,
  kFetched     = 3,
  kProcessed   = 4,
  kFailed      = 5,
  kFetchFailed = 6,
};

// -----------------------------------------------------------------------------
// Events
// -----------------------------------------------------------------------------

enum class EventStatus : std::uint8_t {
  kOk        = 0,
  kWarn      = 1,
  kFailed    = 2,
  kCancelled = 3,
};

enum class EntityKind : std::uint8_t {
  kCompany = 0,
  kPerson  = 1,
};

enum class EvidenceSubject : std::uint8_t {
  kProspect  = 0,
  kExecutive = 1,
};

// -----------------------------------------------------------------------------
// Text forms (persisted)
// -----------------------------------------------------------------------------

std::string_view ToString(RunStatus status);
std::string_view ToString(JobStatus status);
std::string_view ToString(StepStatus status);
std::string_view ToString(SourceType type);
std::string_view ToString(SourceStatus status);
std::string_view ToString(EventStatus status);
std::string_view ToString(EntityKind kind);
std::string_view ToString(EvidenceSubject subject);

std::optional<RunStatus>       ParseRunStatus(std::string_view text);
std::optional<JobStatus>       ParseJobStatus(std::string_view text);
std::optional<StepStatus>      ParseStepStatus(std::string_view text);
std::optional<SourceType>      ParseSourceType(std::string_view text);
std::optional<SourceStatus>    ParseSourceStatus(std::string_view text);
std::optional<EventStatus>     ParseEventStatus(std::string_view text);
std::optional<EntityKind>      ParseEntityKind(std::string_view text);
std::optional<EvidenceSubject> ParseEvidenceSubject(std::string_view text);

} // namespace research::model
