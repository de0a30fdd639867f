#include "state_machine.hpp"

#include <array>
#include <utility>

namespace research::model {

namespace {

template <typename Enum, size_t N>
std::string_view Lookup(const std::array<std::pair<Enum, std::string_view>, N>& table, Enum value) {
  for (const auto& [e, name] : table) {
    if (e == value) return name;
  }
  return "unknown";
}

template <typename Enum, size_t N>
std::optional<Enum> Reverse(const std::array<std::pair<Enum, std::string_view>, N>& table, std::string_view text) {
  for (const auto& [e, name] : table) {
    if (name == text) return e;
  }
  return std::nullopt;
}

constexpr std::array<std::pair<RunStatus, std::string_view>, 6> kRunStatus{{
    {RunStatus::kQueued, "queued"},
    {RunStatus::kRunning, "running"},
    {RunStatus::kCancelRequested, "cancel_requested"},
    {RunStatus::kCancelled, "cancelled"},
    {RunStatus::kSucceeded, "succeeded"},
    {RunStatus::kFailed, "failed"},
}};

constexpr std::array<std::pair<JobStatus, std::string_view>, 5> kJobStatus{{
    {JobStatus::kQueued, "queued"},
    {JobStatus::kRunning, "running"},
    {JobStatus::kSucceeded, "succeeded"},
    {JobStatus::kFailed, "failed"},
    {JobStatus::kCancelled, "cancelled"},
}};

constexpr std::array<std::pair<StepStatus, std::string_view>, 6> kStepStatus{{
    {StepStatus::kPending, "pending"},
    {StepStatus::kRunning, "running"},
    {StepStatus::kSucceeded, "succeeded"},
    {StepStatus::kFailed, "failed"},
    {StepStatus::kSkipped, "skipped"},
    {StepStatus::kCancelled, "cancelled"},
}};

constexpr std::array<std::pair<SourceType, std::string_view>, 5> kSourceType{{
    {SourceType::kUrl, "url"},
    {SourceType::kText, "text"},
    {SourceType::kPdf, "pdf"},
    {SourceType::kList, "list"},
    {SourceType::kProposal, "proposal"},
}};

constexpr std::array<std::pair<SourceStatus, std::string_view>, 7> kSourceStatus{{
    {SourceStatus::kNew, "new"},
    {SourceStatus::kQueued, "queued"},
    {SourceStatus::kFetching, "fetching"},
    {SourceStatus::kFetched, "fetched"},
    {SourceStatus::kProcessed, "processed"},
    {SourceStatus::kFailed, "failed"},
    {SourceStatus::kFetchFailed, "fetch_failed"},
}};

constexpr std::array<std::pair<EventStatus, std::string_view>, 4> kEventStatus{{
    {EventStatus::kOk, "ok"},
    {EventStatus::kWarn, "warn"},
    {EventStatus::kFailed, "failed"},
    {EventStatus::kCancelled, "cancelled"},
}};

constexpr std::array<std::pair<EntityKind, std::string_view>, 2> kEntityKind{{
    {EntityKind::kCompany, "company"},
    {EntityKind::kPerson, "person"},
}};

constexpr std::array<std::pair<EvidenceSubject, std::string_view>, 2> kEvidenceSubject{{
    {EvidenceSubject::kProspect, "prospect"},
    {EvidenceSubject::kExecutive, "executive"},
}};

} // namespace

std::string_view ToString(RunStatus status) {
  return Lookup(kRunStatus, status);
}
std::string_view ToString(JobStatus status) {
  return Lookup(kJobStatus, status);
}
std::string_view ToString(StepStatus status) {
  return Lookup(kStepStatus, status);
}
std::string_view ToString(SourceType type) {
  return Lookup(kSourceType, type);
}
std::string_view ToString(SourceStatus status) {
  return Lookup(kSourceStatus, status);
}
std::string_view ToString(EventStatus status) {
  return Lookup(kEventStatus, status);
}
std::string_view ToString(EntityKind kind) {
  return Lookup(kEntityKind, kind);
}
std::string_view ToString(EvidenceSubject subject) {
  return Lookup(kEvidenceSubject, subject);
}

std::optional<RunStatus> ParseRunStatus(std::string_view text) {
  return Reverse(kRunStatus, text);
}
std::optional<JobStatus> ParseJobStatus(std::string_view text) {
  return Reverse(kJobStatus, text);
}
std::optional<StepStatus> ParseStepStatus(std::string_view text) {
  return Reverse(kStepStatus, text);
}
std::optional<SourceType> ParseSourceType(std::string_view text) {
  return Reverse(kSourceType, text);
}
std::optional<SourceStatus> ParseSourceStatus(std::string_view text) {
  return Reverse(kSourceStatus, text);
}
std::optional<EventStatus> ParseEventStatus(std::string_view text) {
  return Reverse(kEventStatus, text);
}
std::optional<EntityKind> ParseEntityKind(std::string_view text) {
  return Reverse(kEntityKind, text);
}
std::optional<EvidenceSubject> ParseEvidenceSubject(std::string_view text) {
  return Reverse(kEvidenceSubject, text);
}

} // namespace research::model
