#include "memory_repository.hpp"

#include <algorithm>
#include <tuple>

#include "memory_tx.hpp"

namespace research::db::memory {

using research::model::EntityKind;
using research::model::EvidenceSubject;
using research::model::JobStatus;

namespace {

std::string LinkKey(const std::string& tenant_id, EntityKind kind, const std::string& raw_entity_id) {
  return tenant_id + "#" + std::string(research::model::ToString(kind)) + "#" + raw_entity_id;
}

bool SameAssignmentKey(const model::EnrichmentAssignmentRecord& a, const model::EnrichmentAssignmentRecord& b) {
  return std::tie(a.tenant_id, a.target_entity_type, a.target_canonical_id, a.field_key, a.content_hash, a.source_document_id) ==
         std::tie(b.tenant_id, b.target_entity_type, b.target_canonical_id, b.field_key, b.content_hash, b.source_document_id);
}

template <typename Record>
std::optional<Record> Find(const std::map<std::string, Record>& table, const std::string& id) {
  auto it = table.find(id);
  if (it == table.end()) return std::nullopt;
  return it->second;
}

} // namespace

MemoryRepository::MemoryRepository() = default;

std::unique_ptr<db::Transaction> MemoryRepository::Begin() {
  return std::make_unique<MemoryTransaction>(*this);
}

static MemoryTransaction& TX(db::Transaction& tx) {
  return static_cast<MemoryTransaction&>(tx);
}

// ------------------------------------------------------------------
// Runs
// ------------------------------------------------------------------

Result MemoryRepository::InsertRun(Transaction& t, const model::RunRecord& r) {
  if (TX(t).View().runs.contains(r.id)) return Result::Err(ErrorCode::AlreadyExists, "run " + r.id);
  TX(t).Mutable().runs[r.id] = r;
  return Result::Ok();
}

std::optional<model::RunRecord> MemoryRepository::GetRun(Transaction& t, const std::string& tenant_id, const std::string& run_id) {
  auto run = Find(TX(t).View().runs, run_id);
  if (!run || run->tenant_id != tenant_id) return std::nullopt;
  return run;
}

Result MemoryRepository::UpdateRun(Transaction& t, const model::RunRecord& r) {
  if (!TX(t).View().runs.contains(r.id)) return Result::Err(ErrorCode::NotFound, "run " + r.id);
  TX(t).Mutable().runs[r.id] = r;
  return Result::Ok();
}

// ------------------------------------------------------------------
// Jobs
// ------------------------------------------------------------------

Result MemoryRepository::InsertJob(Transaction& t, const model::JobRecord& r) {
  const auto& s = TX(t).View();
  if (s.jobs.contains(r.id)) return Result::Err(ErrorCode::AlreadyExists, "job " + r.id);
  if (!s.runs.contains(r.run_id)) return Result::Err(ErrorCode::ConstraintViolation, "job references unknown run " + r.run_id);
  if (research::model::IsActive(r.status)) {
    for (const auto& [_, job] : s.jobs) {
      if (job.tenant_id == r.tenant_id && job.run_id == r.run_id && job.job_type == r.job_type && research::model::IsActive(job.status)) {
        return Result::Err(ErrorCode::AlreadyExists, "active job exists for run " + r.run_id);
      }
    }
  }
  TX(t).Mutable().jobs[r.id] = r;
  return Result::Ok();
}

std::optional<model::JobRecord> MemoryRepository::GetJob(Transaction& t, const std::string& job_id) {
  return Find(TX(t).View().jobs, job_id);
}

std::optional<model::JobRecord> MemoryRepository::FindActiveJob(Transaction& t, const std::string& tenant_id, const std::string& run_id,
                                                                const std::string& job_type) {
  for (const auto& [_, job] : TX(t).View().jobs) {
    if (job.tenant_id == tenant_id && job.run_id == run_id && job.job_type == job_type && research::model::IsActive(job.status)) {
      return job;
    }
  }
  return std::nullopt;
}

std::vector<model::JobRecord> MemoryRepository::ListJobs(Transaction& t, const std::string& tenant_id, const std::string& run_id) {
  std::vector<model::JobRecord> out;
  for (const auto& [_, job] : TX(t).View().jobs) {
    if (job.tenant_id == tenant_id && job.run_id == run_id) out.push_back(job);
  }
  std::sort(out.begin(), out.end(), [](const auto& a, const auto& b) { return std::tie(a.created_at_ms, a.id) < std::tie(b.created_at_ms, b.id); });
  return out;
}

std::optional<model::JobRecord> MemoryRepository::ClaimNextJob(Transaction& t, const std::string& worker_id, uint64_t now_ms,
                                                               uint64_t stale_before_ms) {
  const model::JobRecord* best = nullptr;
  for (const auto& [_, job] : TX(t).View().jobs) {
    const bool ready = job.status == JobStatus::kQueued && job.next_retry_at_ms <= now_ms;
    const bool stale = job.status == JobStatus::kRunning && job.locked_at_ms < stale_before_ms;
    if (!ready && !stale) continue;
    if (!best || std::tie(job.created_at_ms, job.id) < std::tie(best->created_at_ms, best->id)) {
      best = &job;
    }
  }
  if (!best) return std::nullopt;

  model::JobRecord claimed = *best;
  claimed.status           = JobStatus::kRunning;
  claimed.locked_at_ms     = now_ms;
  claimed.locked_by        = worker_id;
  claimed.updated_at_ms    = now_ms;
  TX(t).Mutable().jobs[claimed.id] = claimed;
  return claimed;
}

Result MemoryRepository::UpdateJob(Transaction& t, const model::JobRecord& r) {
  const auto& s = TX(t).View();
  if (!s.jobs.contains(r.id)) return Result::Err(ErrorCode::NotFound, "job " + r.id);
  if (research::model::IsActive(r.status)) {
    for (const auto& [id, job] : s.jobs) {
      if (id != r.id && job.tenant_id == r.tenant_id && job.run_id == r.run_id && job.job_type == r.job_type &&
          research::model::IsActive(job.status)) {
        return Result::Err(ErrorCode::AlreadyExists, "active job exists for run " + r.run_id);
      }
    }
  }
  TX(t).Mutable().jobs[r.id] = r;
  return Result::Ok();
}

// ------------------------------------------------------------------
// Plan / steps
// ------------------------------------------------------------------

Result MemoryRepository::InsertPlan(Transaction& t, const model::PlanRecord& r) {
  const auto& s = TX(t).View();
  if (s.plans.contains(r.id)) return Result::Err(ErrorCode::AlreadyExists, "plan " + r.id);
  for (const auto& [_, plan] : s.plans) {
    if (plan.tenant_id == r.tenant_id && plan.run_id == r.run_id) return Result::Err(ErrorCode::AlreadyExists, "plan for run " + r.run_id);
  }
  TX(t).Mutable().plans[r.id] = r;
  return Result::Ok();
}

std::optional<model::PlanRecord> MemoryRepository::GetPlan(Transaction& t, const std::string& tenant_id, const std::string& run_id) {
  for (const auto& [_, plan] : TX(t).View().plans) {
    if (plan.tenant_id == tenant_id && plan.run_id == run_id) return plan;
  }
  return std::nullopt;
}

Result MemoryRepository::UpdatePlan(Transaction& t, const model::PlanRecord& r) {
  if (!TX(t).View().plans.contains(r.id)) return Result::Err(ErrorCode::NotFound, "plan " + r.id);
  TX(t).Mutable().plans[r.id] = r;
  return Result::Ok();
}

Result MemoryRepository::InsertStep(Transaction& t, const model::StepRecord& r) {
  const auto& s = TX(t).View();
  if (s.steps.contains(r.id)) return Result::Err(ErrorCode::AlreadyExists, "step " + r.id);
  for (const auto& [_, step] : s.steps) {
    if (step.tenant_id == r.tenant_id && step.run_id == r.run_id && step.step_key == r.step_key) {
      return Result::Err(ErrorCode::AlreadyExists, "step " + r.step_key + " for run " + r.run_id);
    }
  }
  TX(t).Mutable().steps[r.id] = r;
  return Result::Ok();
}

std::vector<model::StepRecord> MemoryRepository::ListSteps(Transaction& t, const std::string& tenant_id, const std::string& run_id) {
  std::vector<model::StepRecord> out;
  for (const auto& [_, step] : TX(t).View().steps) {
    if (step.tenant_id == tenant_id && step.run_id == run_id) out.push_back(step);
  }
  std::sort(out.begin(), out.end(), [](const auto& a, const auto& b) { return a.step_order < b.step_order; });
  return out;
}

Result MemoryRepository::UpdateStep(Transaction& t, const model::StepRecord& r) {
  if (!TX(t).View().steps.contains(r.id)) return Result::Err(ErrorCode::NotFound, "step " + r.id);
  TX(t).Mutable().steps[r.id] = r;
  return Result::Ok();
}

// ------------------------------------------------------------------
// Source documents
// ------------------------------------------------------------------

Result MemoryRepository::InsertSource(Transaction& t, const model::SourceDocumentRecord& r) {
  const auto& s = TX(t).View();
  if (s.sources.contains(r.id)) return Result::Err(ErrorCode::AlreadyExists, "source " + r.id);
  if (!s.runs.contains(r.run_id)) return Result::Err(ErrorCode::ConstraintViolation, "source references unknown run " + r.run_id);
  TX(t).Mutable().sources[r.id] = r;
  return Result::Ok();
}

std::optional<model::SourceDocumentRecord> MemoryRepository::GetSource(Transaction& t, const std::string& tenant_id,
                                                                       const std::string& source_id) {
  auto source = Find(TX(t).View().sources, source_id);
  if (!source || source->tenant_id != tenant_id) return std::nullopt;
  return source;
}

std::vector<model::SourceDocumentRecord> MemoryRepository::ListSources(Transaction& t, const std::string& tenant_id, const std::string& run_id) {
  std::vector<model::SourceDocumentRecord> out;
  for (const auto& [_, source] : TX(t).View().sources) {
    if (source.tenant_id == tenant_id && source.run_id == run_id) out.push_back(source);
  }
  std::sort(out.begin(), out.end(), [](const auto& a, const auto& b) { return std::tie(a.created_at_ms, a.id) < std::tie(b.created_at_ms, b.id); });
  return out;
}

Result MemoryRepository::UpdateSource(Transaction& t, const model::SourceDocumentRecord& r) {
  if (!TX(t).View().sources.contains(r.id)) return Result::Err(ErrorCode::NotFound, "source " + r.id);
  TX(t).Mutable().sources[r.id] = r;
  return Result::Ok();
}

// ------------------------------------------------------------------
// Raw entities and evidence
// ------------------------------------------------------------------

Result MemoryRepository::InsertProspect(Transaction& t, const model::ProspectRecord& r) {
  const auto& s = TX(t).View();
  if (s.prospects.contains(r.id)) return Result::Err(ErrorCode::AlreadyExists, "prospect " + r.id);
  for (const auto& [_, prospect] : s.prospects) {
    if (prospect.tenant_id == r.tenant_id && prospect.run_id == r.run_id && prospect.name_normalized == r.name_normalized) {
      return Result::Err(ErrorCode::AlreadyExists, "prospect " + r.name_normalized);
    }
  }
  TX(t).Mutable().prospects[r.id] = r;
  return Result::Ok();
}

std::optional<model::ProspectRecord> MemoryRepository::FindProspectByName(Transaction& t, const std::string& tenant_id, const std::string& run_id,
                                                                          const std::string& name_normalized) {
  for (const auto& [_, prospect] : TX(t).View().prospects) {
    if (prospect.tenant_id == tenant_id && prospect.run_id == run_id && prospect.name_normalized == name_normalized) return prospect;
  }
  return std::nullopt;
}

std::vector<model::ProspectRecord> MemoryRepository::ListProspects(Transaction& t, const std::string& tenant_id, const std::string& run_id) {
  std::vector<model::ProspectRecord> out;
  for (const auto& [_, prospect] : TX(t).View().prospects) {
    if (prospect.tenant_id == tenant_id && prospect.run_id == run_id) out.push_back(prospect);
  }
  return out; // map order is id order
}

Result MemoryRepository::UpdateProspect(Transaction& t, const model::ProspectRecord& r) {
  if (!TX(t).View().prospects.contains(r.id)) return Result::Err(ErrorCode::NotFound, "prospect " + r.id);
  TX(t).Mutable().prospects[r.id] = r;
  return Result::Ok();
}

Result MemoryRepository::InsertExecutive(Transaction& t, const model::ExecutiveRecord& r) {
  const auto& s = TX(t).View();
  if (s.executives.contains(r.id)) return Result::Err(ErrorCode::AlreadyExists, "executive " + r.id);
  if (!s.prospects.contains(r.company_prospect_id)) {
    return Result::Err(ErrorCode::ConstraintViolation, "executive references unknown prospect " + r.company_prospect_id);
  }
  TX(t).Mutable().executives[r.id] = r;
  return Result::Ok();
}

std::vector<model::ExecutiveRecord> MemoryRepository::ListExecutives(Transaction& t, const std::string& tenant_id, const std::string& run_id) {
  std::vector<model::ExecutiveRecord> out;
  for (const auto& [_, executive] : TX(t).View().executives) {
    if (executive.tenant_id == tenant_id && executive.run_id == run_id) out.push_back(executive);
  }
  return out;
}

Result MemoryRepository::InsertEvidence(Transaction& t, const model::EvidenceRecord& r) {
  const auto& s = TX(t).View();
  if (r.source_document_id.empty() || !s.sources.contains(r.source_document_id)) {
    return Result::Err(ErrorCode::ConstraintViolation, "evidence requires a source document");
  }
  if (s.evidence.contains(r.id)) return Result::Err(ErrorCode::AlreadyExists, "evidence " + r.id);
  for (const auto& [_, row] : s.evidence) {
    if (row.subject_type == r.subject_type && row.subject_id == r.subject_id && row.source_document_id == r.source_document_id) {
      return Result::Err(ErrorCode::AlreadyExists, "evidence for " + r.subject_id);
    }
  }
  TX(t).Mutable().evidence[r.id] = r;
  return Result::Ok();
}

std::vector<model::EvidenceRecord> MemoryRepository::ListEvidence(Transaction& t, const std::string& tenant_id, EvidenceSubject subject_type,
                                                                  const std::string& subject_id) {
  std::vector<model::EvidenceRecord> out;
  for (const auto& [_, row] : TX(t).View().evidence) {
    if (row.tenant_id == tenant_id && row.subject_type == subject_type && row.subject_id == subject_id) out.push_back(row);
  }
  std::sort(out.begin(), out.end(), [](const auto& a, const auto& b) { return a.source_document_id < b.source_document_id; });
  return out;
}

// ------------------------------------------------------------------
// Canonical entities
// ------------------------------------------------------------------

Result MemoryRepository::InsertCanonicalCompany(Transaction& t, const model::CanonicalCompanyRecord& r) {
  if (TX(t).View().companies.contains(r.id)) return Result::Err(ErrorCode::AlreadyExists, "company " + r.id);
  TX(t).Mutable().companies[r.id] = r;
  return Result::Ok();
}

std::optional<model::CanonicalCompanyRecord> MemoryRepository::FindCompanyByDomain(Transaction& t, const std::string& tenant_id,
                                                                                   const std::string& domain) {
  for (const auto& [_, company] : TX(t).View().companies) {
    if (company.tenant_id == tenant_id && company.primary_domain == domain) return company;
  }
  return std::nullopt;
}

std::optional<model::CanonicalCompanyRecord> MemoryRepository::FindCompanyByNameCountry(Transaction& t, const std::string& tenant_id,
                                                                                        const std::string& name_normalized,
                                                                                        const std::string& country_code) {
  for (const auto& [_, company] : TX(t).View().companies) {
    if (company.tenant_id == tenant_id && company.name_normalized == name_normalized && company.country_code == country_code) return company;
  }
  return std::nullopt;
}

Result MemoryRepository::InsertCanonicalPerson(Transaction& t, const model::CanonicalPersonRecord& r) {
  if (TX(t).View().people.contains(r.id)) return Result::Err(ErrorCode::AlreadyExists, "person " + r.id);
  TX(t).Mutable().people[r.id] = r;
  return Result::Ok();
}

std::optional<model::CanonicalPersonRecord> MemoryRepository::FindPersonByEmail(Transaction& t, const std::string& tenant_id,
                                                                                const std::string& email) {
  for (const auto& [_, person] : TX(t).View().people) {
    if (person.tenant_id == tenant_id && person.primary_email == email) return person;
  }
  return std::nullopt;
}

std::optional<model::CanonicalPersonRecord> MemoryRepository::FindPersonByLinkedin(Transaction& t, const std::string& tenant_id,
                                                                                   const std::string& linkedin_url) {
  for (const auto& [_, person] : TX(t).View().people) {
    if (person.tenant_id == tenant_id && person.primary_linkedin_url == linkedin_url) return person;
  }
  return std::nullopt;
}

std::optional<model::CanonicalPersonRecord> MemoryRepository::GetCanonicalPerson(Transaction& t, const std::string& tenant_id,
                                                                                 const std::string& person_id) {
  auto person = Find(TX(t).View().people, person_id);
  if (!person || person->tenant_id != tenant_id) return std::nullopt;
  return person;
}

Result MemoryRepository::InsertLink(Transaction& t, const model::CanonicalLinkRecord& r) {
  const auto key = LinkKey(r.tenant_id, r.entity_kind, r.raw_entity_id);
  if (TX(t).View().links.contains(key)) return Result::Err(ErrorCode::AlreadyExists, "link for " + r.raw_entity_id);
  TX(t).Mutable().links[key] = r;
  return Result::Ok();
}

std::optional<model::CanonicalLinkRecord> MemoryRepository::GetLink(Transaction& t, const std::string& tenant_id, EntityKind kind,
                                                                    const std::string& raw_entity_id) {
  return Find(TX(t).View().links, LinkKey(tenant_id, kind, raw_entity_id));
}

// ------------------------------------------------------------------
// Enrichment assignments
// ------------------------------------------------------------------

Result MemoryRepository::UpsertAssignment(Transaction& t, const model::EnrichmentAssignmentRecord& r) {
  auto& s = TX(t).Mutable();
  for (auto& [_, existing] : s.assignments) {
    if (SameAssignmentKey(existing, r)) {
      existing.value            = r.value;
      existing.confidence       = r.confidence;
      existing.derived_by       = r.derived_by;
      existing.input_scope_hash = r.input_scope_hash;
      existing.updated_at_ms    = r.updated_at_ms;
      return Result::Ok();
    }
  }
  s.assignments[r.id] = r;
  return Result::Ok();
}

std::vector<model::EnrichmentAssignmentRecord> MemoryRepository::ListAssignments(Transaction& t, const std::string& tenant_id,
                                                                                 const std::string& entity_type, const std::string& canonical_id) {
  std::vector<model::EnrichmentAssignmentRecord> out;
  for (const auto& [_, row] : TX(t).View().assignments) {
    if (row.tenant_id == tenant_id && row.target_entity_type == entity_type && row.target_canonical_id == canonical_id) out.push_back(row);
  }
  std::sort(out.begin(), out.end(), [](const auto& a, const auto& b) {
    return std::tie(a.field_key, a.source_document_id, a.content_hash) < std::tie(b.field_key, b.source_document_id, b.content_hash);
  });
  return out;
}

// ------------------------------------------------------------------
// Events
// ------------------------------------------------------------------

Result MemoryRepository::InsertEvent(Transaction& t, const model::EventRecord& r) {
  TX(t).Mutable().events.push_back(r);
  return Result::Ok();
}

std::vector<model::EventRecord> MemoryRepository::ListEvents(Transaction& t, const std::string& tenant_id, const std::string& run_id) {
  std::vector<model::EventRecord> out;
  for (const auto& event : TX(t).View().events) {
    if (event.tenant_id == tenant_id && event.run_id == run_id) out.push_back(event);
  }
  return out;
}

} // namespace research::db::memory
