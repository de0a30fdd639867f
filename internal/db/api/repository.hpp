#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/model/assignment_record.hpp"
#include "internal/db/model/canonical_record.hpp"
#include "internal/db/model/event_record.hpp"
#include "internal/db/model/job_record.hpp"
#include "internal/db/model/plan_record.hpp"
#include "internal/db/model/prospect_record.hpp"
#include "internal/db/model/run_record.hpp"
#include "internal/db/model/source_record.hpp"

namespace research::db {

/*
  Repository abstraction.

  CRITICAL GUARANTEES:

  - All reads and writes run inside a Transaction
  - Reads inside a transaction see its writes
  - Uniqueness invariants are enforced by the store, not by callers:
      one active job per (tenant, run, job_type)
      one plan per run, one step per (tenant, run, step_key)
      one evidence row per (subject, source document)
      one link per (tenant, entity_kind, raw_entity_id)
      one assignment per idempotency tuple
  - A uniqueness clash is reported as AlreadyExists and leaves the
    transaction usable

  Reads throw on backend failure; writes return a Result.
*/

class Repository {
 public:
  virtual ~Repository() = default;

  // ---------------------------------------------------------------------
  // Transactions
  // ---------------------------------------------------------------------

  virtual std::unique_ptr<Transaction> Begin() = 0;

  // ---------------------------------------------------------------------
  // Runs
  // ---------------------------------------------------------------------

  virtual Result InsertRun(Transaction&, const model::RunRecord&) = 0;

  virtual std::optional<model::RunRecord> GetRun(Transaction&, const std::string& tenant_id, const std::string& run_id) = 0;

  virtual Result UpdateRun(Transaction&, const model::RunRecord&) = 0;

  // ---------------------------------------------------------------------
  // Jobs
  // ---------------------------------------------------------------------

  virtual Result InsertJob(Transaction&, const model::JobRecord&) = 0;

  virtual std::optional<model::JobRecord> GetJob(Transaction&, const std::string& job_id) = 0;

  virtual std::optional<model::JobRecord> FindActiveJob(Transaction&, const std::string& tenant_id, const std::string& run_id,
                                                        const std::string& job_type) = 0;

  virtual std::vector<model::JobRecord> ListJobs(Transaction&, const std::string& tenant_id, const std::string& run_id) = 0;

  /*
    Claims the oldest eligible job in one conditional update:
      queued  with next_retry_at <= now_ms
      running with locked_at < stale_before_ms (abandoned lock)
    The claimed row is returned with status running and the new lock.
  */
  virtual std::optional<model::JobRecord> ClaimNextJob(Transaction&, const std::string& worker_id, uint64_t now_ms,
                                                       uint64_t stale_before_ms) = 0;

  virtual Result UpdateJob(Transaction&, const model::JobRecord&) = 0;

  // ---------------------------------------------------------------------
  // Plan / steps
  // ---------------------------------------------------------------------

  virtual Result InsertPlan(Transaction&, const model::PlanRecord&) = 0;

  virtual std::optional<model::PlanRecord> GetPlan(Transaction&, const std::string& tenant_id, const std::string& run_id) = 0;

  virtual Result UpdatePlan(Transaction&, const model::PlanRecord&) = 0;

  virtual Result InsertStep(Transaction&, const model::StepRecord&) = 0;

  // Ordered by step_order.
  virtual std::vector<model::StepRecord> ListSteps(Transaction&, const std::string& tenant_id, const std::string& run_id) = 0;

  virtual Result UpdateStep(Transaction&, const model::StepRecord&) = 0;

  // ---------------------------------------------------------------------
  // Source documents
  // ---------------------------------------------------------------------

  virtual Result InsertSource(Transaction&, const model::SourceDocumentRecord&) = 0;

  virtual std::optional<model::SourceDocumentRecord> GetSource(Transaction&, const std::string& tenant_id, const std::string& source_id) = 0;

  // Ordered by (created_at, id).
  virtual std::vector<model::SourceDocumentRecord> ListSources(Transaction&, const std::string& tenant_id, const std::string& run_id) = 0;

  virtual Result UpdateSource(Transaction&, const model::SourceDocumentRecord&) = 0;

  // ---------------------------------------------------------------------
  // Raw entities and evidence
  // ---------------------------------------------------------------------

  virtual Result InsertProspect(Transaction&, const model::ProspectRecord&) = 0;

  virtual std::optional<model::ProspectRecord> FindProspectByName(Transaction&, const std::string& tenant_id, const std::string& run_id,
                                                                  const std::string& name_normalized) = 0;

  // Ordered by id.
  virtual std::vector<model::ProspectRecord> ListProspects(Transaction&, const std::string& tenant_id, const std::string& run_id) = 0;

  virtual Result UpdateProspect(Transaction&, const model::ProspectRecord&) = 0;

  virtual Result InsertExecutive(Transaction&, const model::ExecutiveRecord&) = 0;

  // Ordered by id.
  virtual std::vector<model::ExecutiveRecord> ListExecutives(Transaction&, const std::string& tenant_id, const std::string& run_id) = 0;

  // ConstraintViolation without a known source document; AlreadyExists on a duplicate.
  virtual Result InsertEvidence(Transaction&, const model::EvidenceRecord&) = 0;

  // Ordered by source_document_id.
  virtual std::vector<model::EvidenceRecord> ListEvidence(Transaction&, const std::string& tenant_id, research::model::EvidenceSubject subject_type,
                                                          const std::string& subject_id) = 0;

  // ---------------------------------------------------------------------
  // Canonical entities
  // ---------------------------------------------------------------------

  virtual Result InsertCanonicalCompany(Transaction&, const model::CanonicalCompanyRecord&) = 0;

  virtual std::optional<model::CanonicalCompanyRecord> FindCompanyByDomain(Transaction&, const std::string& tenant_id, const std::string& domain) = 0;

  virtual std::optional<model::CanonicalCompanyRecord> FindCompanyByNameCountry(Transaction&, const std::string& tenant_id,
                                                                                const std::string& name_normalized,
                                                                                const std::string& country_code) = 0;

  virtual Result InsertCanonicalPerson(Transaction&, const model::CanonicalPersonRecord&) = 0;

  virtual std::optional<model::CanonicalPersonRecord> FindPersonByEmail(Transaction&, const std::string& tenant_id, const std::string& email) = 0;

  virtual std::optional<model::CanonicalPersonRecord> FindPersonByLinkedin(Transaction&, const std::string& tenant_id, const std::string& linkedin_url) = 0;

  virtual std::optional<model::CanonicalPersonRecord> GetCanonicalPerson(Transaction&, const std::string& tenant_id, const std::string& person_id) = 0;

  virtual Result InsertLink(Transaction&, const model::CanonicalLinkRecord&) = 0;

  virtual std::optional<model::CanonicalLinkRecord> GetLink(Transaction&, const std::string& tenant_id, research::model::EntityKind kind,
                                                            const std::string& raw_entity_id) = 0;

  // ---------------------------------------------------------------------
  // Enrichment assignments
  // ---------------------------------------------------------------------

  virtual Result UpsertAssignment(Transaction&, const model::EnrichmentAssignmentRecord&) = 0;

  // Ordered by (field_key, source_document_id, content_hash).
  virtual std::vector<model::EnrichmentAssignmentRecord> ListAssignments(Transaction&, const std::string& tenant_id, const std::string& entity_type,
                                                                         const std::string& canonical_id) = 0;

  // ---------------------------------------------------------------------
  // Events
  // ---------------------------------------------------------------------

  virtual Result InsertEvent(Transaction&, const model::EventRecord&) = 0;

  // Insertion order.
  virtual std::vector<model::EventRecord> ListEvents(Transaction&, const std::string& tenant_id, const std::string& run_id) = 0;
};

} // namespace research::db
