#include "internal/db/sql/record_codec.hpp"

#include <optional>
#include <stdexcept>
#include <string>

#include "internal/util/json.hpp"

namespace research::db::sql {

namespace rm = research::model;

namespace {

template <typename Enum>
Enum Require(std::optional<Enum> value, const std::string& column, const std::string& text) {
  if (!value) {
    throw std::runtime_error("unreadable " + column + " value '" + text + "'");
  }
  return *value;
}

std::string Str(std::string_view text) {
  return std::string(text);
}

std::string EncodeMeta(const research::v1::SourceMeta& meta) {
  return util::ToJson(meta);
}

research::v1::SourceMeta DecodeMeta(const std::string& json) {
  research::v1::SourceMeta meta;
  if (json.empty()) return meta;
  try {
    util::FromJson(json, &meta);
  } catch (const std::exception& e) {
    throw std::runtime_error(std::string("unreadable source meta: ") + e.what());
  }
  return meta;
}

} // namespace

// ------------------------------------------------------------------
// Params
// ------------------------------------------------------------------

Params InsertParams(const model::RunRecord& r) {
  return {r.id, r.tenant_id, r.name, Str(rm::ToString(r.status)), r.started_at_ms, r.finished_at_ms, r.last_error, r.created_at_ms, r.updated_at_ms};
}

Params UpdateParams(const model::RunRecord& r) {
  return {r.name, Str(rm::ToString(r.status)), r.started_at_ms, r.finished_at_ms, r.last_error, r.updated_at_ms, r.id};
}

Params InsertParams(const model::JobRecord& r) {
  return {r.id,
          r.tenant_id,
          r.run_id,
          r.job_type,
          Str(rm::ToString(r.status)),
          static_cast<int64_t>(r.attempt_count),
          static_cast<int64_t>(r.max_attempts),
          r.next_retry_at_ms,
          r.locked_at_ms,
          r.locked_by,
          static_cast<int32_t>(r.cancel_requested ? 1 : 0),
          r.last_error,
          r.created_at_ms,
          r.updated_at_ms};
}

Params UpdateParams(const model::JobRecord& r) {
  return {Str(rm::ToString(r.status)),
          static_cast<int64_t>(r.attempt_count),
          static_cast<int64_t>(r.max_attempts),
          r.next_retry_at_ms,
          r.locked_at_ms,
          r.locked_by,
          static_cast<int32_t>(r.cancel_requested ? 1 : 0),
          r.last_error,
          r.updated_at_ms,
          r.id};
}

Params InsertParams(const model::PlanRecord& r) {
  return {r.id, r.tenant_id, r.run_id, static_cast<int64_t>(r.version), r.locked_at_ms, r.created_at_ms};
}

Params UpdateParams(const model::PlanRecord& r) {
  return {static_cast<int64_t>(r.version), r.locked_at_ms, r.id};
}

Params InsertParams(const model::StepRecord& r) {
  return {r.id,
          r.tenant_id,
          r.run_id,
          r.plan_id,
          r.step_key,
          static_cast<int64_t>(r.step_order),
          Str(rm::ToString(r.status)),
          static_cast<int64_t>(r.attempt_count),
          static_cast<int64_t>(r.max_attempts),
          r.next_retry_at_ms,
          r.input_json,
          r.output_json,
          r.last_error,
          r.started_at_ms,
          r.finished_at_ms,
          r.created_at_ms,
          r.updated_at_ms};
}

Params UpdateParams(const model::StepRecord& r) {
  return {Str(rm::ToString(r.status)),
          static_cast<int64_t>(r.attempt_count),
          static_cast<int64_t>(r.max_attempts),
          r.next_retry_at_ms,
          r.input_json,
          r.output_json,
          r.last_error,
          r.started_at_ms,
          r.finished_at_ms,
          r.updated_at_ms,
          r.id};
}

Params InsertParams(const model::SourceDocumentRecord& r) {
  return {r.id,
          r.tenant_id,
          r.run_id,
          Str(rm::ToString(r.source_type)),
          Str(rm::ToString(r.status)),
          r.title,
          r.url,
          r.content_text,
          Blob{r.content_bytes},
          r.mime_type,
          r.content_hash,
          static_cast<int64_t>(r.attempt_count),
          static_cast<int64_t>(r.max_attempts),
          r.next_retry_at_ms,
          r.last_error,
          r.canonical_source_id,
          EncodeMeta(r.meta),
          r.created_at_ms,
          r.updated_at_ms};
}

Params UpdateParams(const model::SourceDocumentRecord& r) {
  return {Str(rm::ToString(r.status)),
          r.title,
          r.url,
          r.content_text,
          Blob{r.content_bytes},
          r.mime_type,
          r.content_hash,
          static_cast<int64_t>(r.attempt_count),
          static_cast<int64_t>(r.max_attempts),
          r.next_retry_at_ms,
          r.last_error,
          r.canonical_source_id,
          EncodeMeta(r.meta),
          r.updated_at_ms,
          r.id};
}

Params InsertParams(const model::ProspectRecord& r) {
  return {r.id,          r.tenant_id,  r.run_id,          r.name_raw,       r.name_normalized, r.website_url,
          r.hq_country,  r.relevance_score, r.evidence_score, r.discovered_by, r.created_at_ms};
}

Params UpdateParams(const model::ProspectRecord& r) {
  return {r.name_raw, r.website_url, r.hq_country, r.relevance_score, r.evidence_score, r.discovered_by, r.id};
}

Params InsertParams(const model::ExecutiveRecord& r) {
  return {r.id,    r.tenant_id, r.run_id,       r.company_prospect_id, r.name_raw,     r.name_normalized,
          r.title, r.email,     r.linkedin_url, r.source_document_id,  r.created_at_ms};
}

Params InsertParams(const model::EvidenceRecord& r) {
  return {r.id,          r.tenant_id,   r.run_id, Str(rm::ToString(r.subject_type)), r.subject_id, r.source_document_id,
          r.source_type, r.source_name, r.weight, r.snippet,                           r.created_at_ms};
}

Params InsertParams(const model::CanonicalCompanyRecord& r) {
  return {r.id, r.tenant_id, r.canonical_name, r.name_normalized, r.primary_domain, r.country_code, r.created_at_ms};
}

Params InsertParams(const model::CanonicalPersonRecord& r) {
  return {r.id, r.tenant_id, r.canonical_full_name, r.name_normalized, r.primary_email, r.primary_linkedin_url, r.created_at_ms};
}

Params InsertParams(const model::CanonicalLinkRecord& r) {
  return {r.tenant_id,  Str(rm::ToString(r.entity_kind)), r.canonical_id, r.raw_entity_id, r.match_rule, r.evidence_source_document_id,
          r.run_id,     r.created_at_ms};
}

Params InsertParams(const model::EnrichmentAssignmentRecord& r) {
  return {r.id,
          r.tenant_id,
          r.target_entity_type,
          r.target_canonical_id,
          r.field_key,
          r.value,
          r.value_normalized,
          r.confidence,
          r.derived_by,
          r.source_document_id,
          r.input_scope_hash,
          r.content_hash,
          r.created_at_ms,
          r.updated_at_ms};
}

Params InsertParams(const model::EventRecord& r) {
  return {r.id,          r.tenant_id,   r.run_id,        r.event_type, Str(rm::ToString(r.status)),
          r.input_json,  r.output_json, r.error_message, r.created_at_ms};
}

// ------------------------------------------------------------------
// Decoders
// ------------------------------------------------------------------

model::RunRecord ReadRun(const Row& row) {
  model::RunRecord r;
  r.id             = row.GetText(0);
  r.tenant_id      = row.GetText(1);
  r.name           = row.GetText(2);
  const auto state = row.GetText(3);
  r.status         = Require(rm::ParseRunStatus(state), "runs.status", state);
  r.started_at_ms  = row.GetU64(4);
  r.finished_at_ms = row.GetU64(5);
  r.last_error     = row.GetText(6);
  r.created_at_ms  = row.GetU64(7);
  r.updated_at_ms  = row.GetU64(8);
  return r;
}

model::JobRecord ReadJob(const Row& row) {
  model::JobRecord r;
  r.id               = row.GetText(0);
  r.tenant_id        = row.GetText(1);
  r.run_id           = row.GetText(2);
  r.job_type         = row.GetText(3);
  const auto state   = row.GetText(4);
  r.status           = Require(rm::ParseJobStatus(state), "jobs.status", state);
  r.attempt_count    = row.GetU32(5);
  r.max_attempts     = row.GetU32(6);
  r.next_retry_at_ms = row.GetU64(7);
  r.locked_at_ms     = row.GetU64(8);
  r.locked_by        = row.GetText(9);
  r.cancel_requested = row.GetInt64(10) != 0;
  r.last_error       = row.GetText(11);
  r.created_at_ms    = row.GetU64(12);
  r.updated_at_ms    = row.GetU64(13);
  return r;
}

model::PlanRecord ReadPlan(const Row& row) {
  model::PlanRecord r;
  r.id            = row.GetText(0);
  r.tenant_id     = row.GetText(1);
  r.run_id        = row.GetText(2);
  r.version       = row.GetU32(3);
  r.locked_at_ms  = row.GetU64(4);
  r.created_at_ms = row.GetU64(5);
  return r;
}

model::StepRecord ReadStep(const Row& row) {
  model::StepRecord r;
  r.id               = row.GetText(0);
  r.tenant_id        = row.GetText(1);
  r.run_id           = row.GetText(2);
  r.plan_id          = row.GetText(3);
  r.step_key         = row.GetText(4);
  r.step_order       = row.GetU32(5);
  const auto state   = row.GetText(6);
  r.status           = Require(rm::ParseStepStatus(state), "steps.status", state);
  r.attempt_count    = row.GetU32(7);
  r.max_attempts     = row.GetU32(8);
  r.next_retry_at_ms = row.GetU64(9);
  r.input_json       = row.GetText(10);
  r.output_json      = row.GetText(11);
  r.last_error       = row.GetText(12);
  r.started_at_ms    = row.GetU64(13);
  r.finished_at_ms   = row.GetU64(14);
  r.created_at_ms    = row.GetU64(15);
  r.updated_at_ms    = row.GetU64(16);
  return r;
}

model::SourceDocumentRecord ReadSource(const Row& row) {
  model::SourceDocumentRecord r;
  r.id                  = row.GetText(0);
  r.tenant_id           = row.GetText(1);
  r.run_id              = row.GetText(2);
  const auto type       = row.GetText(3);
  r.source_type         = Require(rm::ParseSourceType(type), "source_documents.source_type", type);
  const auto state      = row.GetText(4);
  r.status              = Require(rm::ParseSourceStatus(state), "source_documents.status", state);
  r.title               = row.GetText(5);
  r.url                 = row.GetText(6);
  r.content_text        = row.GetText(7);
  r.content_bytes       = row.IsNull(8) ? std::string() : row.GetBlob(8);
  r.mime_type           = row.GetText(9);
  r.content_hash        = row.GetText(10);
  r.attempt_count       = row.GetU32(11);
  r.max_attempts        = row.GetU32(12);
  r.next_retry_at_ms    = row.GetU64(13);
  r.last_error          = row.GetText(14);
  r.canonical_source_id = row.GetText(15);
  r.meta                = DecodeMeta(row.GetText(16));
  r.created_at_ms       = row.GetU64(17);
  r.updated_at_ms       = row.GetU64(18);
  return r;
}

model::ProspectRecord ReadProspect(const Row& row) {
  model::ProspectRecord r;
  r.id              = row.GetText(0);
  r.tenant_id       = row.GetText(1);
  r.run_id          = row.GetText(2);
  r.name_raw        = row.GetText(3);
  r.name_normalized = row.GetText(4);
  r.website_url     = row.GetText(5);
  r.hq_country      = row.GetText(6);
  r.relevance_score = row.GetDouble(7);
  r.evidence_score  = row.GetDouble(8);
  r.discovered_by   = row.GetText(9);
  r.created_at_ms   = row.GetU64(10);
  return r;
}

model::ExecutiveRecord ReadExecutive(const Row& row) {
  model::ExecutiveRecord r;
  r.id                  = row.GetText(0);
  r.tenant_id           = row.GetText(1);
  r.run_id              = row.GetText(2);
  r.company_prospect_id = row.GetText(3);
  r.name_raw            = row.GetText(4);
  r.name_normalized     = row.GetText(5);
  r.title               = row.GetText(6);
  r.email               = row.GetText(7);
  r.linkedin_url        = row.GetText(8);
  r.source_document_id  = row.GetText(9);
  r.created_at_ms       = row.GetU64(10);
  return r;
}

model::EvidenceRecord ReadEvidence(const Row& row) {
  model::EvidenceRecord r;
  r.id                 = row.GetText(0);
  r.tenant_id          = row.GetText(1);
  r.run_id             = row.GetText(2);
  const auto subject   = row.GetText(3);
  r.subject_type       = Require(rm::ParseEvidenceSubject(subject), "evidence.subject_type", subject);
  r.subject_id         = row.GetText(4);
  r.source_document_id = row.GetText(5);
  r.source_type        = row.GetText(6);
  r.source_name        = row.GetText(7);
  r.weight             = row.GetDouble(8);
  r.snippet            = row.GetText(9);
  r.created_at_ms      = row.GetU64(10);
  return r;
}

model::CanonicalCompanyRecord ReadCompany(const Row& row) {
  model::CanonicalCompanyRecord r;
  r.id              = row.GetText(0);
  r.tenant_id       = row.GetText(1);
  r.canonical_name  = row.GetText(2);
  r.name_normalized = row.GetText(3);
  r.primary_domain  = row.GetText(4);
  r.country_code    = row.GetText(5);
  r.created_at_ms   = row.GetU64(6);
  return r;
}

model::CanonicalPersonRecord ReadPerson(const Row& row) {
  model::CanonicalPersonRecord r;
  r.id                   = row.GetText(0);
  r.tenant_id            = row.GetText(1);
  r.canonical_full_name  = row.GetText(2);
  r.name_normalized      = row.GetText(3);
  r.primary_email        = row.GetText(4);
  r.primary_linkedin_url = row.GetText(5);
  r.created_at_ms        = row.GetU64(6);
  return r;
}

model::CanonicalLinkRecord ReadLink(const Row& row) {
  model::CanonicalLinkRecord r;
  r.tenant_id                   = row.GetText(0);
  const auto kind               = row.GetText(1);
  r.entity_kind                 = Require(rm::ParseEntityKind(kind), "canonical_links.entity_kind", kind);
  r.canonical_id                = row.GetText(2);
  r.raw_entity_id               = row.GetText(3);
  r.match_rule                  = row.GetText(4);
  r.evidence_source_document_id = row.GetText(5);
  r.run_id                      = row.GetText(6);
  r.created_at_ms               = row.GetU64(7);
  return r;
}

model::EnrichmentAssignmentRecord ReadAssignment(const Row& row) {
  model::EnrichmentAssignmentRecord r;
  r.id                  = row.GetText(0);
  r.tenant_id           = row.GetText(1);
  r.target_entity_type  = row.GetText(2);
  r.target_canonical_id = row.GetText(3);
  r.field_key           = row.GetText(4);
  r.value               = row.GetText(5);
  r.value_normalized    = row.GetText(6);
  r.confidence          = row.GetDouble(7);
  r.derived_by          = row.GetText(8);
  r.source_document_id  = row.GetText(9);
  r.input_scope_hash    = row.GetText(10);
  r.content_hash        = row.GetText(11);
  r.created_at_ms       = row.GetU64(12);
  r.updated_at_ms       = row.GetU64(13);
  return r;
}

model::EventRecord ReadEvent(const Row& row) {
  model::EventRecord r;
  r.id             = row.GetText(0);
  r.tenant_id      = row.GetText(1);
  r.run_id         = row.GetText(2);
  r.event_type     = row.GetText(3);
  const auto state = row.GetText(4);
  r.status         = Require(rm::ParseEventStatus(state), "events.status", state);
  r.input_json     = row.GetText(5);
  r.output_json    = row.GetText(6);
  r.error_message  = row.GetText(7);
  r.created_at_ms  = row.GetU64(8);
  return r;
}

} // namespace research::db::sql
