#pragma once

namespace research::db::sql {

/*
  Canonical SQL used by the sqlite and postgres backends.

  Written with '?' placeholders in the subset both engines accept; the
  postgres backend renumbers them. Column lists match the decoders in
  record_codec.cpp. Inserts use ON CONFLICT DO NOTHING so a uniqueness clash
  shows up as zero affected rows and never aborts the enclosing transaction.
*/

// runs

#define RESEARCH_RUN_COLUMNS "id,tenant_id,name,status,started_at_ms,finished_at_ms,last_error,created_at_ms,updated_at_ms"

static constexpr const char* INSERT_RUN = "INSERT INTO runs(" RESEARCH_RUN_COLUMNS ") VALUES(?,?,?,?,?,?,?,?,?) ON CONFLICT DO NOTHING;";

static constexpr const char* SELECT_RUN = "SELECT " RESEARCH_RUN_COLUMNS " FROM runs WHERE tenant_id=? AND id=?;";

static constexpr const char* UPDATE_RUN =
    "UPDATE runs SET name=?,status=?,started_at_ms=?,finished_at_ms=?,last_error=?,updated_at_ms=? WHERE id=?;";

// jobs

#define RESEARCH_JOB_COLUMNS                                                                                                   \
  "id,tenant_id,run_id,job_type,status,attempt_count,max_attempts,next_retry_at_ms,locked_at_ms,locked_by,cancel_requested," \
  "last_error,created_at_ms,updated_at_ms"

static constexpr const char* INSERT_JOB =
    "INSERT INTO jobs(" RESEARCH_JOB_COLUMNS ") VALUES(?,?,?,?,?,?,?,?,?,?,?,?,?,?) ON CONFLICT DO NOTHING;";

static constexpr const char* SELECT_JOB = "SELECT " RESEARCH_JOB_COLUMNS " FROM jobs WHERE id=?;";

static constexpr const char* SELECT_ACTIVE_JOB =
    "SELECT " RESEARCH_JOB_COLUMNS " FROM jobs WHERE tenant_id=? AND run_id=? AND job_type=? AND status IN ('queued','running');";

static constexpr const char* LIST_JOBS = "SELECT " RESEARCH_JOB_COLUMNS " FROM jobs WHERE tenant_id=? AND run_id=? ORDER BY created_at_ms, id;";

static constexpr const char* SELECT_CLAIMABLE_JOB =
    "SELECT " RESEARCH_JOB_COLUMNS " FROM jobs WHERE (status='queued' AND next_retry_at_ms<=?) OR (status='running' AND locked_at_ms<?) "
    "ORDER BY created_at_ms, id LIMIT 1";

static constexpr const char* UPDATE_JOB =
    "UPDATE jobs SET status=?,attempt_count=?,max_attempts=?,next_retry_at_ms=?,locked_at_ms=?,locked_by=?,cancel_requested=?,"
    "last_error=?,updated_at_ms=? WHERE id=?;";

// plans / steps

#define RESEARCH_PLAN_COLUMNS "id,tenant_id,run_id,version,locked_at_ms,created_at_ms"

static constexpr const char* INSERT_PLAN = "INSERT INTO plans(" RESEARCH_PLAN_COLUMNS ") VALUES(?,?,?,?,?,?) ON CONFLICT DO NOTHING;";

static constexpr const char* SELECT_PLAN = "SELECT " RESEARCH_PLAN_COLUMNS " FROM plans WHERE tenant_id=? AND run_id=?;";

static constexpr const char* UPDATE_PLAN = "UPDATE plans SET version=?,locked_at_ms=? WHERE id=?;";

#define RESEARCH_STEP_COLUMNS                                                                                                 \
  "id,tenant_id,run_id,plan_id,step_key,step_order,status,attempt_count,max_attempts,next_retry_at_ms,input_json,output_json," \
  "last_error,started_at_ms,finished_at_ms,created_at_ms,updated_at_ms"

static constexpr const char* INSERT_STEP =
    "INSERT INTO steps(" RESEARCH_STEP_COLUMNS ") VALUES(?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?) ON CONFLICT DO NOTHING;";

static constexpr const char* LIST_STEPS = "SELECT " RESEARCH_STEP_COLUMNS " FROM steps WHERE tenant_id=? AND run_id=? ORDER BY step_order;";

static constexpr const char* UPDATE_STEP =
    "UPDATE steps SET status=?,attempt_count=?,max_attempts=?,next_retry_at_ms=?,input_json=?,output_json=?,last_error=?,"
    "started_at_ms=?,finished_at_ms=?,updated_at_ms=? WHERE id=?;";

// source documents

#define RESEARCH_SOURCE_COLUMNS                                                                                         \
  "id,tenant_id,run_id,source_type,status,title,url,content_text,content_bytes,mime_type,content_hash,attempt_count," \
  "max_attempts,next_retry_at_ms,last_error,canonical_source_id,meta,created_at_ms,updated_at_ms"

static constexpr const char* INSERT_SOURCE =
    "INSERT INTO source_documents(" RESEARCH_SOURCE_COLUMNS ") VALUES(?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?) ON CONFLICT DO NOTHING;";

static constexpr const char* SELECT_SOURCE = "SELECT " RESEARCH_SOURCE_COLUMNS " FROM source_documents WHERE tenant_id=? AND id=?;";

static constexpr const char* LIST_SOURCES =
    "SELECT " RESEARCH_SOURCE_COLUMNS " FROM source_documents WHERE tenant_id=? AND run_id=? ORDER BY created_at_ms, id;";

static constexpr const char* UPDATE_SOURCE =
    "UPDATE source_documents SET status=?,title=?,url=?,content_text=?,content_bytes=?,mime_type=?,content_hash=?,"
    "attempt_count=?,max_attempts=?,next_retry_at_ms=?,last_error=?,canonical_source_id=?,meta=?,updated_at_ms=? WHERE id=?;";

// prospects / executives / evidence

#define RESEARCH_PROSPECT_COLUMNS \
  "id,tenant_id,run_id,name_raw,name_normalized,website_url,hq_country,relevance_score,evidence_score,discovered_by,created_at_ms"

static constexpr const char* INSERT_PROSPECT =
    "INSERT INTO prospects(" RESEARCH_PROSPECT_COLUMNS ") VALUES(?,?,?,?,?,?,?,?,?,?,?) ON CONFLICT DO NOTHING;";

static constexpr const char* SELECT_PROSPECT_BY_NAME =
    "SELECT " RESEARCH_PROSPECT_COLUMNS " FROM prospects WHERE tenant_id=? AND run_id=? AND name_normalized=?;";

static constexpr const char* LIST_PROSPECTS = "SELECT " RESEARCH_PROSPECT_COLUMNS " FROM prospects WHERE tenant_id=? AND run_id=? ORDER BY id;";

static constexpr const char* UPDATE_PROSPECT =
    "UPDATE prospects SET name_raw=?,website_url=?,hq_country=?,relevance_score=?,evidence_score=?,discovered_by=? WHERE id=?;";

#define RESEARCH_EXECUTIVE_COLUMNS \
  "id,tenant_id,run_id,company_prospect_id,name_raw,name_normalized,title,email,linkedin_url,source_document_id,created_at_ms"

static constexpr const char* INSERT_EXECUTIVE =
    "INSERT INTO executives(" RESEARCH_EXECUTIVE_COLUMNS ") VALUES(?,?,?,?,?,?,?,?,?,?,?) ON CONFLICT DO NOTHING;";

static constexpr const char* LIST_EXECUTIVES = "SELECT " RESEARCH_EXECUTIVE_COLUMNS " FROM executives WHERE tenant_id=? AND run_id=? ORDER BY id;";

#define RESEARCH_EVIDENCE_COLUMNS \
  "id,tenant_id,run_id,subject_type,subject_id,source_document_id,source_type,source_name,weight,snippet,created_at_ms"

static constexpr const char* INSERT_EVIDENCE =
    "INSERT INTO evidence(" RESEARCH_EVIDENCE_COLUMNS ") VALUES(?,?,?,?,?,?,?,?,?,?,?) ON CONFLICT DO NOTHING;";

static constexpr const char* LIST_EVIDENCE =
    "SELECT " RESEARCH_EVIDENCE_COLUMNS " FROM evidence WHERE tenant_id=? AND subject_type=? AND subject_id=? ORDER BY source_document_id;";

// canonical entities

#define RESEARCH_COMPANY_COLUMNS "id,tenant_id,canonical_name,name_normalized,primary_domain,country_code,created_at_ms"

static constexpr const char* INSERT_COMPANY =
    "INSERT INTO canonical_companies(" RESEARCH_COMPANY_COLUMNS ") VALUES(?,?,?,?,?,?,?) ON CONFLICT DO NOTHING;";

static constexpr const char* SELECT_COMPANY_BY_DOMAIN =
    "SELECT " RESEARCH_COMPANY_COLUMNS " FROM canonical_companies WHERE tenant_id=? AND primary_domain=? ORDER BY created_at_ms, id LIMIT 1;";

static constexpr const char* SELECT_COMPANY_BY_NAME_COUNTRY =
    "SELECT " RESEARCH_COMPANY_COLUMNS " FROM canonical_companies WHERE tenant_id=? AND name_normalized=? AND country_code=? "
    "ORDER BY created_at_ms, id LIMIT 1;";

#define RESEARCH_PERSON_COLUMNS "id,tenant_id,canonical_full_name,name_normalized,primary_email,primary_linkedin_url,created_at_ms"

static constexpr const char* INSERT_PERSON =
    "INSERT INTO canonical_people(" RESEARCH_PERSON_COLUMNS ") VALUES(?,?,?,?,?,?,?) ON CONFLICT DO NOTHING;";

static constexpr const char* SELECT_PERSON_BY_EMAIL =
    "SELECT " RESEARCH_PERSON_COLUMNS " FROM canonical_people WHERE tenant_id=? AND primary_email=? ORDER BY created_at_ms, id LIMIT 1;";

static constexpr const char* SELECT_PERSON_BY_LINKEDIN =
    "SELECT " RESEARCH_PERSON_COLUMNS " FROM canonical_people WHERE tenant_id=? AND primary_linkedin_url=? ORDER BY created_at_ms, id LIMIT 1;";

static constexpr const char* SELECT_PERSON = "SELECT " RESEARCH_PERSON_COLUMNS " FROM canonical_people WHERE tenant_id=? AND id=?;";

#define RESEARCH_LINK_COLUMNS "tenant_id,entity_kind,canonical_id,raw_entity_id,match_rule,evidence_source_document_id,run_id,created_at_ms"

static constexpr const char* INSERT_LINK = "INSERT INTO canonical_links(" RESEARCH_LINK_COLUMNS ") VALUES(?,?,?,?,?,?,?,?) ON CONFLICT DO NOTHING;";

static constexpr const char* SELECT_LINK =
    "SELECT " RESEARCH_LINK_COLUMNS " FROM canonical_links WHERE tenant_id=? AND entity_kind=? AND raw_entity_id=?;";

// enrichment assignments

#define RESEARCH_ASSIGNMENT_COLUMNS                                                                                         \
  "id,tenant_id,target_entity_type,target_canonical_id,field_key,value,value_normalized,confidence,derived_by," \
  "source_document_id,input_scope_hash,content_hash,created_at_ms,updated_at_ms"

static constexpr const char* UPSERT_ASSIGNMENT =
    "INSERT INTO enrichment_assignments(" RESEARCH_ASSIGNMENT_COLUMNS ") VALUES(?,?,?,?,?,?,?,?,?,?,?,?,?,?) "
    "ON CONFLICT(tenant_id,target_entity_type,target_canonical_id,field_key,content_hash,source_document_id) DO UPDATE SET "
    "value=excluded.value,confidence=excluded.confidence,derived_by=excluded.derived_by,"
    "input_scope_hash=excluded.input_scope_hash,updated_at_ms=excluded.updated_at_ms;";

static constexpr const char* LIST_ASSIGNMENTS =
    "SELECT " RESEARCH_ASSIGNMENT_COLUMNS " FROM enrichment_assignments WHERE tenant_id=? AND target_entity_type=? AND "
    "target_canonical_id=? ORDER BY field_key, source_document_id, content_hash;";

// events

#define RESEARCH_EVENT_COLUMNS "id,tenant_id,run_id,event_type,status,input_json,output_json,error_message,created_at_ms"

static constexpr const char* INSERT_EVENT = "INSERT INTO events(" RESEARCH_EVENT_COLUMNS ") VALUES(?,?,?,?,?,?,?,?,?);";

static constexpr const char* LIST_EVENTS = "SELECT " RESEARCH_EVENT_COLUMNS " FROM events WHERE tenant_id=? AND run_id=? ORDER BY seq;";

} // namespace research::db::sql
