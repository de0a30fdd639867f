#pragma once

#include <string>
#include <vector>

namespace research::db::sql {

/*
  Start-up schema bootstrap (CREATE ... IF NOT EXISTS).

  Not a migration system: statements are idempotent and applied in order on
  every start. Uniqueness invariants of the repository contract live here.
*/

inline const std::vector<std::string>& SqliteSchema() {
  static const std::vector<std::string> kStatements = {
      "CREATE TABLE IF NOT EXISTS runs (id TEXT PRIMARY KEY, tenant_id TEXT NOT NULL, name TEXT NOT NULL, status TEXT NOT NULL, "
      "started_at_ms INTEGER NOT NULL DEFAULT 0, finished_at_ms INTEGER NOT NULL DEFAULT 0, last_error TEXT NOT NULL DEFAULT '', "
      "created_at_ms INTEGER NOT NULL, updated_at_ms INTEGER NOT NULL);",

      "CREATE TABLE IF NOT EXISTS jobs (id TEXT PRIMARY KEY, tenant_id TEXT NOT NULL, run_id TEXT NOT NULL REFERENCES runs(id), "
      "job_type TEXT NOT NULL, status TEXT NOT NULL, attempt_count INTEGER NOT NULL DEFAULT 0, max_attempts INTEGER NOT NULL, "
      "next_retry_at_ms INTEGER NOT NULL DEFAULT 0, locked_at_ms INTEGER NOT NULL DEFAULT 0, locked_by TEXT NOT NULL DEFAULT '', "
      "cancel_requested INTEGER NOT NULL DEFAULT 0, last_error TEXT NOT NULL DEFAULT '', created_at_ms INTEGER NOT NULL, "
      "updated_at_ms INTEGER NOT NULL);",
      "CREATE UNIQUE INDEX IF NOT EXISTS jobs_one_active ON jobs(tenant_id, run_id, job_type) WHERE status IN ('queued','running');",
      "CREATE INDEX IF NOT EXISTS jobs_claim ON jobs(status, next_retry_at_ms, created_at_ms);",

      "CREATE TABLE IF NOT EXISTS plans (id TEXT PRIMARY KEY, tenant_id TEXT NOT NULL, run_id TEXT NOT NULL REFERENCES runs(id), "
      "version INTEGER NOT NULL, locked_at_ms INTEGER NOT NULL DEFAULT 0, created_at_ms INTEGER NOT NULL, UNIQUE(tenant_id, run_id));",

      "CREATE TABLE IF NOT EXISTS steps (id TEXT PRIMARY KEY, tenant_id TEXT NOT NULL, run_id TEXT NOT NULL REFERENCES runs(id), "
      "plan_id TEXT NOT NULL REFERENCES plans(id), step_key TEXT NOT NULL, step_order INTEGER NOT NULL, status TEXT NOT NULL, "
      "attempt_count INTEGER NOT NULL DEFAULT 0, max_attempts INTEGER NOT NULL, next_retry_at_ms INTEGER NOT NULL DEFAULT 0, "
      "input_json TEXT NOT NULL DEFAULT '', output_json TEXT NOT NULL DEFAULT '', last_error TEXT NOT NULL DEFAULT '', "
      "started_at_ms INTEGER NOT NULL DEFAULT 0, finished_at_ms INTEGER NOT NULL DEFAULT 0, created_at_ms INTEGER NOT NULL, "
      "updated_at_ms INTEGER NOT NULL, UNIQUE(tenant_id, run_id, step_key));",

      "CREATE TABLE IF NOT EXISTS source_documents (id TEXT PRIMARY KEY, tenant_id TEXT NOT NULL, run_id TEXT NOT NULL REFERENCES runs(id), "
      "source_type TEXT NOT NULL, status TEXT NOT NULL, title TEXT NOT NULL DEFAULT '', url TEXT NOT NULL DEFAULT '', "
      "content_text TEXT NOT NULL DEFAULT '', content_bytes BLOB, mime_type TEXT NOT NULL DEFAULT '', "
      "content_hash TEXT NOT NULL DEFAULT '', attempt_count INTEGER NOT NULL DEFAULT 0, max_attempts INTEGER NOT NULL DEFAULT 0, "
      "next_retry_at_ms INTEGER NOT NULL DEFAULT 0, last_error TEXT NOT NULL DEFAULT '', canonical_source_id TEXT NOT NULL DEFAULT '', "
      "meta TEXT NOT NULL DEFAULT '{}', created_at_ms INTEGER NOT NULL, updated_at_ms INTEGER NOT NULL);",
      "CREATE INDEX IF NOT EXISTS source_documents_run ON source_documents(tenant_id, run_id, created_at_ms);",

      "CREATE TABLE IF NOT EXISTS prospects (id TEXT PRIMARY KEY, tenant_id TEXT NOT NULL, run_id TEXT NOT NULL REFERENCES runs(id), "
      "name_raw TEXT NOT NULL, name_normalized TEXT NOT NULL, website_url TEXT NOT NULL DEFAULT '', hq_country TEXT NOT NULL DEFAULT '', "
      "relevance_score REAL NOT NULL DEFAULT 0, evidence_score REAL NOT NULL DEFAULT 0, discovered_by TEXT NOT NULL DEFAULT '', "
      "created_at_ms INTEGER NOT NULL, UNIQUE(tenant_id, run_id, name_normalized));",

      "CREATE TABLE IF NOT EXISTS executives (id TEXT PRIMARY KEY, tenant_id TEXT NOT NULL, run_id TEXT NOT NULL REFERENCES runs(id), "
      "company_prospect_id TEXT NOT NULL REFERENCES prospects(id), name_raw TEXT NOT NULL, name_normalized TEXT NOT NULL, "
      "title TEXT NOT NULL DEFAULT '', email TEXT NOT NULL DEFAULT '', linkedin_url TEXT NOT NULL DEFAULT '', "
      "source_document_id TEXT NOT NULL DEFAULT '', created_at_ms INTEGER NOT NULL);",

      "CREATE TABLE IF NOT EXISTS evidence (id TEXT PRIMARY KEY, tenant_id TEXT NOT NULL, run_id TEXT NOT NULL, subject_type TEXT NOT NULL, "
      "subject_id TEXT NOT NULL, source_document_id TEXT NOT NULL CHECK (source_document_id <> '') REFERENCES source_documents(id), "
      "source_type TEXT NOT NULL DEFAULT '', source_name TEXT NOT NULL DEFAULT '', weight REAL NOT NULL DEFAULT 0, "
      "snippet TEXT NOT NULL DEFAULT '', created_at_ms INTEGER NOT NULL, UNIQUE(subject_type, subject_id, source_document_id));",

      "CREATE TABLE IF NOT EXISTS canonical_companies (id TEXT PRIMARY KEY, tenant_id TEXT NOT NULL, canonical_name TEXT NOT NULL, "
      "name_normalized TEXT NOT NULL, primary_domain TEXT NOT NULL DEFAULT '', country_code TEXT NOT NULL DEFAULT '', "
      "created_at_ms INTEGER NOT NULL);",
      "CREATE INDEX IF NOT EXISTS canonical_companies_domain ON canonical_companies(tenant_id, primary_domain);",

      "CREATE TABLE IF NOT EXISTS canonical_people (id TEXT PRIMARY KEY, tenant_id TEXT NOT NULL, canonical_full_name TEXT NOT NULL, "
      "name_normalized TEXT NOT NULL, primary_email TEXT NOT NULL DEFAULT '', primary_linkedin_url TEXT NOT NULL DEFAULT '', "
      "created_at_ms INTEGER NOT NULL);",

      "CREATE TABLE IF NOT EXISTS canonical_links (tenant_id TEXT NOT NULL, entity_kind TEXT NOT NULL, canonical_id TEXT NOT NULL, "
      "raw_entity_id TEXT NOT NULL, match_rule TEXT NOT NULL, evidence_source_document_id TEXT NOT NULL, run_id TEXT NOT NULL, "
      "created_at_ms INTEGER NOT NULL, PRIMARY KEY (tenant_id, entity_kind, raw_entity_id));",

      "CREATE TABLE IF NOT EXISTS enrichment_assignments (id TEXT PRIMARY KEY, tenant_id TEXT NOT NULL, target_entity_type TEXT NOT NULL, "
      "target_canonical_id TEXT NOT NULL, field_key TEXT NOT NULL, value TEXT NOT NULL, value_normalized TEXT NOT NULL DEFAULT '', "
      "confidence REAL NOT NULL, derived_by TEXT NOT NULL, source_document_id TEXT NOT NULL, input_scope_hash TEXT NOT NULL, "
      "content_hash TEXT NOT NULL, created_at_ms INTEGER NOT NULL, updated_at_ms INTEGER NOT NULL, "
      "UNIQUE(tenant_id, target_entity_type, target_canonical_id, field_key, content_hash, source_document_id));",

      "CREATE TABLE IF NOT EXISTS events (seq INTEGER PRIMARY KEY AUTOINCREMENT, id TEXT NOT NULL UNIQUE, tenant_id TEXT NOT NULL, "
      "run_id TEXT NOT NULL, event_type TEXT NOT NULL, status TEXT NOT NULL, input_json TEXT NOT NULL DEFAULT '', "
      "output_json TEXT NOT NULL DEFAULT '', error_message TEXT NOT NULL DEFAULT '', created_at_ms INTEGER NOT NULL);",
      "CREATE INDEX IF NOT EXISTS events_run ON events(tenant_id, run_id, seq);",
  };
  return kStatements;
}

inline const std::vector<std::string>& PostgresSchema() {
  static const std::vector<std::string> kStatements = {
      "CREATE TABLE IF NOT EXISTS runs (id TEXT PRIMARY KEY, tenant_id TEXT NOT NULL, name TEXT NOT NULL, status TEXT NOT NULL, "
      "started_at_ms BIGINT NOT NULL DEFAULT 0, finished_at_ms BIGINT NOT NULL DEFAULT 0, last_error TEXT NOT NULL DEFAULT '', "
      "created_at_ms BIGINT NOT NULL, updated_at_ms BIGINT NOT NULL);",

      "CREATE TABLE IF NOT EXISTS jobs (id TEXT PRIMARY KEY, tenant_id TEXT NOT NULL, run_id TEXT NOT NULL REFERENCES runs(id), "
      "job_type TEXT NOT NULL, status TEXT NOT NULL, attempt_count INTEGER NOT NULL DEFAULT 0, max_attempts INTEGER NOT NULL, "
      "next_retry_at_ms BIGINT NOT NULL DEFAULT 0, locked_at_ms BIGINT NOT NULL DEFAULT 0, locked_by TEXT NOT NULL DEFAULT '', "
      "cancel_requested INTEGER NOT NULL DEFAULT 0, last_error TEXT NOT NULL DEFAULT '', created_at_ms BIGINT NOT NULL, "
      "updated_at_ms BIGINT NOT NULL);",
      "CREATE UNIQUE INDEX IF NOT EXISTS jobs_one_active ON jobs(tenant_id, run_id, job_type) WHERE status IN ('queued','running');",
      "CREATE INDEX IF NOT EXISTS jobs_claim ON jobs(status, next_retry_at_ms, created_at_ms);",

      "CREATE TABLE IF NOT EXISTS plans (id TEXT PRIMARY KEY, tenant_id TEXT NOT NULL, run_id TEXT NOT NULL REFERENCES runs(id), "
      "version INTEGER NOT NULL, locked_at_ms BIGINT NOT NULL DEFAULT 0, created_at_ms BIGINT NOT NULL, UNIQUE(tenant_id, run_id));",

      "CREATE TABLE IF NOT EXISTS steps (id TEXT PRIMARY KEY, tenant_id TEXT NOT NULL, run_id TEXT NOT NULL REFERENCES runs(id), "
      "plan_id TEXT NOT NULL REFERENCES plans(id), step_key TEXT NOT NULL, step_order INTEGER NOT NULL, status TEXT NOT NULL, "
      "attempt_count INTEGER NOT NULL DEFAULT 0, max_attempts INTEGER NOT NULL, next_retry_at_ms BIGINT NOT NULL DEFAULT 0, "
      "input_json TEXT NOT NULL DEFAULT '', output_json TEXT NOT NULL DEFAULT '', last_error TEXT NOT NULL DEFAULT '', "
      "started_at_ms BIGINT NOT NULL DEFAULT 0, finished_at_ms BIGINT NOT NULL DEFAULT 0, created_at_ms BIGINT NOT NULL, "
      "updated_at_ms BIGINT NOT NULL, UNIQUE(tenant_id, run_id, step_key));",

      "CREATE TABLE IF NOT EXISTS source_documents (id TEXT PRIMARY KEY, tenant_id TEXT NOT NULL, run_id TEXT NOT NULL REFERENCES runs(id), "
      "source_type TEXT NOT NULL, status TEXT NOT NULL, title TEXT NOT NULL DEFAULT '', url TEXT NOT NULL DEFAULT '', "
      "content_text TEXT NOT NULL DEFAULT '', content_bytes BYTEA, mime_type TEXT NOT NULL DEFAULT '', "
      "content_hash TEXT NOT NULL DEFAULT '', attempt_count INTEGER NOT NULL DEFAULT 0, max_attempts INTEGER NOT NULL DEFAULT 0, "
      "next_retry_at_ms BIGINT NOT NULL DEFAULT 0, last_error TEXT NOT NULL DEFAULT '', canonical_source_id TEXT NOT NULL DEFAULT '', "
      "meta JSONB NOT NULL DEFAULT '{}', created_at_ms BIGINT NOT NULL, updated_at_ms BIGINT NOT NULL);",
      "CREATE INDEX IF NOT EXISTS source_documents_run ON source_documents(tenant_id, run_id, created_at_ms);",

      "CREATE TABLE IF NOT EXISTS prospects (id TEXT PRIMARY KEY, tenant_id TEXT NOT NULL, run_id TEXT NOT NULL REFERENCES runs(id), "
      "name_raw TEXT NOT NULL, name_normalized TEXT NOT NULL, website_url TEXT NOT NULL DEFAULT '', hq_country TEXT NOT NULL DEFAULT '', "
      "relevance_score DOUBLE PRECISION NOT NULL DEFAULT 0, evidence_score DOUBLE PRECISION NOT NULL DEFAULT 0, "
      "discovered_by TEXT NOT NULL DEFAULT '', created_at_ms BIGINT NOT NULL, UNIQUE(tenant_id, run_id, name_normalized));",

      "CREATE TABLE IF NOT EXISTS executives (id TEXT PRIMARY KEY, tenant_id TEXT NOT NULL, run_id TEXT NOT NULL REFERENCES runs(id), "
      "company_prospect_id TEXT NOT NULL REFERENCES prospects(id), name_raw TEXT NOT NULL, name_normalized TEXT NOT NULL, "
      "title TEXT NOT NULL DEFAULT '', email TEXT NOT NULL DEFAULT '', linkedin_url TEXT NOT NULL DEFAULT '', "
      "source_document_id TEXT NOT NULL DEFAULT '', created_at_ms BIGINT NOT NULL);",

      "CREATE TABLE IF NOT EXISTS evidence (id TEXT PRIMARY KEY, tenant_id TEXT NOT NULL, run_id TEXT NOT NULL, subject_type TEXT NOT NULL, "
      "subject_id TEXT NOT NULL, source_document_id TEXT NOT NULL CHECK (source_document_id <> '') REFERENCES source_documents(id), "
      "source_type TEXT NOT NULL DEFAULT '', source_name TEXT NOT NULL DEFAULT '', weight DOUBLE PRECISION NOT NULL DEFAULT 0, "
      "snippet TEXT NOT NULL DEFAULT '', created_at_ms BIGINT NOT NULL, UNIQUE(subject_type, subject_id, source_document_id));",

      "CREATE TABLE IF NOT EXISTS canonical_companies (id TEXT PRIMARY KEY, tenant_id TEXT NOT NULL, canonical_name TEXT NOT NULL, "
      "name_normalized TEXT NOT NULL, primary_domain TEXT NOT NULL DEFAULT '', country_code TEXT NOT NULL DEFAULT '', "
      "created_at_ms BIGINT NOT NULL);",
      "CREATE INDEX IF NOT EXISTS canonical_companies_domain ON canonical_companies(tenant_id, primary_domain);",

      "CREATE TABLE IF NOT EXISTS canonical_people (id TEXT PRIMARY KEY, tenant_id TEXT NOT NULL, canonical_full_name TEXT NOT NULL, "
      "name_normalized TEXT NOT NULL, primary_email TEXT NOT NULL DEFAULT '', primary_linkedin_url TEXT NOT NULL DEFAULT '', "
      "created_at_ms BIGINT NOT NULL);",

      "CREATE TABLE IF NOT EXISTS canonical_links (tenant_id TEXT NOT NULL, entity_kind TEXT NOT NULL, canonical_id TEXT NOT NULL, "
      "raw_entity_id TEXT NOT NULL, match_rule TEXT NOT NULL, evidence_source_document_id TEXT NOT NULL, run_id TEXT NOT NULL, "
      "created_at_ms BIGINT NOT NULL, PRIMARY KEY (tenant_id, entity_kind, raw_entity_id));",

      "CREATE TABLE IF NOT EXISTS enrichment_assignments (id TEXT PRIMARY KEY, tenant_id TEXT NOT NULL, target_entity_type TEXT NOT NULL, "
      "target_canonical_id TEXT NOT NULL, field_key TEXT NOT NULL, value TEXT NOT NULL, value_normalized TEXT NOT NULL DEFAULT '', "
      "confidence DOUBLE PRECISION NOT NULL, derived_by TEXT NOT NULL, source_document_id TEXT NOT NULL, "
      "input_scope_hash TEXT NOT NULL, content_hash TEXT NOT NULL, created_at_ms BIGINT NOT NULL, updated_at_ms BIGINT NOT NULL, "
      "UNIQUE(tenant_id, target_entity_type, target_canonical_id, field_key, content_hash, source_document_id));",

      "CREATE TABLE IF NOT EXISTS events (seq BIGSERIAL PRIMARY KEY, id TEXT NOT NULL UNIQUE, tenant_id TEXT NOT NULL, "
      "run_id TEXT NOT NULL, event_type TEXT NOT NULL, status TEXT NOT NULL, input_json TEXT NOT NULL DEFAULT '', "
      "output_json TEXT NOT NULL DEFAULT '', error_message TEXT NOT NULL DEFAULT '', created_at_ms BIGINT NOT NULL);",
      "CREATE INDEX IF NOT EXISTS events_run ON events(tenant_id, run_id, seq);",
  };
  return kStatements;
}

} // namespace research::db::sql
