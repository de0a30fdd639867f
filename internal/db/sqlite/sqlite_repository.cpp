#include "sqlite_repository.hpp"

#include <sqlite3.h>

#include <stdexcept>
#include <type_traits>

#include "internal/db/sql/record_codec.hpp"
#include "internal/db/sql/sql_queries.hpp"

namespace research::db::sqlite {

using research::db::ErrorCode;
using research::db::Result;

namespace {

/*
  Prepared statement scoped to one call.
*/
class Statement {
 public:
  Statement(sqlite3* db, const char* sql) : db_(db) {
    rc_ = sqlite3_prepare_v2(db_, sql, -1, &stmt_, nullptr);
  }
  ~Statement() {
    if (stmt_) sqlite3_finalize(stmt_);
  }

  Statement(const Statement&)            = delete;
  Statement& operator=(const Statement&) = delete;

  bool Prepared() const {
    return rc_ == SQLITE_OK && stmt_ != nullptr;
  }
  int PrepareCode() const {
    return rc_;
  }

  int Bind(const sql::Params& params) {
    for (size_t i = 0; i < params.size(); ++i) {
      const int idx = static_cast<int>(i) + 1;
      const int rc  = std::visit(
          [&](const auto& value) -> int {
            using T = std::decay_t<decltype(value)>;
            if constexpr (std::is_same_v<T, std::nullptr_t>) {
              return sqlite3_bind_null(stmt_, idx);
            } else if constexpr (std::is_same_v<T, int32_t>) {
              return sqlite3_bind_int(stmt_, idx, value);
            } else if constexpr (std::is_same_v<T, int64_t> || std::is_same_v<T, uint64_t>) {
              return sqlite3_bind_int64(stmt_, idx, static_cast<sqlite3_int64>(value));
            } else if constexpr (std::is_same_v<T, double>) {
              return sqlite3_bind_double(stmt_, idx, value);
            } else if constexpr (std::is_same_v<T, std::string>) {
              return sqlite3_bind_text(stmt_, idx, value.c_str(), static_cast<int>(value.size()), SQLITE_TRANSIENT);
            } else {
              return sqlite3_bind_blob(stmt_, idx, value.bytes.data(), static_cast<int>(value.bytes.size()), SQLITE_TRANSIENT);
            }
          },
          params[i]);
      if (rc != SQLITE_OK) return rc;
    }
    return SQLITE_OK;
  }

  int Step() {
    return sqlite3_step(stmt_);
  }

  sqlite3_stmt* Get() const {
    return stmt_;
  }

 private:
  sqlite3*      db_   = nullptr;
  sqlite3_stmt* stmt_ = nullptr;
  int           rc_   = SQLITE_OK;
};

class SqliteRow final : public sql::Row {
 public:
  explicit SqliteRow(sqlite3_stmt* st) : st_(st) {
  }

  std::string GetText(int col) const override {
    const unsigned char* t = sqlite3_column_text(st_, col);
    return t ? std::string(reinterpret_cast<const char*>(t), static_cast<size_t>(sqlite3_column_bytes(st_, col))) : std::string();
  }

  int64_t GetInt64(int col) const override {
    return sqlite3_column_int64(st_, col);
  }

  double GetDouble(int col) const override {
    return sqlite3_column_double(st_, col);
  }

  std::string GetBlob(int col) const override {
    const void* data = sqlite3_column_blob(st_, col);
    const int   size = sqlite3_column_bytes(st_, col);
    return data ? std::string(static_cast<const char*>(data), static_cast<size_t>(size)) : std::string();
  }

  bool IsNull(int col) const override {
    return sqlite3_column_type(st_, col) == SQLITE_NULL;
  }

 private:
  sqlite3_stmt* st_;
};

template <typename Record>
std::optional<Record> First(std::vector<Record> rows) {
  if (rows.empty()) return std::nullopt;
  return std::move(rows.front());
}

} // namespace

SqliteRepository::SqliteRepository(std::shared_ptr<SqliteDB> db) : db_(std::move(db)) {
}

std::unique_ptr<db::Transaction> SqliteRepository::Begin() {
  return std::make_unique<SqliteTransaction>(db_);
}

SqliteTransaction& SqliteRepository::TX(Transaction& t) {
  return static_cast<SqliteTransaction&>(t);
}

Result SqliteRepository::Translate(sqlite3* db, int rc) {
  if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW) return Result::Ok();

  switch (rc) {
    case SQLITE_CONSTRAINT_UNIQUE:
    case SQLITE_CONSTRAINT_PRIMARYKEY:
      return Result::Err(ErrorCode::AlreadyExists, sqlite3_errmsg(db));
    default:
      break;
  }

  switch (rc & 0xff) {
    case SQLITE_BUSY:
    case SQLITE_LOCKED:
      return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
    case SQLITE_CONSTRAINT:
      return Result::Err(ErrorCode::ConstraintViolation, sqlite3_errmsg(db));
    case SQLITE_IOERR:
      return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db));
    case SQLITE_CORRUPT:
      return Result::Err(ErrorCode::Corruption, sqlite3_errmsg(db));
    default:
      return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  }
}

Result SqliteRepository::Execute(Transaction& t, const char* sql, const sql::Params& params, ErrorCode when_unchanged) {
  auto*     db = TX(t).Handle();
  Statement st(db, sql);
  if (!st.Prepared()) return Translate(db, st.PrepareCode());

  int rc = st.Bind(params);
  if (rc != SQLITE_OK) return Translate(db, rc);

  rc = st.Step();
  if (rc != SQLITE_DONE) return Translate(db, rc);

  if (when_unchanged != ErrorCode::OK && sqlite3_changes(db) == 0) {
    return Result::Err(when_unchanged);
  }
  return Result::Ok();
}

void SqliteRepository::Query(Transaction& t, const char* sql, const sql::Params& params, const RowVisitor& visit) {
  auto*     db = TX(t).Handle();
  Statement st(db, sql);
  if (!st.Prepared()) throw std::runtime_error(std::string("sqlite prepare: ") + sqlite3_errmsg(db));
  if (st.Bind(params) != SQLITE_OK) throw std::runtime_error(std::string("sqlite bind: ") + sqlite3_errmsg(db));

  SqliteRow row(st.Get());
  for (;;) {
    const int rc = st.Step();
    if (rc == SQLITE_DONE) return;
    if (rc != SQLITE_ROW) throw std::runtime_error(std::string("sqlite step: ") + sqlite3_errmsg(db));
    visit(row);
  }
}

// ------------------------------------------------------------------
// Runs
// ------------------------------------------------------------------

Result SqliteRepository::InsertRun(Transaction& t, const model::RunRecord& r) {
  return Execute(t, sql::INSERT_RUN, sql::InsertParams(r), ErrorCode::AlreadyExists);
}

std::optional<model::RunRecord> SqliteRepository::GetRun(Transaction& t, const std::string& tenant_id, const std::string& run_id) {
  std::vector<model::RunRecord> out;
  Query(t, sql::SELECT_RUN, {tenant_id, run_id}, [&](const sql::Row& row) { out.push_back(sql::ReadRun(row)); });
  return First(std::move(out));
}

Result SqliteRepository::UpdateRun(Transaction& t, const model::RunRecord& r) {
  return Execute(t, sql::UPDATE_RUN, sql::UpdateParams(r), ErrorCode::NotFound);
}

// ------------------------------------------------------------------
// Jobs
// ------------------------------------------------------------------

Result SqliteRepository::InsertJob(Transaction& t, const model::JobRecord& r) {
  return Execute(t, sql::INSERT_JOB, sql::InsertParams(r), ErrorCode::AlreadyExists);
}

std::optional<model::JobRecord> SqliteRepository::GetJob(Transaction& t, const std::string& job_id) {
  std::vector<model::JobRecord> out;
  Query(t, sql::SELECT_JOB, {job_id}, [&](const sql::Row& row) { out.push_back(sql::ReadJob(row)); });
  return First(std::move(out));
}

std::optional<model::JobRecord> SqliteRepository::FindActiveJob(Transaction& t, const std::string& tenant_id, const std::string& run_id,
                                                                const std::string& job_type) {
  std::vector<model::JobRecord> out;
  Query(t, sql::SELECT_ACTIVE_JOB, {tenant_id, run_id, job_type}, [&](const sql::Row& row) { out.push_back(sql::ReadJob(row)); });
  return First(std::move(out));
}

std::vector<model::JobRecord> SqliteRepository::ListJobs(Transaction& t, const std::string& tenant_id, const std::string& run_id) {
  std::vector<model::JobRecord> out;
  Query(t, sql::LIST_JOBS, {tenant_id, run_id}, [&](const sql::Row& row) { out.push_back(sql::ReadJob(row)); });
  return out;
}

// BEGIN IMMEDIATE already holds the database write lock, so select-then-update
// is atomic with respect to other workers.
std::optional<model::JobRecord> SqliteRepository::ClaimNextJob(Transaction& t, const std::string& worker_id, uint64_t now_ms,
                                                               uint64_t stale_before_ms) {
  std::vector<model::JobRecord> out;
  Query(t, sql::SELECT_CLAIMABLE_JOB, {now_ms, stale_before_ms}, [&](const sql::Row& row) { out.push_back(sql::ReadJob(row)); });
  if (out.empty()) return std::nullopt;

  auto job          = std::move(out.front());
  job.status        = research::model::JobStatus::kRunning;
  job.locked_at_ms  = now_ms;
  job.locked_by     = worker_id;
  job.updated_at_ms = now_ms;

  auto updated = UpdateJob(t, job);
  if (!updated) {
    throw std::runtime_error("sqlite claim update failed: " + updated.message);
  }
  return job;
}

Result SqliteRepository::UpdateJob(Transaction& t, const model::JobRecord& r) {
  return Execute(t, sql::UPDATE_JOB, sql::UpdateParams(r), ErrorCode::NotFound);
}

// ------------------------------------------------------------------
// Plan / steps
// ------------------------------------------------------------------

Result SqliteRepository::InsertPlan(Transaction& t, const model::PlanRecord& r) {
  return Execute(t, sql::INSERT_PLAN, sql::InsertParams(r), ErrorCode::AlreadyExists);
}

std::optional<model::PlanRecord> SqliteRepository::GetPlan(Transaction& t, const std::string& tenant_id, const std::string& run_id) {
  std::vector<model::PlanRecord> out;
  Query(t, sql::SELECT_PLAN, {tenant_id, run_id}, [&](const sql::Row& row) { out.push_back(sql::ReadPlan(row)); });
  return First(std::move(out));
}

Result SqliteRepository::UpdatePlan(Transaction& t, const model::PlanRecord& r) {
  return Execute(t, sql::UPDATE_PLAN, sql::UpdateParams(r), ErrorCode::NotFound);
}

Result SqliteRepository::InsertStep(Transaction& t, const model::StepRecord& r) {
  return Execute(t, sql::INSERT_STEP, sql::InsertParams(r), ErrorCode::AlreadyExists);
}

std::vector<model::StepRecord> SqliteRepository::ListSteps(Transaction& t, const std::string& tenant_id, const std::string& run_id) {
  std::vector<model::StepRecord> out;
  Query(t, sql::LIST_STEPS, {tenant_id, run_id}, [&](const sql::Row& row) { out.push_back(sql::ReadStep(row)); });
  return out;
}

Result SqliteRepository::UpdateStep(Transaction& t, const model::StepRecord& r) {
  return Execute(t, sql::UPDATE_STEP, sql::UpdateParams(r), ErrorCode::NotFound);
}

// ------------------------------------------------------------------
// Source documents
// ------------------------------------------------------------------

Result SqliteRepository::InsertSource(Transaction& t, const model::SourceDocumentRecord& r) {
  return Execute(t, sql::INSERT_SOURCE, sql::InsertParams(r), ErrorCode::AlreadyExists);
}

std::optional<model::SourceDocumentRecord> SqliteRepository::GetSource(Transaction& t, const std::string& tenant_id,
                                                                       const std::string& source_id) {
  std::vector<model::SourceDocumentRecord> out;
  Query(t, sql::SELECT_SOURCE, {tenant_id, source_id}, [&](const sql::Row& row) { out.push_back(sql::ReadSource(row)); });
  return First(std::move(out));
}

std::vector<model::SourceDocumentRecord> SqliteRepository::ListSources(Transaction& t, const std::string& tenant_id, const std::string& run_id) {
  std::vector<model::SourceDocumentRecord> out;
  Query(t, sql::LIST_SOURCES, {tenant_id, run_id}, [&](const sql::Row& row) { out.push_back(sql::ReadSource(row)); });
  return out;
}

Result SqliteRepository::UpdateSource(Transaction& t, const model::SourceDocumentRecord& r) {
  return Execute(t, sql::UPDATE_SOURCE, sql::UpdateParams(r), ErrorCode::NotFound);
}

// ------------------------------------------------------------------
// Raw entities and evidence
// ------------------------------------------------------------------

Result SqliteRepository::InsertProspect(Transaction& t, const model::ProspectRecord& r) {
  return Execute(t, sql::INSERT_PROSPECT, sql::InsertParams(r), ErrorCode::AlreadyExists);
}

std::optional<model::ProspectRecord> SqliteRepository::FindProspectByName(Transaction& t, const std::string& tenant_id, const std::string& run_id,
                                                                          const std::string& name_normalized) {
  std::vector<model::ProspectRecord> out;
  Query(t, sql::SELECT_PROSPECT_BY_NAME, {tenant_id, run_id, name_normalized},
        [&](const sql::Row& row) { out.push_back(sql::ReadProspect(row)); });
  return First(std::move(out));
}

std::vector<model::ProspectRecord> SqliteRepository::ListProspects(Transaction& t, const std::string& tenant_id, const std::string& run_id) {
  std::vector<model::ProspectRecord> out;
  Query(t, sql::LIST_PROSPECTS, {tenant_id, run_id}, [&](const sql::Row& row) { out.push_back(sql::ReadProspect(row)); });
  return out;
}

Result SqliteRepository::UpdateProspect(Transaction& t, const model::ProspectRecord& r) {
  return Execute(t, sql::UPDATE_PROSPECT, sql::UpdateParams(r), ErrorCode::NotFound);
}

Result SqliteRepository::InsertExecutive(Transaction& t, const model::ExecutiveRecord& r) {
  return Execute(t, sql::INSERT_EXECUTIVE, sql::InsertParams(r), ErrorCode::AlreadyExists);
}

std::vector<model::ExecutiveRecord> SqliteRepository::ListExecutives(Transaction& t, const std::string& tenant_id, const std::string& run_id) {
  std::vector<model::ExecutiveRecord> out;
  Query(t, sql::LIST_EXECUTIVES, {tenant_id, run_id}, [&](const sql::Row& row) { out.push_back(sql::ReadExecutive(row)); });
  return out;
}

Result SqliteRepository::InsertEvidence(Transaction& t, const model::EvidenceRecord& r) {
  if (r.source_document_id.empty()) {
    return Result::Err(ErrorCode::ConstraintViolation, "evidence requires a source document");
  }
  return Execute(t, sql::INSERT_EVIDENCE, sql::InsertParams(r), ErrorCode::AlreadyExists);
}

std::vector<model::EvidenceRecord> SqliteRepository::ListEvidence(Transaction& t, const std::string& tenant_id,
                                                                  research::model::EvidenceSubject subject_type, const std::string& subject_id) {
  std::vector<model::EvidenceRecord> out;
  Query(t, sql::LIST_EVIDENCE, {tenant_id, std::string(research::model::ToString(subject_type)), subject_id},
        [&](const sql::Row& row) { out.push_back(sql::ReadEvidence(row)); });
  return out;
}

// ------------------------------------------------------------------
// Canonical entities
// ------------------------------------------------------------------

Result SqliteRepository::InsertCanonicalCompany(Transaction& t, const model::CanonicalCompanyRecord& r) {
  return Execute(t, sql::INSERT_COMPANY, sql::InsertParams(r), ErrorCode::AlreadyExists);
}

std::optional<model::CanonicalCompanyRecord> SqliteRepository::FindCompanyByDomain(Transaction& t, const std::string& tenant_id,
                                                                                   const std::string& domain) {
  std::vector<model::CanonicalCompanyRecord> out;
  Query(t, sql::SELECT_COMPANY_BY_DOMAIN, {tenant_id, domain}, [&](const sql::Row& row) { out.push_back(sql::ReadCompany(row)); });
  return First(std::move(out));
}

std::optional<model::CanonicalCompanyRecord> SqliteRepository::FindCompanyByNameCountry(Transaction& t, const std::string& tenant_id,
                                                                                        const std::string& name_normalized,
                                                                                        const std::string& country_code) {
  std::vector<model::CanonicalCompanyRecord> out;
  Query(t, sql::SELECT_COMPANY_BY_NAME_COUNTRY, {tenant_id, name_normalized, country_code},
        [&](const sql::Row& row) { out.push_back(sql::ReadCompany(row)); });
  return First(std::move(out));
}

Result SqliteRepository::InsertCanonicalPerson(Transaction& t, const model::CanonicalPersonRecord& r) {
  return Execute(t, sql::INSERT_PERSON, sql::InsertParams(r), ErrorCode::AlreadyExists);
}

std::optional<model::CanonicalPersonRecord> SqliteRepository::FindPersonByEmail(Transaction& t, const std::string& tenant_id,
                                                                                const std::string& email) {
  std::vector<model::CanonicalPersonRecord> out;
  Query(t, sql::SELECT_PERSON_BY_EMAIL, {tenant_id, email}, [&](const sql::Row& row) { out.push_back(sql::ReadPerson(row)); });
  return First(std::move(out));
}

std::optional<model::CanonicalPersonRecord> SqliteRepository::FindPersonByLinkedin(Transaction& t, const std::string& tenant_id,
                                                                                   const std::string& linkedin_url) {
  std::vector<model::CanonicalPersonRecord> out;
  Query(t, sql::SELECT_PERSON_BY_LINKEDIN, {tenant_id, linkedin_url}, [&](const sql::Row& row) { out.push_back(sql::ReadPerson(row)); });
  return First(std::move(out));
}

std::optional<model::CanonicalPersonRecord> SqliteRepository::GetCanonicalPerson(Transaction& t, const std::string& tenant_id,
                                                                                 const std::string& person_id) {
  std::vector<model::CanonicalPersonRecord> out;
  Query(t, sql::SELECT_PERSON, {tenant_id, person_id}, [&](const sql::Row& row) { out.push_back(sql::ReadPerson(row)); });
  return First(std::move(out));
}

Result SqliteRepository::InsertLink(Transaction& t, const model::CanonicalLinkRecord& r) {
  return Execute(t, sql::INSERT_LINK, sql::InsertParams(r), ErrorCode::AlreadyExists);
}

std::optional<model::CanonicalLinkRecord> SqliteRepository::GetLink(Transaction& t, const std::string& tenant_id, research::model::EntityKind kind,
                                                                    const std::string& raw_entity_id) {
  std::vector<model::CanonicalLinkRecord> out;
  Query(t, sql::SELECT_LINK, {tenant_id, std::string(research::model::ToString(kind)), raw_entity_id},
        [&](const sql::Row& row) { out.push_back(sql::ReadLink(row)); });
  return First(std::move(out));
}

// ------------------------------------------------------------------
// Enrichment assignments
// ------------------------------------------------------------------

Result SqliteRepository::UpsertAssignment(Transaction& t, const model::EnrichmentAssignmentRecord& r) {
  return Execute(t, sql::UPSERT_ASSIGNMENT, sql::InsertParams(r), ErrorCode::OK);
}

std::vector<model::EnrichmentAssignmentRecord> SqliteRepository::ListAssignments(Transaction& t, const std::string& tenant_id,
                                                                                 const std::string& entity_type, const std::string& canonical_id) {
  std::vector<model::EnrichmentAssignmentRecord> out;
  Query(t, sql::LIST_ASSIGNMENTS, {tenant_id, entity_type, canonical_id}, [&](const sql::Row& row) { out.push_back(sql::ReadAssignment(row)); });
  return out;
}

// ------------------------------------------------------------------
// Events
// ------------------------------------------------------------------

Result SqliteRepository::InsertEvent(Transaction& t, const model::EventRecord& r) {
  return Execute(t, sql::INSERT_EVENT, sql::InsertParams(r), ErrorCode::OK);
}

std::vector<model::EventRecord> SqliteRepository::ListEvents(Transaction& t, const std::string& tenant_id, const std::string& run_id) {
  std::vector<model::EventRecord> out;
  Query(t, sql::LIST_EVENTS, {tenant_id, run_id}, [&](const sql::Row& row) { out.push_back(sql::ReadEvent(row)); });
  return out;
}

} // namespace research::db::sqlite
