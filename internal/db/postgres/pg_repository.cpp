#include "pg_repository.hpp"

#include <cstddef>
#include <stdexcept>
#include <type_traits>

#include "internal/db/sql/record_codec.hpp"
#include "internal/db/sql/sql_queries.hpp"

namespace research::db::postgres {

namespace {

class PgRow final : public sql::Row {
 public:
  explicit PgRow(const pqxx::row& row) : row_(row) {
  }

  std::string GetText(int col) const override {
    const auto field = row_[col];
    return field.is_null() ? std::string() : std::string(field.c_str(), field.size());
  }

  int64_t GetInt64(int col) const override {
    return row_[col].is_null() ? 0 : row_[col].as<int64_t>();
  }

  double GetDouble(int col) const override {
    return row_[col].is_null() ? 0.0 : row_[col].as<double>();
  }

  std::string GetBlob(int col) const override {
    const auto bytes = row_[col].as<std::basic_string<std::byte>>();
    return std::string(reinterpret_cast<const char*>(bytes.data()), bytes.size());
  }

  bool IsNull(int col) const override {
    return row_[col].is_null();
  }

 private:
  pqxx::row row_;
};

// '?' placeholders become $1..$n.
std::string Renumber(const char* sql) {
  std::string out;
  int         n = 0;
  for (const char* p = sql; *p; ++p) {
    if (*p == '?') {
      out += "$" + std::to_string(++n);
    } else {
      out.push_back(*p);
    }
  }
  return out;
}

pqxx::params Bind(const sql::Params& params) {
  pqxx::params out;
  for (const auto& param : params) {
    std::visit(
        [&](const auto& value) {
          using T = std::decay_t<decltype(value)>;
          if constexpr (std::is_same_v<T, std::nullptr_t>) {
            out.append();
          } else if constexpr (std::is_same_v<T, uint64_t>) {
            out.append(static_cast<int64_t>(value));
          } else if constexpr (std::is_same_v<T, sql::Blob>) {
            out.append(std::basic_string<std::byte>(reinterpret_cast<const std::byte*>(value.bytes.data()), value.bytes.size()));
          } else {
            out.append(value);
          }
        },
        param);
  }
  return out;
}

template <typename Record>
std::optional<Record> First(std::vector<Record> rows) {
  if (rows.empty()) return std::nullopt;
  return std::move(rows.front());
}

} // namespace

PgRepository::PgRepository(std::shared_ptr<PgPool> pool) : pool_(std::move(pool)) {
}

std::unique_ptr<db::Transaction> PgRepository::Begin() {
  return std::make_unique<PgTransaction>(pool_);
}

PgTransaction& PgRepository::TX(Transaction& t) {
  return static_cast<PgTransaction&>(t);
}

Result PgRepository::Translate(const std::exception& e) {
  if (dynamic_cast<const pqxx::unique_violation*>(&e)) return Result::Err(ErrorCode::AlreadyExists, e.what());
  if (dynamic_cast<const pqxx::integrity_constraint_violation*>(&e)) return Result::Err(ErrorCode::ConstraintViolation, e.what());
  if (dynamic_cast<const pqxx::serialization_failure*>(&e)) return Result::Err(ErrorCode::SerializationFailure, e.what());
  if (dynamic_cast<const pqxx::deadlock_detected*>(&e)) return Result::Err(ErrorCode::Conflict, e.what());
  if (dynamic_cast<const pqxx::broken_connection*>(&e)) return Result::Err(ErrorCode::IOError, e.what());
  return Result::Err(ErrorCode::InternalError, e.what());
}

Result PgRepository::Execute(Transaction& t, const char* sql, const sql::Params& params, ErrorCode when_unchanged) {
  try {
    auto res = TX(t).Work().exec_params(Renumber(sql), Bind(params));
    if (when_unchanged != ErrorCode::OK && res.affected_rows() == 0) {
      return Result::Err(when_unchanged);
    }
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

void PgRepository::Query(Transaction& t, const char* sql, const sql::Params& params, const RowVisitor& visit) {
  auto res = TX(t).Work().exec_params(Renumber(sql), Bind(params));
  for (const auto& row : res) {
    visit(PgRow(row));
  }
}

// ------------------------------------------------------------------
// Runs
// ------------------------------------------------------------------

Result PgRepository::InsertRun(Transaction& t, const model::RunRecord& r) {
  return Execute(t, sql::INSERT_RUN, sql::InsertParams(r), ErrorCode::AlreadyExists);
}

std::optional<model::RunRecord> PgRepository::GetRun(Transaction& t, const std::string& tenant_id, const std::string& run_id) {
  std::vector<model::RunRecord> out;
  Query(t, sql::SELECT_RUN, {tenant_id, run_id}, [&](const sql::Row& row) { out.push_back(sql::ReadRun(row)); });
  return First(std::move(out));
}

Result PgRepository::UpdateRun(Transaction& t, const model::RunRecord& r) {
  return Execute(t, sql::UPDATE_RUN, sql::UpdateParams(r), ErrorCode::NotFound);
}

// ------------------------------------------------------------------
// Jobs
// ------------------------------------------------------------------

Result PgRepository::InsertJob(Transaction& t, const model::JobRecord& r) {
  return Execute(t, sql::INSERT_JOB, sql::InsertParams(r), ErrorCode::AlreadyExists);
}

std::optional<model::JobRecord> PgRepository::GetJob(Transaction& t, const std::string& job_id) {
  std::vector<model::JobRecord> out;
  Query(t, sql::SELECT_JOB, {job_id}, [&](const sql::Row& row) { out.push_back(sql::ReadJob(row)); });
  return First(std::move(out));
}

std::optional<model::JobRecord> PgRepository::FindActiveJob(Transaction& t, const std::string& tenant_id, const std::string& run_id,
                                                                const std::string& job_type) {
  std::vector<model::JobRecord> out;
  Query(t, sql::SELECT_ACTIVE_JOB, {tenant_id, run_id, job_type}, [&](const sql::Row& row) { out.push_back(sql::ReadJob(row)); });
  return First(std::move(out));
}

std::vector<model::JobRecord> PgRepository::ListJobs(Transaction& t, const std::string& tenant_id, const std::string& run_id) {
  std::vector<model::JobRecord> out;
  Query(t, sql::LIST_JOBS, {tenant_id, run_id}, [&](const sql::Row& row) { out.push_back(sql::ReadJob(row)); });
  return out;
}

std::optional<model::JobRecord> PgRepository::ClaimNextJob(Transaction& t, const std::string& worker_id, uint64_t now_ms,
                                                           uint64_t stale_before_ms) {
  auto res = TX(t).Work().exec_prepared("claim_next_job", now_ms, worker_id, stale_before_ms);
  if (res.empty()) return std::nullopt;
  return sql::ReadJob(PgRow(res[0]));
}

Result PgRepository::UpdateJob(Transaction& t, const model::JobRecord& r) {
  return Execute(t, sql::UPDATE_JOB, sql::UpdateParams(r), ErrorCode::NotFound);
}

// ------------------------------------------------------------------
// Plan / steps
// ------------------------------------------------------------------

Result PgRepository::InsertPlan(Transaction& t, const model::PlanRecord& r) {
  return Execute(t, sql::INSERT_PLAN, sql::InsertParams(r), ErrorCode::AlreadyExists);
}

std::optional<model::PlanRecord> PgRepository::GetPlan(Transaction& t, const std::string& tenant_id, const std::string& run_id) {
  std::vector<model::PlanRecord> out;
  Query(t, sql::SELECT_PLAN, {tenant_id, run_id}, [&](const sql::Row& row) { out.push_back(sql::ReadPlan(row)); });
  return First(std::move(out));
}

Result PgRepository::UpdatePlan(Transaction& t, const model::PlanRecord& r) {
  return Execute(t, sql::UPDATE_PLAN, sql::UpdateParams(r), ErrorCode::NotFound);
}

Result PgRepository::InsertStep(Transaction& t, const model::StepRecord& r) {
  return Execute(t, sql::INSERT_STEP, sql::InsertParams(r), ErrorCode::AlreadyExists);
}

std::vector<model::StepRecord> PgRepository::ListSteps(Transaction& t, const std::string& tenant_id, const std::string& run_id) {
  std::vector<model::StepRecord> out;
  Query(t, sql::LIST_STEPS, {tenant_id, run_id}, [&](const sql::Row& row) { out.push_back(sql::ReadStep(row)); });
  return out;
}

Result PgRepository::UpdateStep(Transaction& t, const model::StepRecord& r) {
  return Execute(t, sql::UPDATE_STEP, sql::UpdateParams(r), ErrorCode::NotFound);
}

// ------------------------------------------------------------------
// Source documents
// ------------------------------------------------------------------

Result PgRepository::InsertSource(Transaction& t, const model::SourceDocumentRecord& r) {
  return Execute(t, sql::INSERT_SOURCE, sql::InsertParams(r), ErrorCode::AlreadyExists);
}

std::optional<model::SourceDocumentRecord> PgRepository::GetSource(Transaction& t, const std::string& tenant_id,
                                                                       const std::string& source_id) {
  std::vector<model::SourceDocumentRecord> out;
  Query(t, sql::SELECT_SOURCE, {tenant_id, source_id}, [&](const sql::Row& row) { out.push_back(sql::ReadSource(row)); });
  return First(std::move(out));
}

std::vector<model::SourceDocumentRecord> PgRepository::ListSources(Transaction& t, const std::string& tenant_id, const std::string& run_id) {
  std::vector<model::SourceDocumentRecord> out;
  Query(t, sql::LIST_SOURCES, {tenant_id, run_id}, [&](const sql::Row& row) { out.push_back(sql::ReadSource(row)); });
  return out;
}

Result PgRepository::UpdateSource(Transaction& t, const model::SourceDocumentRecord& r) {
  return Execute(t, sql::UPDATE_SOURCE, sql::UpdateParams(r), ErrorCode::NotFound);
}

// ------------------------------------------------------------------
// Raw entities and evidence
// ------------------------------------------------------------------

Result PgRepository::InsertProspect(Transaction& t, const model::ProspectRecord& r) {
  return Execute(t, sql::INSERT_PROSPECT, sql::InsertParams(r), ErrorCode::AlreadyExists);
}

std::optional<model::ProspectRecord> PgRepository::FindProspectByName(Transaction& t, const std::string& tenant_id, const std::string& run_id,
                                                                          const std::string& name_normalized) {
  std::vector<model::ProspectRecord> out;
  Query(t, sql::SELECT_PROSPECT_BY_NAME, {tenant_id, run_id, name_normalized},
        [&](const sql::Row& row) { out.push_back(sql::ReadProspect(row)); });
  return First(std::move(out));
}

std::vector<model::ProspectRecord> PgRepository::ListProspects(Transaction& t, const std::string& tenant_id, const std::string& run_id) {
  std::vector<model::ProspectRecord> out;
  Query(t, sql::LIST_PROSPECTS, {tenant_id, run_id}, [&](const sql::Row& row) { out.push_back(sql::ReadProspect(row)); });
  return out;
}

Result PgRepository::UpdateProspect(Transaction& t, const model::ProspectRecord& r) {
  return Execute(t, sql::UPDATE_PROSPECT, sql::UpdateParams(r), ErrorCode::NotFound);
}

Result PgRepository::InsertExecutive(Transaction& t, const model::ExecutiveRecord& r) {
  return Execute(t, sql::INSERT_EXECUTIVE, sql::InsertParams(r), ErrorCode::AlreadyExists);
}

std::vector<model::ExecutiveRecord> PgRepository::ListExecutives(Transaction& t, const std::string& tenant_id, const std::string& run_id) {
  std::vector<model::ExecutiveRecord> out;
  Query(t, sql::LIST_EXECUTIVES, {tenant_id, run_id}, [&](const sql::Row& row) { out.push_back(sql::ReadExecutive(row)); });
  return out;
}

Result PgRepository::InsertEvidence(Transaction& t, const model::EvidenceRecord& r) {
  if (r.source_document_id.empty()) {
    return Result::Err(ErrorCode::ConstraintViolation, "evidence requires a source document");
  }
  return Execute(t, sql::INSERT_EVIDENCE, sql::InsertParams(r), ErrorCode::AlreadyExists);
}

std::vector<model::EvidenceRecord> PgRepository::ListEvidence(Transaction& t, const std::string& tenant_id,
                                                                  research::model::EvidenceSubject subject_type, const std::string& subject_id) {
  std::vector<model::EvidenceRecord> out;
  Query(t, sql::LIST_EVIDENCE, {tenant_id, std::string(research::model::ToString(subject_type)), subject_id},
        [&](const sql::Row& row) { out.push_back(sql::ReadEvidence(row)); });
  return out;
}

// ------------------------------------------------------------------
// Canonical entities
// ------------------------------------------------------------------

Result PgRepository::InsertCanonicalCompany(Transaction& t, const model::CanonicalCompanyRecord& r) {
  return Execute(t, sql::INSERT_COMPANY, sql::InsertParams(r), ErrorCode::AlreadyExists);
}

std::optional<model::CanonicalCompanyRecord> PgRepository::FindCompanyByDomain(Transaction& t, const std::string& tenant_id,
                                                                                   const std::string& domain) {
  std::vector<model::CanonicalCompanyRecord> out;
  Query(t, sql::SELECT_COMPANY_BY_DOMAIN, {tenant_id, domain}, [&](const sql::Row& row) { out.push_back(sql::ReadCompany(row)); });
  return First(std::move(out));
}

std::optional<model::CanonicalCompanyRecord> PgRepository::FindCompanyByNameCountry(Transaction& t, const std::string& tenant_id,
                                                                                        const std::string& name_normalized,
                                                                                        const std::string& country_code) {
  std::vector<model::CanonicalCompanyRecord> out;
  Query(t, sql::SELECT_COMPANY_BY_NAME_COUNTRY, {tenant_id, name_normalized, country_code},
        [&](const sql::Row& row) { out.push_back(sql::ReadCompany(row)); });
  return First(std::move(out));
}

Result PgRepository::InsertCanonicalPerson(Transaction& t, const model::CanonicalPersonRecord& r) {
  return Execute(t, sql::INSERT_PERSON, sql::InsertParams(r), ErrorCode::AlreadyExists);
}

std::optional<model::CanonicalPersonRecord> PgRepository::FindPersonByEmail(Transaction& t, const std::string& tenant_id,
                                                                                const std::string& email) {
  std::vector<model::CanonicalPersonRecord> out;
  Query(t, sql::SELECT_PERSON_BY_EMAIL, {tenant_id, email}, [&](const sql::Row& row) { out.push_back(sql::ReadPerson(row)); });
  return First(std::move(out));
}

std::optional<model::CanonicalPersonRecord> PgRepository::FindPersonByLinkedin(Transaction& t, const std::string& tenant_id,
                                                                                   const std::string& linkedin_url) {
  std::vector<model::CanonicalPersonRecord> out;
  Query(t, sql::SELECT_PERSON_BY_LINKEDIN, {tenant_id, linkedin_url}, [&](const sql::Row& row) { out.push_back(sql::ReadPerson(row)); });
  return First(std::move(out));
}

std::optional<model::CanonicalPersonRecord> PgRepository::GetCanonicalPerson(Transaction& t, const std::string& tenant_id,
                                                                                 const std::string& person_id) {
  std::vector<model::CanonicalPersonRecord> out;
  Query(t, sql::SELECT_PERSON, {tenant_id, person_id}, [&](const sql::Row& row) { out.push_back(sql::ReadPerson(row)); });
  return First(std::move(out));
}

Result PgRepository::InsertLink(Transaction& t, const model::CanonicalLinkRecord& r) {
  return Execute(t, sql::INSERT_LINK, sql::InsertParams(r), ErrorCode::AlreadyExists);
}

std::optional<model::CanonicalLinkRecord> PgRepository::GetLink(Transaction& t, const std::string& tenant_id, research::model::EntityKind kind,
                                                                    const std::string& raw_entity_id) {
  std::vector<model::CanonicalLinkRecord> out;
  Query(t, sql::SELECT_LINK, {tenant_id, std::string(research::model::ToString(kind)), raw_entity_id},
        [&](const sql::Row& row) { out.push_back(sql::ReadLink(row)); });
  return First(std::move(out));
}

// ------------------------------------------------------------------
// Enrichment assignments
// ------------------------------------------------------------------

Result PgRepository::UpsertAssignment(Transaction& t, const model::EnrichmentAssignmentRecord& r) {
  return Execute(t, sql::UPSERT_ASSIGNMENT, sql::InsertParams(r), ErrorCode::OK);
}

std::vector<model::EnrichmentAssignmentRecord> PgRepository::ListAssignments(Transaction& t, const std::string& tenant_id,
                                                                                 const std::string& entity_type, const std::string& canonical_id) {
  std::vector<model::EnrichmentAssignmentRecord> out;
  Query(t, sql::LIST_ASSIGNMENTS, {tenant_id, entity_type, canonical_id}, [&](const sql::Row& row) { out.push_back(sql::ReadAssignment(row)); });
  return out;
}

// ------------------------------------------------------------------
// Events
// ------------------------------------------------------------------

Result PgRepository::InsertEvent(Transaction& t, const model::EventRecord& r) {
  return Execute(t, sql::INSERT_EVENT, sql::InsertParams(r), ErrorCode::OK);
}

std::vector<model::EventRecord> PgRepository::ListEvents(Transaction& t, const std::string& tenant_id, const std::string& run_id) {
  std::vector<model::EventRecord> out;
  Query(t, sql::LIST_EVENTS, {tenant_id, run_id}, [&](const sql::Row& row) { out.push_back(sql::ReadEvent(row)); });
  return out;
}

} // namespace research::db::postgres
