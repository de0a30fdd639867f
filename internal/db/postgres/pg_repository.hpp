#pragma once

#include <functional>
#include <memory>

#include "internal/db/api/repository.hpp"
#include "internal/db/sql/sql_params.hpp"
#include "internal/db/sql/sql_row.hpp"
#include "pg_pool.hpp"
#include "pg_tx.hpp"

namespace research::db::postgres {

class PgRepository final : public db::Repository {
 public:
  explicit PgRepository(std::shared_ptr<PgPool> pool);

  std::unique_ptr<Transaction> Begin() override;

  Result                           InsertRun(Transaction&, const model::RunRecord&) override;
  std::optional<model::RunRecord>  GetRun(Transaction&, const std::string&, const std::string&) override;
  Result                           UpdateRun(Transaction&, const model::RunRecord&) override;

  Result                           InsertJob(Transaction&, const model::JobRecord&) override;
  std::optional<model::JobRecord>  GetJob(Transaction&, const std::string&) override;
  std::optional<model::JobRecord>  FindActiveJob(Transaction&, const std::string&, const std::string&, const std::string&) override;
  std::vector<model::JobRecord>    ListJobs(Transaction&, const std::string&, const std::string&) override;
  std::optional<model::JobRecord>  ClaimNextJob(Transaction&, const std::string&, uint64_t, uint64_t) override;
  Result                           UpdateJob(Transaction&, const model::JobRecord&) override;

  Result                           InsertPlan(Transaction&, const model::PlanRecord&) override;
  std::optional<model::PlanRecord> GetPlan(Transaction&, const std::string&, const std::string&) override;
  Result                           UpdatePlan(Transaction&, const model::PlanRecord&) override;
  Result                           InsertStep(Transaction&, const model::StepRecord&) override;
  std::vector<model::StepRecord>   ListSteps(Transaction&, const std::string&, const std::string&) override;
  Result                           UpdateStep(Transaction&, const model::StepRecord&) override;

  Result                                     InsertSource(Transaction&, const model::SourceDocumentRecord&) override;
  std::optional<model::SourceDocumentRecord> GetSource(Transaction&, const std::string&, const std::string&) override;
  std::vector<model::SourceDocumentRecord>   ListSources(Transaction&, const std::string&, const std::string&) override;
  Result                                     UpdateSource(Transaction&, const model::SourceDocumentRecord&) override;

  Result                               InsertProspect(Transaction&, const model::ProspectRecord&) override;
  std::optional<model::ProspectRecord> FindProspectByName(Transaction&, const std::string&, const std::string&, const std::string&) override;
  std::vector<model::ProspectRecord>   ListProspects(Transaction&, const std::string&, const std::string&) override;
  Result                               UpdateProspect(Transaction&, const model::ProspectRecord&) override;
  Result                               InsertExecutive(Transaction&, const model::ExecutiveRecord&) override;
  std::vector<model::ExecutiveRecord>  ListExecutives(Transaction&, const std::string&, const std::string&) override;
  Result                               InsertEvidence(Transaction&, const model::EvidenceRecord&) override;
  std::vector<model::EvidenceRecord>   ListEvidence(Transaction&, const std::string&, research::model::EvidenceSubject, const std::string&) override;

  Result InsertCanonicalCompany(Transaction&, const model::CanonicalCompanyRecord&) override;
  std::optional<model::CanonicalCompanyRecord> FindCompanyByDomain(Transaction&, const std::string&, const std::string&) override;
  std::optional<model::CanonicalCompanyRecord> FindCompanyByNameCountry(Transaction&, const std::string&, const std::string&,
                                                                        const std::string&) override;
  Result InsertCanonicalPerson(Transaction&, const model::CanonicalPersonRecord&) override;
  std::optional<model::CanonicalPersonRecord> FindPersonByEmail(Transaction&, const std::string&, const std::string&) override;
  std::optional<model::CanonicalPersonRecord> FindPersonByLinkedin(Transaction&, const std::string&, const std::string&) override;
  std::optional<model::CanonicalPersonRecord> GetCanonicalPerson(Transaction&, const std::string&, const std::string&) override;
  Result InsertLink(Transaction&, const model::CanonicalLinkRecord&) override;
  std::optional<model::CanonicalLinkRecord> GetLink(Transaction&, const std::string&, research::model::EntityKind, const std::string&) override;

  Result UpsertAssignment(Transaction&, const model::EnrichmentAssignmentRecord&) override;
  std::vector<model::EnrichmentAssignmentRecord> ListAssignments(Transaction&, const std::string&, const std::string&,
                                                                 const std::string&) override;

  Result                          InsertEvent(Transaction&, const model::EventRecord&) override;
  std::vector<model::EventRecord> ListEvents(Transaction&, const std::string&, const std::string&) override;

 private:
  std::shared_ptr<PgPool> pool_;

  using RowVisitor = std::function<void(const sql::Row&)>;

  static PgTransaction& TX(Transaction& t);
  static Result         Translate(const std::exception& e);

  // Runs a write; zero affected rows is reported as when_unchanged.
  static Result Execute(Transaction& t, const char* sql, const sql::Params& params, ErrorCode when_unchanged);
  // Runs a read; pqxx exceptions propagate.
  static void Query(Transaction& t, const char* sql, const sql::Params& params, const RowVisitor& visit);
};

} // namespace research::db::postgres
