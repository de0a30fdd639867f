#pragma once

#include <cstdint>
#include <map>
#include <mutex>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"

namespace research::db::memory {

class MemoryTransaction;

/*
  In-process backend.

  Every transaction works on a private copy of the committed state. Commit
  installs the copy only when no other transaction committed since the copy
  was taken, otherwise it throws util::TransactionConflict.
*/
class MemoryRepository final : public db::Repository {
 public:
  MemoryRepository();

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
  friend class MemoryTransaction;

  struct State {
    std::map<std::string, model::RunRecord>                  runs;
    std::map<std::string, model::JobRecord>                  jobs;
    std::map<std::string, model::PlanRecord>                 plans;
    std::map<std::string, model::StepRecord>                 steps;
    std::map<std::string, model::SourceDocumentRecord>       sources;
    std::map<std::string, model::ProspectRecord>             prospects;
    std::map<std::string, model::ExecutiveRecord>            executives;
    std::map<std::string, model::EvidenceRecord>             evidence;
    std::map<std::string, model::CanonicalCompanyRecord>     companies;
    std::map<std::string, model::CanonicalPersonRecord>      people;
    std::map<std::string, model::CanonicalLinkRecord>        links;
    std::map<std::string, model::EnrichmentAssignmentRecord> assignments;
    std::vector<model::EventRecord>                          events;
  };

  std::mutex mutex_;
  State      committed_;
  uint64_t   committed_version_ = 0;
};

} // namespace research::db::memory
