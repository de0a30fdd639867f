#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "internal/db/model/event_record.hpp"
#include "internal/db/model/job_record.hpp"
#include "internal/db/model/plan_record.hpp"
#include "internal/db/model/run_record.hpp"
#include "internal/db/model/source_record.hpp"
#include "internal/enrichment/assignment_store.hpp"
#include "internal/ranking/prospect_ranker.hpp"
#include "research/v1/ranking.pb.h"
#include "service_context.hpp"

namespace research::service {

enum class CancelOutcome {
  kNotFound,
  kNoopTerminal,
  kRequested,   // the active job will stop at its next checkpoint
  kNoActiveJob, // nothing was running; the run was cancelled directly
};

std::string_view ToString(CancelOutcome outcome);

struct SourceInput {
  research::model::SourceType source_type = research::model::SourceType::kUrl;
  std::string                 title;
  std::string                 url;
  std::string                 content_text;
  std::string                 content_bytes;
  std::string                 mime_type;
};

/*
  Run lifecycle operations used by researchctl and by any outer API layer.

  Every state change commits together with its audit event. Errors surface as
  util exceptions: NotFound for unknown runs, Conflict for sources attached
  after the plan was locked, InvalidState for transitions the run does not
  allow, InvalidArgument for malformed input.
*/
class RunService {
 public:
  explicit RunService(ServiceContext ctx);

  db::model::RunRecord            CreateRun(const std::string& tenant_id, const std::string& name);
  db::model::SourceDocumentRecord AttachSource(const std::string& tenant_id, const std::string& run_id, const SourceInput& input);
  db::model::JobRecord            StartRun(const std::string& tenant_id, const std::string& run_id);
  CancelOutcome                   CancelRun(const std::string& tenant_id, const std::string& run_id);
  db::model::JobRecord            RetryRun(const std::string& tenant_id, const std::string& run_id);

  db::model::RunRecord                         GetRun(const std::string& tenant_id, const std::string& run_id);
  std::vector<db::model::StepRecord>           ListSteps(const std::string& tenant_id, const std::string& run_id);
  std::vector<db::model::EventRecord>          ListEvents(const std::string& tenant_id, const std::string& run_id);
  std::vector<db::model::SourceDocumentRecord> ListSources(const std::string& tenant_id, const std::string& run_id);

  research::v1::RankingReport RankedProspects(const std::string& tenant_id, const std::string& run_id,
                                              const ranking::RankingFilters& filters = {});

  std::vector<enrichment::AssignmentRead> ListAssignments(const std::string& tenant_id, const std::string& entity_type,
                                                          const std::string& canonical_id);

 private:
  ServiceContext ctx_;
};

} // namespace research::service
