#pragma once

#include "internal/db/model/assignment_record.hpp"
#include "internal/db/model/canonical_record.hpp"
#include "internal/db/model/event_record.hpp"
#include "internal/db/model/job_record.hpp"
#include "internal/db/model/plan_record.hpp"
#include "internal/db/model/prospect_record.hpp"
#include "internal/db/model/run_record.hpp"
#include "internal/db/model/source_record.hpp"
#include "internal/db/sql/sql_params.hpp"
#include "internal/db/sql/sql_row.hpp"

namespace research::db::sql {

/*
  Record <-> row mapping shared by the SQL backends.

  Insert*Params follow the RESEARCH_*_COLUMNS order; Update*Params follow the
  SET list of the matching UPDATE_* query with the id last. Decoders throw
  std::runtime_error on a stored enum value or meta document they cannot
  parse.
*/

Params InsertParams(const model::RunRecord& r);
Params UpdateParams(const model::RunRecord& r);
Params InsertParams(const model::JobRecord& r);
Params UpdateParams(const model::JobRecord& r);
Params InsertParams(const model::PlanRecord& r);
Params UpdateParams(const model::PlanRecord& r);
Params InsertParams(const model::StepRecord& r);
Params UpdateParams(const model::StepRecord& r);
Params InsertParams(const model::SourceDocumentRecord& r);
Params UpdateParams(const model::SourceDocumentRecord& r);
Params InsertParams(const model::ProspectRecord& r);
Params UpdateParams(const model::ProspectRecord& r);
Params InsertParams(const model::ExecutiveRecord& r);
Params InsertParams(const model::EvidenceRecord& r);
Params InsertParams(const model::CanonicalCompanyRecord& r);
Params InsertParams(const model::CanonicalPersonRecord& r);
Params InsertParams(const model::CanonicalLinkRecord& r);
Params InsertParams(const model::EnrichmentAssignmentRecord& r);
Params InsertParams(const model::EventRecord& r);

model::RunRecord                  ReadRun(const Row& row);
model::JobRecord                  ReadJob(const Row& row);
model::PlanRecord                 ReadPlan(const Row& row);
model::StepRecord                 ReadStep(const Row& row);
model::SourceDocumentRecord       ReadSource(const Row& row);
model::ProspectRecord             ReadProspect(const Row& row);
model::ExecutiveRecord            ReadExecutive(const Row& row);
model::EvidenceRecord             ReadEvidence(const Row& row);
model::CanonicalCompanyRecord     ReadCompany(const Row& row);
model::CanonicalPersonRecord      ReadPerson(const Row& row);
model::CanonicalLinkRecord        ReadLink(const Row& row);
model::EnrichmentAssignmentRecord ReadAssignment(const Row& row);
model::EventRecord                ReadEvent(const Row& row);

} // namespace research::db::sql
