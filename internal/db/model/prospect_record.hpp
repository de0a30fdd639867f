#pragma once

#include <cstdint>
#include <string>

#include "internal/model/state_machine.hpp"

namespace research::db::model {

// Raw company discovered in a run. Unique per (tenant, run, name_normalized).
struct ProspectRecord {
  std::string id;
  std::string tenant_id;
  std::string run_id;
  std::string name_raw;
  std::string name_normalized;
  std::string website_url;
  std::string hq_country;
  double      relevance_score = 0.0;
  double      evidence_score  = 0.0;
  std::string discovered_by;
  uint64_t    created_at_ms = 0;
};

// Raw person attached to a prospect.
struct ExecutiveRecord {
  std::string id;
  std::string tenant_id;
  std::string run_id;
  std::string company_prospect_id;
  std::string name_raw;
  std::string name_normalized;
  std::string title;
  std::string email;
  std::string linkedin_url;
  std::string source_document_id;
  uint64_t    created_at_ms = 0;
};

/*
  Link between a raw entity and the document that supports it.

  source_document_id is mandatory; one row per (subject, document).
*/
struct EvidenceRecord {
  std::string id;
  std::string tenant_id;
  std::string run_id;

  research::model::EvidenceSubject subject_type = research::model::EvidenceSubject::kProspect;
  std::string                      subject_id;

  std::string source_document_id;
  std::string source_type;
  std::string source_name;
  double      weight = 0.0;
  std::string snippet;
  uint64_t    created_at_ms = 0;
};

} // namespace research::db::model
