#pragma once

#include <cstdint>
#include <string>

#include "internal/model/state_machine.hpp"

namespace research::db::model {

struct CanonicalCompanyRecord {
  std::string id;
  std::string tenant_id;
  std::string canonical_name;
  std::string name_normalized;
  std::string primary_domain;
  std::string country_code;
  uint64_t    created_at_ms = 0;
};

struct CanonicalPersonRecord {
  std::string id;
  std::string tenant_id;
  std::string canonical_full_name;
  std::string name_normalized;
  std::string primary_email;
  std::string primary_linkedin_url;
  uint64_t    created_at_ms = 0;
};

// One link per (tenant, entity_kind, raw_entity_id).
struct CanonicalLinkRecord {
  std::string tenant_id;

  research::model::EntityKind entity_kind = research::model::EntityKind::kCompany;

  std::string canonical_id;
  std::string raw_entity_id;
  std::string match_rule;
  std::string evidence_source_document_id;
  std::string run_id;
  uint64_t    created_at_ms = 0;
};

} // namespace research::db::model
