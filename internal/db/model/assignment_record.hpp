#pragma once

#include <cstdint>
#include <string>

namespace research::db::model {

/*
  Field-level enrichment fact for a canonical entity.

  Idempotency key:
    (tenant, target_entity_type, target_canonical_id, field_key,
     content_hash, source_document_id)
  On conflict only value, confidence, derived_by, input_scope_hash and
  updated_at change.
*/
struct EnrichmentAssignmentRecord {
  std::string id;
  std::string tenant_id;
  std::string target_entity_type;
  std::string target_canonical_id;
  std::string field_key;
  std::string value; // JSON text
  std::string value_normalized;
  double      confidence = 0.0;
  std::string derived_by;
  std::string source_document_id;
  std::string input_scope_hash;
  std::string content_hash;
  uint64_t    created_at_ms = 0;
  uint64_t    updated_at_ms = 0;
};

} // namespace research::db::model
