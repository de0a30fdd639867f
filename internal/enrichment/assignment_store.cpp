#include "assignment_store.hpp"

#include <cmath>

#include "internal/core/db_error.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/hash.hpp"
#include "internal/util/json.hpp"
#include "internal/util/uuid.hpp"
#include "research/v1/assignment_fact.pb.h"

namespace research::enrichment {

namespace {

AssignmentRead ToRead(const db::model::EnrichmentAssignmentRecord& record) {
  AssignmentRead read;
  read.field_key          = record.field_key;
  read.value              = record.value;
  read.value_normalized   = record.value_normalized;
  read.confidence         = record.confidence;
  read.derived_by         = record.derived_by;
  read.source_document_id = record.source_document_id;
  read.content_hash       = record.content_hash;
  return read;
}

} // namespace

AssignmentStore::AssignmentStore(db::Repository& repo) : repo_(repo) {
}

std::string AssignmentStore::ContentHash(const AssignmentInput& input) {
  research::v1::AssignmentFact fact;
  fact.set_derived_by(input.derived_by);
  fact.set_field_key(input.field_key);
  fact.set_input_scope_hash(input.input_scope_hash);
  fact.set_source_document_id(input.source_document_id);
  fact.set_target_canonical_id(input.target_canonical_id);
  fact.set_target_entity_type(input.target_entity_type);
  fact.set_value(input.value);
  fact.set_value_normalized(input.value_normalized);
  return util::Sha256Hex(util::ToJson(fact));
}

AssignmentRead AssignmentStore::Record(db::Transaction& tx, const AssignmentInput& input, uint64_t now_ms) {
  if (input.source_document_id.empty()) {
    throw util::InvalidArgument("assignment requires source_document_id");
  }
  if (std::isnan(input.confidence) || input.confidence < 0.0 || input.confidence > 1.0) {
    throw util::InvalidArgument("assignment confidence must be within [0, 1]");
  }
  if (!repo_.GetSource(tx, input.tenant_id, input.source_document_id)) {
    throw util::InvalidArgument("unknown source document: " + input.source_document_id);
  }

  db::model::EnrichmentAssignmentRecord record;
  record.id                  = util::NewId();
  record.tenant_id           = input.tenant_id;
  record.target_entity_type  = input.target_entity_type;
  record.target_canonical_id = input.target_canonical_id;
  record.field_key           = input.field_key;
  record.value               = input.value;
  record.value_normalized    = input.value_normalized;
  record.confidence          = input.confidence;
  record.derived_by          = input.derived_by;
  record.source_document_id  = input.source_document_id;
  record.input_scope_hash    = input.input_scope_hash;
  record.content_hash        = ContentHash(input);
  record.created_at_ms       = now_ms;
  record.updated_at_ms       = now_ms;

  core::ThrowIfDbError(repo_.UpsertAssignment(tx, record), "upsert assignment");
  return ToRead(record);
}

std::vector<AssignmentRead> AssignmentStore::ListForTarget(db::Transaction& tx, const std::string& tenant_id, const std::string& entity_type,
                                                           const std::string& canonical_id) {
  std::vector<AssignmentRead> out;
  for (const auto& record : repo_.ListAssignments(tx, tenant_id, entity_type, canonical_id)) {
    out.push_back(ToRead(record));
  }
  return out;
}

} // namespace research::enrichment
