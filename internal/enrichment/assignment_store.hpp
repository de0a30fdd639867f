#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"

namespace research::enrichment {

inline constexpr std::string_view kTargetCompany = "company";
inline constexpr std::string_view kTargetPerson  = "person";

struct AssignmentInput {
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
};

struct AssignmentRead {
  std::string field_key;
  std::string value;
  std::string value_normalized;
  double      confidence = 0.0;
  std::string derived_by;
  std::string source_document_id;
  std::string content_hash;
};

/*
  Idempotent, evidence-linked writes of enrichment facts.

  The content hash is the SHA-256 of the canonical JSON of the fact, so the
  same fact from the same document always lands on the same row; a repeated
  write only refreshes value, confidence, derived_by, input_scope_hash and
  updated_at.
*/
class AssignmentStore {
 public:
  explicit AssignmentStore(db::Repository& repo);

  // Throws util::InvalidArgument for a missing or unknown source document
  // and for a confidence outside [0, 1].
  AssignmentRead Record(db::Transaction& tx, const AssignmentInput& input, uint64_t now_ms);

  // Ordered by (field_key, source_document_id, content_hash).
  std::vector<AssignmentRead> ListForTarget(db::Transaction& tx, const std::string& tenant_id, const std::string& entity_type,
                                            const std::string& canonical_id);

  static std::string ContentHash(const AssignmentInput& input);

 private:
  db::Repository& repo_;
};

} // namespace research::enrichment
