#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "research/v1/step_output.pb.h"

namespace research::resolution {

/*
  Deterministic resolution of a run's raw entities to tenant-wide canonical
  entities.

  Companies match by normalised website domain, else by normalised name plus
  country. People match by email, then LinkedIn URL, then by name within the
  same prospect (ambiguous candidates are skipped as conflicts). Every link
  records the lowest supporting source document id; an entity with no
  supporting document is not linked. Entities are visited in id order and
  already linked entities are left untouched, so a second pass over the same
  input creates nothing.
*/
class EntityResolver {
 public:
  EntityResolver(db::Repository& repo, db::Transaction& tx, uint64_t now_ms);

  research::v1::ResolutionSummary ResolveCompanies(const std::string& tenant_id, const std::string& run_id);
  research::v1::ResolutionSummary ResolvePeople(const std::string& tenant_id, const std::string& run_id);

 private:
  // Sorted, unique source document ids; empty when nothing supports the entity.
  std::vector<std::string> EvidenceIds(const std::string& tenant_id, research::model::EvidenceSubject subject, const std::string& subject_id,
                                       const std::string& own_source_id);

  // Returns the chosen document id or empty after counting a skip.
  std::string ChooseEvidence(const std::vector<std::string>& ids, research::v1::ResolutionSummary& summary);

  void Link(const std::string& tenant_id, const std::string& run_id, research::model::EntityKind kind, const std::string& canonical_id,
            const std::string& raw_entity_id, const std::string& match_rule, const std::string& evidence_id,
            research::v1::ResolutionSummary& summary);

  db::Repository&  repo_;
  db::Transaction& tx_;
  uint64_t         now_ms_;
};

} // namespace research::resolution
