#pragma once

#include <cstdint>
#include <string>

#include "company_list_parser.hpp"
#include "internal/db/api/repository.hpp"
#include "research/v1/proposal.pb.h"

namespace research::discovery {

inline constexpr double kDefaultProspectScore = 0.5;
inline constexpr double kMentionEvidenceWeight  = 0.5;
inline constexpr double kProposalEvidenceWeight = 0.8;

struct DiscoveryCounts {
  uint32_t prospects_created  = 0;
  uint32_t prospects_matched  = 0;
  uint32_t evidence_created   = 0;
  uint32_t executives_created = 0;
};

/*
  Writes raw prospects, executives and their evidence inside the caller's
  transaction.

  Prospects are matched by (run, normalised name); every write links the
  source document as evidence, and a repeated evidence row is not an error.
*/
class ProspectWriter {
 public:
  ProspectWriter(db::Repository& repo, db::Transaction& tx, uint64_t now_ms);

  // Returns the prospect id.
  std::string RecordMention(const db::model::SourceDocumentRecord& source, const CompanyMention& mention, DiscoveryCounts& counts);

  std::string RecordProposalCompany(const db::model::SourceDocumentRecord& source, const research::v1::ProposalCompany& company,
                                    DiscoveryCounts& counts);

  void RecordProposalExecutive(const db::model::SourceDocumentRecord& source, const std::string& prospect_id,
                               const research::v1::ProposalExecutive& executive, DiscoveryCounts& counts);

 private:
  db::model::ProspectRecord FindOrCreate(const db::model::SourceDocumentRecord& source, const std::string& name_raw,
                                         const std::string& name_normalized, DiscoveryCounts& counts, bool* created);

  void AddEvidence(const db::model::SourceDocumentRecord& source, research::model::EvidenceSubject subject, const std::string& subject_id,
                   double weight, const std::string& snippet, DiscoveryCounts& counts);

  db::Repository&  repo_;
  db::Transaction& tx_;
  uint64_t         now_ms_;
};

} // namespace research::discovery
