#include "prospect_writer.hpp"

#include "internal/core/db_error.hpp"
#include "internal/resolution/identity.hpp"
#include "internal/util/text.hpp"
#include "internal/util/uuid.hpp"

namespace research::discovery {

namespace {

std::string SourceName(const db::model::SourceDocumentRecord& source) {
  return source.title.empty() ? std::string(research::model::ToString(source.source_type)) : source.title;
}

} // namespace

ProspectWriter::ProspectWriter(db::Repository& repo, db::Transaction& tx, uint64_t now_ms) : repo_(repo), tx_(tx), now_ms_(now_ms) {
}

db::model::ProspectRecord ProspectWriter::FindOrCreate(const db::model::SourceDocumentRecord& source, const std::string& name_raw,
                                                       const std::string& name_normalized, DiscoveryCounts& counts, bool* created) {
  if (auto existing = repo_.FindProspectByName(tx_, source.tenant_id, source.run_id, name_normalized)) {
    ++counts.prospects_matched;
    *created = false;
    return *existing;
  }

  db::model::ProspectRecord prospect;
  prospect.id              = util::NewId();
  prospect.tenant_id       = source.tenant_id;
  prospect.run_id          = source.run_id;
  prospect.name_raw        = name_raw;
  prospect.name_normalized = name_normalized;
  prospect.relevance_score = kDefaultProspectScore;
  prospect.evidence_score  = kDefaultProspectScore;
  prospect.discovered_by   = std::string(research::model::ToString(source.source_type));
  prospect.created_at_ms   = now_ms_;

  core::ThrowIfDbError(repo_.InsertProspect(tx_, prospect), "insert prospect");
  ++counts.prospects_created;
  *created = true;
  return prospect;
}

void ProspectWriter::AddEvidence(const db::model::SourceDocumentRecord& source, research::model::EvidenceSubject subject,
                                 const std::string& subject_id, double weight, const std::string& snippet, DiscoveryCounts& counts) {
  db::model::EvidenceRecord evidence;
  evidence.id                 = util::NewId();
  evidence.tenant_id          = source.tenant_id;
  evidence.run_id             = source.run_id;
  evidence.subject_type       = subject;
  evidence.subject_id         = subject_id;
  evidence.source_document_id = source.id;
  evidence.source_type        = std::string(research::model::ToString(source.source_type));
  evidence.source_name        = SourceName(source);
  evidence.weight             = weight;
  evidence.snippet            = snippet;
  evidence.created_at_ms      = now_ms_;

  const auto result = repo_.InsertEvidence(tx_, evidence);
  if (result.code == db::ErrorCode::AlreadyExists) {
    return;
  }
  core::ThrowIfDbError(result, "insert evidence");
  ++counts.evidence_created;
}

// ------------------------------------------------------------

std::string ProspectWriter::RecordMention(const db::model::SourceDocumentRecord& source, const CompanyMention& mention,
                                          DiscoveryCounts& counts) {
  bool       created  = false;
  const auto prospect = FindOrCreate(source, mention.name, mention.name_normalized, counts, &created);
  AddEvidence(source, research::model::EvidenceSubject::kProspect, prospect.id, kMentionEvidenceWeight, mention.snippet, counts);
  return prospect.id;
}

std::string ProspectWriter::RecordProposalCompany(const db::model::SourceDocumentRecord& source, const research::v1::ProposalCompany& company,
                                                  DiscoveryCounts& counts) {
  const auto name       = util::CollapseWhitespace(company.name());
  bool       created    = false;
  auto       prospect   = FindOrCreate(source, name, NormalizeCompanyName(name), counts, &created);
  const auto before     = prospect;

  if (company.has_ai_score()) {
    prospect.relevance_score = company.ai_score();
  }
  if (prospect.website_url.empty() && !company.website_url().empty()) {
    prospect.website_url = company.website_url();
  }
  if (prospect.hq_country.empty() && !company.hq_country().empty()) {
    prospect.hq_country = company.hq_country();
  }

  if (prospect.relevance_score != before.relevance_score || prospect.website_url != before.website_url ||
      prospect.hq_country != before.hq_country) {
    core::ThrowIfDbError(repo_.UpdateProspect(tx_, prospect), "update prospect");
  }

  std::vector<std::string> snippets(company.evidence_snippets().begin(), company.evidence_snippets().end());
  auto                     snippet = snippets.empty() ? company.description() : util::Join(snippets, " | ");
  AddEvidence(source, research::model::EvidenceSubject::kProspect, prospect.id, kProposalEvidenceWeight, snippet, counts);
  return prospect.id;
}

void ProspectWriter::RecordProposalExecutive(const db::model::SourceDocumentRecord& source, const std::string& prospect_id,
                                             const research::v1::ProposalExecutive& executive, DiscoveryCounts& counts) {
  const auto name_normalized = resolution::NormalizePersonName(executive.name());
  if (name_normalized.empty()) {
    return;
  }

  std::string executive_id;
  for (const auto& existing : repo_.ListExecutives(tx_, source.tenant_id, source.run_id)) {
    if (existing.company_prospect_id == prospect_id && existing.name_normalized == name_normalized) {
      executive_id = existing.id;
      break;
    }
  }

  if (executive_id.empty()) {
    db::model::ExecutiveRecord record;
    record.id                  = util::NewId();
    record.tenant_id           = source.tenant_id;
    record.run_id              = source.run_id;
    record.company_prospect_id = prospect_id;
    record.name_raw            = util::CollapseWhitespace(executive.name());
    record.name_normalized     = name_normalized;
    record.title               = executive.title();
    record.email               = executive.email();
    record.linkedin_url        = executive.linkedin_url();
    record.source_document_id  = source.id;
    record.created_at_ms       = now_ms_;

    core::ThrowIfDbError(repo_.InsertExecutive(tx_, record), "insert executive");
    ++counts.executives_created;
    executive_id = record.id;
  }

  const auto snippet = executive.title().empty() ? executive.name() : executive.name() + " | " + executive.title();
  AddEvidence(source, research::model::EvidenceSubject::kExecutive, executive_id, kProposalEvidenceWeight, snippet, counts);
}

} // namespace research::discovery
