#include "entity_resolver.hpp"

#include <algorithm>
#include <optional>
#include <set>

#include "identity.hpp"
#include "internal/core/db_error.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/text.hpp"
#include "internal/util/uuid.hpp"

namespace research::resolution {

using research::model::EntityKind;
using research::model::EvidenceSubject;

EntityResolver::EntityResolver(db::Repository& repo, db::Transaction& tx, uint64_t now_ms) : repo_(repo), tx_(tx), now_ms_(now_ms) {
}

std::vector<std::string> EntityResolver::EvidenceIds(const std::string& tenant_id, EvidenceSubject subject, const std::string& subject_id,
                                                     const std::string& own_source_id) {
  std::set<std::string> ids;
  if (!own_source_id.empty()) ids.insert(own_source_id);
  for (const auto& evidence : repo_.ListEvidence(tx_, tenant_id, subject, subject_id)) {
    if (!evidence.source_document_id.empty()) ids.insert(evidence.source_document_id);
  }
  return {ids.begin(), ids.end()};
}

std::string EntityResolver::ChooseEvidence(const std::vector<std::string>& ids, research::v1::ResolutionSummary& summary) {
  if (ids.empty()) {
    summary.set_evidence_missing_skipped(summary.evidence_missing_skipped() + 1);
    summary.set_conflicts_skipped(summary.conflicts_skipped() + 1);
    return {};
  }
  if (ids.size() > 1) {
    summary.set_warnings_multi_evidence(summary.warnings_multi_evidence() + 1);
    summary.set_multi_evidence_deterministic_choice(summary.multi_evidence_deterministic_choice() + 1);
  }
  return ids.front();
}

void EntityResolver::Link(const std::string& tenant_id, const std::string& run_id, EntityKind kind, const std::string& canonical_id,
                          const std::string& raw_entity_id, const std::string& match_rule, const std::string& evidence_id,
                          research::v1::ResolutionSummary& summary) {
  db::model::CanonicalLinkRecord link;
  link.tenant_id                   = tenant_id;
  link.entity_kind                 = kind;
  link.canonical_id                = canonical_id;
  link.raw_entity_id               = raw_entity_id;
  link.match_rule                  = match_rule;
  link.evidence_source_document_id = evidence_id;
  link.run_id                      = run_id;
  link.created_at_ms               = now_ms_;

  const auto result = repo_.InsertLink(tx_, link);
  if (result.code == db::ErrorCode::AlreadyExists) {
    summary.set_links_existing(summary.links_existing() + 1);
    return;
  }
  core::ThrowIfDbError(result, "insert canonical link");
  summary.set_links_created(summary.links_created() + 1);
}

// ------------------------------------------------------------

research::v1::ResolutionSummary EntityResolver::ResolveCompanies(const std::string& tenant_id, const std::string& run_id) {
  research::v1::ResolutionSummary summary;

  for (const auto& prospect : repo_.ListProspects(tx_, tenant_id, run_id)) {
    summary.set_scanned(summary.scanned() + 1);

    if (repo_.GetLink(tx_, tenant_id, EntityKind::kCompany, prospect.id)) {
      summary.set_links_existing(summary.links_existing() + 1);
      continue;
    }

    const auto evidence_id = ChooseEvidence(EvidenceIds(tenant_id, EvidenceSubject::kProspect, prospect.id, {}), summary);
    if (evidence_id.empty()) continue;

    const auto domain  = NormalizeDomain(prospect.website_url);
    const auto name    = NormalizeEntityName(prospect.name_normalized.empty() ? prospect.name_raw : prospect.name_normalized);
    const auto country = util::ToUpper(util::Trim(prospect.hq_country));

    std::optional<db::model::CanonicalCompanyRecord> canonical;
    std::string                                      rule;
    if (!domain.empty()) {
      rule      = "domain";
      canonical = repo_.FindCompanyByDomain(tx_, tenant_id, domain);
    } else if (!name.empty()) {
      rule      = "name_country";
      canonical = repo_.FindCompanyByNameCountry(tx_, tenant_id, name, country);
    } else {
      summary.set_conflicts_skipped(summary.conflicts_skipped() + 1);
      continue;
    }

    if (canonical) {
      summary.set_matched(summary.matched() + 1);
    } else {
      db::model::CanonicalCompanyRecord created;
      created.id              = util::NewId();
      created.tenant_id       = tenant_id;
      created.canonical_name  = util::CollapseWhitespace(prospect.name_raw);
      created.name_normalized = name;
      created.primary_domain  = domain;
      created.country_code    = country;
      created.created_at_ms   = now_ms_;
      core::ThrowIfDbError(repo_.InsertCanonicalCompany(tx_, created), "insert canonical company");
      summary.set_created(summary.created() + 1);
      canonical = std::move(created);
    }

    Link(tenant_id, run_id, EntityKind::kCompany, canonical->id, prospect.id, rule, evidence_id, summary);
  }

  RESEARCH_LOG_INFO("companies resolved", {observability::StringField("run_id", run_id), observability::IntField("scanned", summary.scanned()),
                                           observability::IntField("created", summary.created()),
                                           observability::IntField("links_created", summary.links_created())});
  return summary;
}

// ------------------------------------------------------------

research::v1::ResolutionSummary EntityResolver::ResolvePeople(const std::string& tenant_id, const std::string& run_id) {
  research::v1::ResolutionSummary summary;

  const auto executives = repo_.ListExecutives(tx_, tenant_id, run_id);

  for (const auto& executive : executives) {
    summary.set_scanned(summary.scanned() + 1);

    if (repo_.GetLink(tx_, tenant_id, EntityKind::kPerson, executive.id)) {
      summary.set_links_existing(summary.links_existing() + 1);
      continue;
    }

    const auto evidence_id =
        ChooseEvidence(EvidenceIds(tenant_id, EvidenceSubject::kExecutive, executive.id, executive.source_document_id), summary);
    if (evidence_id.empty()) continue;

    const auto email    = NormalizeEmail(executive.email);
    const auto linkedin = NormalizeLinkedinUrl(executive.linkedin_url);
    const auto name     = NormalizePersonName(executive.name_normalized.empty() ? executive.name_raw : executive.name_normalized);

    std::optional<db::model::CanonicalPersonRecord> canonical;
    std::string                                     rule;

    if (!email.empty()) {
      rule      = "email";
      canonical = repo_.FindPersonByEmail(tx_, tenant_id, email);
    } else if (!linkedin.empty()) {
      rule      = "linkedin";
      canonical = repo_.FindPersonByLinkedin(tx_, tenant_id, linkedin);
    } else {
      rule = "name_company";
      if (name.empty() || executive.company_prospect_id.empty()) {
        summary.set_conflicts_skipped(summary.conflicts_skipped() + 1);
        continue;
      }

      std::set<std::string> candidates;
      for (const auto& peer : executives) {
        if (peer.id == executive.id || peer.company_prospect_id != executive.company_prospect_id) continue;
        if (NormalizePersonName(peer.name_normalized.empty() ? peer.name_raw : peer.name_normalized) != name) continue;
        if (auto link = repo_.GetLink(tx_, tenant_id, EntityKind::kPerson, peer.id)) {
          candidates.insert(link->canonical_id);
        }
      }

      if (candidates.size() > 1) {
        RESEARCH_LOG_WARN("ambiguous person match skipped",
                          {observability::StringField("run_id", run_id), observability::StringField("executive_id", executive.id),
                           observability::IntField("candidates", static_cast<int64_t>(candidates.size()))});
        summary.set_conflicts_skipped(summary.conflicts_skipped() + 1);
        continue;
      }
      if (candidates.size() == 1) {
        canonical = repo_.GetCanonicalPerson(tx_, tenant_id, *candidates.begin());
      }
    }

    if (canonical) {
      summary.set_matched(summary.matched() + 1);
    } else {
      db::model::CanonicalPersonRecord created;
      created.id                   = util::NewId();
      created.tenant_id            = tenant_id;
      created.canonical_full_name  = name.empty() ? util::CollapseWhitespace(executive.name_raw) : name;
      created.name_normalized      = name;
      created.primary_email        = email;
      created.primary_linkedin_url = linkedin;
      created.created_at_ms        = now_ms_;
      core::ThrowIfDbError(repo_.InsertCanonicalPerson(tx_, created), "insert canonical person");
      summary.set_created(summary.created() + 1);
      canonical = std::move(created);
    }

    Link(tenant_id, run_id, EntityKind::kPerson, canonical->id, executive.id, rule, evidence_id, summary);
  }

  RESEARCH_LOG_INFO("people resolved", {observability::StringField("run_id", run_id), observability::IntField("scanned", summary.scanned()),
                                        observability::IntField("created", summary.created()),
                                        observability::IntField("conflicts_skipped", summary.conflicts_skipped())});
  return summary;
}

} // namespace research::resolution
