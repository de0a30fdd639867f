#include "internal/enrichment/assignment_store.hpp"
#include "internal/enrichment/enrichment_extractor.hpp"
#include "internal/observability/logging.hpp"
#include "internal/ranking/prospect_ranker.hpp"
#include "internal/resolution/entity_resolver.hpp"
#include "pipeline_errors.hpp"
#include "step_handlers.hpp"

namespace research::pipeline {

namespace {

// Documents whose text must not feed enrichment.
bool UsableForEnrichment(const db::model::SourceDocumentRecord& doc) {
  if (doc.content_text.empty() || !doc.canonical_source_id.empty()) return false;
  if (doc.source_type == research::model::SourceType::kProposal) return false;
  const auto& extraction = doc.meta.extraction();
  if (extraction.decision() == research::v1::QUALITY_DECISION_REJECT) return false;
  return !extraction.quality_flags().is_duplicate_template();
}

research::v1::EnrichmentSummary EnrichCompanies(StepContext& ctx) {
  research::v1::EnrichmentSummary summary;
  enrichment::AssignmentStore     store(ctx.repo);

  for (const auto& prospect : ctx.repo.ListProspects(ctx.tx, ctx.run.tenant_id, ctx.run.id)) {
    auto link = ctx.repo.GetLink(ctx.tx, ctx.run.tenant_id, research::model::EntityKind::kCompany, prospect.id);
    if (!link) continue;

    ctx.CheckCancelled();
    summary.set_targets(summary.targets() + 1);

    for (const auto& evidence : ctx.repo.ListEvidence(ctx.tx, ctx.run.tenant_id, research::model::EvidenceSubject::kProspect, prospect.id)) {
      auto doc = ctx.repo.GetSource(ctx.tx, ctx.run.tenant_id, evidence.source_document_id);
      if (!doc || !UsableForEnrichment(*doc)) {
        summary.set_documents_skipped(summary.documents_skipped() + 1);
        continue;
      }
      summary.set_documents_scanned(summary.documents_scanned() + 1);

      for (const auto& fact : enrichment::ExtractEnrichmentFacts(doc->content_text)) {
        enrichment::AssignmentInput input;
        input.tenant_id           = ctx.run.tenant_id;
        input.target_entity_type  = std::string(enrichment::kTargetCompany);
        input.target_canonical_id = link->canonical_id;
        input.field_key           = fact.field_key;
        input.value               = fact.value;
        input.value_normalized    = fact.value_normalized;
        input.confidence          = fact.confidence;
        input.derived_by          = std::string(enrichment::kDerivedBy);
        input.source_document_id  = doc->id;
        input.input_scope_hash    = enrichment::InputScopeHash(doc->id, fact.field_key);

        store.Record(ctx.tx, input, ctx.now_ms);
        summary.set_assignments_written(summary.assignments_written() + 1);
      }
    }
  }
  return summary;
}

} // namespace

// ------------------------------------------------------------
// finalize
// ------------------------------------------------------------

StepResult Finalize(StepContext& ctx) {
  auto blockers = ctx.plans.Blockers(ctx.tx, ctx.run.tenant_id, ctx.run.id, research::model::StepKey::kFinalize);
  if (!blockers.empty()) {
    throw RunBlocked(std::move(blockers));
  }

  StepResult result;
  auto*      summary = result.output.mutable_finalize();

  resolution::EntityResolver resolver(ctx.repo, ctx.tx, ctx.now_ms);
  *summary->mutable_companies() = resolver.ResolveCompanies(ctx.run.tenant_id, ctx.run.id);
  ctx.CheckCancelled();
  *summary->mutable_people() = resolver.ResolvePeople(ctx.run.tenant_id, ctx.run.id);

  *summary->mutable_enrichment() = EnrichCompanies(ctx);

  ranking::ProspectRanker ranker(ctx.repo, ctx.services.ranking);
  const auto              report = ranker.Rank(ctx.tx, ctx.run.tenant_id, ctx.run.id);
  summary->set_ranked_prospects(static_cast<uint32_t>(report.prospects_size()));
  if (report.prospects_size() > 0) {
    summary->set_top_score(report.prospects(0).computed_score());
  }

  RESEARCH_LOG_INFO("run finalized", {observability::StringField("run_id", ctx.run.id),
                                      observability::IntField("companies_linked", summary->companies().links_created()),
                                      observability::IntField("people_linked", summary->people().links_created()),
                                      observability::IntField("assignments", summary->enrichment().assignments_written()),
                                      observability::IntField("ranked", summary->ranked_prospects())});
  return result;
}

} // namespace research::pipeline
