#include <algorithm>
#include <string>
#include <vector>

#include "internal/core/db_error.hpp"
#include "internal/discovery/company_list_parser.hpp"
#include "internal/discovery/proposal_parser.hpp"
#include "internal/discovery/prospect_writer.hpp"
#include "internal/observability/logging.hpp"
#include "internal/quality/dedup_detector.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/hash.hpp"
#include "internal/util/text.hpp"
#include "step_handlers.hpp"

namespace research::pipeline {

using research::model::EventStatus;
using research::model::SourceStatus;
using research::model::SourceType;

namespace {

void SaveSource(StepContext& ctx, db::model::SourceDocumentRecord& doc) {
  doc.updated_at_ms = ctx.now_ms;
  core::ThrowIfDbError(ctx.repo.UpdateSource(ctx.tx, doc), "update source " + doc.id);
}

void AddOutcome(research::v1::DiscoverySummary* summary, const db::model::SourceDocumentRecord& doc, const std::string& outcome,
                const std::string& error = {}) {
  auto* entry = summary->add_details();
  entry->set_source_id(doc.id);
  entry->set_outcome(outcome);
  entry->set_error(error);
  entry->set_attempt(doc.attempt_count);
}

void Accumulate(research::v1::DiscoverySummary* summary, const discovery::DiscoveryCounts& counts) {
  summary->set_prospects_created(summary->prospects_created() + counts.prospects_created);
  summary->set_prospects_matched(summary->prospects_matched() + counts.prospects_matched);
  summary->set_evidence_created(summary->evidence_created() + counts.evidence_created);
  summary->set_executives_created(summary->executives_created() + counts.executives_created);
}

void MarkProcessed(StepContext& ctx, db::model::SourceDocumentRecord& doc, const discovery::DiscoveryCounts& counts,
                   const std::string& skipped_reason = {}) {
  auto* processing = doc.meta.mutable_processing();
  processing->set_processed_at_ms(static_cast<int64_t>(ctx.now_ms));
  processing->set_prospects_created(counts.prospects_created);
  processing->set_prospects_matched(counts.prospects_matched);
  processing->set_evidence_created(counts.evidence_created);
  processing->set_skipped_reason(skipped_reason);
  doc.status = SourceStatus::kProcessed;
  SaveSource(ctx, doc);
}

// Reason a classified document takes no part in discovery, empty when it does.
std::string DiscoverySkipReason(const db::model::SourceDocumentRecord& doc) {
  const auto& extraction = doc.meta.extraction();
  if (extraction.quality_flags().is_duplicate_template()) return "duplicate_template";
  switch (extraction.decision()) {
    case research::v1::QUALITY_DECISION_ACCEPT:
    case research::v1::QUALITY_DECISION_FLAG:
      return {};
    case research::v1::QUALITY_DECISION_REJECT:
      return "rejected";
    default:
      return "not_classified";
  }
}

bool AlreadyHandled(const db::model::SourceDocumentRecord& doc) {
  return doc.status == SourceStatus::kProcessed || doc.status == SourceStatus::kFailed;
}

StepResult SkippedFor(std::string reason) {
  StepResult result;
  result.disposition = StepDisposition::kSkipped;
  result.output.mutable_discovery();
  result.output.set_skipped_reason(std::move(reason));
  return result;
}

} // namespace

// ------------------------------------------------------------
// classify_sources
// ------------------------------------------------------------

StepResult ClassifySources(StepContext& ctx) {
  ctx.CheckCancelled();

  auto sources = ctx.repo.ListSources(ctx.tx, ctx.run.tenant_id, ctx.run.id);
  auto dedup   = quality::DetectTemplateDuplicates(sources);

  for (auto index : dedup.changed) {
    SaveSource(ctx, sources[index]);
  }

  RESEARCH_LOG_INFO("template dedup finished", {observability::StringField("run_id", ctx.run.id),
                                                observability::IntField("count", dedup.summary.count()),
                                                observability::IntField("duplicates", dedup.summary.duplicates()),
                                                observability::IntField("updated", dedup.summary.updated())});

  StepResult result;
  *result.output.mutable_classify() = dedup.summary;
  return result;
}

// ------------------------------------------------------------
// process_sources
// ------------------------------------------------------------

StepResult ProcessSources(StepContext& ctx) {
  StepResult result;
  auto*      summary = result.output.mutable_discovery();

  discovery::ProspectWriter writer(ctx.repo, ctx.tx, ctx.now_ms);

  auto sources = ctx.repo.ListSources(ctx.tx, ctx.run.tenant_id, ctx.run.id);
  for (auto& doc : sources) {
    if (doc.source_type != SourceType::kUrl && doc.source_type != SourceType::kText && doc.source_type != SourceType::kPdf) continue;
    if (AlreadyHandled(doc) || !doc.canonical_source_id.empty() || doc.content_text.empty()) continue;

    ctx.CheckCancelled();

    const auto skip_reason = DiscoverySkipReason(doc);
    if (!skip_reason.empty()) {
      summary->set_sources_skipped(summary->sources_skipped() + 1);
      MarkProcessed(ctx, doc, {}, skip_reason);
      AddOutcome(summary, doc, skip_reason);
      continue;
    }

    discovery::DiscoveryCounts counts;
    for (const auto& mention : discovery::ExtractCompanyNames(doc.content_text)) {
      writer.RecordMention(doc, mention, counts);
    }
    Accumulate(summary, counts);
    summary->set_sources_processed(summary->sources_processed() + 1);
    MarkProcessed(ctx, doc, counts);
    AddOutcome(summary, doc, "processed");

    RESEARCH_LOG_INFO("source processed", {observability::StringField("source_id", doc.id), observability::StringField("run_id", ctx.run.id),
                                           observability::IntField("prospects_created", counts.prospects_created),
                                           observability::IntField("prospects_matched", counts.prospects_matched)});
  }
  return result;
}

// ------------------------------------------------------------
// ingest_lists
// ------------------------------------------------------------

StepResult IngestLists(StepContext& ctx) {
  auto       sources   = ctx.repo.ListSources(ctx.tx, ctx.run.tenant_id, ctx.run.id);
  const bool any_lists = std::any_of(sources.begin(), sources.end(), [](const auto& doc) { return doc.source_type == SourceType::kList; });
  if (!any_lists) {
    return SkippedFor("no_list_sources");
  }

  StepResult result;
  auto*      summary = result.output.mutable_discovery();

  discovery::ProspectWriter writer(ctx.repo, ctx.tx, ctx.now_ms);

  for (auto& doc : sources) {
    if (doc.source_type != SourceType::kList || AlreadyHandled(doc)) continue;

    ctx.CheckCancelled();

    auto text = util::NormalizeLineEndings(doc.content_text);
    if (util::Trim(text).empty()) {
      doc.status     = SourceStatus::kFailed;
      doc.last_error = "empty list";
      summary->set_sources_failed(summary->sources_failed() + 1);

      research::v1::EventDetail detail;
      detail.set_source_id(doc.id);
      ctx.Event("list_invalid", EventStatus::kFailed, detail, doc.last_error);
      SaveSource(ctx, doc);
      AddOutcome(summary, doc, "failed", doc.last_error);
      continue;
    }
    if (doc.content_hash.empty()) {
      doc.content_hash = util::Sha256Hex(text);
    }

    discovery::DiscoveryCounts counts;
    for (const auto& mention : discovery::ExtractCompanyNames(text)) {
      writer.RecordMention(doc, mention, counts);
    }
    Accumulate(summary, counts);
    summary->set_sources_processed(summary->sources_processed() + 1);
    MarkProcessed(ctx, doc, counts);
    AddOutcome(summary, doc, "processed");
  }
  return result;
}

// ------------------------------------------------------------
// ingest_proposal
// ------------------------------------------------------------

StepResult IngestProposal(StepContext& ctx) {
  auto       sources       = ctx.repo.ListSources(ctx.tx, ctx.run.tenant_id, ctx.run.id);
  const bool any_proposals = std::any_of(sources.begin(), sources.end(), [](const auto& doc) { return doc.source_type == SourceType::kProposal; });
  if (!any_proposals) {
    return SkippedFor("no_proposal_sources");
  }

  StepResult result;
  auto*      summary = result.output.mutable_discovery();

  discovery::ProspectWriter writer(ctx.repo, ctx.tx, ctx.now_ms);

  for (auto& doc : sources) {
    if (doc.source_type != SourceType::kProposal || AlreadyHandled(doc)) continue;

    ctx.CheckCancelled();

    research::v1::Proposal proposal;
    try {
      proposal = discovery::ParseProposal(doc.content_text);
    } catch (const util::InvalidArgument& e) {
      doc.status = SourceStatus::kFailed;
      doc.attempt_count += 1;
      doc.last_error = e.what();
      summary->set_sources_failed(summary->sources_failed() + 1);

      research::v1::EventDetail detail;
      detail.set_source_id(doc.id);
      ctx.Event("proposal_invalid", EventStatus::kFailed, detail, e.what());
      SaveSource(ctx, doc);
      AddOutcome(summary, doc, "failed", e.what());
      RESEARCH_LOG_WARN("proposal rejected", {observability::StringField("source_id", doc.id), observability::StringField("error", e.what())});
      continue;
    }

    if (doc.content_hash.empty()) {
      doc.content_hash = util::Sha256Hex(doc.content_text);
    }
    if (doc.title.empty()) {
      doc.title = proposal.query();
    }

    discovery::DiscoveryCounts counts;
    for (const auto& company : proposal.companies()) {
      const auto prospect_id = writer.RecordProposalCompany(doc, company, counts);
      for (const auto& executive : company.executives()) {
        writer.RecordProposalExecutive(doc, prospect_id, executive, counts);
      }
    }
    Accumulate(summary, counts);
    summary->set_sources_processed(summary->sources_processed() + 1);
    MarkProcessed(ctx, doc, counts);
    AddOutcome(summary, doc, "processed");
  }
  return result;
}

} // namespace research::pipeline
