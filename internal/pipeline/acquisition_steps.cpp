#include <algorithm>
#include <optional>
#include <vector>

#include "internal/core/db_error.hpp"
#include "internal/observability/logging.hpp"
#include "internal/quality/quality_classifier.hpp"
#include "internal/util/time.hpp"
#include "retry_policy.hpp"
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

research::v1::EventDetail SourceDetail(const db::model::SourceDocumentRecord& doc, const std::string& message = {}) {
  research::v1::EventDetail detail;
  detail.set_source_id(doc.id);
  detail.set_message(message);
  return detail;
}

void AddOutcome(google::protobuf::RepeatedPtrField<research::v1::SourceOutcome>* details, const db::model::SourceDocumentRecord& doc,
                const std::string& outcome, const std::string& error = {}) {
  auto* entry = details->Add();
  entry->set_source_id(doc.id);
  entry->set_outcome(outcome);
  entry->set_error(error);
  entry->set_attempt(doc.attempt_count);
}

bool DueForFetch(const db::model::SourceDocumentRecord& doc, uint64_t now_ms) {
  switch (doc.status) {
    case SourceStatus::kNew:
    case SourceStatus::kQueued:
    case SourceStatus::kFetching:
      return true;
    case SourceStatus::kFetchFailed:
      return doc.next_retry_at_ms <= now_ms && doc.attempt_count < doc.max_attempts;
    default:
      return false;
  }
}

// Earliest document of the run with the same content, when it is not doc itself.
const db::model::SourceDocumentRecord* EarlierCopy(const std::vector<db::model::SourceDocumentRecord>& sources,
                                                   const db::model::SourceDocumentRecord& doc) {
  for (const auto& other : sources) {
    if (other.content_hash.empty() || other.content_hash != doc.content_hash) continue;
    if (other.id == doc.id) return nullptr;
    return &other;
  }
  return nullptr;
}

// Uploaded text or pdf document that has not been turned into text yet.
bool NeedsText(const db::model::SourceDocumentRecord& doc) {
  if (doc.source_type != SourceType::kText && doc.source_type != SourceType::kPdf) return false;
  return doc.status == SourceStatus::kNew || doc.status == SourceStatus::kQueued;
}

bool Extractable(SourceType type) {
  return type == SourceType::kUrl || type == SourceType::kText || type == SourceType::kPdf;
}

} // namespace

// ------------------------------------------------------------
// fetch_url_sources
// ------------------------------------------------------------

PreparedSources PrepareFetch(PrepareContext& ctx) {
  PreparedSources prepared;
  for (const auto& doc : ctx.ListSources()) {
    if (doc.source_type != SourceType::kUrl || !DueForFetch(doc, ctx.now_ms)) continue;

    ctx.CheckCancelled();
    PreparedSource entry{doc, std::nullopt, std::nullopt};
    try {
      entry.outcome = ctx.services.acquisition->FetchUrl(entry.doc, ctx.now_ms);
    } catch (const acquisition::AcquisitionError& e) {
      entry.error = e;
    }
    prepared.emplace(doc.id, std::move(entry));
  }
  return prepared;
}

StepResult FetchUrlSources(StepContext& ctx) {
  StepResult result;
  auto*      summary = result.output.mutable_fetch();

  auto sources = ctx.repo.ListSources(ctx.tx, ctx.run.tenant_id, ctx.run.id);
  const bool any_url = std::any_of(sources.begin(), sources.end(), [](const auto& doc) { return doc.source_type == SourceType::kUrl; });
  if (!any_url) {
    result.disposition = StepDisposition::kSkipped;
    result.output.set_skipped_reason("no_url_sources");
    return result;
  }

  const auto& worker        = ctx.services.worker;
  uint64_t    earliest_retry = 0;
  auto        note_retry     = [&earliest_retry](uint64_t at_ms) {
    if (earliest_retry == 0 || at_ms < earliest_retry) earliest_retry = at_ms;
  };

  for (auto& doc : sources) {
    if (doc.source_type != SourceType::kUrl) continue;

    if (!DueForFetch(doc, ctx.now_ms)) {
      if (doc.status == SourceStatus::kFetchFailed && doc.attempt_count < doc.max_attempts) {
        note_retry(doc.next_retry_at_ms);
      }
      continue;
    }

    // Not seen by the fetch pass; the next attempt fetches it.
    const auto found = ctx.prepared.find(doc.id);
    if (found == ctx.prepared.end()) {
      note_retry(ctx.now_ms);
      continue;
    }

    ctx.CheckCancelled();
    doc = found->second.doc;
    summary->set_processed(summary->processed() + 1);
    if (doc.max_attempts == 0) {
      doc.max_attempts = worker.source_max_attempts();
    }

    if (!found->second.error) {
      doc.status = SourceStatus::kFetched;
      doc.last_error.clear();
      doc.next_retry_at_ms = 0;

      if (found->second.outcome == acquisition::AcquisitionOutcome::kCached) {
        summary->set_cached(summary->cached() + 1);
        ctx.Event("fetch_cached", EventStatus::kOk, SourceDetail(doc));
        AddOutcome(summary->mutable_details(), doc, "cached");
      } else {
        summary->set_fetched(summary->fetched() + 1);
        ctx.Event("fetch_succeeded", EventStatus::kOk, SourceDetail(doc, doc.meta.fetch().canonical_url()));
        AddOutcome(summary->mutable_details(), doc, "fetched");
      }

      if (const auto* original = EarlierCopy(sources, doc)) {
        doc.canonical_source_id = original->id;
        doc.status              = SourceStatus::kProcessed;
        summary->set_deduplicated(summary->deduplicated() + 1);
        ctx.Event("canonical_dedupe", EventStatus::kOk, SourceDetail(doc, "same content as " + original->id));
        RESEARCH_LOG_INFO("source deduplicated", {observability::StringField("source_id", doc.id),
                                                  observability::StringField("canonical_source_id", original->id)});
      }
    } else {
      const auto& e = *found->second.error;
      doc.attempt_count += 1;
      doc.last_error = e.what();
      summary->set_failed(summary->failed() + 1);

      const bool exhausted = e.Terminal() || doc.attempt_count >= doc.max_attempts;
      ctx.Event("fetch_failed", exhausted ? EventStatus::kFailed : EventStatus::kWarn, SourceDetail(doc, e.Reason()), e.what());

      if (exhausted) {
        doc.status           = SourceStatus::kFailed;
        doc.next_retry_at_ms = 0;
        summary->set_terminal_failures(summary->terminal_failures() + 1);
        ctx.Event("retry_exhausted", EventStatus::kFailed, SourceDetail(doc, e.Reason()), e.what());
        AddOutcome(summary->mutable_details(), doc, "failed", e.what());
      } else {
        const auto backoff   = BackoffSeconds(worker.retry_base_seconds(), worker.retry_cap_seconds(), doc.attempt_count);
        doc.status           = SourceStatus::kFetchFailed;
        doc.next_retry_at_ms = util::MillisAfter(ctx.now_ms, backoff);
        note_retry(doc.next_retry_at_ms);
        summary->set_retry_scheduled(summary->retry_scheduled() + 1);
        ctx.Event("retry_scheduled", EventStatus::kWarn, SourceDetail(doc, e.Reason()), e.what());
        AddOutcome(summary->mutable_details(), doc, "retry_scheduled", e.what());
      }

      RESEARCH_LOG_WARN("source fetch failed", {observability::StringField("source_id", doc.id), observability::StringField("run_id", ctx.run.id),
                                                observability::IntField("attempt", doc.attempt_count), observability::BoolField("terminal", exhausted),
                                                observability::StringField("error", e.what())});
    }

    SaveSource(ctx, doc);
  }

  if (earliest_retry != 0) {
    const auto wait = std::max<uint64_t>(1, util::SecondsUntil(ctx.now_ms, earliest_retry));
    summary->set_next_retry_at_ms(static_cast<int64_t>(earliest_retry));
    summary->set_retry_backoff_seconds(static_cast<uint32_t>(wait));
    result.disposition         = StepDisposition::kRetry;
    result.retry_after_seconds = wait;
    result.message             = "url sources waiting for retry";
  }
  return result;
}

// ------------------------------------------------------------
// extract_url_sources
// ------------------------------------------------------------

PreparedSources PrepareExtract(PrepareContext& ctx) {
  PreparedSources prepared;
  for (const auto& doc : ctx.ListSources()) {
    if (!NeedsText(doc)) continue;

    ctx.CheckCancelled();
    PreparedSource entry{doc, std::nullopt, std::nullopt};
    try {
      if (doc.source_type == SourceType::kText) {
        entry.outcome = ctx.services.acquisition->LoadText(entry.doc);
      } else {
        entry.outcome = ctx.services.acquisition->ExtractPdf(entry.doc);
      }
    } catch (const acquisition::AcquisitionError& e) {
      entry.error = e;
    }
    prepared.emplace(doc.id, std::move(entry));
  }
  return prepared;
}

StepResult ExtractUrlSources(StepContext& ctx) {
  StepResult result;
  auto*      summary = result.output.mutable_extract();

  auto     sources = ctx.repo.ListSources(ctx.tx, ctx.run.tenant_id, ctx.run.id);
  uint32_t pending = 0;

  // Uploaded text and pdf documents become text first.
  for (auto& doc : sources) {
    if (!NeedsText(doc)) continue;

    const auto found = ctx.prepared.find(doc.id);
    if (found == ctx.prepared.end()) {
      pending += 1;
      continue;
    }

    ctx.CheckCancelled();
    doc = found->second.doc;
    if (!found->second.error) {
      doc.status = SourceStatus::kFetched;
      doc.last_error.clear();
    } else {
      const auto& e = *found->second.error;
      doc.status = SourceStatus::kFailed;
      doc.attempt_count += 1;
      doc.last_error = e.what();
      summary->set_failed(summary->failed() + 1);

      // Record the failure flag so the quality decision explains the document.
      quality::ClassifyInput input;
      input.source_type       = doc.source_type;
      input.mime_type         = doc.mime_type;
      input.title             = doc.title;
      input.material_hash     = quality::MaterialHash(doc);
      input.unextractable_pdf = e.Reason() == acquisition::kFlagUnextractablePdf;
      input.pdf_bytes_missing = e.Reason() == acquisition::kFlagPdfBytesMissing;
      *doc.meta.mutable_extraction() = quality::Classify(input, ctx.now_ms);

      ctx.Event("extract_failed", EventStatus::kFailed, SourceDetail(doc, e.Reason()), e.what());
      AddOutcome(summary->mutable_details(), doc, "failed", e.what());
      RESEARCH_LOG_WARN("source extraction failed", {observability::StringField("source_id", doc.id), observability::StringField("error", e.what())});
    }
    SaveSource(ctx, doc);
  }

  for (auto& doc : sources) {
    if (!Extractable(doc.source_type)) continue;
    if (doc.content_text.empty() || !doc.canonical_source_id.empty() || doc.status == SourceStatus::kFailed) continue;

    const auto material = quality::MaterialHash(doc);
    if (quality::IsCurrent(doc.meta.extraction(), material, doc.content_text)) {
      summary->set_skipped(summary->skipped() + 1);
      AddOutcome(summary->mutable_details(), doc, "already_extracted");
      continue;
    }

    ctx.CheckCancelled();
    quality::ClassifyInput input;
    input.source_type   = doc.source_type;
    input.mime_type     = doc.mime_type;
    input.title         = doc.title;
    input.text          = doc.content_text;
    input.material_hash = material;
    *doc.meta.mutable_extraction() = quality::Classify(input, ctx.now_ms);

    summary->set_processed(summary->processed() + 1);
    switch (doc.meta.extraction().decision()) {
      case research::v1::QUALITY_DECISION_ACCEPT:
        summary->set_accepted(summary->accepted() + 1);
        AddOutcome(summary->mutable_details(), doc, "accept");
        break;
      case research::v1::QUALITY_DECISION_FLAG:
        summary->set_flagged(summary->flagged() + 1);
        AddOutcome(summary->mutable_details(), doc, "flag");
        break;
      default:
        summary->set_rejected(summary->rejected() + 1);
        AddOutcome(summary->mutable_details(), doc, "reject");
        break;
    }
    SaveSource(ctx, doc);
  }

  if (pending > 0) {
    result.disposition         = StepDisposition::kRetry;
    result.retry_after_seconds = 1;
    result.message             = "sources waiting for extraction";
  }
  return result;
}

} // namespace research::pipeline
