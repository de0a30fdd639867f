#pragma once

#include <cstdint>
#include <string>

#include "internal/model/state_machine.hpp"
#include "research/v1/source_meta.pb.h"

namespace research::db::model {

/*
  Evidence store document.

  meta is typed; backends persist it as protobuf JSON and reject unknown
  fields when loading it back.
*/
struct SourceDocumentRecord {
  std::string id;
  std::string tenant_id;
  std::string run_id;

  research::model::SourceType   source_type = research::model::SourceType::kUrl;
  research::model::SourceStatus status      = research::model::SourceStatus::kNew;

  std::string title;
  std::string url;
  std::string content_text;
  std::string content_bytes; // raw upload (pdf)
  std::string mime_type;
  std::string content_hash;

  uint32_t    attempt_count    = 0;
  uint32_t    max_attempts     = 0;
  uint64_t    next_retry_at_ms = 0;
  std::string last_error;

  std::string canonical_source_id;

  research::v1::SourceMeta meta;

  uint64_t created_at_ms = 0;
  uint64_t updated_at_ms = 0;
};

} // namespace research::db::model
