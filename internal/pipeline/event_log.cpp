#include "event_log.hpp"

#include "internal/core/db_error.hpp"
#include "internal/util/json.hpp"
#include "internal/util/time.hpp"
#include "internal/util/uuid.hpp"

namespace research::pipeline {

void AppendEvent(db::Repository& repo, db::Transaction& tx, const std::string& tenant_id, const std::string& run_id, std::string_view event_type,
                 research::model::EventStatus status, const research::v1::EventDetail& detail, const std::string& output_json,
                 const std::string& error_message) {
  db::model::EventRecord event;
  event.id            = util::NewId();
  event.tenant_id     = tenant_id;
  event.run_id        = run_id;
  event.event_type    = std::string(event_type);
  event.status        = status;
  event.input_json    = util::ToJson(detail);
  event.output_json   = output_json;
  event.error_message = error_message;
  event.created_at_ms = util::NowMillis();

  core::ThrowIfDbError(repo.InsertEvent(tx, event), "append event " + event.event_type);
}

} // namespace research::pipeline
