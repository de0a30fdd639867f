#pragma once

#include <string>
#include <string_view>

#include "internal/db/api/repository.hpp"
#include "research/v1/step_output.pb.h"

namespace research::pipeline {

/*
  Appends one audit event inside the caller's transaction.

  input_json is the EventDetail printed as protobuf JSON; output_json is
  usually a StepOutput. A failed insert throws, so an event is never lost
  while the state change it describes commits.
*/
void AppendEvent(db::Repository& repo, db::Transaction& tx, const std::string& tenant_id, const std::string& run_id, std::string_view event_type,
                 research::model::EventStatus status, const research::v1::EventDetail& detail, const std::string& output_json = {},
                 const std::string& error_message = {});

} // namespace research::pipeline
