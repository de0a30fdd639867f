#pragma once

#include <vector>

#include "internal/db/model/source_record.hpp"
#include "research/v1/step_output.pb.h"

namespace research::quality {

struct DedupResult {
  research::v1::ClassifySummary summary;
  std::vector<size_t>           changed; // indexes into the input whose meta changed
};

/*
  Template duplicate detection over the documents of one run.

  Eligible documents carry an extraction of the current version with at least
  one word. They are grouped by signature_prefix_2k (text_hash when absent);
  in a group of two or more the document with the most words, then the
  lowest id, is the primary and every other member is flagged as a template
  duplicate. Groups are visited in key order so the result does not depend
  on input order.
*/
DedupResult DetectTemplateDuplicates(std::vector<db::model::SourceDocumentRecord>& docs);

} // namespace research::quality
