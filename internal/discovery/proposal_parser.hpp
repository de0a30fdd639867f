#pragma once

#include <string>

#include "research/v1/proposal.pb.h"

namespace research::discovery {

/*
  Parses and validates an already-produced proposal document.

  Unknown JSON fields are ignored. Throws util::InvalidArgument naming the
  first violated rule:
    - query must be non-empty
    - at least one company, each with a name
    - hq_country, when set, is two upper-case letters
    - website_url, when set, starts with http:// or https://
    - ai_score, when set, lies in [0, 1]
*/
research::v1::Proposal ParseProposal(const std::string& json);

void ValidateProposal(const research::v1::Proposal& proposal);

} // namespace research::discovery
