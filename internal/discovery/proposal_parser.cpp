#include "proposal_parser.hpp"

#include <cctype>

#include "internal/util/errors.hpp"
#include "internal/util/json.hpp"
#include "internal/util/text.hpp"

namespace research::discovery {

namespace {

bool IsCountryCode(const std::string& code) {
  return code.size() == 2 && std::isupper(static_cast<unsigned char>(code[0])) && std::isupper(static_cast<unsigned char>(code[1]));
}

bool IsHttpUrl(const std::string& url) {
  return util::StartsWith(url, "http://") || util::StartsWith(url, "https://");
}

} // namespace

research::v1::Proposal ParseProposal(const std::string& json) {
  research::v1::Proposal proposal;
  util::FromJson(json, &proposal, /*ignore_unknown_fields=*/true);
  ValidateProposal(proposal);
  return proposal;
}

void ValidateProposal(const research::v1::Proposal& proposal) {
  if (util::Trim(proposal.query()).empty()) {
    throw util::InvalidArgument("proposal query is empty");
  }
  if (proposal.companies().empty()) {
    throw util::InvalidArgument("proposal has no companies");
  }

  for (int i = 0; i < proposal.companies_size(); ++i) {
    const auto& company = proposal.companies(i);
    const auto  where   = "companies[" + std::to_string(i) + "]";

    if (util::Trim(company.name()).empty()) {
      throw util::InvalidArgument(where + ".name is empty");
    }
    if (!company.hq_country().empty() && !IsCountryCode(company.hq_country())) {
      throw util::InvalidArgument(where + ".hq_country must be a 2-letter upper-case code");
    }
    if (!company.website_url().empty() && !IsHttpUrl(company.website_url())) {
      throw util::InvalidArgument(where + ".website_url must start with http:// or https://");
    }
    if (company.has_ai_score() && (company.ai_score() < 0.0 || company.ai_score() > 1.0)) {
      throw util::InvalidArgument(where + ".ai_score must be within [0, 1]");
    }
  }

  for (const auto& source : proposal.sources()) {
    if (!source.url().empty() && !IsHttpUrl(source.url())) {
      throw util::InvalidArgument("sources[" + source.temp_id() + "].url must start with http:// or https://");
    }
  }
}

} // namespace research::discovery
