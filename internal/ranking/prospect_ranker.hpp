#pragma once

#include <optional>
#include <string>

#include "config/config.pb.h"
#include "internal/db/api/repository.hpp"
#include "research/v1/ranking.pb.h"

namespace research::ranking {

struct RankingFilters {
  std::optional<double> min_score;
  bool                  has_hq        = false;
  bool                  has_ownership = false;
  bool                  has_industry  = false;
};

// Half-away-from-zero rounding to 4 decimals.
double Round4(double value);

/*
  Explainable prospect ranking.

  Every prospect of the run is scored from its own scores, the enrichment
  assignments of its canonical company and its evidence coverage. Each
  component is rounded to 4 decimals before summing so the same inputs
  always print the same report. Ranks follow computed_score desc, then
  prospect id asc, and are assigned before filters are applied.
*/
class ProspectRanker {
 public:
  ProspectRanker(db::Repository& repo, research::runtime::config::RankingConfig weights);

  research::v1::RankingReport Rank(db::Transaction& tx, const std::string& tenant_id, const std::string& run_id,
                                   const RankingFilters& filters = {});

 private:
  research::v1::RankedProspect Score(db::Transaction& tx, const db::model::ProspectRecord& prospect);

  db::Repository&                          repo_;
  research::runtime::config::RankingConfig weights_;
};

} // namespace research::ranking
