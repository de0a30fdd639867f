#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace research::acquisition {

struct DistilledHtml {
  std::string              title;
  std::string              text;       // newline separated
  std::vector<std::string> candidates; // structured candidates kept, empty on fallback
};

/*
  Structural HTML distillation for company-list pages.

  Chrome (script, style, nav, footer, header, aside, button, navigation-like
  class/id/role) is removed. Candidates are taken from the first cell of
  table rows, then ul and ol items, filtered for UI noise and capped at 200.
  Without candidates the visible text is returned line by line.
*/
DistilledHtml DistillHtml(std::string_view html);

// Candidate filter shared with tests; true when the string cannot be a name.
bool IsNoiseCandidate(std::string_view candidate);

} // namespace research::acquisition
