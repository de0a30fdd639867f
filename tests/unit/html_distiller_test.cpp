#include "internal/acquisition/html_distiller.hpp"

#include <algorithm>
#include <cassert>
#include <iostream>
#include <string>

namespace {

using research::acquisition::DistillHtml;
using research::acquisition::IsNoiseCandidate;

bool Has(const std::vector<std::string>& values, const std::string& value) {
  return std::find(values.begin(), values.end(), value) != values.end();
}

void TestTableAndListCandidates() {
  const std::string html = R"(<html><head><title>Top Robotics Firms</title></head><body>
<nav><ul><li>Home</li><li>Careers Portal</li></ul></nav>
<table>
  <tr><th>Company</th><th>Country</th></tr>
  <tr><td>Acme Robotics</td><td>Germany</td></tr>
  <tr><td><b>Borealis</b> Systems GmbH</td><td>Austria</td></tr>
</table>
<ul>
  <li>Cobalt Analytics</li>
  <li>$120M</li>
  <li>Subscribe</li>
</ul>
<footer><ul><li>Footer Holdings</li></ul></footer>
</body></html>)";

  const auto distilled = DistillHtml(html);
  assert(distilled.title == "Top Robotics Firms");
  assert(Has(distilled.candidates, "Acme Robotics"));
  assert(Has(distilled.candidates, "Borealis Systems GmbH"));
  assert(Has(distilled.candidates, "Cobalt Analytics"));
  assert(!Has(distilled.candidates, "$120M"));
  assert(!Has(distilled.candidates, "Subscribe"));
  assert(!Has(distilled.candidates, "Careers Portal"));
  assert(!Has(distilled.candidates, "Footer Holdings"));
  assert(distilled.text.find("Acme Robotics\n") != std::string::npos);
}

void TestOgTitlePreferred() {
  const std::string html =
      R"(<html><head><meta property="og:title" content=" Open Graph Title "><title>Plain</title></head>)"
      R"(<body><p>x</p></body></html>)";
  assert(DistillHtml(html).title == "Open Graph Title");
}

void TestFallbackToVisibleText() {
  const std::string html = R"(<html><body>
<script>var hidden = "Script Text";</script>
<p>First paragraph line.</p>
<div>Second   block</div>
</body></html>)";

  const auto distilled = DistillHtml(html);
  assert(distilled.candidates.empty());
  assert(distilled.text == "First paragraph line.\nSecond   block");
}

void TestNoiseCandidates() {
  assert(IsNoiseCandidate("ab"));
  assert(IsNoiseCandidate("12345"));
  assert(IsNoiseCandidate("Login"));
  assert(IsNoiseCandidate("Read more about us"));
  assert(IsNoiseCandidate("search-outline"));
  assert(IsNoiseCandidate("button_arrow_left"));
  assert(IsNoiseCandidate("Industry Week | Rankings"));
  assert(IsNoiseCandidate("Manufacturing Journal"));
  assert(IsNoiseCandidate("\xE2\x82\xAC" "45m"));
  assert(!IsNoiseCandidate("Acme Robotics"));
  assert(!IsNoiseCandidate("Borealis Systems GmbH"));
}

} // namespace

int main() {
  TestTableAndListCandidates();
  TestOgTitlePreferred();
  TestFallbackToVisibleText();
  TestNoiseCandidates();

  std::cout << "research_unit_html_distiller: pass\n";
  return 0;
}
