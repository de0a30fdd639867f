#include "html_distiller.hpp"

#include <gumbo.h>

#include <array>
#include <cctype>
#include <memory>
#include <stdexcept>

#include "internal/util/text.hpp"

namespace research::acquisition {

namespace {

constexpr size_t kMaxCandidateChars = 150;
constexpr size_t kMaxCandidates     = 200;

constexpr std::array<std::string_view, 9> kChromeMarkers = {
    "nav", "menu", "sidebar", "widget", "social", "share", "comment", "ad", "banner",
};

constexpr std::array<std::string_view, 63> kNavigationPhrases = {
    "home",     "about",     "contact",   "search",     "login",     "logout",  "sign in",  "sign up",   "subscribe",
    "menu",     "close",     "open",      "skip to",    "read more", "learn more", "click here", "view all", "see all",
    "show more", "author:",  "published:", "facebook",  "twitter",   "linkedin", "instagram", "youtube",  "social",
    "share",    "email",     "print",     "download",   "newsletter", "rss",     "previous", "next",      "back",
    "forward",  "arrow",     "button",    "icon",       "caret",     "chevron", "hamburger", "pause",    "play",
    "stop",     "mute",      "copyright", "\xC2\xA9",   "privacy",   "terms",   "cookie",   "sitemap",   "all rights reserved",
    "awards",   "winners",   "articles",  "news",       "digital",   "magazine", "related", "content",   "submit",
};

constexpr std::array<std::string_view, 33> kUiWords = {
    "pause",    "play",   "stop",   "mute",     "search",    "close",  "open",   "menu",     "home",
    "back",     "next",   "skip",   "more",     "less",      "submit", "cancel", "twitter",  "facebook",
    "linkedin", "youtube", "instagram", "subscribe", "login", "logout", "register", "signin", "signup",
    "print",    "download", "share", "email",   "follow",    "unfollow",
};

constexpr std::array<std::string_view, 5> kPublicationSuffixes = {" Magazine", " Journal", " News", " Times", " Post"};

using GumboOutputPtr = std::unique_ptr<GumboOutput, void (*)(GumboOutput*)>;

GumboOutputPtr Parse(std::string_view html) {
  auto* output = gumbo_parse_with_options(&kGumboDefaultOptions, html.data(), html.size());
  if (!output) {
    throw std::runtime_error("html parse failed");
  }
  return GumboOutputPtr(output, [](GumboOutput* o) { gumbo_destroy_output(&kGumboDefaultOptions, o); });
}

std::string Attribute(const GumboNode* node, const char* name) {
  if (node->type != GUMBO_NODE_ELEMENT) return {};
  const auto* attr = gumbo_get_attribute(&node->v.element.attributes, name);
  return attr ? std::string(attr->value) : std::string{};
}

bool ContainsAny(std::string_view value, std::initializer_list<std::string_view> markers) {
  for (auto marker : markers) {
    if (util::Contains(value, marker)) return true;
  }
  return false;
}

bool IsChrome(const GumboNode* node) {
  if (node->type != GUMBO_NODE_ELEMENT) return false;

  switch (node->v.element.tag) {
    case GUMBO_TAG_SCRIPT:
    case GUMBO_TAG_STYLE:
    case GUMBO_TAG_NAV:
    case GUMBO_TAG_FOOTER:
    case GUMBO_TAG_HEADER:
    case GUMBO_TAG_ASIDE:
    case GUMBO_TAG_BUTTON:
      return true;
    default:
      break;
  }

  const auto role = util::ToLower(Attribute(node, "role"));
  if (role == "navigation" || role == "complementary") return true;

  const auto cls = util::ToLower(Attribute(node, "class"));
  const auto id  = util::ToLower(Attribute(node, "id"));
  for (auto marker : kChromeMarkers) {
    if (util::Contains(cls, marker) || util::Contains(id, marker)) return true;
  }
  return false;
}

bool HasTag(const GumboNode* node, GumboTag tag) {
  return node->type == GUMBO_NODE_ELEMENT && node->v.element.tag == tag;
}

template <typename Visit>
void Walk(const GumboNode* node, const Visit& visit) {
  if (IsChrome(node)) return;
  if (!visit(node)) return;
  if (node->type != GUMBO_NODE_ELEMENT && node->type != GUMBO_NODE_DOCUMENT) return;

  const GumboVector& children = node->type == GUMBO_NODE_DOCUMENT ? node->v.document.children : node->v.element.children;
  for (unsigned int i = 0; i < children.length; ++i) {
    Walk(static_cast<const GumboNode*>(children.data[i]), visit);
  }
}

void CollectText(const GumboNode* node, std::vector<std::string>* pieces) {
  Walk(node, [pieces](const GumboNode* n) {
    if (n->type == GUMBO_NODE_TEXT || n->type == GUMBO_NODE_CDATA) {
      auto piece = util::Trim(n->v.text.text);
      if (!piece.empty()) pieces->push_back(std::move(piece));
    }
    return true;
  });
}

// Visible text of an element with stripped pieces joined by single spaces.
std::string ElementText(const GumboNode* node) {
  std::vector<std::string> pieces;
  CollectText(node, &pieces);
  return util::CollapseWhitespace(util::Join(pieces, " "));
}

std::vector<const GumboNode*> FindAll(const GumboNode* root, GumboTag tag) {
  std::vector<const GumboNode*> found;
  Walk(root, [&found, root, tag](const GumboNode* n) {
    if (n != root && HasTag(n, tag)) found.push_back(n);
    return true;
  });
  return found;
}

std::vector<const GumboNode*> DirectChildren(const GumboNode* node, GumboTag tag) {
  std::vector<const GumboNode*> found;
  const auto&                   children = node->v.element.children;
  for (unsigned int i = 0; i < children.length; ++i) {
    const auto* child = static_cast<const GumboNode*>(children.data[i]);
    if (HasTag(child, tag) && !IsChrome(child)) found.push_back(child);
  }
  return found;
}

void AddCandidate(std::string text, std::vector<std::string>* candidates) {
  if (!text.empty() && util::Utf8Length(text) <= kMaxCandidateChars) {
    candidates->push_back(std::move(text));
  }
}

std::vector<std::string> StructuredCandidates(const GumboNode* root) {
  std::vector<std::string> candidates;

  for (const auto* table : FindAll(root, GUMBO_TAG_TABLE)) {
    const auto cls = util::ToLower(Attribute(table, "class"));
    if (ContainsAny(cls, {"nav", "menu", "widget", "sidebar"})) continue;

    for (const auto* row : FindAll(table, GUMBO_TAG_TR)) {
      const GumboNode* first_cell = nullptr;
      Walk(row, [&first_cell, row](const GumboNode* n) {
        if (first_cell) return false;
        if (n != row && (HasTag(n, GUMBO_TAG_TD) || HasTag(n, GUMBO_TAG_TH))) {
          first_cell = n;
          return false;
        }
        return true;
      });
      if (first_cell) AddCandidate(ElementText(first_cell), &candidates);
    }
  }

  for (const auto* list : FindAll(root, GUMBO_TAG_UL)) {
    const auto cls = util::ToLower(Attribute(list, "class"));
    const auto id  = util::ToLower(Attribute(list, "id"));
    if (ContainsAny(cls, {"nav", "menu", "social", "share", "widget", "sidebar"}) ||
        ContainsAny(id, {"nav", "menu", "social", "share", "widget", "sidebar"})) {
      continue;
    }
    for (const auto* item : DirectChildren(list, GUMBO_TAG_LI)) {
      AddCandidate(ElementText(item), &candidates);
    }
  }

  for (const auto* list : FindAll(root, GUMBO_TAG_OL)) {
    const auto cls = util::ToLower(Attribute(list, "class"));
    if (ContainsAny(cls, {"nav", "menu", "sidebar"})) continue;
    for (const auto* item : DirectChildren(list, GUMBO_TAG_LI)) {
      AddCandidate(ElementText(item), &candidates);
    }
  }

  return candidates;
}

std::string Title(const GumboNode* root) {
  std::string title;
  Walk(root, [&title](const GumboNode* n) {
    if (!title.empty()) return false;
    if (HasTag(n, GUMBO_TAG_META)) {
      const auto property = util::ToLower(Attribute(n, "property"));
      const auto name     = util::ToLower(Attribute(n, "name"));
      if (property == "og:title" || name == "og:title") title = util::Trim(Attribute(n, "content"));
    }
    return true;
  });
  if (!title.empty()) return title;

  for (auto tag : {GUMBO_TAG_TITLE, GUMBO_TAG_H1}) {
    const auto nodes = FindAll(root, tag);
    if (!nodes.empty()) {
      title = ElementText(nodes.front());
      if (!title.empty()) return title;
    }
  }
  return {};
}

// search-outline, button_arrow_left: lower-case identifiers joined by - or _.
bool IsIconName(std::string_view s) {
  size_t pos = 0;
  while (pos < s.size() && std::islower(static_cast<unsigned char>(s[pos])))
    ++pos;
  if (pos == 0 || pos >= s.size() || (s[pos] != '-' && s[pos] != '_')) return false;
  for (char c : s) {
    if (std::isupper(static_cast<unsigned char>(c)) || c == ' ') return false;
  }
  return pos + 1 < s.size() && std::islower(static_cast<unsigned char>(s[pos + 1]));
}

} // namespace

bool IsNoiseCandidate(std::string_view candidate) {
  if (util::Utf8Length(candidate) < 3 || !util::HasLetter(candidate)) return true;

  const auto lower    = util::ToLower(candidate);
  const bool one_word = candidate.find(' ') == std::string_view::npos;

  if (one_word) {
    for (auto word : kUiWords) {
      if (lower == word) return true;
    }
  }
  for (auto phrase : kNavigationPhrases) {
    if (util::Contains(lower, phrase)) return true;
  }
  if (IsIconName(candidate)) return true;
  if (util::IsFinancialValue(candidate)) return true;

  if (util::Contains(candidate, " | ")) return true;
  for (auto suffix : kPublicationSuffixes) {
    if (util::EndsWith(candidate, suffix)) return true;
  }
  return false;
}

DistilledHtml DistillHtml(std::string_view html) {
  auto        output = Parse(html);
  const auto* root   = output->root;

  DistilledHtml result;
  result.title = Title(output->document);

  for (auto& candidate : StructuredCandidates(root)) {
    if (IsNoiseCandidate(candidate)) continue;
    result.candidates.push_back(std::move(candidate));
    if (result.candidates.size() == kMaxCandidates) break;
  }

  if (!result.candidates.empty()) {
    result.text = util::Join(result.candidates, "\n");
    return result;
  }

  std::vector<std::string> lines;
  Walk(output->document, [&lines](const GumboNode* n) {
    if (n->type == GUMBO_NODE_TEXT || n->type == GUMBO_NODE_CDATA) {
      for (const auto& line : util::SplitLines(n->v.text.text)) {
        auto stripped = util::Trim(line);
        if (!stripped.empty()) lines.push_back(std::move(stripped));
      }
    }
    return true;
  });
  result.text = util::Join(lines, "\n");
  return result;
}

} // namespace research::acquisition
