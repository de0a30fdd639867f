#include "url_canonicalizer.hpp"

#include <cctype>

#include "internal/util/errors.hpp"
#include "internal/util/text.hpp"

namespace research::acquisition {

namespace {

bool IsHostChar(char c) {
  const auto uc = static_cast<unsigned char>(c);
  return std::isalnum(uc) != 0 || c == '-' || c == '.' || c == '_';
}

bool IsValidHost(std::string_view host) {
  if (host.empty()) return false;
  if (host.front() == '[') {
    return host.size() > 2 && host.back() == ']';
  }
  for (char c : host) {
    if (!IsHostChar(c)) return false;
  }
  return host.find_first_not_of('.') != std::string_view::npos;
}

std::string NormalizePath(std::string_view raw_path) {
  std::string path;
  path.reserve(raw_path.size() + 1);
  for (char c : raw_path) {
    if (c == '/' && !path.empty() && path.back() == '/') continue;
    path.push_back(c);
  }
  if (path.empty() || path.front() != '/') path.insert(path.begin(), '/');
  while (path.size() > 1 && path.back() == '/')
    path.pop_back();
  return path;
}

} // namespace

std::string CanonicalizeUrl(std::string_view raw_url, std::string_view default_scheme) {
  const auto text = util::Trim(raw_url);
  if (text.empty()) {
    throw util::InvalidArgument("empty_url");
  }

  std::string      scheme;
  std::string_view rest = text;
  if (const auto pos = rest.find("://"); pos != std::string_view::npos) {
    scheme = util::ToLower(rest.substr(0, pos));
    rest   = rest.substr(pos + 3);
  } else if (util::StartsWith(rest, "//")) {
    rest = rest.substr(2);
  }
  if (scheme.empty()) scheme = util::ToLower(default_scheme);

  const auto authority_end = rest.find_first_of("/?#");
  auto       authority     = rest.substr(0, authority_end);
  auto       remainder     = authority_end == std::string_view::npos ? std::string_view{} : rest.substr(authority_end);

  if (const auto at = authority.rfind('@'); at != std::string_view::npos) {
    authority = authority.substr(at + 1);
  }

  std::string_view host = authority;
  std::string_view port;
  if (!authority.empty() && authority.front() == '[') {
    const auto close = authority.find(']');
    if (close == std::string_view::npos) throw util::InvalidArgument("invalid_host");
    host = authority.substr(0, close + 1);
    if (close + 1 < authority.size()) {
      if (authority[close + 1] != ':') throw util::InvalidArgument("invalid_host");
      port = authority.substr(close + 2);
    }
  } else if (const auto colon = authority.rfind(':'); colon != std::string_view::npos) {
    host = authority.substr(0, colon);
    port = authority.substr(colon + 1);
  }

  auto host_lower = util::ToLower(host);
  if (!IsValidHost(host_lower)) {
    throw util::InvalidArgument("invalid_host");
  }

  std::string netloc = host_lower;
  if (!port.empty()) {
    for (char c : port) {
      if (!std::isdigit(static_cast<unsigned char>(c))) throw util::InvalidArgument("invalid_host");
    }
    const bool default_port = (scheme == "http" && port == "80") || (scheme == "https" && port == "443");
    if (!default_port) netloc += ":" + std::string(port);
  }

  const auto path_end = remainder.find_first_of("?#");
  const auto path     = NormalizePath(remainder.substr(0, path_end));

  return scheme + "://" + netloc + path;
}

} // namespace research::acquisition
