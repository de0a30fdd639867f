#pragma once

#include <string>
#include <string_view>

namespace research::acquisition {

/*
  Deterministic URL form used for fetching and deduping.

  Rules:
    - default scheme when none is given
    - lower-case scheme and host, userinfo dropped
    - default ports (80 for http, 443 for https) dropped
    - query and fragment dropped
    - repeated slashes collapsed, trailing slash removed except for "/"

  Throws util::InvalidArgument("empty_url") or ("invalid_host").
*/
std::string CanonicalizeUrl(std::string_view raw_url, std::string_view default_scheme = "http");

} // namespace research::acquisition
