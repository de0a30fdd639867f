#pragma once

#include "http_fetcher.hpp"

namespace research::acquisition {

// libcurl easy-handle fetcher; one handle per request.
class CurlHttpFetcher final : public HttpFetcher {
 public:
  CurlHttpFetcher();

  FetchResponse Get(const FetchRequest& request) override;
};

} // namespace research::acquisition
