#pragma once

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace research::acquisition {

struct FetchRequest {
  std::string url;
  uint32_t    timeout_seconds = 30;
  uint64_t    max_bytes       = 2000000;
  std::string user_agent;
};

struct FetchResponse {
  long                                             status_code = 0;
  std::string                                      final_url;
  std::string                                      content_type;
  std::vector<std::pair<std::string, std::string>> headers; // final response only
  std::string                                      body;
  bool                                             truncated = false;
};

/*
  Blocking HTTP GET.

  Redirects are followed; the body is capped at max_bytes (truncated is then
  set). Transport failures (DNS, connect, timeout) throw std::runtime_error
  with the transport's message. HTTP error statuses are returned, not thrown.
*/
class HttpFetcher {
 public:
  virtual ~HttpFetcher() = default;

  virtual FetchResponse Get(const FetchRequest& request) = 0;
};

} // namespace research::acquisition
