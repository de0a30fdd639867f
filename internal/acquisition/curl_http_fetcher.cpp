#include "curl_http_fetcher.hpp"

#include <curl/curl.h>

#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>

#include "internal/util/text.hpp"

namespace research::acquisition {

namespace {

struct TransferState {
  FetchResponse* response  = nullptr;
  uint64_t       max_bytes = 0;
};

size_t OnBody(char* data, size_t size, size_t count, void* user) {
  auto*        state = static_cast<TransferState*>(user);
  const size_t bytes = size * count;
  auto&        body  = state->response->body;

  if (body.size() + bytes > state->max_bytes) {
    body.append(data, state->max_bytes - body.size());
    state->response->truncated = true;
    return 0; // aborts the transfer with CURLE_WRITE_ERROR
  }
  body.append(data, bytes);
  return bytes;
}

size_t OnHeader(char* data, size_t size, size_t count, void* user) {
  auto*        state = static_cast<TransferState*>(user);
  const size_t bytes = size * count;
  const auto   line  = util::Trim(std::string_view(data, bytes));

  // A new status line starts the headers of the next hop of a redirect chain.
  if (util::StartsWith(line, "HTTP/")) {
    state->response->headers.clear();
    return bytes;
  }

  const auto colon = line.find(':');
  if (colon != std::string::npos) {
    state->response->headers.emplace_back(util::ToLower(util::Trim(line.substr(0, colon))), util::Trim(line.substr(colon + 1)));
  }
  return bytes;
}

void GlobalInit() {
  static std::once_flag once;
  std::call_once(once, [] {
    if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK) {
      throw std::runtime_error("curl_global_init failed");
    }
  });
}

} // namespace

CurlHttpFetcher::CurlHttpFetcher() {
  GlobalInit();
}

FetchResponse CurlHttpFetcher::Get(const FetchRequest& request) {
  std::unique_ptr<CURL, decltype(&curl_easy_cleanup)> handle(curl_easy_init(), &curl_easy_cleanup);
  if (!handle) {
    throw std::runtime_error("curl_easy_init failed");
  }

  FetchResponse response;
  TransferState state{&response, request.max_bytes};
  char          error_buffer[CURL_ERROR_SIZE] = {0};

  CURL* curl = handle.get();
  curl_easy_setopt(curl, CURLOPT_URL, request.url.c_str());
  curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
  curl_easy_setopt(curl, CURLOPT_MAXREDIRS, 10L);
  curl_easy_setopt(curl, CURLOPT_TIMEOUT, static_cast<long>(request.timeout_seconds));
  curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
  curl_easy_setopt(curl, CURLOPT_ACCEPT_ENCODING, "");
  curl_easy_setopt(curl, CURLOPT_ERRORBUFFER, error_buffer);
  curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, &OnBody);
  curl_easy_setopt(curl, CURLOPT_WRITEDATA, &state);
  curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, &OnHeader);
  curl_easy_setopt(curl, CURLOPT_HEADERDATA, &state);
  if (!request.user_agent.empty()) {
    curl_easy_setopt(curl, CURLOPT_USERAGENT, request.user_agent.c_str());
  }

  const CURLcode rc = curl_easy_perform(curl);
  if (rc != CURLE_OK && !(rc == CURLE_WRITE_ERROR && response.truncated)) {
    std::string message = curl_easy_strerror(rc);
    if (error_buffer[0] != '\0') {
      message += ": ";
      message += error_buffer;
    }
    throw std::runtime_error(message);
  }

  long status = 0;
  curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &status);
  response.status_code = status;

  char* effective_url = nullptr;
  if (curl_easy_getinfo(curl, CURLINFO_EFFECTIVE_URL, &effective_url) == CURLE_OK && effective_url) {
    response.final_url = effective_url;
  }

  char* content_type = nullptr;
  if (curl_easy_getinfo(curl, CURLINFO_CONTENT_TYPE, &content_type) == CURLE_OK && content_type) {
    response.content_type = content_type;
  }

  return response;
}

} // namespace research::acquisition
