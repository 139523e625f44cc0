#include "benchfeed/http_client.hpp"
#include "benchfeed/errors.hpp"
#include <cstdlib>
#include <curl/curl.h>
#include <memory>
#include <mutex>
#include <spdlog/spdlog.h>

namespace benchfeed {

// ── cURL write callback ──────────────────────────────────────────────
static size_t writeCallback(char *data, size_t size, size_t nmemb,
                            void *userp) {
  auto *buf = static_cast<std::string *>(userp);
  buf->append(data, size * nmemb);
  return size * nmemb;
}

// Thread-safe curl lifecycle management
static std::once_flag curl_init_flag;
static void initCurlOnce() {
  curl_global_init(CURL_GLOBAL_DEFAULT);
  std::atexit(curl_global_cleanup);
}

CurlHttpClient::CurlHttpClient() { std::call_once(curl_init_flag, initCurlOnce); }

static std::string escape(const std::string &s) {
  char *out = curl_easy_escape(nullptr, s.c_str(), static_cast<int>(s.size()));
  if (!out)
    throw TransportError("failed to escape query parameter");
  std::string escaped(out);
  curl_free(out);
  return escaped;
}

std::string buildUrl(const HttpRequest &request) {
  std::string url = request.url;
  char sep = url.find('?') == std::string::npos ? '?' : '&';
  for (const auto &param : request.query) {
    url += sep;
    url += escape(param.first) + "=" + escape(param.second);
    sep = '&';
  }
  return url;
}

HttpResponse CurlHttpClient::get(const HttpRequest &request) {
  std::unique_ptr<CURL, decltype(&curl_easy_cleanup)> curl(curl_easy_init(),
                                                          curl_easy_cleanup);
  if (!curl)
    throw TransportError("failed to init curl");

  std::string url = buildUrl(request);

  HttpResponse response;
  curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
  curl_easy_setopt(curl.get(), CURLOPT_HTTPGET, 1L);
  curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, writeCallback);
  curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &response.body);
  curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT,
                   static_cast<long>(request.timeout.count()));
  curl_easy_setopt(curl.get(), CURLOPT_FOLLOWLOCATION, 1L);
  curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);

  struct curl_slist *headers = nullptr;
  headers = curl_slist_append(headers, "Accept: application/json");
  curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, headers);

  spdlog::debug("[Http] GET {}", url);
  CURLcode res = curl_easy_perform(curl.get());
  curl_slist_free_all(headers);

  if (res != CURLE_OK) {
    throw TransportError(std::string("GET ") + request.url +
                         " failed: " + curl_easy_strerror(res));
  }

  if (curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE,
                        &response.status) != CURLE_OK)
    throw TransportError(std::string("GET ") + request.url +
                         ": no response code");
  spdlog::debug("[Http] {} ({} bytes)", response.status, response.body.size());
  return response;
}

} // namespace benchfeed
