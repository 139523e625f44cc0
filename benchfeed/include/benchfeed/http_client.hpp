#pragma once
#include <chrono>
#include <string>
#include <utility>
#include <vector>

namespace benchfeed {

struct HttpRequest {
  std::string url; // without query string
  std::vector<std::pair<std::string, std::string>> query; // repeated keys allowed
  std::chrono::seconds timeout{0};                       // 0 = none
};

struct HttpResponse {
  long status = 0;
  std::string body;
};

// Request/response transport. Implementations throw TransportError when
// no response is received; non-2xx replies are returned, not thrown.
class HttpClient {
public:
  virtual ~HttpClient() = default;
  virtual HttpResponse get(const HttpRequest &request) = 0;
};

// url followed by the percent-escaped query, in order. Appends with '&'
// when url already carries a query string.
std::string buildUrl(const HttpRequest &request);

class CurlHttpClient : public HttpClient {
public:
  CurlHttpClient();
  HttpResponse get(const HttpRequest &request) override;
};

} // namespace benchfeed
