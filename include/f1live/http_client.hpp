#pragma once
#include <string>

namespace f1live {

struct HttpResponse {
  bool ok{false};         // transfer completed and status is 2xx
  long status{0};
  std::string body;
  std::string error;      // transport error text when the transfer failed
};

// Blocking libcurl calls; run them off the render loop.
HttpResponse http_get(const std::string& url, long timeout_s);
HttpResponse http_post_json(const std::string& url, const std::string& body, long timeout_s);

// Process-wide libcurl setup; call once from main before any request.
class CurlGlobal {
public:
  CurlGlobal();
  ~CurlGlobal();
  CurlGlobal(const CurlGlobal&) = delete;
  CurlGlobal& operator=(const CurlGlobal&) = delete;
};

} // namespace f1live
