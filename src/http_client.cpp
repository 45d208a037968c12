#include <f1live/http_client.hpp>

#include <curl/curl.h>

namespace f1live {

namespace {

size_t write_body_callback(char* ptr, size_t size, size_t nmemb, void* userdata) {
  auto* out = static_cast<std::string*>(userdata);
  out->append(ptr, size * nmemb);
  return size * nmemb;
}

HttpResponse perform_(CURL* curl, const std::string& url, long timeout_s) {
  HttpResponse res;
  curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
  curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
  curl_easy_setopt(curl, CURLOPT_TIMEOUT, timeout_s);
  curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
  curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_body_callback);
  curl_easy_setopt(curl, CURLOPT_WRITEDATA, &res.body);

  const CURLcode code = curl_easy_perform(curl);
  curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &res.status);
  if (code != CURLE_OK) {
    res.error = curl_easy_strerror(code);
    return res;
  }
  res.ok = res.status >= 200 && res.status < 300;
  if (!res.ok) res.error = "HTTP " + std::to_string(res.status);
  return res;
}

} // namespace

HttpResponse http_get(const std::string& url, long timeout_s) {
  CURL* curl = curl_easy_init();
  if (!curl) return {false, 0, {}, "curl_easy_init failed"};
  HttpResponse res = perform_(curl, url, timeout_s);
  curl_easy_cleanup(curl);
  return res;
}

HttpResponse http_post_json(const std::string& url, const std::string& body, long timeout_s) {
  CURL* curl = curl_easy_init();
  if (!curl) return {false, 0, {}, "curl_easy_init failed"};

  curl_slist* headers = curl_slist_append(nullptr, "Content-Type: application/json");
  curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
  curl_easy_setopt(curl, CURLOPT_POST, 1L);
  curl_easy_setopt(curl, CURLOPT_POSTFIELDS, body.c_str());
  curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(body.size()));

  HttpResponse res = perform_(curl, url, timeout_s);
  curl_slist_free_all(headers);
  curl_easy_cleanup(curl);
  return res;
}

CurlGlobal::CurlGlobal() { curl_global_init(CURL_GLOBAL_DEFAULT); }
CurlGlobal::~CurlGlobal() { curl_global_cleanup(); }

} // namespace f1live
