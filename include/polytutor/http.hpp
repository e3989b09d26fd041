#pragma once

#include <map>
#include <mutex>
#include <string>

#include <curl/curl.h>

#include "polytutor/common.hpp"

namespace polytutor {

struct HttpResponse {
  long status{0};
  std::string body;
  std::string error;
  std::map<std::string, std::string> headers{};

  bool ok() const { return error.empty() && status >= 200 && status < 300; }
};

// One curl easy handle per client; use one client per thread.
class HttpClient {
 public:
  HttpClient() {
    ensure_global_init();
    easy_ = curl_easy_init();
  }

  ~HttpClient() {
    if (easy_) {
      curl_easy_cleanup(easy_);
      easy_ = nullptr;
    }
  }

  HttpClient(const HttpClient&) = delete;
  HttpClient& operator=(const HttpClient&) = delete;

  HttpResponse get(const std::string& url, const std::map<std::string, std::string>& headers = {},
                   int timeout_s = 30) {
    return request(false, url, "", headers, timeout_s);
  }

  HttpResponse post_json(const std::string& url, const json& body,
                         std::map<std::string, std::string> headers = {}, int timeout_s = 60) {
    headers["Content-Type"] = "application/json";
    return request(true, url, body.dump(), headers, timeout_s);
  }

 private:
  static size_t write_cb(char* ptr, size_t size, size_t nmemb, void* userdata) {
    const auto n = size * nmemb;
    static_cast<std::string*>(userdata)->append(ptr, n);
    return n;
  }

  static size_t header_cb(char* ptr, size_t size, size_t nmemb, void* userdata) {
    const auto n = size * nmemb;
    auto* headers = static_cast<std::map<std::string, std::string>*>(userdata);
    if (!headers || !ptr || n == 0) {
      return n;
    }

    const std::string line = trim(std::string(ptr, n));
    const auto p = line.find(':');
    if (p == std::string::npos) {
      return n;
    }
    const std::string key = to_lower(trim(line.substr(0, p)));
    if (!key.empty()) {
      (*headers)[key] = trim(line.substr(p + 1));
    }
    return n;
  }

  static void ensure_global_init() {
    static std::once_flag flag;
    std::call_once(flag, []() { curl_global_init(CURL_GLOBAL_DEFAULT); });
  }

  HttpResponse request(bool post, const std::string& url, const std::string& body,
                       const std::map<std::string, std::string>& headers, int timeout_s) {
    if (!easy_) {
      easy_ = curl_easy_init();
    }
    if (!easy_) {
      return HttpResponse{0, "", "curl init failed"};
    }

    CURL* curl = easy_;
    curl_easy_reset(curl);
    std::string response_body;
    std::map<std::string, std::string> response_headers;
    struct curl_slist* header_list = nullptr;

    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, &write_cb);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response_body);
    curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, &header_cb);
    curl_easy_setopt(curl, CURLOPT_HEADERDATA, &response_headers);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, static_cast<long>(timeout_s));
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, static_cast<long>((std::min)(10, (std::max)(1, timeout_s / 3))));
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl, CURLOPT_MAXREDIRS, 5L);
    curl_easy_setopt(curl, CURLOPT_USERAGENT, "polytutor/0.1");
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);

    if (post) {
      curl_easy_setopt(curl, CURLOPT_POST, 1L);
      curl_easy_setopt(curl, CURLOPT_POSTFIELDS, body.c_str());
      curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(body.size()));
    }

    for (const auto& [k, v] : headers) {
      const std::string line = k + ": " + v;
      header_list = curl_slist_append(header_list, line.c_str());
    }
    if (header_list) {
      curl_easy_setopt(curl, CURLOPT_HTTPHEADER, header_list);
    }

    const CURLcode rc = curl_easy_perform(curl);

    HttpResponse out;
    if (rc != CURLE_OK) {
      out.error = curl_easy_strerror(rc);
    }
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &out.status);
    out.body = std::move(response_body);
    out.headers = std::move(response_headers);

    if (header_list) {
      curl_slist_free_all(header_list);
    }
    return out;
  }

  CURL* easy_{nullptr};
};

}  // namespace polytutor
