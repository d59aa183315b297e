#pragma once

#include <algorithm>
#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <string>

#include <curl/curl.h>

#include "chatbridge/common.hpp"

namespace chatbridge {

struct HttpResponse {
  long status{0};
  std::string body;
  // Empty unless the transfer itself failed.
  std::string error;
  bool timed_out{false};

  bool ok() const { return error.empty() && status >= 200 && status < 300; }
};

using HttpHeaders = std::map<std::string, std::string>;

// Blocking libcurl client for model backends. Not thread-safe; keep one per thread so the
// easy handle and its connection cache are reused between turns.
class HttpClient {
 public:
  HttpClient() {
    static std::once_flag init;
    std::call_once(init, []() { curl_global_init(CURL_GLOBAL_DEFAULT); });
    easy_.reset(curl_easy_init());
  }

  HttpClient(const HttpClient&) = delete;
  HttpClient& operator=(const HttpClient&) = delete;

  HttpResponse get(const std::string& url, const HttpHeaders& headers = {}, long timeout_ms = 30000) {
    return perform(url, nullptr, headers, timeout_ms);
  }

  HttpResponse post(const std::string& url, const std::string& body, const HttpHeaders& headers = {},
                    long timeout_ms = 60000) {
    return perform(url, &body, headers, timeout_ms);
  }

 private:
  struct EasyDeleter {
    void operator()(CURL* curl) const { curl_easy_cleanup(curl); }
  };
  struct SlistDeleter {
    void operator()(curl_slist* list) const { curl_slist_free_all(list); }
  };

  static size_t append_body(char* ptr, size_t size, size_t nmemb, void* userdata) {
    static_cast<std::string*>(userdata)->append(ptr, size * nmemb);
    return size * nmemb;
  }

  HttpResponse perform(const std::string& url, const std::string* body, const HttpHeaders& headers,
                       long timeout_ms) {
    HttpResponse out;
    CURL* curl = easy_.get();
    if (!curl) {
      out.error = "curl_easy_init failed";
      return out;
    }
    curl_easy_reset(curl);

    std::unique_ptr<curl_slist, SlistDeleter> header_list;
    for (const auto& [name, value] : headers) {
      const std::string line = name + ": " + value;
      curl_slist* appended = curl_slist_append(header_list.get(), line.c_str());
      if (!appended) {
        out.error = "cannot allocate request headers";
        return out;
      }
      header_list.release();
      header_list.reset(appended);
    }

    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, &append_body);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &out.body);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, timeout_ms);
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS, (std::min)(10000L, (std::max)(1000L, timeout_ms / 3)));
    curl_easy_setopt(curl, CURLOPT_USERAGENT, "chatbridge/0.1");
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    if (header_list) {
      curl_easy_setopt(curl, CURLOPT_HTTPHEADER, header_list.get());
    }
    if (body) {
      curl_easy_setopt(curl, CURLOPT_POST, 1L);
      curl_easy_setopt(curl, CURLOPT_POSTFIELDS, body->data());
      curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE_LARGE, static_cast<curl_off_t>(body->size()));
    }

    const CURLcode rc = curl_easy_perform(curl);
    if (rc != CURLE_OK) {
      out.error = curl_easy_strerror(rc);
      out.timed_out = rc == CURLE_OPERATION_TIMEDOUT;
    }
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &out.status);
    return out;
  }

  std::unique_ptr<CURL, EasyDeleter> easy_;
};

}  // namespace chatbridge
