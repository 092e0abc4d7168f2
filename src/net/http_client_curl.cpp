#include "net/http_client.hpp"
#include "common/logger.hpp"
#include <mutex>
#include <curl/curl.h>

namespace {
size_t AppendBody(char* ptr, size_t size, size_t nmemb, void* userdata) {
  static_cast<std::string*>(userdata)->append(ptr, size * nmemb);
  return size * nmemb;
}

struct HeaderList {
  curl_slist* head = nullptr;
  ~HeaderList() { if (head) curl_slist_free_all(head); }
};

// One easy handle per client so the node connection is reused between calls.
class CurlHttpClient : public HttpClient {
public:
  explicit CurlHttpClient(const HttpClientTuning& tuning) : tuning_(tuning) {
    curl_global_init(CURL_GLOBAL_DEFAULT);
    handle_ = curl_easy_init();
    if (!handle_) Logger::Error("curl_easy_init failed");
  }
  ~CurlHttpClient() override {
    if (handle_) curl_easy_cleanup(handle_);
    curl_global_cleanup();
  }

  HttpResponse Post(const std::string& url,
                    const std::string& body,
                    const std::unordered_map<std::string, std::string>& headers,
                    int timeout_ms) override {
    HttpResponse resp;
    std::lock_guard<std::mutex> lock(mutex_);
    if (!handle_) return resp;
    curl_easy_reset(handle_);

    HeaderList header_list;
    for (const auto& kv : headers) {
      header_list.head = curl_slist_append(header_list.head, (kv.first + ": " + kv.second).c_str());
    }
    std::string received;
    curl_easy_setopt(handle_, CURLOPT_URL, url.c_str());
    curl_easy_setopt(handle_, CURLOPT_POST, 1L);
    curl_easy_setopt(handle_, CURLOPT_HTTPHEADER, header_list.head);
    curl_easy_setopt(handle_, CURLOPT_POSTFIELDS, body.c_str());
    curl_easy_setopt(handle_, CURLOPT_POSTFIELDSIZE, static_cast<long>(body.size()));
    curl_easy_setopt(handle_, CURLOPT_WRITEFUNCTION, AppendBody);
    curl_easy_setopt(handle_, CURLOPT_WRITEDATA, &received);
    curl_easy_setopt(handle_, CURLOPT_TIMEOUT_MS, static_cast<long>(timeout_ms));
    curl_easy_setopt(handle_, CURLOPT_NOSIGNAL, 1L);
    if (tuning_.enable_tcp_keepalive) {
      curl_easy_setopt(handle_, CURLOPT_TCP_KEEPALIVE, 1L);
      curl_easy_setopt(handle_, CURLOPT_TCP_KEEPIDLE, static_cast<long>(tuning_.tcp_keepidle_s));
      curl_easy_setopt(handle_, CURLOPT_TCP_KEEPINTVL, static_cast<long>(tuning_.tcp_keepintvl_s));
    }
    if (tuning_.enable_http2) curl_easy_setopt(handle_, CURLOPT_HTTP_VERSION, CURL_HTTP_VERSION_2TLS);
    if (!tuning_.verify_tls) {
      curl_easy_setopt(handle_, CURLOPT_SSL_VERIFYPEER, 0L);
      curl_easy_setopt(handle_, CURLOPT_SSL_VERIFYHOST, 0L);
    }

    CURLcode rc = curl_easy_perform(handle_);
    if (rc != CURLE_OK) {
      Logger::Error("POST " + url + " failed: " + curl_easy_strerror(rc));
      return resp;
    }
    curl_easy_getinfo(handle_, CURLINFO_RESPONSE_CODE, &resp.status);
    resp.body = std::move(received);
    return resp;
  }
private:
  HttpClientTuning tuning_;
  CURL* handle_ = nullptr;
  std::mutex mutex_;
};
}

std::unique_ptr<HttpClient> CreateCurlHttpClient(const HttpClientTuning& tuning) {
  return std::unique_ptr<HttpClient>(new CurlHttpClient(tuning));
}
