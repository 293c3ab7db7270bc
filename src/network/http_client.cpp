#include "network/http_client.h"
#include "common/logging.h"
#include <algorithm>
#include <curl/curl.h>
#include <mutex>

namespace hacluster {
namespace network {

// Connection setup gets a bounded share of the request timeout
constexpr long MAX_CONNECT_TIMEOUT_MS = 5000L;

// Thread-safe CURL initialization
static std::once_flag curl_init_flag;
static void init_curl_once() { curl_global_init(CURL_GLOBAL_DEFAULT); }

// Callback function for CURL to write response data
static size_t curl_write_callback(void *contents, size_t size, size_t nmemb,
                                  void *userp) {
  std::string *buffer = static_cast<std::string *>(userp);
  size_t total_size = size * nmemb;
  buffer->append(static_cast<char *>(contents), total_size);
  return total_size;
}

HttpClient::HttpClient() : user_agent_("hacluster/1.0") {
  std::call_once(curl_init_flag, init_curl_once);
}

// curl_global_cleanup() is left to process exit; other clients may still be
// live when one instance is destroyed.
HttpClient::~HttpClient() = default;

HttpResponse HttpClient::get(const std::string &url,
                             const HttpHeaders &headers,
                             std::chrono::milliseconds timeout) {
  return execute_request(url, "GET", "", headers, timeout);
}

HttpResponse HttpClient::post(const std::string &url, const std::string &body,
                              const HttpHeaders &headers,
                              std::chrono::milliseconds timeout) {
  return execute_request(url, "POST", body, headers, timeout);
}

HttpResponse HttpClient::execute_request(const std::string &url,
                                         const std::string &method,
                                         const std::string &data,
                                         const HttpHeaders &headers,
                                         std::chrono::milliseconds timeout) {
  HttpResponse response;

  CURL *curl = curl_easy_init();
  if (!curl) {
    response.error_message = "Failed to initialize CURL";
    return response;
  }

  std::string response_body;
  long timeout_ms = std::max<long>(1L, static_cast<long>(timeout.count()));

  curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
  curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, curl_write_callback);
  curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response_body);
  curl_easy_setopt(curl, CURLOPT_USERAGENT, user_agent_.c_str());
  curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, timeout_ms);
  curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS,
                   std::min(timeout_ms, MAX_CONNECT_TIMEOUT_MS));
  curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
  curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, 1L);
  curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST, 2L);

  if (method == "POST") {
    curl_easy_setopt(curl, CURLOPT_POST, 1L);
    curl_easy_setopt(curl, CURLOPT_POSTFIELDS, data.c_str());
    curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE,
                     static_cast<long>(data.length()));
  }
  // GET is the default

  struct curl_slist *header_list = nullptr;
  for (const auto &header : headers) {
    std::string header_line = header.first + ": " + header.second;
    header_list = curl_slist_append(header_list, header_line.c_str());
  }
  if (header_list) {
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, header_list);
  }

  CURLcode res = curl_easy_perform(curl);

  if (res != CURLE_OK) {
    response.error_message =
        std::string("CURL error: ") + curl_easy_strerror(res);
    LOG_DEBUG("http", method, " ", url, " failed: ", response.error_message);
    if (header_list)
      curl_slist_free_all(header_list);
    curl_easy_cleanup(curl);
    return response;
  }

  long http_code = 0;
  curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &http_code);

  response.status_code = static_cast<int>(http_code);
  response.body = response_body;
  response.success = (http_code >= 200 && http_code < 300);

  if (!response.success) {
    response.error_message = "HTTP error: " + std::to_string(http_code);
  }

  if (header_list)
    curl_slist_free_all(header_list);
  curl_easy_cleanup(curl);

  return response;
}

} // namespace network
} // namespace hacluster
