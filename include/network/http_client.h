#pragma once

#include <chrono>
#include <map>
#include <string>

namespace hacluster {
namespace network {

using HttpHeaders = std::map<std::string, std::string>;

/**
 * HTTP Response structure
 *
 * success is true only for a 2xx status. A transport failure (refused,
 * timed out, DNS) leaves status_code at 0 and fills error_message.
 */
struct HttpResponse {
    int status_code = 0;
    std::string body;
    bool success = false;
    std::string error_message;
};

/**
 * Outbound HTTP used for peer health checks, notifications and promotion
 * requests. Every call carries its own timeout so a single client can serve
 * the 10s health probe and the 30s promote call.
 */
class IHttpClient {
public:
    virtual ~IHttpClient() = default;

    virtual HttpResponse get(const std::string& url, const HttpHeaders& headers,
                             std::chrono::milliseconds timeout) = 0;
    virtual HttpResponse post(const std::string& url, const std::string& body,
                              const HttpHeaders& headers,
                              std::chrono::milliseconds timeout) = 0;
};

/**
 * libcurl-backed client; one easy handle per request, safe to share between
 * threads.
 */
class HttpClient : public IHttpClient {
public:
    HttpClient();
    ~HttpClient() override;

    HttpResponse get(const std::string& url, const HttpHeaders& headers,
                     std::chrono::milliseconds timeout) override;
    HttpResponse post(const std::string& url, const std::string& body,
                      const HttpHeaders& headers,
                      std::chrono::milliseconds timeout) override;

    void set_user_agent(const std::string& user_agent) { user_agent_ = user_agent; }

private:
    std::string user_agent_;

    HttpResponse execute_request(const std::string& url, const std::string& method,
                                 const std::string& data, const HttpHeaders& headers,
                                 std::chrono::milliseconds timeout);
};

} // namespace network
} // namespace hacluster
