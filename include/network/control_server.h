#pragma once

#include "common/types.h"
#include "network/http_client.h"
#include <cstdint>
#include <functional>
#include <memory>
#include <string>

namespace hacluster {
namespace network {

using common::Result;

/**
 * Parsed inbound request. Header names are lower-cased.
 */
struct HttpRequest {
    std::string method;
    std::string path;           ///< Without the query string
    HttpHeaders headers;
    std::string body;
    std::string remote_address;

    std::string header(const std::string& name) const;
};

struct HttpReply {
    int status_code = 200;
    std::string body;
    std::string content_type = "application/json";
};

using RouteHandler = std::function<HttpReply(const HttpRequest&)>;

/**
 * Small HTTP/1.1 server for the cluster control endpoints.
 *
 * One accept thread polls the listening socket; each connection is served on
 * its own thread and closed after a single response. stop() waits for the
 * in-flight connections before returning.
 */
class ControlServer {
public:
    explicit ControlServer(const std::string& bind_address);
    ~ControlServer();

    ControlServer(const ControlServer&) = delete;
    ControlServer& operator=(const ControlServer&) = delete;

    void add_route(const std::string& method, const std::string& path,
                   RouteHandler handler);

    /// Bind and listen synchronously, then serve from a background thread
    Result<bool> start();
    void stop() noexcept;
    bool is_running() const noexcept;

    /// Port actually bound; differs from the configured one when it was 0
    uint16_t port() const noexcept;

    /// Route a request without any socket I/O
    HttpReply dispatch(const HttpRequest& request) const;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

/**
 * Parse a complete raw request (head and body).
 * @return error for a malformed request line or header block
 */
Result<HttpRequest> parse_http_request(const std::string& raw);

/// Serialize a reply with Content-Length and Connection: close
std::string build_http_response(const HttpReply& reply);

/// Reason phrase for the status codes the control server emits
const char* status_reason(int status_code);

} // namespace network
} // namespace hacluster
