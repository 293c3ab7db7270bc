#include "network/control_server.h"
#include "common/config.h"
#include "common/logging.h"
#include <algorithm>
#include <arpa/inet.h>
#include <atomic>
#include <cctype>
#include <cerrno>
#include <condition_variable>
#include <cstdlib>
#include <cstring>
#include <map>
#include <mutex>
#include <netinet/in.h>
#include <poll.h>
#include <sstream>
#include <sys/socket.h>
#include <sys/time.h>
#include <thread>
#include <unistd.h>

namespace hacluster {
namespace network {

namespace {

constexpr size_t MAX_HEADER_BYTES = 16 * 1024;
constexpr size_t MAX_BODY_BYTES = 1024 * 1024;
constexpr int CLIENT_RECV_TIMEOUT_SEC = 10;
constexpr int ACCEPT_POLL_MS = 250;

std::string to_lower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return s;
}

std::string trim(const std::string &s) {
  size_t begin = s.find_first_not_of(" \t");
  if (begin == std::string::npos)
    return "";
  size_t end = s.find_last_not_of(" \t\r");
  return s.substr(begin, end - begin + 1);
}

std::string error_body(const std::string &message) {
  return "{\"success\":false,\"message\":\"" + message + "\"}";
}

} // namespace

std::string HttpRequest::header(const std::string &name) const {
  auto it = headers.find(to_lower(name));
  return it == headers.end() ? "" : it->second;
}

const char *status_reason(int status_code) {
  switch (status_code) {
  case 200:
    return "OK";
  case 202:
    return "Accepted";
  case 400:
    return "Bad Request";
  case 401:
    return "Unauthorized";
  case 404:
    return "Not Found";
  case 405:
    return "Method Not Allowed";
  case 409:
    return "Conflict";
  case 413:
    return "Payload Too Large";
  case 500:
    return "Internal Server Error";
  case 502:
    return "Bad Gateway";
  case 503:
    return "Service Unavailable";
  default:
    return "Unknown";
  }
}

std::string build_http_response(const HttpReply &reply) {
  std::ostringstream response_stream;
  response_stream << "HTTP/1.1 " << reply.status_code << " "
                  << status_reason(reply.status_code) << "\r\n";
  response_stream << "Content-Type: " << reply.content_type << "\r\n";
  response_stream << "Content-Length: " << reply.body.length() << "\r\n";
  response_stream << "Connection: close\r\n";
  response_stream << "\r\n";
  response_stream << reply.body;
  return response_stream.str();
}

Result<HttpRequest> parse_http_request(const std::string &raw) {
  size_t header_end = raw.find("\r\n\r\n");
  if (header_end == std::string::npos) {
    return Result<HttpRequest>("incomplete request head");
  }

  std::istringstream head(raw.substr(0, header_end));
  std::string request_line;
  if (!std::getline(head, request_line)) {
    return Result<HttpRequest>("missing request line");
  }
  request_line = trim(request_line);

  HttpRequest request;
  std::istringstream line_stream(request_line);
  std::string target;
  std::string version;
  line_stream >> request.method >> target >> version;
  if (request.method.empty() || target.empty() ||
      version.rfind("HTTP/", 0) != 0) {
    return Result<HttpRequest>("malformed request line");
  }

  size_t query = target.find('?');
  request.path = query == std::string::npos ? target : target.substr(0, query);

  std::string line;
  while (std::getline(head, line)) {
    line = trim(line);
    if (line.empty())
      continue;
    size_t colon = line.find(':');
    if (colon == std::string::npos) {
      return Result<HttpRequest>("malformed header line");
    }
    request.headers[to_lower(trim(line.substr(0, colon)))] =
        trim(line.substr(colon + 1));
  }

  request.body = raw.substr(header_end + 4);
  std::string length_text = request.header("content-length");
  if (!length_text.empty()) {
    char *end = nullptr;
    unsigned long long length = std::strtoull(length_text.c_str(), &end, 10);
    if (end == length_text.c_str() || *end != '\0') {
      return Result<HttpRequest>("invalid Content-Length");
    }
    if (request.body.size() > length) {
      request.body.resize(static_cast<size_t>(length));
    }
  }
  return Result<HttpRequest>(request);
}

class ControlServer::Impl {
public:
  explicit Impl(const std::string &bind_address)
      : bind_address_(bind_address), running_(false), server_socket_(-1),
        bound_port_(0), active_clients_(0) {}

  std::string bind_address_;
  std::atomic<bool> running_;
  std::thread server_thread_;
  int server_socket_;
  uint16_t bound_port_;

  std::map<std::string, std::map<std::string, RouteHandler>> routes_;

  std::mutex clients_mutex_;
  std::condition_variable clients_cv_;
  size_t active_clients_;

  Result<bool> open_listener() {
    auto host_port = common::parse_host_port(bind_address_);
    if (!host_port.is_ok()) {
      return Result<bool>(host_port.error());
    }
    const auto &[ip_address, port] = host_port.value();

    server_socket_ = socket(AF_INET, SOCK_STREAM, 0);
    if (server_socket_ < 0) {
      return Result<bool>(std::string("Failed to create socket: ") +
                          strerror(errno));
    }

    // Allow socket reuse
    int opt = 1;
    if (setsockopt(server_socket_, SOL_SOCKET, SO_REUSEADDR, &opt,
                   sizeof(opt)) < 0) {
      std::string error =
          std::string("Failed to set socket options: ") + strerror(errno);
      close_listener();
      return Result<bool>(error);
    }

    struct sockaddr_in address;
    std::memset(&address, 0, sizeof(address));
    address.sin_family = AF_INET;
    address.sin_port = htons(port);
    std::string ip = ip_address.empty() ? "0.0.0.0" : ip_address;
    if (inet_pton(AF_INET, ip.c_str(), &address.sin_addr) <= 0) {
      close_listener();
      return Result<bool>("Invalid IP address: " + ip);
    }

    if (bind(server_socket_, (struct sockaddr *)&address, sizeof(address)) <
        0) {
      std::string error = "Failed to bind to " + bind_address_ + ": " +
                          strerror(errno);
      if (errno == EADDRINUSE) {
        error += " (port already in use)";
      }
      close_listener();
      return Result<bool>(error);
    }

    if (listen(server_socket_, 16) < 0) {
      std::string error =
          std::string("Failed to listen on socket: ") + strerror(errno);
      close_listener();
      return Result<bool>(error);
    }

    socklen_t len = sizeof(address);
    if (getsockname(server_socket_, (struct sockaddr *)&address, &len) == 0) {
      bound_port_ = ntohs(address.sin_port);
    }
    return Result<bool>(true);
  }

  void close_listener() {
    if (server_socket_ >= 0) {
      close(server_socket_);
      server_socket_ = -1;
    }
  }

  void accept_loop(const ControlServer *server) {
    while (running_.load()) {
      struct pollfd poll_fd;
      poll_fd.fd = server_socket_;
      poll_fd.events = POLLIN;
      poll_fd.revents = 0;

      int poll_result = poll(&poll_fd, 1, ACCEPT_POLL_MS);
      if (poll_result < 0 && errno != EINTR) {
        LOG_ERROR("control", "poll failed: ", strerror(errno));
        break;
      }

      if (poll_result > 0 && (poll_fd.revents & POLLIN)) {
        struct sockaddr_in client_addr;
        socklen_t client_len = sizeof(client_addr);
        int client_socket = accept(
            server_socket_, (struct sockaddr *)&client_addr, &client_len);
        if (client_socket < 0) {
          continue;
        }

        char ip_buffer[INET_ADDRSTRLEN] = {0};
        inet_ntop(AF_INET, &client_addr.sin_addr, ip_buffer,
                  sizeof(ip_buffer));
        std::string remote(ip_buffer);

        {
          std::lock_guard<std::mutex> lock(clients_mutex_);
          active_clients_++;
        }
        std::thread([this, server, client_socket, remote]() {
          handle_client(server, client_socket, remote);
          std::lock_guard<std::mutex> lock(clients_mutex_);
          active_clients_--;
          clients_cv_.notify_all();
        }).detach();
      }
    }
  }

  void wait_for_clients() {
    std::unique_lock<std::mutex> lock(clients_mutex_);
    clients_cv_.wait(lock, [this] { return active_clients_ == 0; });
  }

  // Reads until the head and the announced body are complete
  Result<bool> read_request(int client_socket, std::string &raw) {
    char buffer[4096];
    size_t expected_total = 0;

    while (true) {
      ssize_t bytes_received = recv(client_socket, buffer, sizeof(buffer), 0);
      if (bytes_received < 0 && errno == EINTR)
        continue;
      if (bytes_received <= 0) {
        if (raw.empty())
          return Result<bool>("connection closed");
        break;
      }
      raw.append(buffer, static_cast<size_t>(bytes_received));

      size_t header_end = raw.find("\r\n\r\n");
      if (header_end == std::string::npos) {
        if (raw.size() > MAX_HEADER_BYTES)
          return Result<bool>("request head too large");
        continue;
      }

      if (expected_total == 0) {
        size_t content_length = 0;
        std::string head = to_lower(raw.substr(0, header_end));
        size_t pos = head.find("content-length:");
        if (pos != std::string::npos) {
          content_length = static_cast<size_t>(
              std::strtoull(head.c_str() + pos + 15, nullptr, 10));
        }
        if (content_length > MAX_BODY_BYTES)
          return Result<bool>("request body too large");
        expected_total = header_end + 4 + content_length;
      }
      if (raw.size() >= expected_total)
        break;
    }
    return Result<bool>(true);
  }

  void handle_client(const ControlServer *server, int client_socket,
                     const std::string &remote) {
    struct timeval tv;
    tv.tv_sec = CLIENT_RECV_TIMEOUT_SEC;
    tv.tv_usec = 0;
    setsockopt(client_socket, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));

    HttpReply reply;
    std::string raw;
    auto received = read_request(client_socket, raw);
    if (!received.is_ok()) {
      LOG_DEBUG("control", "dropping connection from ", remote, ": ",
                received.error());
      close(client_socket);
      return;
    }

    auto parsed = parse_http_request(raw);
    if (!parsed.is_ok()) {
      reply.status_code = 400;
      reply.body = error_body(parsed.error());
    } else {
      HttpRequest request = parsed.value();
      request.remote_address = remote;
      try {
        reply = server->dispatch(request);
      } catch (const std::exception &e) {
        LOG_ERROR("control", "handler for ", request.method, " ",
                  request.path, " threw: ", e.what());
        reply.status_code = 500;
        reply.body = error_body("internal error");
      }
      LOG_DEBUG("control", request.method, " ", request.path, " from ",
                remote, " -> ", reply.status_code);
    }

    std::string http_response = build_http_response(reply);
    size_t sent_total = 0;
    while (sent_total < http_response.size()) {
      ssize_t bytes_sent =
          send(client_socket, http_response.data() + sent_total,
               http_response.size() - sent_total, MSG_NOSIGNAL);
      if (bytes_sent < 0 && errno == EINTR)
        continue;
      if (bytes_sent <= 0) {
        LOG_DEBUG("control", "failed to send response to ", remote, ": ",
                  strerror(errno));
        break;
      }
      sent_total += static_cast<size_t>(bytes_sent);
    }
    close(client_socket);
  }
};

ControlServer::ControlServer(const std::string &bind_address)
    : impl_(std::make_unique<Impl>(bind_address)) {}

ControlServer::~ControlServer() { stop(); }

void ControlServer::add_route(const std::string &method,
                              const std::string &path, RouteHandler handler) {
  impl_->routes_[path][method] = std::move(handler);
}

Result<bool> ControlServer::start() {
  if (impl_->running_.load()) {
    return Result<bool>("control server already running");
  }

  auto listener = impl_->open_listener();
  if (!listener.is_ok()) {
    return listener;
  }

  impl_->running_.store(true);
  impl_->server_thread_ = std::thread([this]() { impl_->accept_loop(this); });

  LOG_INFO("control", "control server listening on ", impl_->bind_address_,
           " (port ", impl_->bound_port_, ")");
  return Result<bool>(true);
}

void ControlServer::stop() noexcept {
  if (!impl_->running_.load()) {
    return;
  }
  impl_->running_.store(false);

  if (impl_->server_thread_.joinable()) {
    impl_->server_thread_.join();
  }
  impl_->close_listener();
  impl_->wait_for_clients();
  LOG_INFO("control", "control server stopped");
}

bool ControlServer::is_running() const noexcept {
  return impl_->running_.load();
}

uint16_t ControlServer::port() const noexcept { return impl_->bound_port_; }

HttpReply ControlServer::dispatch(const HttpRequest &request) const {
  LOG_TRACE("control", request.method, " ", request.path, " from ",
            request.remote_address, " (", request.body.size(), " bytes)");
  auto path_it = impl_->routes_.find(request.path);
  if (path_it == impl_->routes_.end()) {
    HttpReply reply;
    reply.status_code = 404;
    reply.body = error_body("not found");
    return reply;
  }

  auto method_it = path_it->second.find(request.method);
  if (method_it == path_it->second.end()) {
    HttpReply reply;
    reply.status_code = 405;
    reply.body = error_body("method not allowed");
    return reply;
  }
  return method_it->second(request);
}

} // namespace network
} // namespace hacluster
