// Repository: AudioInject
// Component: CredentialStubServer
// Purpose: Minimal HTTP/1.1 stub that hands VPN credentials to the test
//          harness and answers health checks.
// Copyright (c) 2026 AudioInject

#include "audioinject/stub/CredentialStubServer.hpp"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <chrono>
#include <cstdlib>
#include <cstring>
#include <sstream>
#include <stdexcept>
#include <utility>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include "audioinject/util/Logger.hpp"

namespace audioinject::stub {

using util::Logger;

namespace {

constexpr size_t kMaxHeaderBytes = 16 * 1024;
constexpr size_t kMaxBodyBytes = 64 * 1024;
constexpr int kAcceptPollMs = 100;
constexpr int kClientReadTimeoutMs = 2000;

std::string JsonEscape(const std::string& s) {
  std::string out;
  out.reserve(s.size());
  for (char c : s) {
    switch (c) {
      case '"': out += "\\\""; break;
      case '\\': out += "\\\\"; break;
      case '\n': out += "\\n"; break;
      case '\r': out += "\\r"; break;
      case '\t': out += "\\t"; break;
      default: out += c;
    }
  }
  return out;
}

const char* ReasonPhrase(int status) {
  switch (status) {
    case 200: return "OK";
    case 400: return "Bad Request";
    case 404: return "Not Found";
    default: return "Error";
  }
}

std::string ToLower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return s;
}

// Reads into `buf` until `done(buf)` or the peer goes quiet.  Returns false
// on timeout, error, or close before done.
template <typename Pred>
bool RecvUntil(int fd, std::string& buf, size_t limit, Pred done) {
  const auto deadline =
      std::chrono::steady_clock::now() + std::chrono::milliseconds(kClientReadTimeoutMs);
  while (!done(buf)) {
    if (buf.size() > limit) return false;
    auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
        deadline - std::chrono::steady_clock::now());
    if (remaining.count() <= 0) return false;
    pollfd pfd{};
    pfd.fd = fd;
    pfd.events = POLLIN;
    int rc = ::poll(&pfd, 1, static_cast<int>(remaining.count()));
    if (rc < 0 && errno == EINTR) continue;
    if (rc <= 0) return false;
    char chunk[2048];
    ssize_t n = ::recv(fd, chunk, sizeof(chunk), 0);
    if (n < 0 && errno == EINTR) continue;
    if (n <= 0) return false;
    buf.append(chunk, static_cast<size_t>(n));
  }
  return true;
}

void SendAll(int fd, const std::string& data) {
  size_t sent = 0;
  while (sent < data.size()) {
    ssize_t n = ::send(fd, data.data() + sent, data.size() - sent, MSG_NOSIGNAL);
    if (n < 0) {
      if (errno == EINTR) continue;
      Logger::Warn(std::string("[CredentialStub] send failed: ") + std::strerror(errno));
      return;
    }
    sent += static_cast<size_t>(n);
  }
}

}  // namespace

std::string HttpResponse::Serialize() const {
  std::ostringstream oss;
  oss << "HTTP/1.1 " << status << " " << ReasonPhrase(status) << "\r\n"
      << "Content-Type: application/json\r\n"
      << "Content-Length: " << body.size() << "\r\n"
      << "Connection: close\r\n"
      << "\r\n"
      << body;
  return oss.str();
}

HttpResponse Route(const std::string& method, const std::string& target,
                   const CredentialStubConfig& config) {
  const std::string path = target.substr(0, target.find('?'));
  HttpResponse response;
  if (method == "POST" && path == "/api/v1/vpn/auth-key") {
    response.status = 200;
    response.body = "{\"server_url\":\"" + JsonEscape(config.server_url) +
                    "\",\"auth_key\":\"" + JsonEscape(config.auth_key) + "\"}";
  } else if (method == "GET" && path == "/health") {
    response.status = 200;
    response.body = "{\"status\":\"ok\"}";
  } else {
    response.status = 404;
    response.body = "{\"error\":\"not found\"}";
  }
  return response;
}

CredentialStubServer::CredentialStubServer(CredentialStubConfig config)
    : config_(std::move(config)) {}

CredentialStubServer::~CredentialStubServer() {
  Stop();
}

void CredentialStubServer::Start() {
  if (listen_fd_ >= 0) return;

  int fd = ::socket(AF_INET, SOCK_STREAM, 0);
  if (fd < 0) {
    throw std::runtime_error(std::string("CredentialStub: socket failed: ") + std::strerror(errno));
  }
  int reuse = 1;
  if (::setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &reuse, sizeof(reuse)) != 0) {
    Logger::Warn(std::string("[CredentialStub] SO_REUSEADDR failed: ") + std::strerror(errno));
  }

  sockaddr_in addr{};
  addr.sin_family = AF_INET;
  addr.sin_port = htons(static_cast<uint16_t>(config_.port));
  if (::inet_pton(AF_INET, config_.bind_address.c_str(), &addr.sin_addr) != 1) {
    ::close(fd);
    throw std::runtime_error("CredentialStub: invalid bind address " + config_.bind_address);
  }
  if (::bind(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) != 0 ||
      ::listen(fd, 16) != 0) {
    const std::string err = std::strerror(errno);
    ::close(fd);
    throw std::runtime_error("CredentialStub: cannot listen on " + config_.bind_address + ":" +
                             std::to_string(config_.port) + ": " + err);
  }

  sockaddr_in bound{};
  socklen_t len = sizeof(bound);
  if (::getsockname(fd, reinterpret_cast<sockaddr*>(&bound), &len) != 0) {
    const std::string err = std::strerror(errno);
    ::close(fd);
    throw std::runtime_error("CredentialStub: getsockname failed: " + err);
  }
  bound_port_ = ntohs(bound.sin_port);
  listen_fd_ = fd;
  stop_.store(false, std::memory_order_release);
  accept_thread_ = std::thread([this] { AcceptLoop(); });

  Logger::Info("[CredentialStub] listening on " + config_.bind_address + ":" +
               std::to_string(bound_port_));
}

void CredentialStubServer::Stop() {
  stop_.store(true, std::memory_order_release);
  if (accept_thread_.joinable()) {
    accept_thread_.join();
  }
  if (listen_fd_ >= 0) {
    ::close(listen_fd_);
    listen_fd_ = -1;
  }
}

void CredentialStubServer::AcceptLoop() {
  while (!stop_.load(std::memory_order_acquire)) {
    pollfd pfd{};
    pfd.fd = listen_fd_;
    pfd.events = POLLIN;
    int rc = ::poll(&pfd, 1, kAcceptPollMs);
    if (rc < 0) {
      if (errno == EINTR) continue;
      Logger::Error(std::string("[CredentialStub] poll failed: ") + std::strerror(errno));
      return;
    }
    if (rc == 0) continue;

    int client_fd = ::accept(listen_fd_, nullptr, nullptr);
    if (client_fd < 0) {
      if (errno == EINTR || errno == EAGAIN || errno == ECONNABORTED) continue;
      Logger::Error(std::string("[CredentialStub] accept failed: ") + std::strerror(errno));
      return;
    }
    HandleConnection(client_fd);
    ::close(client_fd);
  }
}

void CredentialStubServer::HandleConnection(int client_fd) {
  std::string request;
  const bool have_headers = RecvUntil(client_fd, request, kMaxHeaderBytes, [](const std::string& b) {
    return b.find("\r\n\r\n") != std::string::npos;
  });

  HttpResponse response;
  std::string method;
  std::string target;
  if (!have_headers) {
    response.status = 400;
    response.body = "{\"error\":\"bad request\"}";
  } else {
    const size_t header_end = request.find("\r\n\r\n");
    std::istringstream head(request.substr(0, header_end));
    std::string request_line;
    std::getline(head, request_line);
    std::istringstream rl(request_line);
    std::string version;
    rl >> method >> target >> version;

    size_t content_length = 0;
    std::string header;
    while (std::getline(head, header)) {
      const size_t colon = header.find(':');
      if (colon == std::string::npos) continue;
      if (ToLower(header.substr(0, colon)) == "content-length") {
        content_length = static_cast<size_t>(
            std::strtoul(header.c_str() + colon + 1, nullptr, 10));
      }
    }

    if (method.empty() || target.empty() || version.compare(0, 5, "HTTP/") != 0 ||
        content_length > kMaxBodyBytes) {
      response.status = 400;
      response.body = "{\"error\":\"bad request\"}";
    } else {
      // The body is not used by any route; read it so the client sees a clean close.
      const size_t body_start = header_end + 4;
      const bool have_body = RecvUntil(
          client_fd, request, body_start + kMaxBodyBytes,
          [body_start, content_length](const std::string& b) {
            return b.size() >= body_start + content_length;
          });
      if (!have_body) {
        response.status = 400;
        response.body = "{\"error\":\"incomplete body\"}";
      } else {
        response = Route(method, target, config_);
      }
    }
  }

  SendAll(client_fd, response.Serialize());
  requests_served_.fetch_add(1, std::memory_order_relaxed);
  Logger::Info("[CredentialStub] " + (method.empty() ? std::string("-") : method) + " " +
               (target.empty() ? std::string("-") : target) + " -> " +
               std::to_string(response.status));
}

}  // namespace audioinject::stub
