// Repository: AudioInject
// Component: CredentialStubServer
// Purpose: Minimal HTTP/1.1 stub that hands VPN credentials to the test
//          harness and answers health checks.
// Copyright (c) 2026 AudioInject

#ifndef AUDIOINJECT_STUB_CREDENTIAL_STUB_SERVER_HPP_
#define AUDIOINJECT_STUB_CREDENTIAL_STUB_SERVER_HPP_

#include <atomic>
#include <cstdint>
#include <string>
#include <thread>

namespace audioinject::stub {

inline constexpr int kDefaultStubPort = 8080;

struct CredentialStubConfig {
  std::string bind_address = "0.0.0.0";
  int port = kDefaultStubPort;  // 0 = ephemeral
  std::string server_url = "http://10.0.2.2:8080";
  std::string auth_key = "stub-auth-key";
};

struct HttpResponse {
  int status = 200;
  std::string body;

  // Status line, headers and body, Connection: close.
  std::string Serialize() const;
};

// Route table:
//   POST /api/v1/vpn/auth-key → 200 {"server_url":..,"auth_key":..}
//   GET  /health              → 200 {"status":"ok"}
//   anything else             → 404 {"error":"not found"}
// The query string is ignored when matching.
HttpResponse Route(const std::string& method, const std::string& target,
                   const CredentialStubConfig& config);

// Serves one request per connection on a dedicated accept thread.
//
// Lifecycle:
//   1. Start() binds, listens and spawns the accept thread (throws
//      std::runtime_error on bind/listen failure)
//   2. Stop() (or the destructor) closes the listener and joins
class CredentialStubServer {
 public:
  explicit CredentialStubServer(CredentialStubConfig config);
  ~CredentialStubServer();

  CredentialStubServer(const CredentialStubServer&) = delete;
  CredentialStubServer& operator=(const CredentialStubServer&) = delete;

  void Start();
  void Stop();

  // Bound port (resolved when config.port was 0).  Valid after Start().
  int Port() const { return bound_port_; }

  uint64_t RequestsServed() const { return requests_served_.load(std::memory_order_relaxed); }

 private:
  void AcceptLoop();
  void HandleConnection(int client_fd);

  CredentialStubConfig config_;
  int listen_fd_ = -1;
  int bound_port_ = 0;
  std::atomic<bool> stop_{false};
  std::atomic<uint64_t> requests_served_{0};
  std::thread accept_thread_;
};

}  // namespace audioinject::stub

#endif  // AUDIOINJECT_STUB_CREDENTIAL_STUB_SERVER_HPP_
