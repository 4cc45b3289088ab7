// Repository: AudioInject
// Component: ConsoleClient
// Purpose: Line-oriented control console client (auth, one command, quit).
// Copyright (c) 2026 AudioInject

#include "audioinject/console/ConsoleClient.hpp"

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <utility>

#include <netdb.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/types.h>
#include <unistd.h>

#include "audioinject/util/Errors.hpp"
#include "audioinject/util/Logger.hpp"

namespace audioinject::console {

using util::Logger;

namespace {

constexpr size_t kReadChunk = 1024;

bool StartsWith(const std::string& s, const char* prefix) {
  return s.compare(0, std::strlen(prefix), prefix) == 0;
}

std::string Trim(const std::string& s) {
  const char* ws = " \t\r\n";
  size_t begin = s.find_first_not_of(ws);
  if (begin == std::string::npos) return "";
  size_t end = s.find_last_not_of(ws);
  return s.substr(begin, end - begin + 1);
}

}  // namespace

std::string DefaultTokenPath() {
  const char* home = std::getenv("HOME");
  return std::string(home ? home : "") + "/.emulator_console_auth_token";
}

std::string ReadAuthToken(const std::string& path) {
  std::ifstream file(path);
  if (!file.is_open()) {
    throw ControlProtocolError("cannot read console auth token from " + path + ": " +
                               std::strerror(errno));
  }
  std::string line;
  std::getline(file, line);
  std::string token = Trim(line);
  if (token.empty()) {
    throw ControlProtocolError("console auth token file " + path + " is empty");
  }
  return token;
}

ConsoleClient::ConsoleClient(ConsoleConfig config) : config_(std::move(config)) {}

ConsoleClient::~ConsoleClient() {
  Close();
}

void ConsoleClient::Close() {
  if (fd_ >= 0) {
    ::shutdown(fd_, SHUT_RDWR);
    ::close(fd_);
    fd_ = -1;
  }
  pending_.clear();
}

void ConsoleClient::Connect() {
  Close();

  addrinfo hints{};
  hints.ai_family = AF_UNSPEC;
  hints.ai_socktype = SOCK_STREAM;
  addrinfo* results = nullptr;
  const std::string port = std::to_string(config_.port);
  int rc = ::getaddrinfo(config_.host.c_str(), port.c_str(), &hints, &results);
  if (rc != 0) {
    throw ControlProtocolError("cannot resolve " + config_.host + ": " + gai_strerror(rc));
  }

  std::string last_error = "no address";
  for (addrinfo* ai = results; ai != nullptr; ai = ai->ai_next) {
    int fd = ::socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
    if (fd < 0) {
      last_error = std::strerror(errno);
      continue;
    }
    if (::connect(fd, ai->ai_addr, ai->ai_addrlen) == 0) {
      fd_ = fd;
      break;
    }
    last_error = std::strerror(errno);
    ::close(fd);
  }
  ::freeaddrinfo(results);

  if (fd_ < 0) {
    throw ControlProtocolError("cannot connect to console at " + config_.host + ":" + port +
                               ": " + last_error);
  }
  Logger::Debug("[ConsoleClient] connected to " + config_.host + ":" + port);

  ConsoleReply banner = ReadReply();
  if (!banner.ok) {
    throw ControlProtocolError("console banner not acknowledged: " + Trim(banner.text));
  }
}

void ConsoleClient::Authenticate(const std::string& token) {
  SendLine("auth " + token);
  ConsoleReply reply = ReadReply();
  if (!reply.ok) {
    throw ControlProtocolError("console authentication rejected: " + Trim(reply.text));
  }
  Logger::Debug("[ConsoleClient] authenticated");
}

std::string ConsoleClient::SendCommand(const std::string& command) {
  SendLine(command);
  ConsoleReply reply = ReadReply();
  if (!reply.ok) {
    throw ControlProtocolError("command '" + command + "' not acknowledged: " + Trim(reply.text));
  }
  return reply.text;
}

void ConsoleClient::Quit() {
  SendLine("quit");
  Close();
}

void ConsoleClient::SendLine(const std::string& line) {
  if (fd_ < 0) {
    throw ControlProtocolError("console not connected");
  }
  const std::string framed = line + "\r\n";
  size_t sent = 0;
  while (sent < framed.size()) {
    ssize_t n = ::send(fd_, framed.data() + sent, framed.size() - sent, MSG_NOSIGNAL);
    if (n < 0) {
      if (errno == EINTR) continue;
      throw ControlProtocolError(std::string("console send failed: ") + std::strerror(errno));
    }
    sent += static_cast<size_t>(n);
  }
}

ConsoleReply ConsoleClient::ReadReply() {
  const auto deadline = std::chrono::steady_clock::now() + config_.reply_timeout;
  ConsoleReply reply;

  while (true) {
    // Consume complete lines already buffered.
    size_t eol;
    while ((eol = pending_.find('\n')) != std::string::npos) {
      std::string line = pending_.substr(0, eol + 1);
      pending_.erase(0, eol + 1);
      reply.text += line;
      if (StartsWith(line, "OK")) {
        reply.ok = true;
        return reply;
      }
      if (StartsWith(line, "KO")) {
        reply.ok = false;
        return reply;
      }
    }

    const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
        deadline - std::chrono::steady_clock::now());
    if (remaining.count() <= 0) {
      throw ControlProtocolError("timed out waiting for console reply");
    }

    pollfd pfd{};
    pfd.fd = fd_;
    pfd.events = POLLIN;
    int rc = ::poll(&pfd, 1, static_cast<int>(remaining.count()));
    if (rc < 0) {
      if (errno == EINTR) continue;
      throw ControlProtocolError(std::string("console poll failed: ") + std::strerror(errno));
    }
    if (rc == 0) {
      throw ControlProtocolError("timed out waiting for console reply");
    }

    char buf[kReadChunk];
    ssize_t n = ::recv(fd_, buf, sizeof(buf), 0);
    if (n < 0) {
      if (errno == EINTR) continue;
      throw ControlProtocolError(std::string("console recv failed: ") + std::strerror(errno));
    }
    if (n == 0) {
      throw ControlProtocolError("console closed the connection" +
                                 (reply.text.empty() ? std::string() : ": " + Trim(reply.text)));
    }
    pending_.append(buf, static_cast<size_t>(n));
  }
}

int RunRewindAudio(const ConsoleConfig& config) {
  try {
    const std::string token_path =
        config.token_path.empty() ? DefaultTokenPath() : config.token_path;
    const std::string token = ReadAuthToken(token_path);

    ConsoleClient client(config);
    client.Connect();
    client.Authenticate(token);
    client.SendCommand(kRewindAudioCommand);
    client.Quit();
    Logger::Info("[rewind-audio] audio playback rewound");
    return 0;
  } catch (const ControlProtocolError& e) {
    Logger::Error(std::string("[rewind-audio] ") + e.what());
    return 1;
  }
}

}  // namespace audioinject::console
