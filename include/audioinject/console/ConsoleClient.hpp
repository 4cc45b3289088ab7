// Repository: AudioInject
// Component: ConsoleClient
// Purpose: Line-oriented control console client (auth, one command, quit).
// Copyright (c) 2026 AudioInject

#ifndef AUDIOINJECT_CONSOLE_CONSOLE_CLIENT_HPP_
#define AUDIOINJECT_CONSOLE_CONSOLE_CLIENT_HPP_

#include <chrono>
#include <string>

namespace audioinject::console {

inline constexpr int kDefaultConsolePort = 5554;
inline constexpr const char* kRewindAudioCommand = "avd rewindaudio";

struct ConsoleConfig {
  std::string host = "localhost";
  int port = kDefaultConsolePort;
  // Empty: $HOME/.emulator_console_auth_token
  std::string token_path;
  std::chrono::milliseconds reply_timeout{5000};
};

// Default token location, resolved against $HOME.
std::string DefaultTokenPath();

// Reads the first line of the token file, trimmed.
// Throws ControlProtocolError if the file is missing or empty.
std::string ReadAuthToken(const std::string& path);

// A reply is every line up to and including the first line starting with
// "OK" or "KO".  ok is true for an "OK" terminator.
struct ConsoleReply {
  std::string text;
  bool ok = false;
};

// ConsoleClient owns one TCP connection to the console.
//
// Each step throws ControlProtocolError on a KO reply, timeout, or closed
// peer; the caller must not continue the exchange after a failed step.
// The socket is closed by the destructor.
class ConsoleClient {
 public:
  explicit ConsoleClient(ConsoleConfig config);
  ~ConsoleClient();

  ConsoleClient(const ConsoleClient&) = delete;
  ConsoleClient& operator=(const ConsoleClient&) = delete;

  // Connects and consumes the banner.
  void Connect();

  // Sends "auth <token>" and requires an OK reply.
  void Authenticate(const std::string& token);

  // Sends a command line and requires an OK reply.  Returns the reply text.
  std::string SendCommand(const std::string& command);

  // Sends "quit" and closes the connection.  Does not wait for a reply.
  void Quit();

  void Close();

  bool IsConnected() const { return fd_ >= 0; }

 private:
  void SendLine(const std::string& line);
  ConsoleReply ReadReply();

  ConsoleConfig config_;
  int fd_ = -1;
  std::string pending_;
};

// Connect → auth → "avd rewindaudio" → quit.  Returns 0 on success and 1 on
// ControlProtocolError, logging one diagnostic line.
int RunRewindAudio(const ConsoleConfig& config);

}  // namespace audioinject::console

#endif  // AUDIOINJECT_CONSOLE_CONSOLE_CLIENT_HPP_
