// Repository: AudioInject
// Component: Error Taxonomy
// Purpose: Fatal error types raised by the injection pipeline and its tools.
// Copyright (c) 2026 AudioInject

#ifndef AUDIOINJECT_UTIL_ERRORS_HPP_
#define AUDIOINJECT_UTIL_ERRORS_HPP_

#include <stdexcept>
#include <string>
#include <utility>

namespace audioinject {

// Source declares a sample layout this pipeline does not carry
// (anything other than 16-bit signed PCM, mono or stereo).
// Raised before any frame is produced.
class FormatError : public std::runtime_error {
 public:
  explicit FormatError(const std::string& what) : std::runtime_error(what) {}
};

// Source file missing, unreadable, or not a decodable container.
class SourceReadError : public std::runtime_error {
 public:
  explicit SourceReadError(const std::string& what) : std::runtime_error(what) {}
};

// The outbound streaming call failed.  code() is the transport status code
// (grpc::StatusCode numbering), detail() the remote message.
class StreamError : public std::runtime_error {
 public:
  StreamError(int code, std::string detail)
      : std::runtime_error("stream failed (code=" + std::to_string(code) +
                           "): " + detail),
        code_(code),
        detail_(std::move(detail)) {}

  int code() const { return code_; }
  const std::string& detail() const { return detail_; }

 private:
  int code_;
  std::string detail_;
};

// Console peer rejected auth, did not acknowledge a command, or went away.
class ControlProtocolError : public std::runtime_error {
 public:
  explicit ControlProtocolError(const std::string& what) : std::runtime_error(what) {}
};

}  // namespace audioinject

#endif  // AUDIOINJECT_UTIL_ERRORS_HPP_
