// Repository: AudioInject
// Component: Audio Stream Transport Interface
// Purpose: The capability StreamInjector consumes: open one outbound stream
//          of typed audio frames and submit them in order.
// Copyright (c) 2026 AudioInject

#ifndef AUDIOINJECT_INJECT_IAUDIO_STREAM_TRANSPORT_HPP_
#define AUDIOINJECT_INJECT_IAUDIO_STREAM_TRANSPORT_HPP_

#include <memory>
#include <string>

#include "audioinject/audio/AudioTypes.hpp"

namespace audioinject::inject {

// Terminal status of one call.  code uses grpc::StatusCode numbering
// (0 = OK, 1 = CANCELLED, 2 = UNKNOWN, 14 = UNAVAILABLE, ...).
struct StreamStatus {
  static constexpr int kOk = 0;
  static constexpr int kCancelled = 1;
  static constexpr int kUnknown = 2;

  int code = kOk;
  std::string detail;

  bool ok() const { return code == kOk; }
};

// One open outbound call.
//
// Lifecycle:
//   1. Write() frames in order until done or a write is rejected
//   2. Finish() exactly once to half-close and collect the terminal status
//   Cancel() may be called before Finish() to abort the call.
//
// Implementations must release the call in their destructor if Finish() was
// never reached.
class IAudioStream {
 public:
  virtual ~IAudioStream() = default;

  // Blocks until the frame is accepted by the transport.
  // Returns false once the stream is broken; no later write will succeed.
  virtual bool Write(const audio::Frame& frame) = 0;

  virtual void Cancel() = 0;

  virtual StreamStatus Finish() = 0;
};

class IAudioStreamTransport {
 public:
  virtual ~IAudioStreamTransport() = default;

  virtual std::unique_ptr<IAudioStream> OpenStream() = 0;

  // Human-readable target for logs ("localhost:8556").
  virtual std::string Describe() const = 0;
};

}  // namespace audioinject::inject

#endif  // AUDIOINJECT_INJECT_IAUDIO_STREAM_TRANSPORT_HPP_
