// Repository: AudioInject
// Component: StreamInjector
// Purpose: Submit the paced frame sequence over one outbound call and surface
//          terminal success or failure.
// Copyright (c) 2026 AudioInject

#ifndef AUDIOINJECT_INJECT_STREAM_INJECTOR_HPP_
#define AUDIOINJECT_INJECT_STREAM_INJECTOR_HPP_

#include <chrono>
#include <cstdint>

#include "audioinject/inject/IAudioStreamTransport.hpp"
#include "audioinject/pacing/Pacer.hpp"

namespace audioinject::inject {

struct InjectionSummary {
  int64_t frames_submitted = 0;
  int64_t silence_frames_submitted = 0;
  uint64_t bytes_submitted = 0;
  std::chrono::milliseconds elapsed{0};
};

// StreamInjector owns the StreamSession for one call: the open stream and
// the cursor over the pacer's frames.  It never retries.
//
// Run() blocks until either:
//   - every frame (silence run included) was accepted and the call finished
//     OK → returns the summary
//   - a write was rejected or the call finished with an error → throws
//     StreamError with the transport's code and detail
//   - the pacer was stopped externally → the call is cancelled and
//     StreamError(CANCELLED) is thrown
//
// On a rejected write the pacer is cancelled so no further pacing delay is
// spent on frames that can no longer be sent.
class StreamInjector {
 public:
  explicit StreamInjector(IAudioStreamTransport& transport) : transport_(transport) {}

  StreamInjector(const StreamInjector&) = delete;
  StreamInjector& operator=(const StreamInjector&) = delete;

  InjectionSummary Run(pacing::Pacer& pacer);

 private:
  IAudioStreamTransport& transport_;
};

}  // namespace audioinject::inject

#endif  // AUDIOINJECT_INJECT_STREAM_INJECTOR_HPP_
