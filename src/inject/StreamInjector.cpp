// Repository: AudioInject
// Component: StreamInjector
// Purpose: Submit the paced frame sequence over one outbound call and surface
//          terminal success or failure.
// Copyright (c) 2026 AudioInject

#include "audioinject/inject/StreamInjector.hpp"

#include <memory>
#include <string>

#include "audioinject/util/Errors.hpp"
#include "audioinject/util/Logger.hpp"

namespace audioinject::inject {

using util::Logger;

InjectionSummary StreamInjector::Run(pacing::Pacer& pacer) {
  const auto started = std::chrono::steady_clock::now();

  std::unique_ptr<IAudioStream> stream = transport_.OpenStream();
  if (!stream) {
    throw StreamError(StreamStatus::kUnknown, "could not open stream to " + transport_.Describe());
  }
  Logger::Info("[StreamInjector] streaming to " + transport_.Describe());

  InjectionSummary summary;
  bool write_rejected = false;

  while (std::optional<audio::Frame> frame = pacer.Next()) {
    if (!stream->Write(*frame)) {
      write_rejected = true;
      pacer.Cancel();
      Logger::Warn("[StreamInjector] write rejected at frame " +
                   std::to_string(summary.frames_submitted) + ", stopping");
      break;
    }
    ++summary.frames_submitted;
    if (frame->is_silence) ++summary.silence_frames_submitted;
    summary.bytes_submitted += frame->payload.size();
  }

  if (!write_rejected && pacer.Cancelled()) {
    stream->Cancel();
    StreamStatus status = stream->Finish();
    Logger::Debug("[StreamInjector] cancelled call finished with code=" +
                  std::to_string(status.code) + " detail=" + status.detail);
    throw StreamError(StreamStatus::kCancelled,
                      "injection interrupted after " +
                          std::to_string(summary.frames_submitted) + " frames");
  }

  StreamStatus status = stream->Finish();
  if (!status.ok()) {
    throw StreamError(status.code, status.detail);
  }
  if (write_rejected) {
    // Transport broke the stream but reported success on finish.
    throw StreamError(StreamStatus::kUnknown,
                      "stream closed by peer after " +
                          std::to_string(summary.frames_submitted) + " frames");
  }

  summary.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::steady_clock::now() - started);
  Logger::Info("[StreamInjector] injected " + std::to_string(summary.frames_submitted) +
               " frames (" + std::to_string(summary.silence_frames_submitted) +
               " silence, " + std::to_string(summary.bytes_submitted) + " bytes) in " +
               std::to_string(summary.elapsed.count()) + " ms");
  return summary;
}

}  // namespace audioinject::inject
