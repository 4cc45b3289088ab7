// Repository: AudioInject
// Component: InjectionPipeline
// Purpose: One injection run: decode → validate → chunk → pace → stream.
// Copyright (c) 2026 AudioInject

#ifndef AUDIOINJECT_INJECT_INJECTION_PIPELINE_HPP_
#define AUDIOINJECT_INJECT_INJECTION_PIPELINE_HPP_

#include <memory>
#include <string>

#include "audioinject/audio/FrameChunker.hpp"
#include "audioinject/decode/WaveSource.hpp"
#include "audioinject/inject/IAudioStreamTransport.hpp"
#include "audioinject/inject/StreamInjector.hpp"
#include "audioinject/pacing/IWaitStrategy.hpp"
#include "audioinject/time/ITimeSource.hpp"

namespace audioinject::inject {

inline constexpr int kDefaultInjectPort = 8556;

// Process exit statuses of inject-audio.
inline constexpr int kExitSuccess = 0;
inline constexpr int kExitInjectionFailed = 1;  // StreamError or FormatError
inline constexpr int kExitUsage = 2;            // bad flags / configuration
inline constexpr int kExitSourceUnreadable = 3; // SourceReadError

struct InjectorConfig {
  std::string audio_path;
  std::string host = "localhost";
  int port = kDefaultInjectPort;
  int chunk_duration_ms = audio::kDefaultChunkDurationMs;
  int silence_frames = audio::kDefaultSilenceFrames;
  int max_read_seconds = decode::kDefaultMaxReadSeconds;

  std::string TargetAddress() const { return host + ":" + std::to_string(port); }

  // Throws std::invalid_argument naming the first bad field.
  void Validate() const;
};

// Idle → FormatValidated → Streaming → {Completed | Failed}
enum class InjectionState { kIdle, kFormatValidated, kStreaming, kCompleted, kFailed };

const char* ToString(InjectionState state);

// Not reusable: Run() may be called once.
class InjectionPipeline {
 public:
  InjectionPipeline(InjectorConfig config, IAudioStreamTransport& transport,
                    std::shared_ptr<time::ITimeSource> time_source,
                    std::unique_ptr<pacing::IWaitStrategy> wait_strategy);

  InjectionPipeline(const InjectionPipeline&) = delete;
  InjectionPipeline& operator=(const InjectionPipeline&) = delete;

  // Throws FormatError / SourceReadError before any stream is opened,
  // StreamError once streaming has begun.  State is kFailed on any throw.
  InjectionSummary Run();

  InjectionState state() const { return state_; }

 private:
  void TransitionTo(InjectionState next);

  InjectorConfig config_;
  IAudioStreamTransport& transport_;
  std::shared_ptr<time::ITimeSource> time_source_;
  std::unique_ptr<pacing::IWaitStrategy> wait_strategy_;
  InjectionState state_ = InjectionState::kIdle;
};

// Runs one pipeline and maps its outcome to an exit status, logging a single
// diagnostic line naming the failed stage.
int RunInjection(const InjectorConfig& config, IAudioStreamTransport& transport,
                 std::shared_ptr<time::ITimeSource> time_source,
                 std::unique_ptr<pacing::IWaitStrategy> wait_strategy);

}  // namespace audioinject::inject

#endif  // AUDIOINJECT_INJECT_INJECTION_PIPELINE_HPP_
