// Repository: AudioInject
// Component: InjectionPipeline
// Purpose: One injection run: decode → validate → chunk → pace → stream.
// Copyright (c) 2026 AudioInject

#include "audioinject/inject/InjectionPipeline.hpp"

#include <stdexcept>
#include <utility>

#include "audioinject/pacing/Pacer.hpp"
#include "audioinject/util/Errors.hpp"
#include "audioinject/util/Logger.hpp"

namespace audioinject::inject {

using util::Logger;

void InjectorConfig::Validate() const {
  if (audio_path.empty()) {
    throw std::invalid_argument("audio file path is required");
  }
  if (host.empty()) {
    throw std::invalid_argument("--host must not be empty");
  }
  if (port <= 0 || port > 65535) {
    throw std::invalid_argument("--port out of range: " + std::to_string(port));
  }
  if (chunk_duration_ms <= 0) {
    throw std::invalid_argument("--chunk-ms must be positive");
  }
  if (silence_frames < 0) {
    throw std::invalid_argument("--silence-frames must not be negative");
  }
  if (max_read_seconds <= 0) {
    throw std::invalid_argument("--max-seconds must be positive");
  }
}

const char* ToString(InjectionState state) {
  switch (state) {
    case InjectionState::kIdle: return "Idle";
    case InjectionState::kFormatValidated: return "FormatValidated";
    case InjectionState::kStreaming: return "Streaming";
    case InjectionState::kCompleted: return "Completed";
    case InjectionState::kFailed: return "Failed";
  }
  return "Unknown";
}

InjectionPipeline::InjectionPipeline(InjectorConfig config, IAudioStreamTransport& transport,
                                     std::shared_ptr<time::ITimeSource> time_source,
                                     std::unique_ptr<pacing::IWaitStrategy> wait_strategy)
    : config_(std::move(config)),
      transport_(transport),
      time_source_(std::move(time_source)),
      wait_strategy_(std::move(wait_strategy)) {
  config_.Validate();
}

void InjectionPipeline::TransitionTo(InjectionState next) {
  Logger::Debug(std::string("[InjectionPipeline] ") + ToString(state_) + " -> " + ToString(next));
  state_ = next;
}

InjectionSummary InjectionPipeline::Run() {
  if (state_ != InjectionState::kIdle) {
    throw std::logic_error("InjectionPipeline::Run called twice");
  }

  try {
    decode::WaveSource source(config_.audio_path, config_.max_read_seconds);
    audio::DecodedAudio decoded = source.Read();
    const audio::AudioFormat format = audio::AudioFormatFor(decoded);
    TransitionTo(InjectionState::kFormatValidated);

    audio::FrameChunker chunker(std::move(decoded.buffer), format,
                                config_.chunk_duration_ms, config_.silence_frames);
    Logger::Info("[InjectionPipeline] " + config_.audio_path + ": " + audio::ToString(format) +
                 ", " + std::to_string(chunker.TotalFrameCount()) + " frames of " +
                 std::to_string(config_.chunk_duration_ms) + " ms");

    pacing::Pacer pacer(chunker, config_.chunk_duration_ms, time_source_,
                        std::move(wait_strategy_));
    StreamInjector injector(transport_);
    TransitionTo(InjectionState::kStreaming);
    InjectionSummary summary = injector.Run(pacer);
    TransitionTo(InjectionState::kCompleted);
    return summary;
  } catch (...) {
    TransitionTo(InjectionState::kFailed);
    throw;
  }
}

int RunInjection(const InjectorConfig& config, IAudioStreamTransport& transport,
                 std::shared_ptr<time::ITimeSource> time_source,
                 std::unique_ptr<pacing::IWaitStrategy> wait_strategy) {
  try {
    InjectionPipeline pipeline(config, transport, std::move(time_source),
                               std::move(wait_strategy));
    pipeline.Run();
    Logger::Info("[inject-audio] audio injected successfully");
    return kExitSuccess;
  } catch (const FormatError& e) {
    Logger::Error(std::string("[inject-audio] format validation failed: ") + e.what());
    return kExitInjectionFailed;
  } catch (const SourceReadError& e) {
    Logger::Error(std::string("[inject-audio] source read failed: ") + e.what());
    return kExitSourceUnreadable;
  } catch (const StreamError& e) {
    Logger::Error(std::string("[inject-audio] streaming failed: ") + e.what());
    return kExitInjectionFailed;
  } catch (const std::invalid_argument& e) {
    Logger::Error(std::string("[inject-audio] invalid configuration: ") + e.what());
    return kExitUsage;
  }
}

}  // namespace audioinject::inject
