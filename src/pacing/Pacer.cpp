// Repository: AudioInject
// Component: Pacer
// Purpose: Stamp frames on a single session clock and release them at
//          real-time cadence.
// Copyright (c) 2026 AudioInject

#include "audioinject/pacing/Pacer.hpp"

#include <stdexcept>
#include <string>

#include "audioinject/util/Logger.hpp"

namespace audioinject::pacing {

using util::Logger;

Pacer::Pacer(audio::IFrameSource& source, int chunk_duration_ms,
             std::shared_ptr<time::ITimeSource> time_source,
             std::unique_ptr<IWaitStrategy> wait_strategy)
    : source_(source),
      frame_duration_us_(static_cast<int64_t>(chunk_duration_ms) * 1000),
      time_source_(std::move(time_source)),
      wait_strategy_(std::move(wait_strategy)) {
  if (chunk_duration_ms <= 0) {
    throw std::invalid_argument("Pacer requires a positive chunk duration");
  }
  if (!time_source_) {
    throw std::invalid_argument("Pacer requires a time source");
  }
  if (!wait_strategy_) {
    wait_strategy_ = std::make_unique<RealtimeWaitStrategy>();
  }
}

std::chrono::nanoseconds Pacer::DeadlineOffset(int64_t session_frame_index) const {
  return std::chrono::microseconds(session_frame_index * frame_duration_us_);
}

std::optional<audio::Frame> Pacer::Next() {
  if (Cancelled()) return std::nullopt;

  std::optional<audio::Frame> frame = source_.Next();
  if (!frame) return std::nullopt;

  if (!started_) {
    started_ = true;
    session_start_ = std::chrono::steady_clock::now();
    session_epoch_utc_us_ = time_source_->NowUtcUs();
    Logger::Debug("[Pacer] session start epoch_us=" + std::to_string(session_epoch_utc_us_) +
                  " frame_us=" + std::to_string(frame_duration_us_));
  } else {
    const auto deadline = session_start_ + DeadlineOffset(frames_emitted_);
    if (!wait_strategy_->WaitUntil(deadline)) {
      cancelled_.store(true, std::memory_order_release);
      Logger::Debug("[Pacer] wait interrupted before frame " + std::to_string(frames_emitted_));
      return std::nullopt;
    }
    // Cancel() may land between the wake-up and here.
    if (Cancelled()) return std::nullopt;
  }

  frame->timestamp_us = session_epoch_utc_us_ + frames_emitted_ * frame_duration_us_;
  ++frames_emitted_;
  return frame;
}

void Pacer::Cancel() {
  cancelled_.store(true, std::memory_order_release);
  wait_strategy_->Interrupt();
}

}  // namespace audioinject::pacing
