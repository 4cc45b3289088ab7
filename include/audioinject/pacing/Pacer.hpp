// Repository: AudioInject
// Component: Pacer
// Purpose: Stamp frames on a single session clock and release them at
//          real-time cadence.
// Copyright (c) 2026 AudioInject
//
// Pacer sleeps to absolute deadlines keyed to a session frame index rather
// than accumulating relative sleeps, so N frames take N chunk durations of
// wall time with no cumulative drift.  The same clock runs across the
// data/silence boundary.

#ifndef AUDIOINJECT_PACING_PACER_HPP_
#define AUDIOINJECT_PACING_PACER_HPP_

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>

#include "audioinject/audio/AudioTypes.hpp"
#include "audioinject/pacing/IWaitStrategy.hpp"
#include "audioinject/time/ITimeSource.hpp"

namespace audioinject::pacing {

class Pacer : public audio::IFrameSource {
 public:
  // source is borrowed and must outlive the Pacer.
  // time_source supplies the wall-clock epoch for timestamps.
  // wait_strategy defaults to RealtimeWaitStrategy with no stop flag.
  Pacer(audio::IFrameSource& source, int chunk_duration_ms,
        std::shared_ptr<time::ITimeSource> time_source,
        std::unique_ptr<IWaitStrategy> wait_strategy = nullptr);

  Pacer(const Pacer&) = delete;
  Pacer& operator=(const Pacer&) = delete;

  // Frame 0 is returned immediately and fixes the session epoch.
  // Frame N is returned no earlier than session start + N * chunk duration,
  // stamped epoch_us + N * chunk_duration_ms * 1000.
  // Returns nullopt when the source is exhausted (without waiting) or when
  // pacing was cancelled (including mid-wait).
  std::optional<audio::Frame> Next() override;

  // Stop emitting.  Wakes a pending wait.  Safe from any thread.
  void Cancel();

  bool Cancelled() const { return cancelled_.load(std::memory_order_acquire); }
  int64_t FramesEmitted() const { return frames_emitted_; }
  int64_t FrameDurationUs() const { return frame_duration_us_; }

  // Absolute offset of frame N from session start.  Pure arithmetic.
  std::chrono::nanoseconds DeadlineOffset(int64_t session_frame_index) const;

  // Valid after the first frame has been emitted.
  int64_t SessionEpochUtcUs() const { return session_epoch_utc_us_; }

 private:
  audio::IFrameSource& source_;
  int64_t frame_duration_us_;
  std::shared_ptr<time::ITimeSource> time_source_;
  std::unique_ptr<IWaitStrategy> wait_strategy_;

  std::atomic<bool> cancelled_{false};
  bool started_ = false;
  int64_t frames_emitted_ = 0;
  int64_t session_epoch_utc_us_ = 0;
  std::chrono::steady_clock::time_point session_start_;
};

}  // namespace audioinject::pacing

#endif  // AUDIOINJECT_PACING_PACER_HPP_
