// Repository: AudioInject
// Component: FrameChunker
// Purpose: Slice a raw PCM buffer into fixed-duration frames and append a
//          trailing silence run that drains the receiver's jitter buffer.
// Copyright (c) 2026 AudioInject

#ifndef AUDIOINJECT_AUDIO_FRAME_CHUNKER_HPP_
#define AUDIOINJECT_AUDIO_FRAME_CHUNKER_HPP_

#include <cstddef>
#include <cstdint>
#include <optional>

#include "audioinject/audio/AudioTypes.hpp"

namespace audioinject::audio {

inline constexpr int kDefaultChunkDurationMs = 30;

// Number of all-zero frames appended after the last data frame.
inline constexpr int kDefaultSilenceFrames = 10;

// FrameChunker walks the buffer in non-overlapping windows of ChunkBytes().
// The final data window may be shorter; it is emitted as-is.  Afterwards
// exactly silence_frames frames of ChunkBytes() zero bytes follow.
//
// Emitted frames carry timestamp_us = 0; Pacer stamps them.
//
// Not restartable: once Next() returns nullopt it keeps returning nullopt.
class FrameChunker : public IFrameSource {
 public:
  // Throws std::invalid_argument if chunk_duration_ms <= 0,
  // silence_frames < 0, or the computed chunk size is zero bytes.
  FrameChunker(RawAudioBuffer buffer, AudioFormat format,
               int chunk_duration_ms = kDefaultChunkDurationMs,
               int silence_frames = kDefaultSilenceFrames);

  std::optional<Frame> Next() override;

  // sample_rate * channels * sample_width * duration_ms / 1000, truncated.
  static size_t ChunkBytes(const AudioFormat& format, int chunk_duration_ms);

  size_t ChunkBytes() const { return chunk_bytes_; }
  int ChunkDurationMs() const { return chunk_duration_ms_; }

  // ceil(buffer / chunk) data frames plus the silence run.
  size_t DataFrameCount() const;
  size_t TotalFrameCount() const { return DataFrameCount() + static_cast<size_t>(silence_frames_); }

 private:
  RawAudioBuffer buffer_;
  AudioFormat format_;
  int chunk_duration_ms_;
  int silence_frames_;
  size_t chunk_bytes_;

  size_t cursor_ = 0;
  int silence_emitted_ = 0;
};

}  // namespace audioinject::audio

#endif  // AUDIOINJECT_AUDIO_FRAME_CHUNKER_HPP_
