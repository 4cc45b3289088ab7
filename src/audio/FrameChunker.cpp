// Repository: AudioInject
// Component: FrameChunker
// Purpose: Slice a raw PCM buffer into fixed-duration frames and append a
//          trailing silence run that drains the receiver's jitter buffer.
// Copyright (c) 2026 AudioInject

#include "audioinject/audio/FrameChunker.hpp"

#include <algorithm>
#include <stdexcept>
#include <string>

#include "audioinject/util/Logger.hpp"

namespace audioinject::audio {

using util::Logger;

size_t FrameChunker::ChunkBytes(const AudioFormat& format, int chunk_duration_ms) {
  // Integer arithmetic; the fractional byte is dropped.
  const int64_t numerator = static_cast<int64_t>(format.sampling_rate_hz) *
                            format.Channels() * format.SampleWidthBytes() *
                            chunk_duration_ms;
  return static_cast<size_t>(numerator / 1000);
}

FrameChunker::FrameChunker(RawAudioBuffer buffer, AudioFormat format,
                           int chunk_duration_ms, int silence_frames)
    : buffer_(std::move(buffer)),
      format_(format),
      chunk_duration_ms_(chunk_duration_ms),
      silence_frames_(silence_frames),
      chunk_bytes_(0) {
  if (chunk_duration_ms_ <= 0) {
    throw std::invalid_argument("chunk duration must be positive, got " +
                                std::to_string(chunk_duration_ms_) + " ms");
  }
  if (silence_frames_ < 0) {
    throw std::invalid_argument("silence frame count must not be negative");
  }
  chunk_bytes_ = ChunkBytes(format_, chunk_duration_ms_);
  if (chunk_bytes_ == 0) {
    throw std::invalid_argument("chunk of " + std::to_string(chunk_duration_ms_) +
                                " ms at " + ToString(format_) + " is zero bytes");
  }

  const size_t block_align = static_cast<size_t>(format_.Channels() * format_.SampleWidthBytes());
  if (chunk_bytes_ % block_align != 0) {
    Logger::Warn("[FrameChunker] chunk size " + std::to_string(chunk_bytes_) +
                 " bytes is not a whole number of sample frames (" +
                 std::to_string(block_align) + " bytes each) at " + ToString(format_) +
                 "; frame boundaries will split samples");
  }

  Logger::Debug("[FrameChunker] " + std::to_string(buffer_.bytes.size()) + " bytes -> " +
                std::to_string(DataFrameCount()) + " data frames of " +
                std::to_string(chunk_bytes_) + " bytes + " +
                std::to_string(silence_frames_) + " silence frames");
}

size_t FrameChunker::DataFrameCount() const {
  return (buffer_.bytes.size() + chunk_bytes_ - 1) / chunk_bytes_;
}

std::optional<Frame> FrameChunker::Next() {
  if (cursor_ < buffer_.bytes.size()) {
    const size_t len = std::min(chunk_bytes_, buffer_.bytes.size() - cursor_);
    Frame frame;
    frame.format = format_;
    frame.payload.assign(buffer_.bytes.begin() + static_cast<std::ptrdiff_t>(cursor_),
                         buffer_.bytes.begin() + static_cast<std::ptrdiff_t>(cursor_ + len));
    cursor_ += len;
    return frame;
  }

  if (silence_emitted_ < silence_frames_) {
    ++silence_emitted_;
    Frame frame;
    frame.format = format_;
    frame.payload.assign(chunk_bytes_, 0);
    frame.is_silence = true;
    return frame;
  }

  return std::nullopt;
}

}  // namespace audioinject::audio
