// Repository: AudioInject
// Component: Audio Types
// Purpose: Format, raw buffer and frame value types shared by every stage.
// Copyright (c) 2026 AudioInject

#ifndef AUDIOINJECT_AUDIO_AUDIO_TYPES_HPP_
#define AUDIOINJECT_AUDIO_AUDIO_TYPES_HPP_

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace audioinject::audio {

// Only 16-bit signed PCM is carried to the receiver.
inline constexpr int kRequiredSampleWidthBytes = 2;

enum class ChannelLayout { kMono, kStereo };

enum class SampleEncoding { kSignedPcm16 };

struct AudioFormat {
  int sampling_rate_hz = 0;
  ChannelLayout channel_layout = ChannelLayout::kMono;
  SampleEncoding sample_encoding = SampleEncoding::kSignedPcm16;

  int Channels() const { return channel_layout == ChannelLayout::kStereo ? 2 : 1; }
  int SampleWidthBytes() const { return kRequiredSampleWidthBytes; }

  bool operator==(const AudioFormat& other) const {
    return sampling_rate_hz == other.sampling_rate_hz &&
           channel_layout == other.channel_layout &&
           sample_encoding == other.sample_encoding;
  }
  bool operator!=(const AudioFormat& other) const { return !(*this == other); }
};

// Interleaved PCM bytes as captured from the source, plus the layout they
// were captured with.
struct RawAudioBuffer {
  std::vector<uint8_t> bytes;
  int channels = 0;
  int sample_width_bytes = 0;
};

// WaveSource output: the buffer plus the declared sample rate.
struct DecodedAudio {
  RawAudioBuffer buffer;
  int sample_rate_hz = 0;
};

// One fixed-duration slice of audio.  timestamp_us is 0 until Pacer stamps it.
struct Frame {
  AudioFormat format;
  int64_t timestamp_us = 0;
  std::vector<uint8_t> payload;
  bool is_silence = false;
};

// Finite, ordered, non-restartable frame sequence.
class IFrameSource {
 public:
  virtual ~IFrameSource() = default;
  // Next frame in emission order, or nullopt once the sequence is exhausted.
  virtual std::optional<Frame> Next() = 0;
};

// Derives the receiver format from decoded metadata.
// Throws FormatError for a sample width other than 16 bits or a channel
// count other than 1 or 2, and std::invalid_argument for a non-positive rate.
AudioFormat AudioFormatFor(const DecodedAudio& decoded);

std::string ToString(const AudioFormat& format);

}  // namespace audioinject::audio

#endif  // AUDIOINJECT_AUDIO_AUDIO_TYPES_HPP_
