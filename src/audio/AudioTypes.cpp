// Repository: AudioInject
// Component: Audio Types
// Purpose: Format derivation and diagnostics for the shared audio types.
// Copyright (c) 2026 AudioInject

#include "audioinject/audio/AudioTypes.hpp"

#include <sstream>
#include <stdexcept>

#include "audioinject/util/Errors.hpp"

namespace audioinject::audio {

AudioFormat AudioFormatFor(const DecodedAudio& decoded) {
  const RawAudioBuffer& buffer = decoded.buffer;
  if (buffer.sample_width_bytes != kRequiredSampleWidthBytes) {
    throw FormatError("unsupported sample width: " +
                      std::to_string(buffer.sample_width_bytes * 8) +
                      "-bit (only 16-bit PCM is accepted)");
  }
  if (decoded.sample_rate_hz <= 0) {
    throw std::invalid_argument("sample rate must be positive, got " +
                                std::to_string(decoded.sample_rate_hz));
  }

  AudioFormat format;
  format.sampling_rate_hz = decoded.sample_rate_hz;
  format.sample_encoding = SampleEncoding::kSignedPcm16;
  switch (buffer.channels) {
    case 1:
      format.channel_layout = ChannelLayout::kMono;
      break;
    case 2:
      format.channel_layout = ChannelLayout::kStereo;
      break;
    default:
      throw FormatError("unsupported channel count: " +
                        std::to_string(buffer.channels) +
                        " (only mono or stereo is accepted)");
  }
  return format;
}

std::string ToString(const AudioFormat& format) {
  std::ostringstream oss;
  oss << format.sampling_rate_hz << "Hz "
      << (format.channel_layout == ChannelLayout::kStereo ? "stereo" : "mono")
      << " s16";
  return oss.str();
}

}  // namespace audioinject::audio
