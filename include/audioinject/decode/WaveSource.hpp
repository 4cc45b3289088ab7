// Repository: AudioInject
// Component: WaveSource
// Purpose: Decode an audio file container into interleaved 16-bit PCM bytes
//          using libavformat/libavcodec.
// Copyright (c) 2026 AudioInject

#ifndef AUDIOINJECT_DECODE_WAVE_SOURCE_HPP_
#define AUDIOINJECT_DECODE_WAVE_SOURCE_HPP_

#include <string>

#include "audioinject/audio/AudioTypes.hpp"

namespace audioinject::decode {

// Upper bound on decoded audio, independent of what the container advertises.
inline constexpr int kDefaultMaxReadSeconds = 60;

// WaveSource reads one audio stream from a file.
//
// Validation happens on container metadata, before any sample is decoded:
// the declared sample width must be 16 bits.  8-bit, 24-bit, 32-bit and
// compressed codecs are rejected with FormatError naming the width or codec.
//
// At most max_read_seconds * sample_rate sample frames are kept; the rest of
// the file is not read.
//
// Error Handling:
// - FormatError: unsupported sample width or codec
// - SourceReadError: missing, unreadable or undecodable file (carries the
//   FFmpeg/OS cause)
//
// Lifecycle: every FFmpeg handle is scoped to Read() and released before it
// returns, on all paths.
class WaveSource {
 public:
  explicit WaveSource(std::string path, int max_read_seconds = kDefaultMaxReadSeconds);

  audio::DecodedAudio Read() const;

  const std::string& path() const { return path_; }

 private:
  std::string path_;
  int max_read_seconds_;
};

}  // namespace audioinject::decode

#endif  // AUDIOINJECT_DECODE_WAVE_SOURCE_HPP_
