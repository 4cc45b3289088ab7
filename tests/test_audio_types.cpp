// Repository: AudioInject
// Component: Audio format validation unit tests
// Copyright (c) 2026 AudioInject

#include <gtest/gtest.h>

#include <stdexcept>

#include "audioinject/audio/AudioTypes.hpp"
#include "audioinject/util/Errors.hpp"

namespace audioinject::audio {
namespace {

DecodedAudio MakeDecoded(int rate, int channels, int width_bytes) {
  DecodedAudio decoded;
  decoded.sample_rate_hz = rate;
  decoded.buffer.channels = channels;
  decoded.buffer.sample_width_bytes = width_bytes;
  return decoded;
}

TEST(AudioFormatForTest, MonoSixteenBit) {
  AudioFormat format = AudioFormatFor(MakeDecoded(16000, 1, 2));
  EXPECT_EQ(format.sampling_rate_hz, 16000);
  EXPECT_EQ(format.channel_layout, ChannelLayout::kMono);
  EXPECT_EQ(format.sample_encoding, SampleEncoding::kSignedPcm16);
  EXPECT_EQ(format.Channels(), 1);
  EXPECT_EQ(format.SampleWidthBytes(), 2);
}

TEST(AudioFormatForTest, StereoSixteenBit) {
  AudioFormat format = AudioFormatFor(MakeDecoded(44100, 2, 2));
  EXPECT_EQ(format.channel_layout, ChannelLayout::kStereo);
  EXPECT_EQ(format.Channels(), 2);
  EXPECT_EQ(ToString(format), "44100Hz stereo s16");
}

TEST(AudioFormatForTest, RejectsOtherWidths) {
  EXPECT_THROW(AudioFormatFor(MakeDecoded(16000, 1, 1)), FormatError);
  EXPECT_THROW(AudioFormatFor(MakeDecoded(16000, 1, 3)), FormatError);
  EXPECT_THROW(AudioFormatFor(MakeDecoded(16000, 2, 4)), FormatError);
}

TEST(AudioFormatForTest, WidthErrorNamesTheWidth) {
  try {
    AudioFormatFor(MakeDecoded(16000, 1, 3));
    FAIL() << "expected FormatError";
  } catch (const FormatError& e) {
    EXPECT_NE(std::string(e.what()).find("24-bit"), std::string::npos) << e.what();
  }
}

TEST(AudioFormatForTest, RejectsMultichannel) {
  EXPECT_THROW(AudioFormatFor(MakeDecoded(48000, 6, 2)), FormatError);
}

TEST(AudioFormatForTest, RejectsNonPositiveRate) {
  EXPECT_THROW(AudioFormatFor(MakeDecoded(0, 1, 2)), std::invalid_argument);
}

}  // namespace
}  // namespace audioinject::audio
