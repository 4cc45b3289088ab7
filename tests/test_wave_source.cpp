// Repository: AudioInject
// Component: WaveSource decode tests
// Copyright (c) 2026 AudioInject
//
// Fixtures are written to /tmp and removed on scope exit.

#include <gtest/gtest.h>

#include <algorithm>
#include <stdexcept>
#include <string>

#include "audioinject/decode/WaveSource.hpp"
#include "audioinject/util/Errors.hpp"
#include "support/WavFixture.hpp"

namespace audioinject::decode {
namespace {

using testing::ScopedWavFile;
using testing::TempWavPath;
using testing::WriteWav;

TEST(WaveSourceTest, DecodesSixteenBitMono) {
  ScopedWavFile file(TempWavPath("mono16"));
  const auto expected = WriteWav(file.path(), 16000, 1, 16, 16000);

  audio::DecodedAudio decoded = WaveSource(file.path(), 60).Read();
  EXPECT_EQ(decoded.sample_rate_hz, 16000);
  EXPECT_EQ(decoded.buffer.channels, 1);
  EXPECT_EQ(decoded.buffer.sample_width_bytes, 2);
  EXPECT_EQ(decoded.buffer.bytes, expected);
}

TEST(WaveSourceTest, DecodesSixteenBitStereoInterleaved) {
  ScopedWavFile file(TempWavPath("stereo16"));
  const auto expected = WriteWav(file.path(), 44100, 2, 16, 4410);

  audio::DecodedAudio decoded = WaveSource(file.path()).Read();
  EXPECT_EQ(decoded.sample_rate_hz, 44100);
  EXPECT_EQ(decoded.buffer.channels, 2);
  EXPECT_EQ(decoded.buffer.bytes, expected);

  audio::AudioFormat format = audio::AudioFormatFor(decoded);
  EXPECT_EQ(format.channel_layout, audio::ChannelLayout::kStereo);
}

TEST(WaveSourceTest, EightBitIsFormatError) {
  ScopedWavFile file(TempWavPath("mono8"));
  WriteWav(file.path(), 8000, 1, 8, 800);
  EXPECT_THROW(WaveSource(file.path()).Read(), FormatError);
}

TEST(WaveSourceTest, TwentyFourBitIsFormatError) {
  ScopedWavFile file(TempWavPath("mono24"));
  WriteWav(file.path(), 48000, 1, 24, 480);
  try {
    WaveSource(file.path()).Read();
    FAIL() << "expected FormatError";
  } catch (const FormatError& e) {
    EXPECT_NE(std::string(e.what()).find("24-bit"), std::string::npos) << e.what();
  }
}

TEST(WaveSourceTest, MissingFileIsSourceReadError) {
  EXPECT_THROW(WaveSource("/tmp/audioinject_test_does_not_exist.wav").Read(), SourceReadError);
}

TEST(WaveSourceTest, ReadIsCappedAtMaxSeconds) {
  ScopedWavFile file(TempWavPath("long"));
  const auto full = WriteWav(file.path(), 8000, 1, 16, 8000 * 3);

  audio::DecodedAudio decoded = WaveSource(file.path(), 1).Read();
  ASSERT_EQ(decoded.buffer.bytes.size(), 8000u * 2u);
  EXPECT_TRUE(std::equal(decoded.buffer.bytes.begin(), decoded.buffer.bytes.end(), full.begin()));
}

TEST(WaveSourceTest, RejectsNonPositiveCap) {
  EXPECT_THROW(WaveSource("x.wav", 0), std::invalid_argument);
}

}  // namespace
}  // namespace audioinject::decode
