// Repository: AudioInject
// Component: StreamInjector unit tests
// Copyright (c) 2026 AudioInject

#include <gtest/gtest.h>

#include <memory>

#include "audioinject/audio/FrameChunker.hpp"
#include "audioinject/inject/StreamInjector.hpp"
#include "audioinject/util/Errors.hpp"
#include "support/DeterministicTimeSource.hpp"
#include "support/DeterministicWaitStrategy.hpp"
#include "support/FakeAudioTransport.hpp"
#include "support/WavFixture.hpp"

namespace audioinject::inject {
namespace {

using testing::DeterministicTimeSource;
using testing::DeterministicWaitStrategy;
using testing::FakeAudioTransport;
using testing::WaitLog;

constexpr int64_t kEpochUs = 1'000'000;

audio::FrameChunker MakeChunker(size_t bytes, int silence_frames) {
  audio::AudioFormat format;
  format.sampling_rate_hz = 16000;
  format.channel_layout = audio::ChannelLayout::kMono;
  audio::RawAudioBuffer buffer;
  buffer.bytes = testing::PatternBytes(bytes);
  buffer.channels = 1;
  buffer.sample_width_bytes = 2;
  return audio::FrameChunker(std::move(buffer), format, 30, silence_frames);
}

class StreamInjectorTest : public ::testing::Test {
 protected:
  std::unique_ptr<pacing::Pacer> MakePacer(audio::FrameChunker& chunker,
                                           int interrupt_on_wait = 0) {
    return std::make_unique<pacing::Pacer>(
        chunker, 30, ts_,
        std::make_unique<DeterministicWaitStrategy>(ts_, log_, interrupt_on_wait));
  }

  std::shared_ptr<DeterministicTimeSource> ts_ =
      std::make_shared<DeterministicTimeSource>(kEpochUs);
  std::shared_ptr<WaitLog> log_ = std::make_shared<WaitLog>();
};

TEST_F(StreamInjectorTest, SubmitsEveryFrameInOrder) {
  auto chunker = MakeChunker(32000, 10);
  auto pacer = MakePacer(chunker);
  FakeAudioTransport transport;

  InjectionSummary summary = StreamInjector(transport).Run(*pacer);

  const auto& rec = transport.record();
  EXPECT_EQ(rec.open_calls, 1);
  EXPECT_EQ(rec.finish_calls, 1);
  EXPECT_EQ(rec.cancel_calls, 0);
  ASSERT_EQ(rec.frames.size(), 43u);
  EXPECT_EQ(summary.frames_submitted, 43);
  EXPECT_EQ(summary.silence_frames_submitted, 10);
  EXPECT_EQ(summary.bytes_submitted, 32000u + 10u * 960u);

  for (size_t i = 0; i < rec.frames.size(); ++i) {
    EXPECT_EQ(rec.frames[i].timestamp_us, kEpochUs + static_cast<int64_t>(i) * 30000);
  }
  EXPECT_TRUE(rec.frames.back().is_silence);
}

// -----------------------------------------------------------------------------
// Transport breaks on the 5th write: error surfaced, no further pacing
// -----------------------------------------------------------------------------
TEST_F(StreamInjectorTest, FailureOnFifthWriteSurfacesTransportStatus) {
  auto chunker = MakeChunker(32000, 10);
  auto pacer = MakePacer(chunker);
  FakeAudioTransport transport(/*fail_on_write=*/5, /*failure_code=*/14, "emulator went away");

  try {
    StreamInjector(transport).Run(*pacer);
    FAIL() << "expected StreamError";
  } catch (const StreamError& e) {
    EXPECT_EQ(e.code(), 14);
    EXPECT_EQ(e.detail(), "emulator went away");
  }

  const auto& rec = transport.record();
  EXPECT_EQ(rec.write_attempts, 5);
  EXPECT_EQ(rec.frames.size(), 4u);
  EXPECT_EQ(rec.finish_calls, 1);
  // Frames 1..4 waited once each; nothing was waited for after the failure.
  EXPECT_EQ(log_->deadlines.size(), 4u);
  EXPECT_TRUE(pacer->Cancelled());
}

TEST_F(StreamInjectorTest, RejectedWriteWithOkFinishIsStillAnError) {
  auto chunker = MakeChunker(9600, 0);
  auto pacer = MakePacer(chunker);
  FakeAudioTransport transport(/*fail_on_write=*/2, /*failure_code=*/0, "");

  try {
    StreamInjector(transport).Run(*pacer);
    FAIL() << "expected StreamError";
  } catch (const StreamError& e) {
    EXPECT_EQ(e.code(), StreamStatus::kUnknown);
  }
  EXPECT_EQ(transport.record().frames.size(), 1u);
}

TEST_F(StreamInjectorTest, ExternalStopCancelsCall) {
  auto chunker = MakeChunker(32000, 10);
  auto pacer = MakePacer(chunker, /*interrupt_on_wait=*/6);
  FakeAudioTransport transport;

  try {
    StreamInjector(transport).Run(*pacer);
    FAIL() << "expected StreamError";
  } catch (const StreamError& e) {
    EXPECT_EQ(e.code(), StreamStatus::kCancelled);
  }

  const auto& rec = transport.record();
  EXPECT_EQ(rec.frames.size(), 6u);
  EXPECT_EQ(rec.cancel_calls, 1);
  EXPECT_EQ(rec.finish_calls, 1);
}

TEST_F(StreamInjectorTest, SilenceOnlySequence) {
  auto chunker = MakeChunker(0, 3);
  auto pacer = MakePacer(chunker);
  FakeAudioTransport transport;

  InjectionSummary summary = StreamInjector(transport).Run(*pacer);
  EXPECT_EQ(summary.frames_submitted, 3);
  EXPECT_EQ(summary.silence_frames_submitted, 3);
}

}  // namespace
}  // namespace audioinject::inject
