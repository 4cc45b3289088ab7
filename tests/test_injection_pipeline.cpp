// Repository: AudioInject
// Component: InjectionPipeline end-to-end tests (fake transport, virtual time)
// Copyright (c) 2026 AudioInject

#include <gtest/gtest.h>

#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "audioinject/inject/InjectionPipeline.hpp"
#include "audioinject/util/Errors.hpp"
#include "audioinject/util/Logger.hpp"
#include "support/DeterministicTimeSource.hpp"
#include "support/DeterministicWaitStrategy.hpp"
#include "support/FakeAudioTransport.hpp"
#include "support/WavFixture.hpp"

namespace audioinject::inject {
namespace {

using testing::DeterministicTimeSource;
using testing::DeterministicWaitStrategy;
using testing::FakeAudioTransport;
using testing::ScopedWavFile;
using testing::TempWavPath;
using testing::WaitLog;
using testing::WriteWav;

class InjectionPipelineTest : public ::testing::Test {
 protected:
  void SetUp() override {
    util::Logger::SetCaptureSink(util::Logger::Level::kError,
                                 [this](util::Logger::Level, const std::string& line) {
                                   errors_.push_back(line);
                                 });
  }
  void TearDown() override { util::Logger::ClearCaptureSink(); }

  InjectorConfig Config(const std::string& path) {
    InjectorConfig config;
    config.audio_path = path;
    return config;
  }

  std::unique_ptr<pacing::IWaitStrategy> Strategy() {
    return std::make_unique<DeterministicWaitStrategy>(ts_, log_);
  }

  std::shared_ptr<DeterministicTimeSource> ts_ =
      std::make_shared<DeterministicTimeSource>(5'000'000);
  std::shared_ptr<WaitLog> log_ = std::make_shared<WaitLog>();
  std::vector<std::string> errors_;
};

TEST_F(InjectionPipelineTest, InjectsOneSecondMonoFile) {
  ScopedWavFile file(TempWavPath("pipeline_ok"));
  const auto pcm = WriteWav(file.path(), 16000, 1, 16, 16000);
  FakeAudioTransport transport;

  InjectionPipeline pipeline(Config(file.path()), transport, ts_, Strategy());
  EXPECT_EQ(pipeline.state(), InjectionState::kIdle);
  InjectionSummary summary = pipeline.Run();
  EXPECT_EQ(pipeline.state(), InjectionState::kCompleted);

  const auto& frames = transport.record().frames;
  ASSERT_EQ(frames.size(), 43u);
  EXPECT_EQ(summary.frames_submitted, 43);
  std::vector<uint8_t> joined;
  for (const auto& frame : frames) {
    EXPECT_EQ(frame.format.sampling_rate_hz, 16000);
    EXPECT_EQ(frame.format.channel_layout, audio::ChannelLayout::kMono);
    if (!frame.is_silence) {
      joined.insert(joined.end(), frame.payload.begin(), frame.payload.end());
    }
  }
  EXPECT_EQ(joined, pcm);
  EXPECT_EQ(frames.front().timestamp_us, 5'000'000);
  EXPECT_EQ(frames.back().timestamp_us, 5'000'000 + 42 * 30000);
}

TEST_F(InjectionPipelineTest, RunTwiceIsLogicError) {
  ScopedWavFile file(TempWavPath("pipeline_twice"));
  WriteWav(file.path(), 16000, 1, 16, 160);
  FakeAudioTransport transport;

  InjectionPipeline pipeline(Config(file.path()), transport, ts_, Strategy());
  pipeline.Run();
  EXPECT_THROW(pipeline.Run(), std::logic_error);
}

// -----------------------------------------------------------------------------
// Format rejection happens before any network activity
// -----------------------------------------------------------------------------
TEST_F(InjectionPipelineTest, EightBitFileNeverOpensStream) {
  ScopedWavFile file(TempWavPath("pipeline_u8"));
  WriteWav(file.path(), 8000, 1, 8, 8000);
  FakeAudioTransport transport;

  InjectionPipeline pipeline(Config(file.path()), transport, ts_, Strategy());
  EXPECT_THROW(pipeline.Run(), FormatError);
  EXPECT_EQ(pipeline.state(), InjectionState::kFailed);
  EXPECT_EQ(transport.record().open_calls, 0);
}

TEST_F(InjectionPipelineTest, EightBitFileExitsOne) {
  ScopedWavFile file(TempWavPath("pipeline_u8_exit"));
  WriteWav(file.path(), 8000, 1, 8, 8000);
  FakeAudioTransport transport;

  EXPECT_EQ(RunInjection(Config(file.path()), transport, ts_, Strategy()), kExitInjectionFailed);
  EXPECT_EQ(transport.record().open_calls, 0);
  ASSERT_EQ(errors_.size(), 1u);
  EXPECT_NE(errors_[0].find("format validation failed"), std::string::npos) << errors_[0];
}

TEST_F(InjectionPipelineTest, MissingFileExitsThree) {
  FakeAudioTransport transport;
  EXPECT_EQ(RunInjection(Config("/tmp/audioinject_test_missing.wav"), transport, ts_, Strategy()),
            kExitSourceUnreadable);
  EXPECT_EQ(transport.record().open_calls, 0);
}

TEST_F(InjectionPipelineTest, StreamFailureExitsOne) {
  ScopedWavFile file(TempWavPath("pipeline_broken"));
  WriteWav(file.path(), 16000, 1, 16, 16000);
  FakeAudioTransport transport(/*fail_on_write=*/5, /*failure_code=*/14, "unavailable");

  EXPECT_EQ(RunInjection(Config(file.path()), transport, ts_, Strategy()), kExitInjectionFailed);
  EXPECT_EQ(transport.record().write_attempts, 5);
  ASSERT_EQ(errors_.size(), 1u);
  EXPECT_NE(errors_[0].find("unavailable"), std::string::npos) << errors_[0];
}

TEST_F(InjectionPipelineTest, StreamFailureLeavesFailedState) {
  ScopedWavFile file(TempWavPath("pipeline_failed_state"));
  WriteWav(file.path(), 16000, 1, 16, 16000);
  FakeAudioTransport transport(3);

  InjectionPipeline pipeline(Config(file.path()), transport, ts_, Strategy());
  EXPECT_THROW(pipeline.Run(), StreamError);
  EXPECT_EQ(pipeline.state(), InjectionState::kFailed);
  EXPECT_EQ(transport.record().open_calls, 1);
}

TEST_F(InjectionPipelineTest, InvalidConfigExitsTwo) {
  FakeAudioTransport transport;
  InjectorConfig config = Config("a.wav");
  config.chunk_duration_ms = 0;
  EXPECT_EQ(RunInjection(config, transport, ts_, Strategy()), kExitUsage);
}

TEST(InjectorConfigTest, ValidateAndTarget) {
  InjectorConfig config;
  EXPECT_THROW(config.Validate(), std::invalid_argument);  // no path
  config.audio_path = "in.wav";
  EXPECT_NO_THROW(config.Validate());
  EXPECT_EQ(config.TargetAddress(), "localhost:8556");

  config.port = 70000;
  EXPECT_THROW(config.Validate(), std::invalid_argument);
  config.port = 8556;
  config.silence_frames = -1;
  EXPECT_THROW(config.Validate(), std::invalid_argument);
  config.silence_frames = 0;
  config.max_read_seconds = 0;
  EXPECT_THROW(config.Validate(), std::invalid_argument);
}

TEST(InjectionStateTest, Names) {
  EXPECT_STREQ(ToString(InjectionState::kIdle), "Idle");
  EXPECT_STREQ(ToString(InjectionState::kFormatValidated), "FormatValidated");
  EXPECT_STREQ(ToString(InjectionState::kStreaming), "Streaming");
  EXPECT_STREQ(ToString(InjectionState::kCompleted), "Completed");
  EXPECT_STREQ(ToString(InjectionState::kFailed), "Failed");
}

}  // namespace
}  // namespace audioinject::inject
