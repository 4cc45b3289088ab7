// Repository: AudioInject
// Component: gRPC audio transport implementation
// Purpose: IAudioStreamTransport over EmulatorController.injectAudio.
// Copyright (c) 2026 AudioInject

#include "audioinject/inject/GrpcAudioTransport.hpp"

#include <google/protobuf/empty.pb.h>

#include "audioinject/util/Logger.hpp"

namespace audioinject::inject {

namespace proto = android::emulation::control;

using util::Logger;

namespace {

// One injectAudio call.  The context and writer live exactly as long as this
// object; if Finish() was never reached the call is cancelled and reaped in
// the destructor.
class GrpcAudioStream : public IAudioStream {
 public:
  explicit GrpcAudioStream(proto::EmulatorController::Stub* stub)
      : context_(std::make_unique<grpc::ClientContext>()) {
    writer_ = stub->injectAudio(context_.get(), &response_);
  }

  ~GrpcAudioStream() override {
    if (!finished_ && writer_) {
      context_->TryCancel();
      grpc::Status status = writer_->Finish();
      Logger::Debug("[GrpcAudioTransport] abandoned stream reaped: code=" +
                    std::to_string(static_cast<int>(status.error_code())));
    }
  }

  GrpcAudioStream(const GrpcAudioStream&) = delete;
  GrpcAudioStream& operator=(const GrpcAudioStream&) = delete;

  bool Write(const audio::Frame& frame) override {
    if (!writer_ || finished_) return false;
    return writer_->Write(GrpcAudioTransport::ToProto(frame));
  }

  void Cancel() override { context_->TryCancel(); }

  StreamStatus Finish() override {
    StreamStatus result;
    if (finished_) {
      result.code = StreamStatus::kUnknown;
      result.detail = "stream already finished";
      return result;
    }
    finished_ = true;
    if (!writer_) {
      result.code = StreamStatus::kUnknown;
      result.detail = "injectAudio call was not created";
      return result;
    }
    // Finish() carries the authoritative status even when WritesDone fails.
    if (!writer_->WritesDone()) {
      Logger::Debug("[GrpcAudioTransport] WritesDone on a closed stream");
    }
    grpc::Status status = writer_->Finish();
    result.code = static_cast<int>(status.error_code());
    result.detail = status.error_message();
    return result;
  }

 private:
  std::unique_ptr<grpc::ClientContext> context_;
  google::protobuf::Empty response_;
  std::unique_ptr<grpc::ClientWriter<proto::AudioPacket>> writer_;
  bool finished_ = false;
};

}  // namespace

GrpcAudioTransport::GrpcAudioTransport(const std::string& target_address)
    : target_address_(target_address),
      grpc_channel_(grpc::CreateChannel(target_address, grpc::InsecureChannelCredentials())),
      stub_(proto::EmulatorController::NewStub(grpc_channel_)) {}

std::unique_ptr<IAudioStream> GrpcAudioTransport::OpenStream() {
  Logger::Debug("[GrpcAudioTransport] opening injectAudio on " + target_address_);
  return std::make_unique<GrpcAudioStream>(stub_.get());
}

proto::AudioPacket GrpcAudioTransport::ToProto(const audio::Frame& frame) {
  proto::AudioPacket p;
  auto* format = p.mutable_format();
  format->set_samplingrate(static_cast<uint64_t>(frame.format.sampling_rate_hz));
  format->set_channels(frame.format.channel_layout == audio::ChannelLayout::kStereo
                           ? proto::AudioFormat::Stereo
                           : proto::AudioFormat::Mono);
  format->set_format(proto::AudioFormat::AUD_FMT_S16);
  p.set_timestamp(static_cast<uint64_t>(frame.timestamp_us));
  p.set_audio(frame.payload.data(), frame.payload.size());
  return p;
}

}  // namespace audioinject::inject
