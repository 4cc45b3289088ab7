// Repository: AudioInject
// Component: gRPC audio transport
// Purpose: IAudioStreamTransport over EmulatorController.injectAudio.
// Copyright (c) 2026 AudioInject

#ifndef AUDIOINJECT_INJECT_GRPC_AUDIO_TRANSPORT_HPP_
#define AUDIOINJECT_INJECT_GRPC_AUDIO_TRANSPORT_HPP_

#include <memory>
#include <string>

#include <grpcpp/grpcpp.h>
#include "emulator_controller.grpc.pb.h"

#include "audioinject/inject/IAudioStreamTransport.hpp"

namespace audioinject::inject {

// Opens client-streaming injectAudio calls on an insecure channel.
//
// One channel and stub per transport; one ClientContext per stream.
class GrpcAudioTransport : public IAudioStreamTransport {
 public:
  explicit GrpcAudioTransport(const std::string& target_address);

  GrpcAudioTransport(const GrpcAudioTransport&) = delete;
  GrpcAudioTransport& operator=(const GrpcAudioTransport&) = delete;

  std::unique_ptr<IAudioStream> OpenStream() override;
  std::string Describe() const override { return target_address_; }

  // Convert a frame to its wire message.
  static android::emulation::control::AudioPacket ToProto(const audio::Frame& frame);

 private:
  std::string target_address_;
  std::shared_ptr<grpc::Channel> grpc_channel_;
  std::unique_ptr<android::emulation::control::EmulatorController::Stub> stub_;
};

}  // namespace audioinject::inject

#endif  // AUDIOINJECT_INJECT_GRPC_AUDIO_TRANSPORT_HPP_
