// Repository: AudioInject
// Component: inject-audio
// Purpose: Stream an audio file into a running emulator's microphone over
//          the EmulatorController.injectAudio call.
// Copyright (c) 2026 AudioInject
//
// Usage: inject-audio [OPTIONS] AUDIO_FILE
// Exit status: 0 success, 1 injection failed, 2 usage, 3 unreadable source.

#include <atomic>
#include <csignal>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>

#include "audioinject/inject/GrpcAudioTransport.hpp"
#include "audioinject/inject/InjectionPipeline.hpp"
#include "audioinject/pacing/IWaitStrategy.hpp"
#include "audioinject/time/SystemTimeSource.hpp"

namespace {

// =============================================================================
// Global state for signal handling
// =============================================================================
std::atomic<bool> g_termination_requested{false};

void SignalHandler(int signal) {
  if (signal == SIGINT || signal == SIGTERM) {
    g_termination_requested.store(true, std::memory_order_release);
  }
}

// =============================================================================
// CLI Arguments
// =============================================================================
struct CliArgs {
  audioinject::inject::InjectorConfig config;
  bool help = false;
  bool valid = false;
  std::string error;
};

void PrintUsage(const char* program_name) {
  std::cerr << "Usage: " << program_name << " [OPTIONS] AUDIO_FILE\n"
            << "\n"
            << "Streams a 16-bit PCM audio file to the emulator microphone in real time,\n"
            << "followed by a tail of silence.\n"
            << "\n"
            << "OPTIONS:\n"
            << "  --host HOST          Emulator gRPC host (default: localhost)\n"
            << "  --port PORT          Emulator gRPC port (default: "
            << audioinject::inject::kDefaultInjectPort << ")\n"
            << "  --chunk-ms MS        Frame duration in milliseconds (default: "
            << audioinject::audio::kDefaultChunkDurationMs << ")\n"
            << "  --silence-frames N   Silence frames appended after the audio (default: "
            << audioinject::audio::kDefaultSilenceFrames << ")\n"
            << "  --max-seconds S      Read at most S seconds of the file (default: "
            << audioinject::decode::kDefaultMaxReadSeconds << ")\n"
            << "  --help               Show this help message\n"
            << "\n"
            << "EXIT STATUS:\n"
            << "  0 success, 1 injection failed, 2 usage error, 3 unreadable audio file\n"
            << "\n"
            << "EXAMPLE:\n"
            << "    " << program_name << " --port 8556 prompts/ok_google.wav\n"
            << "\n";
}

bool ParseIntFlag(const std::string& flag, const char* value, int* out, std::string* error) {
  try {
    size_t consumed = 0;
    const int parsed = std::stoi(value, &consumed);
    if (consumed != std::string(value).size()) {
      throw std::invalid_argument(value);
    }
    *out = parsed;
    return true;
  } catch (const std::exception&) {
    *error = flag + " expects an integer, got '" + value + "'";
    return false;
  }
}

CliArgs ParseArgs(int argc, char* argv[]) {
  CliArgs args;

  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];

    if (arg == "--help" || arg == "-h") {
      args.help = true;
      args.valid = true;
      return args;
    } else if (arg == "--host" && i + 1 < argc) {
      args.config.host = argv[++i];
    } else if (arg == "--port" && i + 1 < argc) {
      if (!ParseIntFlag(arg, argv[++i], &args.config.port, &args.error)) return args;
    } else if (arg == "--chunk-ms" && i + 1 < argc) {
      if (!ParseIntFlag(arg, argv[++i], &args.config.chunk_duration_ms, &args.error)) return args;
    } else if (arg == "--silence-frames" && i + 1 < argc) {
      if (!ParseIntFlag(arg, argv[++i], &args.config.silence_frames, &args.error)) return args;
    } else if (arg == "--max-seconds" && i + 1 < argc) {
      if (!ParseIntFlag(arg, argv[++i], &args.config.max_read_seconds, &args.error)) return args;
    } else if (!arg.empty() && arg[0] == '-') {
      args.error = "Unknown argument: " + arg;
      return args;
    } else if (args.config.audio_path.empty()) {
      args.config.audio_path = arg;
    } else {
      args.error = "Unexpected extra argument: " + arg;
      return args;
    }
  }

  if (args.config.audio_path.empty()) {
    args.error = "Must specify an AUDIO_FILE";
    return args;
  }

  try {
    args.config.Validate();
  } catch (const std::invalid_argument& e) {
    args.error = e.what();
    return args;
  }

  args.valid = true;
  return args;
}

}  // namespace

// =============================================================================
// Main Entry Point
// =============================================================================

int main(int argc, char* argv[]) {
  CliArgs args = ParseArgs(argc, argv);

  if (args.help) {
    PrintUsage(argv[0]);
    return audioinject::inject::kExitSuccess;
  }

  if (!args.valid) {
    std::cerr << "Error: " << args.error << "\n\n";
    PrintUsage(argv[0]);
    return audioinject::inject::kExitUsage;
  }

  std::signal(SIGINT, SignalHandler);
  std::signal(SIGTERM, SignalHandler);

  audioinject::inject::GrpcAudioTransport transport(args.config.TargetAddress());
  return audioinject::inject::RunInjection(
      args.config, transport, std::make_shared<audioinject::time::SystemTimeSource>(),
      std::make_unique<audioinject::pacing::RealtimeWaitStrategy>(&g_termination_requested));
}
