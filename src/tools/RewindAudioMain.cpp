// Repository: AudioInject
// Component: rewind-audio
// Purpose: Ask the emulator console to rewind injected audio playback.
// Copyright (c) 2026 AudioInject
//
// Usage: rewind-audio [OPTIONS]
// Exit status: 0 success, 1 console exchange failed, 2 usage.

#include <chrono>
#include <iostream>
#include <stdexcept>
#include <string>

#include "audioinject/console/ConsoleClient.hpp"

namespace {

struct CliArgs {
  audioinject::console::ConsoleConfig config;
  bool help = false;
  bool valid = false;
  std::string error;
};

void PrintUsage(const char* program_name) {
  std::cerr << "Usage: " << program_name << " [OPTIONS]\n"
            << "\n"
            << "Authenticates to the emulator console and sends '"
            << audioinject::console::kRewindAudioCommand << "'.\n"
            << "\n"
            << "OPTIONS:\n"
            << "  --host HOST          Console host (default: localhost)\n"
            << "  --port PORT          Console port (default: "
            << audioinject::console::kDefaultConsolePort << ")\n"
            << "  --token-file PATH    Auth token file (default: $HOME/.emulator_console_auth_token)\n"
            << "  --timeout-ms MS      Per-reply timeout (default: 5000)\n"
            << "  --help               Show this help message\n"
            << "\n";
}

bool ParsePositiveInt(const std::string& flag, const char* value, int* out, std::string* error) {
  try {
    size_t consumed = 0;
    const int parsed = std::stoi(value, &consumed);
    if (consumed != std::string(value).size() || parsed <= 0) {
      throw std::invalid_argument(value);
    }
    *out = parsed;
    return true;
  } catch (const std::exception&) {
    *error = flag + " expects a positive integer, got '" + value + "'";
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
      if (!ParsePositiveInt(arg, argv[++i], &args.config.port, &args.error)) return args;
    } else if (arg == "--token-file" && i + 1 < argc) {
      args.config.token_path = argv[++i];
    } else if (arg == "--timeout-ms" && i + 1 < argc) {
      int timeout_ms = 0;
      if (!ParsePositiveInt(arg, argv[++i], &timeout_ms, &args.error)) return args;
      args.config.reply_timeout = std::chrono::milliseconds(timeout_ms);
    } else {
      args.error = "Unknown argument: " + arg;
      return args;
    }
  }

  if (args.config.port > 65535) {
    args.error = "--port out of range";
    return args;
  }

  args.valid = true;
  return args;
}

}  // namespace

int main(int argc, char* argv[]) {
  CliArgs args = ParseArgs(argc, argv);

  if (args.help) {
    PrintUsage(argv[0]);
    return 0;
  }

  if (!args.valid) {
    std::cerr << "Error: " << args.error << "\n\n";
    PrintUsage(argv[0]);
    return 2;
  }

  return audioinject::console::RunRewindAudio(args.config);
}
