// Repository: AudioInject
// Component: credential-stub
// Purpose: Serve fixed VPN credentials to the device under test until
//          SIGINT/SIGTERM.
// Copyright (c) 2026 AudioInject

#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <stdexcept>
#include <string>
#include <thread>

#include "audioinject/stub/CredentialStubServer.hpp"
#include "audioinject/util/Logger.hpp"

namespace {

std::atomic<bool> g_termination_requested{false};

void SignalHandler(int signal) {
  if (signal == SIGINT || signal == SIGTERM) {
    g_termination_requested.store(true, std::memory_order_release);
  }
}

struct CliArgs {
  audioinject::stub::CredentialStubConfig config;
  bool help = false;
  bool valid = false;
  std::string error;
};

void PrintUsage(const char* program_name) {
  std::cerr << "Usage: " << program_name << " [OPTIONS]\n"
            << "\n"
            << "HTTP stub for the VPN credential endpoint.\n"
            << "\n"
            << "OPTIONS:\n"
            << "  --port PORT          Listen port (default: "
            << audioinject::stub::kDefaultStubPort << ", 0 = ephemeral)\n"
            << "  --server-url URL     server_url returned to clients (default: http://10.0.2.2:8080)\n"
            << "  --auth-key KEY       auth_key returned to clients (default: stub-auth-key)\n"
            << "  --help               Show this help message\n"
            << "\n"
            << "ROUTES:\n"
            << "  POST /api/v1/vpn/auth-key   credentials as JSON\n"
            << "  GET  /health                {\"status\":\"ok\"}\n"
            << "\n";
}

CliArgs ParseArgs(int argc, char* argv[]) {
  CliArgs args;

  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];

    if (arg == "--help" || arg == "-h") {
      args.help = true;
      args.valid = true;
      return args;
    } else if (arg == "--port" && i + 1 < argc) {
      const std::string value = argv[++i];
      try {
        size_t consumed = 0;
        args.config.port = std::stoi(value, &consumed);
        if (consumed != value.size() || args.config.port < 0 || args.config.port > 65535) {
          throw std::out_of_range(value);
        }
      } catch (const std::exception&) {
        args.error = "--port expects 0-65535, got '" + value + "'";
        return args;
      }
    } else if (arg == "--server-url" && i + 1 < argc) {
      args.config.server_url = argv[++i];
    } else if (arg == "--auth-key" && i + 1 < argc) {
      args.config.auth_key = argv[++i];
    } else {
      args.error = "Unknown argument: " + arg;
      return args;
    }
  }

  args.valid = true;
  return args;
}

}  // namespace

int main(int argc, char* argv[]) {
  using audioinject::util::Logger;

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

  std::signal(SIGINT, SignalHandler);
  std::signal(SIGTERM, SignalHandler);

  audioinject::stub::CredentialStubServer server(args.config);
  try {
    server.Start();
  } catch (const std::runtime_error& e) {
    Logger::Error(std::string("[credential-stub] ") + e.what());
    return 1;
  }

  while (!g_termination_requested.load(std::memory_order_acquire)) {
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
  }

  server.Stop();
  Logger::Info("[credential-stub] stopped after " + std::to_string(server.RequestsServed()) +
               " requests");
  return 0;
}
