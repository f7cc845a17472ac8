/* @file main.cpp
 * @brief dtxd entry point - CLI, config, logging, device/bus bring-up
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <iostream>
#include <memory>
#include <optional>
#include <string>

// Linux headers
#include <getopt.h>

// 3rd-party headers
#include <boost/asio/io_context.hpp>
#include <spdlog/spdlog.h>

// dtxd headers
#include "core/ConfigLoader.hpp"
#include "core/Error.hpp"
#include "core/Logger.hpp"
#include "core/SystemCoordinator.hpp"
#include "io/DbusService.hpp"
#include "io/DtxDevice.hpp"
#include "io/ProcessRunner.hpp"

#ifndef DTXD_VERSION
#define DTXD_VERSION "0.0.0"
#endif

using namespace dtxd;

namespace {

  void usage(std::ostream& out, const char* argv0) {
    out << "Usage: " << argv0 << " [OPTIONS]\n"
        << "Surface Detachment System (DTX) Daemon\n\n"
        << "  -c, --config <FILE>  Use the specified config file\n"
        << "  -h, --help           Print this help and exit\n"
        << "  -V, --version        Print version information and exit\n";
  }

  void logChain(const core::Error& e) {
    spdlog::critical("Error: {}", e.what());
    for (const auto& cause : e.causes())
      spdlog::critical("Caused by: {}", cause);
  }

} // namespace

int main(int argc, char** argv) {
  static const option longOptions[] = {
    { "config", required_argument, nullptr, 'c' },
    { "help", no_argument, nullptr, 'h' },
    { "version", no_argument, nullptr, 'V' },
    { nullptr, 0, nullptr, 0 },
  };

  std::optional<std::string> configPath;
  int opt;
  while ((opt = getopt_long(argc, argv, "c:hV", longOptions, nullptr)) != -1) {
    switch (opt) {
    case 'c':
      configPath = optarg;
      break;
    case 'h':
      usage(std::cout, argv[0]);
      return 0;
    case 'V':
      std::cout << "dtxd " << DTXD_VERSION << "\n";
      return 0;
    default:
      usage(std::cerr, argv[0]);
      return 2;
    }
  }
  if (optind < argc) {
    usage(std::cerr, argv[0]);
    return 2;
  }

  core::Config config;
  try {
    config = configPath ? core::ConfigLoader(*configPath).load() : core::ConfigLoader::loadDefault();
  } catch (const core::Error& e) {
    core::initLogging(spdlog::level::info);
    logChain(e);
    return 1;
  }

  core::initLogging(config.logLevel);

  boost::asio::io_context io;
  try {
    auto device = std::make_shared<io::SurfaceDtxDevice>(io);
    auto service = std::make_shared<io::DbusService>(io, device);
    service->connect();
    auto runner = std::make_shared<io::BoostProcessRunner>(io);

    core::SystemCoordinator coordinator(io, std::move(config), device, service, runner);
    coordinator.initialize();
    io.run();
  } catch (const core::Error& e) {
    logChain(e);
    return 1;
  }

  spdlog::info("[main] shutdown complete");
  return 0;
}
