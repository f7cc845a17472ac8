/* @file Logger.cpp
 * @brief spdlog default logger for the daemon
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

#include <algorithm>
#include <cctype>

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include "core/Error.hpp"
#include "core/Logger.hpp"

using namespace dtxd::core;

void dtxd::core::initLogging(spdlog::level::level_enum level) {
  auto logger = spdlog::stderr_color_mt("dtxd");
  logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
  logger->set_level(level);
  logger->flush_on(spdlog::level::warn);
  spdlog::set_default_logger(std::move(logger));
}

spdlog::level::level_enum dtxd::core::parseLogLevel(const std::string& name) {
  std::string lower = name;
  std::transform(lower.begin(), lower.end(), lower.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

  if (lower == "critical")
    return spdlog::level::critical;
  if (lower == "error")
    return spdlog::level::err;
  if (lower == "warning" || lower == "warn")
    return spdlog::level::warn;
  if (lower == "info")
    return spdlog::level::info;
  if (lower == "debug")
    return spdlog::level::debug;
  if (lower == "trace")
    return spdlog::level::trace;

  throw Error(ErrorKind::Config, "[Logger] invalid log level: '" + name + "'");
}
