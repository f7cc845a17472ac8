#pragma once
/** @file  Logger.hpp
 *  @brief Process-wide spdlog sink setup and level parsing.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <string>

#include <spdlog/common.h>

namespace dtxd {
  namespace core {

    /// Install a colored stderr logger as spdlog's default at \p level.
    void initLogging(spdlog::level::level_enum level);

    /// "critical" … "trace" (case-insensitive) or throw Error(Config).
    spdlog::level::level_enum parseLogLevel(const std::string& name);

  } // namespace core
} // namespace dtxd
