#pragma once
/** @file  ConfigLoader.hpp
 *  @brief Loads run-time configuration (JSON) from the host FS.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <chrono>
#include <optional>
#include <string>

#include <nlohmann/json_fwd.hpp>
#include <spdlog/common.h>

namespace dtxd::core {

  /// Default location of the daemon configuration.
  inline constexpr const char* kDefaultConfigPath = "/etc/surface-dtx/surface-dtx-daemon.json";

  /// Handler working directory when no file was loaded.
  inline constexpr const char* kDefaultConfigDir = "/etc/surface-dtx";

  /** Immutable for the process lifetime once loaded. */
  struct Config {
    spdlog::level::level_enum logLevel{ spdlog::level::info };
    std::chrono::milliseconds attachDelay{ 5000 };

    std::optional<std::string> attachHandler{};
    std::optional<std::string> detachHandler{};
    std::optional<std::string> detachAbortHandler{};

    std::string dir{ kDefaultConfigDir }; ///< cwd for every handler
  };

  /**
 * @class ConfigLoader
 * @brief Thin helper that reads a JSON file, validates it, and hands the
 *        resulting Config to the caller.
 *
 *  * No caching: every call to `load()` re-reads the file.
 *  * Handler paths are resolved relative to the file's directory.
 */
  class ConfigLoader {
  public:
    /// @param configPath  Absolute or relative path on the host FS.
    explicit ConfigLoader(std::string configPath);

    /// Parse the file into a Config or throw `Error(ErrorKind::Config)`.
    Config load() const;

    /// Parse an already-read document; \p dir is used as handler cwd.
    static Config fromJson(const nlohmann::json& doc, const std::string& dir);

    /// Load kDefaultConfigPath if present, defaults otherwise.
    static Config loadDefault();

  private:
    std::string path_;
  };

} // namespace dtxd::core
