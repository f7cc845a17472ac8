/* @file ConfigLoader.cpp
 * @brief JSON -> Config with validation and path resolution
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <chrono>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <string>

// 3rd-party headers
#include <nlohmann/json.hpp>

// dtxd headers
#include "core/ConfigLoader.hpp"
#include "core/Error.hpp"
#include "core/Logger.hpp"

using namespace dtxd::core;
namespace fs = std::filesystem;

namespace {

  // Returns the named section, or nullptr if absent. Present but not an object is an error.
  const nlohmann::json* section(const nlohmann::json& doc, const char* key) {
    if (!doc.contains(key))
      return nullptr;

    const auto& value = doc.at(key);
    if (!value.is_object())
      throw Error(ErrorKind::Config, std::string("[ConfigLoader] section '") + key + "' must be an object");
    return &value;
  }

  std::optional<std::string> handlerPath(const nlohmann::json& handler, const char* key,
                                         const std::string& dir) {
    if (!handler.contains(key) || handler.at(key).is_null())
      return std::nullopt;

    fs::path path = handler.at(key).get<std::string>();
    if (path.empty())
      throw Error(ErrorKind::Config, std::string("[ConfigLoader] empty handler path: ") + key);
    if (path.is_relative())
      path = fs::path(dir) / path;

    return path.lexically_normal().string();
  }

} // namespace

ConfigLoader::ConfigLoader(std::string configPath)
    : path_(std::move(configPath)) {}

Config ConfigLoader::load() const {
  std::ifstream in(path_);
  if (!in)
    throw Error(ErrorKind::Config, "[ConfigLoader] cannot open config file: " + path_);

  nlohmann::json doc;
  try {
    in >> doc;
  } catch (const nlohmann::json::exception& e) {
    throw Error::wrap(ErrorKind::Config, "[ConfigLoader] failed to parse " + path_, e);
  }

  fs::path dir = fs::absolute(fs::path(path_)).parent_path();
  try {
    return fromJson(doc, dir.lexically_normal().string());
  } catch (const nlohmann::json::exception& e) {
    throw Error::wrap(ErrorKind::Config, "[ConfigLoader] invalid config " + path_, e);
  }
}

Config ConfigLoader::fromJson(const nlohmann::json& doc, const std::string& dir) {
  if (!doc.is_object())
    throw Error(ErrorKind::Config, "[ConfigLoader] top-level value must be an object");

  Config cfg;
  cfg.dir = dir;

  if (const auto* log = section(doc, "log")) {
    if (log->contains("level"))
      cfg.logLevel = parseLogLevel(log->at("level").get<std::string>());
  }

  if (const auto* delay = section(doc, "delay")) {
    if (delay->contains("attach")) {
      // 2^63 as a double: anything below it converts to milliseconds::rep
      constexpr auto kMaxMillis = static_cast<double>(std::chrono::milliseconds::max().count());

      double seconds = delay->at("attach").get<double>();
      if (!std::isfinite(seconds) || seconds < 0.0 || seconds * 1000.0 >= kMaxMillis)
        throw Error(ErrorKind::Config, "[ConfigLoader] delay.attach out of range: " + std::to_string(seconds));
      cfg.attachDelay = std::chrono::milliseconds(static_cast<long long>(seconds * 1000.0));
    }
  }

  if (const auto* handler = section(doc, "handler")) {
    cfg.attachHandler = handlerPath(*handler, "attach", dir);
    cfg.detachHandler = handlerPath(*handler, "detach", dir);
    cfg.detachAbortHandler = handlerPath(*handler, "detach_abort", dir);
  }

  return cfg;
}

Config ConfigLoader::loadDefault() {
  std::error_code ec;
  if (!fs::exists(kDefaultConfigPath, ec))
    return Config{};

  return ConfigLoader(kDefaultConfigPath).load();
}
