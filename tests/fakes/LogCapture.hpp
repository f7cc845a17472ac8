#pragma once
/** @file  LogCapture.hpp
 *  @brief Routes spdlog's default logger into a string for assertions.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <memory>
#include <sstream>
#include <string>

#include <spdlog/sinks/ostream_sink.h>
#include <spdlog/spdlog.h>

namespace dtxd {
  namespace test {

    class LogCapture {
    public:
      LogCapture()
          : previous_(spdlog::default_logger()) {
        auto sink = std::make_shared<spdlog::sinks::ostream_sink_mt>(stream_);
        sink->set_pattern("[%l] %v");
        auto logger = std::make_shared<spdlog::logger>("capture", sink);
        logger->set_level(spdlog::level::trace);
        spdlog::set_default_logger(logger);
      }

      ~LogCapture() { spdlog::set_default_logger(previous_); }

      LogCapture(const LogCapture&) = delete;
      LogCapture& operator=(const LogCapture&) = delete;

      std::string text() const { return stream_.str(); }
      bool contains(const std::string& needle) const { return text().find(needle) != std::string::npos; }

    private:
      std::ostringstream stream_;
      std::shared_ptr<spdlog::logger> previous_;
    };

  } // namespace test
} // namespace dtxd
