#pragma once
/** @file  Error.hpp
 *  @brief Daemon error type with a causal chain of predecessors.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <exception>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace dtxd {
  namespace core {

    enum class ErrorKind { Config, Runtime, DBusService, Process, Io };

    inline const char* toString(ErrorKind k) {
      switch (k) {
      case ErrorKind::Config:
        return "configuration error";
      case ErrorKind::Runtime:
        return "runtime error";
      case ErrorKind::DBusService:
        return "D-Bus service error";
      case ErrorKind::Process:
        return "subprocess error";
      case ErrorKind::Io:
        return "hardware I/O error";
      default:
        return "unknown error";
      }
    }

    /**
 * @class Error
 * @brief `std::runtime_error` tagged with an ErrorKind and an optional cause.
 *
 *  * The cause is itself an Error, so a chain can be walked without RTTI.
 *  * Foreign exceptions are wrapped via `wrap()`; only their what() survives.
 */
    class Error : public std::runtime_error {
    public:
      Error(ErrorKind kind, const std::string& message);
      Error(ErrorKind kind, const std::string& message, const Error& cause);

      /// Wrap any exception as the cause of a new \p kind error.
      static Error wrap(ErrorKind kind, const std::string& message, const std::exception& cause);

      /// Same as above, for an in-flight exception_ptr (null -> no cause).
      static Error wrap(ErrorKind kind, const std::string& message, std::exception_ptr cause);

      ErrorKind kind() const noexcept { return kind_; }
      const Error* cause() const noexcept { return cause_.get(); }

      /// Predecessor messages, outermost first.
      std::vector<std::string> causes() const;

    private:
      ErrorKind kind_;
      std::shared_ptr<const Error> cause_{};
    };

  } // namespace core
} // namespace dtxd
