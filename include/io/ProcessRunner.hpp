#pragma once
/** @file  ProcessRunner.hpp
 *  @brief Asynchronous handler-program execution with captured output.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <exception>
#include <functional>
#include <map>
#include <string>
#include <vector>

#include <boost/asio/io_context.hpp>

namespace dtxd {
  namespace io {

    struct ProcessSpec {
      std::string executable;
      std::vector<std::string> arguments{};
      std::string workingDir{};
      std::map<std::string, std::string> environment{}; ///< added on top of ours
    };

    struct ProcessOutput {
      int status{ 0 };
      std::string out{};
      std::string err{};

      bool success() const { return status == 0; }
    };

    /// Anything worth logging: failure status or any output at all.
    void logProcessOutput(const ProcessOutput& output);

    /**
 * @class ProcessRunner
 * @brief Spawns one program and reports once it has fully finished.
 *
 *  * `done` receives a null exception_ptr and the output on success, or the
 *    spawn/wait failure (`core::Error(Process)`) otherwise.
 *  * `done` is always invoked from the io_context, never inline.
 */
    class ProcessRunner {
    public:
      using Completion = std::function<void(std::exception_ptr, ProcessOutput)>;

      virtual ~ProcessRunner() = default;
      virtual void runAsync(const ProcessSpec& spec, Completion done) = 0;
    };

    /** Boost.Process implementation sharing the daemon's io_context. */
    class BoostProcessRunner : public ProcessRunner {
    public:
      explicit BoostProcessRunner(boost::asio::io_context& io)
          : io_(io) {}

      void runAsync(const ProcessSpec& spec, Completion done) override;

    private:
      boost::asio::io_context& io_;
    };

  } // namespace io
} // namespace dtxd
