/* @file ProcessRunner.cpp
 * @brief Boost.Process spawn with async stdout/stderr capture
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <iterator>
#include <memory>
#include <system_error>

// 3rd-party headers
#include <boost/asio/post.hpp>
#include <boost/asio/read.hpp>
#include <boost/asio/streambuf.hpp>
#include <boost/process.hpp>
#include <spdlog/spdlog.h>

// dtxd headers
#include "core/Error.hpp"
#include "io/ProcessRunner.hpp"

using namespace dtxd::io;
using dtxd::core::Error;
using dtxd::core::ErrorKind;
namespace bp = boost::process;

namespace {

  /// Shared by the exit handler and both pipe readers; reports once all three finished.
  struct Run {
    Run(boost::asio::io_context& io, ProcessRunner::Completion cb)
        : outPipe(io), errPipe(io), done(std::move(cb)) {}

    bp::async_pipe outPipe;
    bp::async_pipe errPipe;
    boost::asio::streambuf outBuf;
    boost::asio::streambuf errBuf;
    bp::child child;

    int status{ 0 };
    int pending{ 3 };
    std::exception_ptr error{};
    ProcessRunner::Completion done;

    void finishOne() {
      if (--pending > 0)
        return;

      ProcessOutput output;
      output.status = status;
      output.out.assign(std::istreambuf_iterator<char>(&outBuf), std::istreambuf_iterator<char>());
      output.err.assign(std::istreambuf_iterator<char>(&errBuf), std::istreambuf_iterator<char>());
      done(error, std::move(output));
    }
  };

  void readAll(const std::shared_ptr<Run>& run, bp::async_pipe& pipe, boost::asio::streambuf& buf) {
    // completes with eof once the child (and everything it forked) closed the pipe
    boost::asio::async_read(pipe, buf, [run](const boost::system::error_code& ec, std::size_t) {
      if (ec && ec != boost::asio::error::eof)
        spdlog::warn("[ProcessRunner] output pipe error: {}", ec.message());
      run->finishOne();
    });
  }

} // namespace

void dtxd::io::logProcessOutput(const ProcessOutput& output) {
  if (!output.success() || !output.out.empty() || !output.err.empty())
    spdlog::info("[ProcessRunner] subprocess terminated with exit status {}", output.status);

  if (!output.out.empty())
    spdlog::info("[ProcessRunner] subprocess terminated with stdout: {}", output.out);

  if (!output.err.empty())
    spdlog::info("[ProcessRunner] subprocess terminated with stderr: {}", output.err);
}

void BoostProcessRunner::runAsync(const ProcessSpec& spec, Completion done) {
  auto run = std::make_shared<Run>(io_, std::move(done));

  bp::environment env = boost::this_process::environment();
  for (const auto& [key, value] : spec.environment)
    env[key] = value;

  const std::string dir = spec.workingDir.empty() ? std::string(".") : spec.workingDir;

  std::error_code ec;
  run->child = bp::child(
      bp::exe = spec.executable, bp::args = spec.arguments, bp::start_dir = dir, env,
      bp::std_in.close(), bp::std_out > run->outPipe, bp::std_err > run->errPipe, io_,
      bp::on_exit = [run](int exitCode, const std::error_code& waitEc) {
        if (waitEc)
          run->error = std::make_exception_ptr(
              Error(ErrorKind::Process, "[ProcessRunner] waiting for subprocess failed: " + waitEc.message()));
        run->status = exitCode;
        run->finishOne();
      },
      ec);

  if (ec) {
    auto err = std::make_exception_ptr(
        Error(ErrorKind::Process, "[ProcessRunner] failed to spawn " + spec.executable + ": " + ec.message()));
    boost::system::error_code ignored;
    run->outPipe.close(ignored);
    run->errPipe.close(ignored);
    boost::asio::post(io_, [run, err] { run->done(err, ProcessOutput{}); });
    return;
  }

  run->child.detach(); // reaped by the io_context's SIGCHLD service
  readAll(run, run->outPipe, run->outBuf);
  readAll(run, run->errPipe, run->errBuf);
}
