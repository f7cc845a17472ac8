/* @file ShutdownCoordinator.cpp
 * @brief two-stage signal escalation
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

#include <csignal>
#include <cstdlib>

#include <spdlog/spdlog.h>

#include "core/ShutdownCoordinator.hpp"

using namespace dtxd::core;

ShutdownCoordinator::ShutdownCoordinator(boost::asio::io_context& io, ProcessQueue& queue, ExitFn exitFn)
    : signals_(io, SIGINT, SIGTERM), queue_(queue), exit_(std::move(exitFn)) {
  if (!exit_)
    exit_ = [](int code) { std::exit(code); };
}

void ShutdownCoordinator::start() { awaitSignal(); }

void ShutdownCoordinator::cancel() {
  boost::system::error_code ec;
  signals_.cancel(ec);
}

void ShutdownCoordinator::awaitSignal() {
  signals_.async_wait([this](const boost::system::error_code& ec, int signo) {
    if (ec == boost::asio::error::operation_aborted)
      return;
    if (ec) {
      spdlog::error("[ShutdownCoordinator] signal wait failed: {}", ec.message());
      return;
    }
    onSignal(signo);
  });
}

void ShutdownCoordinator::onSignal(int signo) {
  switch (phase_) {
  case Phase::Running:
    spdlog::info("[ShutdownCoordinator] shutting down...");
    phase_ = Phase::Draining;

    if (onShutdown_)
      onShutdown_();

    // second signal races the drain
    awaitSignal();
    queue_.asyncDrain([this] {
      if (phase_ != Phase::Draining)
        return;

      phase_ = Phase::Terminated;
      cancel();
      spdlog::debug("[ShutdownCoordinator] process queue drained");
      if (onDrained_)
        onDrained_();
    });
    break;

  case Phase::Draining:
    spdlog::info("[ShutdownCoordinator] terminating...");
    phase_ = Phase::Terminated;
    exit_(128 + signo);
    break;

  case Phase::Terminated:
    break;
  }
}
