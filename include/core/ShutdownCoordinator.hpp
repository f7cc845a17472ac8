#pragma once
/** @file  ShutdownCoordinator.hpp
 *  @brief SIGINT/SIGTERM handling: graceful drain, forced exit on repeat.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <functional>

#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>

#include "core/ProcessQueue.hpp"

namespace dtxd::core {

  /**
 * @class ShutdownCoordinator
 * @brief Running → (1st signal) → Draining → (drained | 2nd signal) → Terminated.
 *
 *  * First signal: `onShutdown` stops the event sources, then the process
 *    queue is drained. If the drain wins, `onDrained` is called.
 *  * Second signal while draining: `exit(128 + signo)` right away.
 */
  class ShutdownCoordinator {
  public:
    enum class Phase { Running, Draining, Terminated };

    using ExitFn = std::function<void(int)>;

    /// \p exitFn defaults to `std::exit`.
    ShutdownCoordinator(boost::asio::io_context& io, ProcessQueue& queue, ExitFn exitFn = {});

    void onShutdown(std::function<void()> cb) { onShutdown_ = std::move(cb); }
    void onDrained(std::function<void()> cb) { onDrained_ = std::move(cb); }

    void start(); ///< begin listening for signals
    void cancel();

    Phase phase() const { return phase_; }
    bool draining() const { return phase_ == Phase::Draining; }

  private:
    void awaitSignal();
    void onSignal(int signo);

    boost::asio::signal_set signals_;
    ProcessQueue& queue_;
    ExitFn exit_;
    std::function<void()> onShutdown_{};
    std::function<void()> onDrained_{};
    Phase phase_{ Phase::Running };
  };

} // namespace dtxd::core
