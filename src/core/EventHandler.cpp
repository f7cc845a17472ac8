/* @file EventHandler.cpp
 * @brief detach/attach state machine - transitions, handler jobs and the
 *        latch decisions taken when those jobs resume
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <memory>
#include <type_traits>

// 3rd-party headers
#include <boost/asio/steady_timer.hpp>
#include <spdlog/spdlog.h>

// dtxd headers
#include "core/Error.hpp"
#include "core/EventHandler.hpp"

using namespace dtxd::core;

EventHandler::EventHandler(boost::asio::io_context& io, Config config,
                           std::shared_ptr<io::Service> service, std::shared_ptr<io::DtxDevice> device,
                           ProcessQueue& queue, std::shared_ptr<io::ProcessRunner> runner)
    : io_(io), config_(std::move(config)), service_(std::move(service)), device_(std::move(device)),
      queue_(queue), runner_(std::move(runner)) {}

void EventHandler::handle(const RawEvent& raw) {
  spdlog::trace("[EventHandler] received event: type={:#04x} code={:#04x} arg0={:#04x} arg1={:#04x}",
                raw.type, raw.code, raw.arg0, raw.arg1);

  auto evt = classify(raw);
  if (!evt) {
    spdlog::warn("[EventHandler] unhandled event: type={:#04x} code={:#04x} arg0={:#04x} arg1={:#04x}",
                 raw.type, raw.code, raw.arg0, raw.arg1);
    return;
  }

  std::visit(
      [this](const auto& e) {
        using T = std::decay_t<decltype(e)>;
        if constexpr (std::is_same_v<T, event::OpModeChange>)
          onOpModeChange(e.mode);
        else if constexpr (std::is_same_v<T, event::ConnectionChange>)
          onConnectionChange(e.state);
        else if constexpr (std::is_same_v<T, event::LatchStateChange>)
          onLatchStateChange(e.state);
        else if constexpr (std::is_same_v<T, event::DetachRequest>)
          onDetachRequest();
        else
          onDetachError(e.code);
      },
      *evt);
}

void EventHandler::onOpModeChange(OpMode mode) {
  spdlog::debug("[EventHandler] device mode changed: {}", toString(mode));
  service_->setDeviceMode(mode);
}

void EventHandler::onLatchStateChange(LatchState latch) {
  spdlog::debug("[EventHandler] latch-state changed: {}", toString(latch));

  if (latch == LatchState::Open)
    service_->signalDetachStateChange(DetachState::DetachReady);
}

void EventHandler::onConnectionChange(ConnectionState connection) {
  spdlog::debug("[EventHandler] clipboard connection changed: {}", toString(connection));

  if (state_ == State::Detaching && connection == ConnectionState::Disconnected) {
    state_ = State::Normal;
    service_->signalDetachStateChange(DetachState::DetachCompleted);
    spdlog::debug("[EventHandler] detachment procedure completed");

  } else if (state_ == State::Normal && connection == ConnectionState::Connected) {
    state_ = State::Attaching;
    schedule(AttachJob{ config_.attachDelay });

  } else {
    spdlog::error("[EventHandler] invalid state: state={}, connection={}", toString(state_),
                  toString(connection));
  }
}

void EventHandler::onDetachRequest() {
  if (ignoreRequest_ > 0) {
    --ignoreRequest_;
    spdlog::trace("[EventHandler] ignoring expected detach request ({} left)", ignoreRequest_);
    return;
  }

  switch (state_) {
  case State::Normal:
    spdlog::debug("[EventHandler] clipboard detach requested");
    state_ = State::Detaching;
    schedule(DetachJob{});
    break;

  case State::Detaching:
    spdlog::debug("[EventHandler] clipboard detach-abort requested");
    state_ = State::Aborting;
    service_->signalDetachStateChange(DetachState::DetachAborted);
    schedule(DetachAbortJob{});
    break;

  case State::Aborting:
  case State::Attaching:
    // the hardware echoes our own request back as a DetachRequest
    ++ignoreRequest_;
    device_->latchRequest();
    break;
  }
}

void EventHandler::onDetachError(std::uint8_t code) {
  if (code == kDetachErrorTimeout)
    spdlog::debug("[EventHandler] detachment procedure: timed out");
  else
    spdlog::error("[EventHandler] unknown error event: code={:#04x}", code);

  if (state_ == State::Detaching) {
    state_ = State::Aborting;
    schedule(DetachAbortJob{});
  }
}

void EventHandler::schedule(Job job) { queue_.trySubmit(std::move(job)); }

void EventHandler::run(const Job& job, Completion done) {
  if (const auto* attach = std::get_if<AttachJob>(&job))
    runAttach(*attach, std::move(done));
  else if (std::holds_alternative<DetachJob>(job))
    runDetach(std::move(done));
  else
    runDetachAbort(std::move(done));
}

void EventHandler::runAttach(const AttachJob& job, Completion done) {
  spdlog::debug("[EventHandler] subprocess: delaying attach process");

  auto timer = std::make_shared<boost::asio::steady_timer>(io_, job.delay);
  timer->async_wait([this, timer, done](const boost::system::error_code& ec) {
    if (ec) {
      done(std::make_exception_ptr(
          Error(ErrorKind::Runtime, "[EventHandler] attach delay failed: " + ec.message())));
      return;
    }

    if (!config_.attachHandler) {
      spdlog::debug("[EventHandler] subprocess: no attach handler executable");
      attachFinished();
      done(nullptr);
      return;
    }

    io::ProcessSpec spec;
    spec.executable = *config_.attachHandler;
    spec.workingDir = config_.dir;

    spdlog::debug("[EventHandler] subprocess: attach started");
    runner_->runAsync(spec, [this, done](std::exception_ptr error, io::ProcessOutput output) {
      if (error) {
        done(error);
        return;
      }

      spdlog::debug("[EventHandler] subprocess: attach finished");
      io::logProcessOutput(output);
      attachFinished();
      done(nullptr);
    });
  });
}

void EventHandler::runDetach(Completion done) {
  if (!config_.detachHandler) {
    spdlog::debug("[EventHandler] subprocess: no detach handler executable");
    try {
      detachDecision(true);
    } catch (...) {
      done(std::current_exception());
      return;
    }
    done(nullptr);
    return;
  }

  io::ProcessSpec spec;
  spec.executable = *config_.detachHandler;
  spec.workingDir = config_.dir;
  spec.environment = { { "EXIT_DETACH_COMMENCE", "0" }, { "EXIT_DETACH_ABORT", "1" } };

  spdlog::debug("[EventHandler] subprocess: detach started");
  runner_->runAsync(spec, [this, done](std::exception_ptr error, io::ProcessOutput output) {
    if (error) {
      done(error);
      return;
    }

    spdlog::debug("[EventHandler] subprocess: detach finished");
    io::logProcessOutput(output);

    try {
      detachDecision(output.success());
    } catch (...) {
      done(std::current_exception());
      return;
    }
    done(nullptr);
  });
}

void EventHandler::runDetachAbort(Completion done) {
  if (!config_.detachAbortHandler) {
    spdlog::debug("[EventHandler] subprocess: no detach_abort handler executable");
    state_ = State::Normal;
    done(nullptr);
    return;
  }

  io::ProcessSpec spec;
  spec.executable = *config_.detachAbortHandler;
  spec.workingDir = config_.dir;

  spdlog::debug("[EventHandler] subprocess: detach_abort started");
  runner_->runAsync(spec, [this, done](std::exception_ptr error, io::ProcessOutput output) {
    if (error) {
      done(error);
      return;
    }

    spdlog::debug("[EventHandler] subprocess: detach_abort finished");
    io::logProcessOutput(output);
    state_ = State::Normal;
    done(nullptr);
  });
}

void EventHandler::attachFinished() {
  state_ = State::Normal;
  service_->signalDetachStateChange(DetachState::AttachCompleted);
}

// Runs after the detach handler returned: the state may have moved on
// (e.g. to Aborting) while it was running, in which case the latch stays shut.
void EventHandler::detachDecision(bool commence) {
  if (state_ != State::Detaching) {
    spdlog::debug("[EventHandler] state changed during detachment, not opening latch");
    return;
  }

  if (commence) {
    spdlog::debug("[EventHandler] commencing detach, opening latch");
    device_->latchOpen();
  } else {
    spdlog::info("[EventHandler] aborting detach");
    device_->latchRequest();
  }
}
