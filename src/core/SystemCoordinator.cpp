/* @file SystemCoordinator.cpp
 * @brief main composition - every long-running task is fatal on failure
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// 3rd-party headers
#include <boost/asio/post.hpp>
#include <spdlog/spdlog.h>

// dtxd headers
#include "core/SystemCoordinator.hpp"

using namespace dtxd::core;

SystemCoordinator::SystemCoordinator(boost::asio::io_context& io, Config config,
                                     std::shared_ptr<io::DtxDevice> device,
                                     std::shared_ptr<io::Service> service,
                                     std::shared_ptr<io::ProcessRunner> runner,
                                     ShutdownCoordinator::ExitFn exitFn)
    : io_(io), device_(device), service_(service), queue_(io),
      handler_(io, std::move(config), service, device, queue_, std::move(runner)),
      shutdown_(io, queue_, std::move(exitFn)) {}

void SystemCoordinator::initialize() {
  startProcessTask();
  startEventTask();
  startServiceTask();
  startShutdownTask();

  // consumers must see the right mode before the first OpModeChange
  boost::asio::post(io_, [this] { syncDeviceMode(); });

  spdlog::debug("[SystemCoordinator] running...");
}

void SystemCoordinator::handleError(const Error& error) { errorMonitor_.notifyFailure(error); }

void SystemCoordinator::startEventTask() {
  device_->readEvents(
      [this](const RawEvent& raw) {
        try {
          handler_.handle(raw);
        } catch (const std::exception& e) {
          device_->close();
          handleError(Error::wrap(ErrorKind::Runtime, "[SystemCoordinator] event task failed", e));
        }
      },
      [this](const Error& error) {
        handleError(Error(ErrorKind::Io, "[SystemCoordinator] event stream ended", error));
      });
}

void SystemCoordinator::startServiceTask() {
  service_->serve([this](const Error& error) {
    handleError(Error(ErrorKind::DBusService, "[SystemCoordinator] service task ended", error));
  });
}

void SystemCoordinator::startProcessTask() {
  queue_.start(handler_, [this](std::exception_ptr error) {
    auto err = Error::wrap(ErrorKind::Process, "[SystemCoordinator] process task failed", error);

    if (shutdown_.phase() != ShutdownCoordinator::Phase::Running) {
      spdlog::error("[SystemCoordinator] error while terminating: {}", err.what());
      for (const auto& cause : err.causes())
        spdlog::error("[SystemCoordinator] caused by: {}", cause);
      return;
    }

    handleError(err);
  });
}

void SystemCoordinator::startShutdownTask() {
  // the device stays open: drained jobs still issue latch commands
  shutdown_.onShutdown([this] {
    device_->stopEvents();
    service_->stop();
  });

  shutdown_.onDrained([this] {
    queue_.close();
    io_.stop();
  });

  shutdown_.start();
}

void SystemCoordinator::syncDeviceMode() {
  try {
    service_->setDeviceMode(device_->getOpMode());
  } catch (const Error& e) {
    handleError(Error(ErrorKind::Runtime, "[SystemCoordinator] initial device mode query failed", e));
  }
}
