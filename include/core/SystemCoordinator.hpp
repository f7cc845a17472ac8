#pragma once

/** @file  SystemCoordinator.hpp
 *  @brief Public API for dtxd::core::SystemCoordinator (main composition).
 *
 *  © 2025 Milo Medical — licensed under MIT.
 */

#include <memory>

#include <boost/asio/io_context.hpp>

#include "core/ConfigLoader.hpp"
#include "core/Error.hpp"
#include "core/ErrorMonitor.hpp"
#include "core/EventHandler.hpp"
#include "core/ProcessQueue.hpp"
#include "core/ShutdownCoordinator.hpp"
#include "io/DtxDevice.hpp"
#include "io/ProcessRunner.hpp"
#include "io/Service.hpp"

namespace dtxd {
  namespace core {

    /**
 * @class SystemCoordinator
 * @brief Wires device events → EventHandler, the bus service, the process
 *        queue consumer and the shutdown coordinator onto one io_context.
 *
 *  * Every task is expected to run forever; any of them ending with an error
 *    goes through ErrorMonitor (critical log + abort).
 *  * The loop returns only after a graceful drain.
 */
    class SystemCoordinator {

    public:
      SystemCoordinator(boost::asio::io_context& io, Config config,
                        std::shared_ptr<io::DtxDevice> device, std::shared_ptr<io::Service> service,
                        std::shared_ptr<io::ProcessRunner> runner,
                        ShutdownCoordinator::ExitFn exitFn = {});
      ~SystemCoordinator() = default;

      // ---- public API ----------------------------------------------------------
      void initialize(); ///< start all tasks and post the opmode sync
      void handleError(const Error& error);

      ErrorMonitor& errorMonitor() { return errorMonitor_; }
      const EventHandler& eventHandler() const { return handler_; }
      const ShutdownCoordinator& shutdown() const { return shutdown_; }

    private:
      void startEventTask();
      void startServiceTask();
      void startProcessTask();
      void startShutdownTask();
      void syncDeviceMode();

      boost::asio::io_context& io_;
      std::shared_ptr<io::DtxDevice> device_;
      std::shared_ptr<io::Service> service_;

      ErrorMonitor errorMonitor_;
      ProcessQueue queue_;
      EventHandler handler_;
      ShutdownCoordinator shutdown_;
    };

  } // namespace core
} // namespace dtxd
