#pragma once
/** @file  DbusService.hpp
 *  @brief org.surface.dtx on the system bus (sd-bus, driven by Boost.Asio).
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <functional>
#include <memory>

#include <boost/asio/io_context.hpp>
#include <boost/asio/posix/stream_descriptor.hpp>
#include <boost/asio/steady_timer.hpp>

#include "core/Error.hpp"
#include "io/DtxDevice.hpp"
#include "io/Service.hpp"

struct sd_bus;
struct sd_bus_slot;
struct sd_bus_message;
struct sd_bus_error;

namespace dtxd {
  namespace io {

    /**
 * @class DbusService
 * @brief Exposes the `DeviceMode` property, the `DetachStateChanged` signal
 *        and the `Request()` method.
 *
 *  * `serve()` is the long-running request task; it re-arms on the bus fd
 *    and the bus timeout until `stop()`.
 *  * A bus processing failure is reported once through `onError` and ends
 *    the task.
 */
    class DbusService : public Service {
    public:
      static constexpr const char* kBusName = "org.surface.dtx";
      static constexpr const char* kInterface = "org.surface.dtx";
      static constexpr const char* kObjectPath = "/org/surface/dtx";

      DbusService(boost::asio::io_context& io, std::shared_ptr<DtxDevice> device);
      ~DbusService() override;

      DbusService(const DbusService&) = delete;
      DbusService& operator=(const DbusService&) = delete;

      //---public API-------------------------------------------
      void connect(); ///< open system bus, register object, take name

      //---Service----------------------------------------------
      void setDeviceMode(core::OpMode mode) override;
      void signalDetachStateChange(core::DetachState state) override;
      void serve(ErrorCallback onError) override;
      void stop() override;

    private:
      static int onRequest(sd_bus_message* msg, void* userdata, sd_bus_error* retError);
      static int getDeviceMode(sd_bus* bus, const char* path, const char* iface,
                               const char* property, sd_bus_message* reply, void* userdata,
                               sd_bus_error* retError);

      void process();
      void arm();
      void fail(const core::Error& error);

      std::shared_ptr<DtxDevice> device_;
      boost::asio::posix::stream_descriptor fd_;
      boost::asio::steady_timer timer_;
      ErrorCallback onError_{};

      sd_bus* bus_{ nullptr };
      sd_bus_slot* slot_{ nullptr };
      core::OpMode mode_{ core::OpMode::Laptop };
      bool serving_{ false };
      bool waiting_{ false }; ///< fd wait armed
    };

  } // namespace io
} // namespace dtxd
