#pragma once
/** @file  DtxDevice.hpp
 *  @brief Detachment-system device: event stream + latch commands.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <functional>
#include <string>

#include <boost/asio/io_context.hpp>
#include <boost/asio/posix/stream_descriptor.hpp>

#include "core/Error.hpp"
#include "core/Event.hpp"

namespace dtxd {
  namespace io {

    /**
 * @class DtxDevice
 * @brief Abstract device handle shared by the event handler, its jobs and
 *        the bus service.
 *
 *  * Commands are synchronous and throw `core::Error(Io)` on failure.
 *  * The event stream is asynchronous and not restartable: after `onError`
 *    fired once, no further events are delivered.
 */
    class DtxDevice {
    public:
      using EventCallback = std::function<void(const core::RawEvent&)>;
      using ErrorCallback = std::function<void(const core::Error&)>;

      virtual ~DtxDevice() = default;

      //---commands---------------------------------------------
      virtual void latchOpen() = 0;
      virtual void latchRequest() = 0;
      virtual core::OpMode getOpMode() = 0;

      //---event stream-----------------------------------------
      virtual void readEvents(EventCallback onEvent, ErrorCallback onError) = 0;
      virtual void stopEvents() = 0; ///< cancel the stream, commands keep working
      virtual void close() = 0;      ///< stopEvents() and release the device
    };

    /**
 * @class SurfaceDtxDevice
 * @brief RAII wrapper around /dev/surface_dtx (ioctl commands, 4-byte event
 *        records read through Boost.Asio).
 *
 *  * *Non-copyable*, not movable (async reads capture `this`).
 */
    class SurfaceDtxDevice : public DtxDevice {
    public:
      static constexpr const char* kDefaultPath = "/dev/surface_dtx";

      //---ctr / dtr--------------------------------------------
      /// Open \p path or throw `core::Error(Io)`.
      SurfaceDtxDevice(boost::asio::io_context& io, const std::string& path = kDefaultPath);

      /// Adopt an already-open descriptor (takes ownership).
      SurfaceDtxDevice(boost::asio::io_context& io, int fd);

      ~SurfaceDtxDevice() override;

      SurfaceDtxDevice(const SurfaceDtxDevice&) = delete;
      SurfaceDtxDevice& operator=(const SurfaceDtxDevice&) = delete;

      //---DtxDevice--------------------------------------------
      void latchOpen() override;
      void latchRequest() override;
      core::OpMode getOpMode() override;

      void readEvents(EventCallback onEvent, ErrorCallback onError) override;
      void stopEvents() override;
      void close() override;

    private:
      void readNext();
      void command(unsigned long request, const char* name);

      boost::asio::posix::stream_descriptor stream_;
      core::RawEvent record_{};
      EventCallback onEvent_{};
      ErrorCallback onError_{};
      bool closing_{ false };
    };

  } // namespace io
} // namespace dtxd
