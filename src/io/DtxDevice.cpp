/* @file DtxDevice.cpp
 * @brief /dev/surface_dtx wrapper - ioctl latch commands and async event records - POSIX
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <cerrno>
#include <cstring> // for strerror

// Linux headers
#include <fcntl.h>     // open flags
#include <sys/ioctl.h> // _IO, _IOR, ioctl()

// 3rd-party headers
#include <boost/asio/read.hpp>
#include <spdlog/spdlog.h>

// dtxd headers
#include "io/DtxDevice.hpp"

using namespace dtxd::io;
using dtxd::core::Error;
using dtxd::core::ErrorKind;

namespace {
  constexpr unsigned long kCmdLatchRequest = _IO(0x11, 0x03);
  constexpr unsigned long kCmdLatchOpen = _IO(0x11, 0x04);
  constexpr unsigned long kCmdGetOpMode = _IOR(0x11, 0x05, int);

  int openOrThrow(const std::string& path) {
    int fd = ::open(path.c_str(), O_RDONLY | O_NONBLOCK | O_CLOEXEC);
    if (fd < 0)
      throw Error(ErrorKind::Io,
                  "[DtxDevice] failed to open " + path + ": " + std::strerror(errno));
    return fd;
  }
} // namespace

SurfaceDtxDevice::SurfaceDtxDevice(boost::asio::io_context& io, const std::string& path)
    : SurfaceDtxDevice(io, openOrThrow(path)) {}

SurfaceDtxDevice::SurfaceDtxDevice(boost::asio::io_context& io, int fd)
    : stream_(io, fd) {}

SurfaceDtxDevice::~SurfaceDtxDevice() { close(); }

void SurfaceDtxDevice::latchOpen() { command(kCmdLatchOpen, "latch-open"); }

void SurfaceDtxDevice::latchRequest() { command(kCmdLatchRequest, "latch-request"); }

dtxd::core::OpMode SurfaceDtxDevice::getOpMode() {
  int value = 0;
  if (::ioctl(stream_.native_handle(), kCmdGetOpMode, &value) < 0)
    throw Error(ErrorKind::Io, std::string("[DtxDevice] get-opmode failed: ") + std::strerror(errno));

  auto mode = core::opModeFromRaw(value);
  if (!mode)
    throw Error(ErrorKind::Io, "[DtxDevice] get-opmode returned invalid mode " + std::to_string(value));
  return *mode;
}

void SurfaceDtxDevice::readEvents(EventCallback onEvent, ErrorCallback onError) {
  onEvent_ = std::move(onEvent);
  onError_ = std::move(onError);
  closing_ = false;
  readNext();
}

void SurfaceDtxDevice::stopEvents() {
  closing_ = true;
  if (stream_.is_open()) {
    boost::system::error_code ec;
    stream_.cancel(ec);
  }
}

void SurfaceDtxDevice::close() {
  stopEvents();
  if (stream_.is_open()) {
    boost::system::error_code ec;
    stream_.close(ec);
  }
}

// -------------------------------------------------------------------
// SurfaceDtxDevice::readNext
// One record per completion; re-arms itself until close() or an error.
// EOF counts as an error: the device never ends the stream on its own.
// -------------------------------------------------------------------
void SurfaceDtxDevice::readNext() {
  boost::asio::async_read(
      stream_, boost::asio::buffer(&record_, sizeof(record_)),
      [this](const boost::system::error_code& ec, std::size_t) {
        if (closing_)
          return;

        if (ec) {
          onError_(Error(ErrorKind::Io, "[DtxDevice] event stream failed: " + ec.message()));
          return;
        }

        onEvent_(record_);

        if (!closing_)
          readNext();
      });
}

void SurfaceDtxDevice::command(unsigned long request, const char* name) {
  if (!stream_.is_open())
    throw Error(ErrorKind::Io, std::string("[DtxDevice] ") + name + " on closed device");

  spdlog::trace("[DtxDevice] issuing {}", name);
  if (::ioctl(stream_.native_handle(), request) < 0)
    throw Error(ErrorKind::Io,
                std::string("[DtxDevice] ") + name + " failed: " + std::strerror(errno));
}
