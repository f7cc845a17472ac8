/* @file DbusService.cpp
 * @brief sd-bus object for org.surface.dtx, integrated into the asio loop
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <cerrno>
#include <chrono>
#include <cstdint>
#include <cstring> // for strerror

// 3rd-party headers
#include <spdlog/spdlog.h>
#include <systemd/sd-bus.h>

// dtxd headers
#include "io/DbusService.hpp"

using namespace dtxd::io;
using dtxd::core::Error;
using dtxd::core::ErrorKind;

namespace {
  Error busError(const char* what, int r) {
    return Error(ErrorKind::DBusService, std::string("[DbusService] ") + what + ": " + std::strerror(-r));
  }
} // namespace

DbusService::DbusService(boost::asio::io_context& io, std::shared_ptr<DtxDevice> device)
    : device_(std::move(device)), fd_(io), timer_(io) {}

DbusService::~DbusService() {
  stop();
  if (slot_)
    sd_bus_slot_unref(slot_);
  if (bus_)
    sd_bus_flush_close_unref(bus_);
}

void DbusService::connect() {
  static const sd_bus_vtable vtable[] = {
    SD_BUS_VTABLE_START(0),
    SD_BUS_PROPERTY("DeviceMode", "s", &DbusService::getDeviceMode, 0,
                    SD_BUS_VTABLE_PROPERTY_EMITS_CHANGE),
    SD_BUS_METHOD("Request", "", "", &DbusService::onRequest, SD_BUS_VTABLE_UNPRIVILEGED),
    SD_BUS_SIGNAL("DetachStateChanged", "s", 0),
    SD_BUS_VTABLE_END
  };

  if (bus_)
    return;

  int r = sd_bus_open_system(&bus_);
  if (r < 0)
    throw busError("failed to connect to system bus", r);

  r = sd_bus_add_object_vtable(bus_, &slot_, kObjectPath, kInterface, vtable, this);
  if (r < 0)
    throw busError("failed to register object", r);

  r = sd_bus_request_name(bus_, kBusName, 0);
  if (r < 0)
    throw busError("failed to acquire bus name", r);

  fd_.assign(sd_bus_get_fd(bus_));
  spdlog::debug("[DbusService] registered {} at {}", kBusName, kObjectPath);
}

void DbusService::serve(ErrorCallback onError) {
  if (!bus_)
    throw Error(ErrorKind::DBusService, "[DbusService] serve() before connect()");

  onError_ = std::move(onError);
  serving_ = true;
  waiting_ = false;
  process();
}

void DbusService::stop() {
  serving_ = false;
  waiting_ = false;

  boost::system::error_code ec;
  timer_.cancel();
  if (fd_.is_open()) {
    fd_.cancel(ec);
    fd_.release(); // descriptor belongs to sd-bus
  }
}

void DbusService::setDeviceMode(core::OpMode mode) {
  mode_ = mode;
  spdlog::debug("[DbusService] device mode set to {}", core::toString(mode));

  if (!bus_)
    return;

  int r = sd_bus_emit_properties_changed(bus_, kObjectPath, kInterface, "DeviceMode", nullptr);
  if (r < 0)
    spdlog::warn("[DbusService] failed to emit DeviceMode change: {}", std::strerror(-r));
}

void DbusService::signalDetachStateChange(core::DetachState state) {
  spdlog::debug("[DbusService] detach state: {}", core::toString(state));

  if (!bus_)
    return;

  int r = sd_bus_emit_signal(bus_, kObjectPath, kInterface, "DetachStateChanged", "s",
                             core::toString(state));
  if (r < 0)
    spdlog::warn("[DbusService] failed to emit DetachStateChanged: {}", std::strerror(-r));
}

// -------------------------------------------------------------------
// DbusService::process
// Drain everything sd-bus has queued, flush replies, then wait for the
// fd or the bus timeout, whichever comes first.
// -------------------------------------------------------------------
void DbusService::process() {
  if (!serving_)
    return;

  int r;
  while ((r = sd_bus_process(bus_, nullptr)) > 0) {
  }
  if (r < 0) {
    fail(busError("bus processing failed", r));
    return;
  }

  r = sd_bus_flush(bus_);
  if (r < 0) {
    fail(busError("bus flush failed", r));
    return;
  }

  arm();
}

void DbusService::arm() {
  if (!waiting_) {
    waiting_ = true;
    fd_.async_wait(boost::asio::posix::stream_descriptor::wait_read,
                   [this](const boost::system::error_code& ec) {
                     waiting_ = false;
                     if (ec == boost::asio::error::operation_aborted || !serving_)
                       return;
                     if (ec) {
                       fail(Error(ErrorKind::DBusService, "[DbusService] wait failed: " + ec.message()));
                       return;
                     }
                     process();
                   });
  }

  std::uint64_t usec = 0;
  if (sd_bus_get_timeout(bus_, &usec) < 0 || usec == UINT64_MAX)
    return;

  // sd-bus reports CLOCK_MONOTONIC, which is what steady_clock uses on Linux
  timer_.expires_at(std::chrono::steady_clock::time_point(std::chrono::microseconds(usec)));
  timer_.async_wait([this](const boost::system::error_code& ec) {
    if (ec || !serving_)
      return;
    process();
  });
}

void DbusService::fail(const Error& error) {
  stop();
  if (onError_)
    onError_(error);
}

int DbusService::onRequest(sd_bus_message* msg, void* userdata, sd_bus_error* retError) {
  auto* self = static_cast<DbusService*>(userdata);
  spdlog::debug("[DbusService] latch request via bus");

  try {
    self->device_->latchRequest();
  } catch (const Error& e) {
    spdlog::error("[DbusService] request failed: {}", e.what());
    return sd_bus_error_set_errno(retError, EIO);
  }

  return sd_bus_reply_method_return(msg, "");
}

int DbusService::getDeviceMode(sd_bus*, const char*, const char*, const char*,
                               sd_bus_message* reply, void* userdata, sd_bus_error*) {
  auto* self = static_cast<DbusService*>(userdata);
  return sd_bus_message_append(reply, "s", core::toString(self->mode_));
}
