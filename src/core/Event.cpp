/* @file Event.cpp
 * @brief RawEvent -> Event classification
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

#include "core/Event.hpp"

using namespace dtxd::core;

namespace {
  // SAM base-attachment event category and its DTX event codes
  constexpr std::uint8_t kTypeDtx = 0x11;
  constexpr std::uint8_t kCodeConnection = 0x0c;
  constexpr std::uint8_t kCodeOpMode = 0x0d;
  constexpr std::uint8_t kCodeDetachRequest = 0x0e;
  constexpr std::uint8_t kCodeDetachError = 0x0f;
  constexpr std::uint8_t kCodeLatchState = 0x11;
} // namespace

std::optional<OpMode> dtxd::core::opModeFromRaw(int value) {
  switch (value) {
  case 0:
    return OpMode::Tablet;
  case 1:
    return OpMode::Laptop;
  case 2:
    return OpMode::Studio;
  default:
    return std::nullopt;
  }
}

std::optional<Event> dtxd::core::classify(const RawEvent& raw) {
  if (raw.type != kTypeDtx)
    return std::nullopt;

  switch (raw.code) {
  case kCodeConnection:
    if (raw.arg0 > 1)
      return std::nullopt;
    return event::ConnectionChange{
      raw.arg0 ? ConnectionState::Connected : ConnectionState::Disconnected, raw.arg1
    };

  case kCodeOpMode:
    if (auto mode = opModeFromRaw(raw.arg0))
      return event::OpModeChange{ *mode };
    return std::nullopt;

  case kCodeDetachRequest:
    return event::DetachRequest{};

  case kCodeDetachError:
    return event::DetachError{ raw.arg0 };

  case kCodeLatchState:
    if (raw.arg0 > 1)
      return std::nullopt;
    return event::LatchStateChange{ raw.arg0 ? LatchState::Open : LatchState::Closed };

  default:
    return std::nullopt;
  }
}
