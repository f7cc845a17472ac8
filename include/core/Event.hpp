#pragma once
/** @file  Event.hpp
 *  @brief Raw DTX hardware records and their typed classification.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <cstdint>
#include <optional>
#include <variant>

namespace dtxd {
  namespace core {

    /** Record as delivered by the surface_dtx character device (4 bytes). */
    struct RawEvent {
      std::uint8_t type;
      std::uint8_t code;
      std::uint8_t arg0;
      std::uint8_t arg1;
    };
    static_assert(sizeof(RawEvent) == 4, "RawEvent must match the kernel record layout");

    enum class OpMode : std::uint8_t { Tablet, Laptop, Studio };
    enum class LatchState : std::uint8_t { Closed, Open };
    enum class ConnectionState : std::uint8_t { Disconnected, Connected };

    /// Outward status broadcast, never stored.
    enum class DetachState : std::uint8_t { DetachReady, DetachCompleted, DetachAborted, AttachCompleted };

    /// DetachError code reported when the hardware gave up waiting.
    constexpr std::uint8_t kDetachErrorTimeout = 0x02;

    inline const char* toString(OpMode m) {
      switch (m) {
      case OpMode::Tablet:
        return "tablet";
      case OpMode::Laptop:
        return "laptop";
      case OpMode::Studio:
        return "studio";
      default:
        return "unknown";
      }
    }

    inline const char* toString(LatchState s) { return s == LatchState::Open ? "open" : "closed"; }

    inline const char* toString(ConnectionState s) {
      return s == ConnectionState::Connected ? "connected" : "disconnected";
    }

    inline const char* toString(DetachState s) {
      switch (s) {
      case DetachState::DetachReady:
        return "detach-ready";
      case DetachState::DetachCompleted:
        return "detach-completed";
      case DetachState::DetachAborted:
        return "detach-aborted";
      case DetachState::AttachCompleted:
        return "attach-completed";
      default:
        return "unknown";
      }
    }

    /// Maps the raw opmode value (event payload or ioctl result).
    std::optional<OpMode> opModeFromRaw(int value);

    namespace event {
      struct OpModeChange {
        OpMode mode;
      };
      struct ConnectionChange {
        ConnectionState state;
        std::uint8_t arg1;
      };
      struct LatchStateChange {
        LatchState state;
      };
      struct DetachRequest {};
      struct DetachError {
        std::uint8_t code;
      };
    } // namespace event

    using Event = std::variant<event::OpModeChange, event::ConnectionChange, event::LatchStateChange,
                               event::DetachRequest, event::DetachError>;

    /// Pure lookup on (type, code). `std::nullopt` means "unhandled, log it".
    std::optional<Event> classify(const RawEvent& raw);

  } // namespace core
} // namespace dtxd
