#pragma once
/** @file  Service.hpp
 *  @brief One-way status pushes toward bus consumers.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <functional>

#include "core/Error.hpp"
#include "core/Event.hpp"

namespace dtxd::io {

  /**
 * @class Service
 * @brief Fire-and-forget publisher used by the event handler, plus the
 *        request-serving task driven by the main composition.
 *
 *  * Pushes must not throw: a failed push is logged, not escalated.
 *  * `serve()` runs until `stop()`; `onError` fires at most once if it ends
 *    for any other reason.
 */
  class Service {
  public:
    using ErrorCallback = std::function<void(const core::Error&)>;

    virtual ~Service() = default;

    virtual void setDeviceMode(core::OpMode mode) = 0;
    virtual void signalDetachStateChange(core::DetachState state) = 0;

    virtual void serve(ErrorCallback onError) = 0;
    virtual void stop() = 0;
  };

} // namespace dtxd::io
