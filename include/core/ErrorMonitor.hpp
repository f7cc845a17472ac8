#pragma once
/** @file  ErrorMonitor.hpp
 *  @brief Central fatal-fault sink & escalation helper.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <functional>
#include <mutex>
#include <string>
#include <vector>

#include "core/Error.hpp"

namespace dtxd::core {

  /**
 * @class ErrorMonitor
 * @brief Long-running tasks call `notifyFailure()` when they end unexpectedly;
 *        we log the whole cause chain at critical severity and call the
 *        registered escalation callback exactly once per unique error.
 *
 * * Default escalation aborts the process (nothing is expected to recover).
 * * Debounces duplicate failures so a flapping source doesn’t spam the log.
 */
  class ErrorMonitor {
  public:
    using Escalation = std::function<void(const Error&)>;

    ErrorMonitor();
    virtual ~ErrorMonitor();

    /// Replace the default (abort) escalation, e.g. in tests.
    void registerEscalation(Escalation cb);

    /// Called by tasks on fatal fault; logs the chain and escalates.
    virtual void notifyFailure(const Error& error);

  private:
    bool isNew(const std::string& message);

    Escalation escalation_{};
    std::vector<std::string> seen_; ///< de-dupe list
    mutable std::mutex mtx_;
  };

} // namespace dtxd::core
