#pragma once
/** @file  EventHandler.hpp
 *  @brief Detach/attach policy state machine and the jobs it schedules.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <cstdint>
#include <memory>

// 3rd-party headers
#include <boost/asio/io_context.hpp>

// dtxd headers
#include "core/ConfigLoader.hpp"
#include "core/Event.hpp"
#include "core/ProcessQueue.hpp"
#include "io/DtxDevice.hpp"
#include "io/ProcessRunner.hpp"
#include "io/Service.hpp"

namespace dtxd {
  namespace core {

    enum class State { Normal, Detaching, Aborting, Attaching };

    inline const char* toString(State s) {
      switch (s) {
      case State::Normal:
        return "Normal";
      case State::Detaching:
        return "Detaching";
      case State::Aborting:
        return "Aborting";
      case State::Attaching:
        return "Attaching";
      default:
        return "Unknown";
      }
    }

    /**
 * @class EventHandler
 * @brief Consumes classified hardware events, owns the machine state and
 *        the ignore counter, and runs the jobs it queued.
 *
 *  * Everything runs on the io_context thread; no locks.
 *  * Every job callback that resumes after a suspension (timer, subprocess)
 *    re-reads `state_` before touching the hardware.
 *  * Hardware command failures throw `Error(Io)` out of `handle()` or fail
 *    the job; both are fatal for the caller.
 */
    class EventHandler : public JobRunner {
    public:
      EventHandler(boost::asio::io_context& io, Config config, std::shared_ptr<io::Service> service,
                   std::shared_ptr<io::DtxDevice> device, ProcessQueue& queue,
                   std::shared_ptr<io::ProcessRunner> runner);

      //---event side-------------------------------------------
      void handle(const RawEvent& raw);

      //---JobRunner--------------------------------------------
      void run(const Job& job, Completion done) override;

      State state() const { return state_; }
      std::uint32_t ignoredRequests() const { return ignoreRequest_; }

    private:
      void onOpModeChange(OpMode mode);
      void onConnectionChange(ConnectionState connection);
      void onLatchStateChange(LatchState latch);
      void onDetachRequest();
      void onDetachError(std::uint8_t code);

      void schedule(Job job);

      void runAttach(const AttachJob& job, Completion done);
      void runDetach(Completion done);
      void runDetachAbort(Completion done);

      void attachFinished();
      void detachDecision(bool commence);

      boost::asio::io_context& io_;
      const Config config_;
      std::shared_ptr<io::Service> service_;
      std::shared_ptr<io::DtxDevice> device_;
      ProcessQueue& queue_;
      std::shared_ptr<io::ProcessRunner> runner_;

      State state_{ State::Normal };
      std::uint32_t ignoreRequest_{ 0 }; ///< expected duplicate DetachRequests
    };

  } // namespace core
} // namespace dtxd
