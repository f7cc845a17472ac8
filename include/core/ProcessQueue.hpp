#pragma once
/** @file  ProcessQueue.hpp
 *  @brief Bounded FIFO of deferred jobs with a single serial consumer.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <chrono>
#include <cstddef>
#include <deque>
#include <exception>
#include <functional>
#include <variant>

// 3rd-party headers
#include <boost/asio/io_context.hpp>

namespace dtxd {
  namespace core {

    //---job variants-------------------------------------------
    struct AttachJob {
      std::chrono::milliseconds delay;
    };
    struct DetachJob {};
    struct DetachAbortJob {};

    using Job = std::variant<AttachJob, DetachJob, DetachAbortJob>;

    const char* toString(const Job& job);

    /** Executes one job; must call `done` exactly once, asynchronously or not. */
    class JobRunner {
    public:
      using Completion = std::function<void(std::exception_ptr)>;

      virtual ~JobRunner() = default;
      virtual void run(const Job& job, Completion done) = 0;
    };

    /**
 * @class ProcessQueue
 * @brief Jobs are run strictly one at a time, in submission order.
 *
 *  * `trySubmit()` never blocks: a full queue drops the job with a warning.
 *  * Submitting after `close()` is a logic error and throws
 *    `std::logic_error` (the caller treats that as fatal).
 *  * A job failure is handed to the error callback; the consumer then
 *    carries on with the next job.
 */
    class ProcessQueue {
    public:
      static constexpr std::size_t kCapacity = 32;

      using ErrorCallback = std::function<void(std::exception_ptr)>;

      explicit ProcessQueue(boost::asio::io_context& io, std::size_t capacity = kCapacity);

      ProcessQueue(const ProcessQueue&) = delete;
      ProcessQueue& operator=(const ProcessQueue&) = delete;

      //---producer side----------------------------------------
      /// @returns false if the job was dropped because the queue is full.
      bool trySubmit(Job job);

      //---consumer side----------------------------------------
      void start(JobRunner& runner, ErrorCallback onError);

      /// Invoke \p onIdle once the queue is empty and no job is in flight.
      void asyncDrain(std::function<void()> onIdle);

      void close(); ///< end of consumer lifetime

      bool idle() const { return pending_.empty() && !busy_; }
      bool closed() const { return closed_; }
      std::size_t capacity() const { return capacity_; }
      const std::deque<Job>& pending() const { return pending_; }

    private:
      void schedule();
      void runNext();
      void notifyIfIdle();

      boost::asio::io_context& io_;
      std::size_t capacity_;
      std::deque<Job> pending_{};
      JobRunner* runner_{ nullptr };
      ErrorCallback onError_{};
      std::function<void()> onIdle_{};
      bool busy_{ false };
      bool scheduled_{ false };
      bool closed_{ false };
    };

  } // namespace core
} // namespace dtxd
