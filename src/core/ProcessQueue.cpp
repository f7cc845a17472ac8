/* @file ProcessQueue.cpp
 * @brief serial executor for handler jobs
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <stdexcept>

// 3rd-party headers
#include <boost/asio/post.hpp>
#include <spdlog/spdlog.h>

// dtxd headers
#include "core/ProcessQueue.hpp"

using namespace dtxd::core;

const char* dtxd::core::toString(const Job& job) {
  struct Name {
    const char* operator()(const AttachJob&) const { return "attach"; }
    const char* operator()(const DetachJob&) const { return "detach"; }
    const char* operator()(const DetachAbortJob&) const { return "detach_abort"; }
  };
  return std::visit(Name{}, job);
}

ProcessQueue::ProcessQueue(boost::asio::io_context& io, std::size_t capacity)
    : io_(io), capacity_(capacity) {}

bool ProcessQueue::trySubmit(Job job) {
  if (closed_)
    throw std::logic_error("[ProcessQueue] submit after the consumer was closed");

  if (pending_.size() >= capacity_) {
    spdlog::warn("[ProcessQueue] process queue is full, dropping {} task", toString(job));
    return false;
  }

  pending_.push_back(std::move(job));
  schedule();
  return true;
}

void ProcessQueue::start(JobRunner& runner, ErrorCallback onError) {
  runner_ = &runner;
  onError_ = std::move(onError);
  schedule();
}

void ProcessQueue::asyncDrain(std::function<void()> onIdle) {
  onIdle_ = std::move(onIdle);
  boost::asio::post(io_, [this] { notifyIfIdle(); });
}

void ProcessQueue::close() {
  closed_ = true;
  pending_.clear();
}

// never run a job inline from the producer: hop through the io_context
void ProcessQueue::schedule() {
  if (!runner_ || busy_ || scheduled_ || pending_.empty())
    return;

  scheduled_ = true;
  boost::asio::post(io_, [this] {
    scheduled_ = false;
    runNext();
  });
}

void ProcessQueue::runNext() {
  if (closed_ || busy_ || pending_.empty())
    return;

  Job job = std::move(pending_.front());
  pending_.pop_front();
  busy_ = true;

  auto done = [this](std::exception_ptr error) {
    busy_ = false;
    if (error && onError_)
      onError_(error);
    schedule();
    notifyIfIdle();
  };

  try {
    runner_->run(job, done);
  } catch (...) {
    done(std::current_exception());
  }
}

void ProcessQueue::notifyIfIdle() {
  if (!onIdle_ || !idle())
    return;

  auto cb = std::move(onIdle_);
  onIdle_ = nullptr;
  cb();
}
