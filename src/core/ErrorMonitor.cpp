/* @file ErrorMonitor.cpp
 * @brief logs fatal cause chains and escalates once per unique failure
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

#include <algorithm>
#include <cstdlib>

#include <spdlog/spdlog.h>

#include "core/ErrorMonitor.hpp"

using namespace dtxd::core;

ErrorMonitor::ErrorMonitor()
    : escalation_([](const Error&) { std::abort(); }) {}

ErrorMonitor::~ErrorMonitor() = default;

void ErrorMonitor::registerEscalation(Escalation cb) {
  std::lock_guard<std::mutex> lock(mtx_);
  escalation_ = std::move(cb);
}

void ErrorMonitor::notifyFailure(const Error& error) {
  spdlog::critical("Error: {}", error.what());
  for (const auto& cause : error.causes())
    spdlog::critical("Caused by: {}", cause);

  if (!isNew(error.what()))
    return;

  Escalation cb;
  {
    std::lock_guard<std::mutex> lock(mtx_);
    cb = escalation_;
  }
  if (cb)
    cb(error);
}

bool ErrorMonitor::isNew(const std::string& message) {
  std::lock_guard<std::mutex> lock(mtx_);
  if (std::find(seen_.begin(), seen_.end(), message) != seen_.end())
    return false;
  seen_.push_back(message);
  return true;
}
