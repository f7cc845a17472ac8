/* @file Error.cpp
 * @brief causal error chain
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

#include "core/Error.hpp"

using namespace dtxd::core;

Error::Error(ErrorKind kind, const std::string& message)
    : std::runtime_error(message), kind_(kind) {}

Error::Error(ErrorKind kind, const std::string& message, const Error& cause)
    : std::runtime_error(message), kind_(kind), cause_(std::make_shared<const Error>(cause)) {}

Error Error::wrap(ErrorKind kind, const std::string& message, const std::exception& cause) {
  if (auto* err = dynamic_cast<const Error*>(&cause))
    return Error(kind, message, *err);

  return Error(kind, message, Error(kind, cause.what()));
}

Error Error::wrap(ErrorKind kind, const std::string& message, std::exception_ptr cause) {
  if (!cause)
    return Error(kind, message);

  try {
    std::rethrow_exception(cause);
  } catch (const std::exception& e) {
    return wrap(kind, message, e);
  } catch (...) {
    return Error(kind, message, Error(kind, "non-standard exception"));
  }
}

std::vector<std::string> Error::causes() const {
  std::vector<std::string> out;
  for (const Error* c = cause(); c != nullptr; c = c->cause())
    out.emplace_back(c->what());
  return out;
}
