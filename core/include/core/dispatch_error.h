#pragma once

#include <map>
#include <string>

namespace runq::core {

/// Error categories. Callers branch on these (the HTTP layer maps them to
/// status codes) instead of parsing messages.
enum class ErrorCategory {
  Validation, // Malformed submission or request
  NotFound,   // Unknown run, runner or session
  Conflict,   // Operation illegal for the current state
  Timeout,    // Deadline exceeded
  Canceled,   // Caller gave up (cancel token or shutdown)
  Network,    // Transport failure (client side)
  Internal,   // Invariant violation
  Unknown
};

/// Structured error returned by every fallible runq operation.
struct DispatchError {
  ErrorCategory category = ErrorCategory::Unknown;
  int code = 0; // Stable numeric code, see the factory functions below
  std::string message;
  bool retryable = false;
  std::map<std::string, std::string> details;

  DispatchError() = default;

  DispatchError(ErrorCategory cat, int c, std::string msg,
                std::map<std::string, std::string> dets = {})
      : category(cat), code(c), message(std::move(msg)),
        details(std::move(dets)) {}

  static DispatchError Validation(std::string msg) {
    return {ErrorCategory::Validation, 1001, std::move(msg)};
  }
  static DispatchError NotFound(std::string msg) {
    return {ErrorCategory::NotFound, 1002, std::move(msg)};
  }
  static DispatchError Conflict(std::string msg) {
    return {ErrorCategory::Conflict, 1003, std::move(msg)};
  }
  static DispatchError Internal(std::string msg) {
    return {ErrorCategory::Internal, 1004, std::move(msg)};
  }
};

inline const char *to_string(ErrorCategory cat) {
  switch (cat) {
  case ErrorCategory::Validation:
    return "validation_error";
  case ErrorCategory::NotFound:
    return "not_found";
  case ErrorCategory::Conflict:
    return "conflict";
  case ErrorCategory::Timeout:
    return "timeout";
  case ErrorCategory::Canceled:
    return "canceled";
  case ErrorCategory::Network:
    return "network";
  case ErrorCategory::Internal:
    return "internal";
  case ErrorCategory::Unknown:
    return "unknown";
  }
  return "unknown";
}

} // namespace runq::core
