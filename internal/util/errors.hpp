#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>

namespace flowlock::util {

/*
  Central error types.

  Every error that crosses the engine boundary is a WorkflowError carrying
  a closed ErrorKind plus the correlation id of the operation that raised it.
  Callers branch on kind(), never on what().
*/

enum class ErrorKind : std::uint8_t {
  kValidation = 0,
  kInvalidTransition,
  kNotFound,
  kSecurity,

  kLockAcquisition,
  kStaleObject,
  kSerializationConflict,

  kTransientConnection,

  kServiceUnavailable,
  kInternal,
};

constexpr bool IsRetryable(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::kLockAcquisition:
    case ErrorKind::kStaleObject:
    case ErrorKind::kSerializationConflict:
    case ErrorKind::kTransientConnection:
      return true;
    case ErrorKind::kValidation:
    case ErrorKind::kInvalidTransition:
    case ErrorKind::kNotFound:
    case ErrorKind::kSecurity:
    case ErrorKind::kServiceUnavailable:
    case ErrorKind::kInternal:
      return false;
  }
  return false;
}

constexpr bool IsContention(ErrorKind kind) {
  return kind == ErrorKind::kLockAcquisition || kind == ErrorKind::kStaleObject || kind == ErrorKind::kSerializationConflict;
}

std::string_view KindName(ErrorKind kind);

class WorkflowError : public std::runtime_error {
 public:
  WorkflowError(ErrorKind kind, const std::string& msg, std::string correlation_id = {})
      : std::runtime_error(msg), kind_(kind), correlation_id_(std::move(correlation_id)) {
  }

  ErrorKind kind() const noexcept {
    return kind_;
  }

  const std::string& correlation_id() const noexcept {
    return correlation_id_;
  }

  // Errors are often raised deep in the repository layer before the
  // correlation id is known; the workflow layer stamps it on the way out.
  void set_correlation_id(std::string correlation_id) {
    correlation_id_ = std::move(correlation_id);
  }

 private:
  ErrorKind   kind_;
  std::string correlation_id_;
};

class ValidationError : public WorkflowError {
 public:
  explicit ValidationError(const std::string& msg, std::string correlation_id = {})
      : WorkflowError(ErrorKind::kValidation, msg, std::move(correlation_id)) {
  }
};

class InvalidTransitionError : public WorkflowError {
 public:
  explicit InvalidTransitionError(const std::string& msg, std::string correlation_id = {})
      : WorkflowError(ErrorKind::kInvalidTransition, msg, std::move(correlation_id)) {
  }
};

class NotFoundError : public WorkflowError {
 public:
  explicit NotFoundError(const std::string& msg, std::string correlation_id = {})
      : WorkflowError(ErrorKind::kNotFound, msg, std::move(correlation_id)) {
  }
};

class SecurityError : public WorkflowError {
 public:
  explicit SecurityError(const std::string& msg, std::string correlation_id = {})
      : WorkflowError(ErrorKind::kSecurity, msg, std::move(correlation_id)) {
  }
};

class LockAcquisitionError : public WorkflowError {
 public:
  explicit LockAcquisitionError(const std::string& msg, std::string correlation_id = {})
      : WorkflowError(ErrorKind::kLockAcquisition, msg, std::move(correlation_id)) {
  }
};

class StaleObjectError : public WorkflowError {
 public:
  explicit StaleObjectError(const std::string& msg, std::string correlation_id = {})
      : WorkflowError(ErrorKind::kStaleObject, msg, std::move(correlation_id)) {
  }
};

class SerializationConflict : public WorkflowError {
 public:
  explicit SerializationConflict(const std::string& msg, std::string correlation_id = {})
      : WorkflowError(ErrorKind::kSerializationConflict, msg, std::move(correlation_id)) {
  }
};

class TransientConnectionError : public WorkflowError {
 public:
  explicit TransientConnectionError(const std::string& msg, std::string correlation_id = {})
      : WorkflowError(ErrorKind::kTransientConnection, msg, std::move(correlation_id)) {
  }
};

class ServiceUnavailableError : public WorkflowError {
 public:
  ServiceUnavailableError(const std::string& msg, std::string correlation_id, ErrorKind last_cause)
      : WorkflowError(ErrorKind::kServiceUnavailable, msg, std::move(correlation_id)), last_cause_(last_cause) {
  }

  // Kind of the final retryable failure before the retry budget ran out.
  ErrorKind last_cause() const noexcept {
    return last_cause_;
  }

 private:
  ErrorKind last_cause_;
};

class InternalError : public WorkflowError {
 public:
  explicit InternalError(const std::string& msg, std::string correlation_id = {})
      : WorkflowError(ErrorKind::kInternal, msg, std::move(correlation_id)) {
  }
};

// Throws the WorkflowError subclass matching kind.
[[noreturn]] void Throw(ErrorKind kind, const std::string& msg, std::string correlation_id = {});

// Caller-facing text: no lock keys, SQL or backend detail.
std::string PublicMessage(const WorkflowError& error);

} // namespace flowlock::util
