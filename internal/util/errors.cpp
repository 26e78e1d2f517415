#include "errors.hpp"

namespace flowlock::util {

std::string_view KindName(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::kValidation:
      return "validation";
    case ErrorKind::kInvalidTransition:
      return "invalid_transition";
    case ErrorKind::kNotFound:
      return "not_found";
    case ErrorKind::kSecurity:
      return "security";
    case ErrorKind::kLockAcquisition:
      return "lock_acquisition";
    case ErrorKind::kStaleObject:
      return "stale_object";
    case ErrorKind::kSerializationConflict:
      return "serialization_conflict";
    case ErrorKind::kTransientConnection:
      return "transient_connection";
    case ErrorKind::kServiceUnavailable:
      return "service_unavailable";
    case ErrorKind::kInternal:
      return "internal";
  }
  return "internal";
}

void Throw(ErrorKind kind, const std::string& msg, std::string correlation_id) {
  switch (kind) {
    case ErrorKind::kValidation:
      throw ValidationError(msg, std::move(correlation_id));
    case ErrorKind::kInvalidTransition:
      throw InvalidTransitionError(msg, std::move(correlation_id));
    case ErrorKind::kNotFound:
      throw NotFoundError(msg, std::move(correlation_id));
    case ErrorKind::kSecurity:
      throw SecurityError(msg, std::move(correlation_id));
    case ErrorKind::kLockAcquisition:
      throw LockAcquisitionError(msg, std::move(correlation_id));
    case ErrorKind::kStaleObject:
      throw StaleObjectError(msg, std::move(correlation_id));
    case ErrorKind::kSerializationConflict:
      throw SerializationConflict(msg, std::move(correlation_id));
    case ErrorKind::kTransientConnection:
      throw TransientConnectionError(msg, std::move(correlation_id));
    case ErrorKind::kServiceUnavailable:
      throw ServiceUnavailableError(msg, std::move(correlation_id), ErrorKind::kInternal);
    case ErrorKind::kInternal:
      break;
  }
  throw InternalError(msg, std::move(correlation_id));
}

std::string PublicMessage(const WorkflowError& error) {
  switch (error.kind()) {
    case ErrorKind::kValidation:
    case ErrorKind::kInvalidTransition:
    case ErrorKind::kNotFound:
      // Raised from caller input; the message only names states and ids.
      return error.what();
    case ErrorKind::kSecurity:
      return "operation not permitted";
    case ErrorKind::kLockAcquisition:
    case ErrorKind::kStaleObject:
    case ErrorKind::kSerializationConflict:
      return "resource is busy; retry later";
    case ErrorKind::kTransientConnection:
    case ErrorKind::kServiceUnavailable:
      return "service temporarily unavailable; retry later";
    case ErrorKind::kInternal:
      break;
  }
  return "internal error";
}

} // namespace flowlock::util
