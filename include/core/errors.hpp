#ifndef FARMTRACE_CORE_ERRORS_HPP
#define FARMTRACE_CORE_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace farmtrace {

enum class ErrorKind {
  Validation,
  StorageUnavailable,
  PinFailed,
  NotFound,
  Serialization,
  Internal
};

inline const char* error_kind_to_string(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::Validation:         return "validation";
    case ErrorKind::StorageUnavailable: return "storage_unavailable";
    case ErrorKind::PinFailed:          return "pin_failed";
    case ErrorKind::NotFound:           return "not_found";
    case ErrorKind::Serialization:      return "serialization";
    case ErrorKind::Internal:           return "internal";
    default:                            return "unknown";
  }
}

class Error : public std::runtime_error {
public:
  Error(ErrorKind kind, const std::string& message)
    : std::runtime_error(message), kind_(kind) {}

  ErrorKind kind() const { return kind_; }

private:
  ErrorKind kind_;
};

// Malformed or missing input; never retried
class ValidationError : public Error {
public:
  explicit ValidationError(const std::string& message)
    : Error(ErrorKind::Validation, message) {}
};

// Persist, fetch or pin transport failed; retryable
class StorageUnavailableError : public Error {
public:
  explicit StorageUnavailableError(const std::string& message)
    : Error(ErrorKind::StorageUnavailable, message) {}
};

// Content was persisted but the durability pin failed; retry the pin alone
class PinFailedError : public Error {
public:
  PinFailedError(const std::string& content_address, const std::string& message)
    : Error(ErrorKind::PinFailed, message), content_address_(content_address) {}

  const std::string& content_address() const { return content_address_; }

private:
  std::string content_address_;
};

class NotFoundError : public Error {
public:
  explicit NotFoundError(const std::string& message)
    : Error(ErrorKind::NotFound, message) {}
};

// Envelope could not be canonicalized; indicates a defect
class SerializationError : public Error {
public:
  explicit SerializationError(const std::string& message)
    : Error(ErrorKind::Serialization, message) {}
};

} // namespace farmtrace

#endif // FARMTRACE_CORE_ERRORS_HPP
