#pragma once

#include <stdexcept>
#include <string>
#include <string_view>

namespace refstore::util {

/*
  Central error types.

  Every store failure carries the reference name and the operation that was
  attempted. The service layer translates these into contract error codes.
*/

enum class ErrorCode {
  InvalidReferenceName,
  ReferenceNotFound,
  StorageIOError,
  FormatError,
};

inline std::string_view ToString(ErrorCode code) {
  switch (code) {
    case ErrorCode::InvalidReferenceName:
      return "InvalidReferenceName";
    case ErrorCode::ReferenceNotFound:
      return "ReferenceNotFound";
    case ErrorCode::StorageIOError:
      return "StorageIOError";
    case ErrorCode::FormatError:
      return "FormatError";
  }
  return "Unknown";
}

class ReferenceError : public std::runtime_error {
 public:
  ReferenceError(ErrorCode code, std::string name, std::string operation, std::string detail)
      : std::runtime_error(Describe(name, operation, detail)),
        code_(code),
        name_(std::move(name)),
        operation_(std::move(operation)),
        detail_(std::move(detail)) {
  }

  ErrorCode code() const noexcept {
    return code_;
  }

  const std::string& name() const noexcept {
    return name_;
  }

  const std::string& operation() const noexcept {
    return operation_;
  }

  const std::string& detail() const noexcept {
    return detail_;
  }

 private:
  static std::string Describe(const std::string& name, const std::string& operation, const std::string& detail) {
    return operation + " '" + name + "': " + detail;
  }

  ErrorCode   code_;
  std::string name_;
  std::string operation_;
  std::string detail_;
};

class InvalidReferenceName : public ReferenceError {
 public:
  InvalidReferenceName(std::string name, std::string operation, std::string detail)
      : ReferenceError(ErrorCode::InvalidReferenceName, std::move(name), std::move(operation), std::move(detail)) {
  }
};

class ReferenceNotFound : public ReferenceError {
 public:
  ReferenceNotFound(std::string name, std::string operation)
      : ReferenceError(ErrorCode::ReferenceNotFound, std::move(name), std::move(operation), "reference not found") {
  }
};

class StorageIOError : public ReferenceError {
 public:
  StorageIOError(std::string name, std::string operation, std::string detail)
      : ReferenceError(ErrorCode::StorageIOError, std::move(name), std::move(operation), std::move(detail)) {
  }
};

class FormatError : public ReferenceError {
 public:
  FormatError(std::string name, std::string operation, std::string detail)
      : ReferenceError(ErrorCode::FormatError, std::move(name), std::move(operation), std::move(detail)) {
  }
};

} // namespace refstore::util
