#pragma once
#include <stdexcept>
#include <string>

namespace wam {

enum class ErrorCode {
  AuthFailed,
  ValidationError,
  NotFound,
  ReplicateError,
  BackgroundRemovalFailed,
  StorageError,
  MethodNotAllowed,
  InternalError,
};

// Wire name used in the `error_code` response field.
const char* to_string(ErrorCode code);

int default_http_status(ErrorCode code);

// Base for every error that maps onto an API response.
class ServiceError : public std::runtime_error {
public:
  ServiceError(ErrorCode code, const std::string& message)
    : std::runtime_error(message), code_(code), httpStatus_(default_http_status(code)) {}
  ServiceError(ErrorCode code, int httpStatus, const std::string& message)
    : std::runtime_error(message), code_(code), httpStatus_(httpStatus) {}

  ErrorCode code() const { return code_; }
  int httpStatus() const { return httpStatus_; }

private:
  ErrorCode code_;
  int httpStatus_;
};

class ValidationError : public ServiceError {
public:
  explicit ValidationError(const std::string& message)
    : ServiceError(ErrorCode::ValidationError, message) {}
};

class AuthError : public ServiceError {
public:
  explicit AuthError(const std::string& message, int httpStatus = 401)
    : ServiceError(ErrorCode::AuthFailed, httpStatus, message) {}
};

class NotFoundError : public ServiceError {
public:
  explicit NotFoundError(const std::string& message)
    : ServiceError(ErrorCode::NotFound, message) {}
};

// Failure reported by (or while talking to) an external model service.
class UpstreamError : public ServiceError {
public:
  UpstreamError(ErrorCode code, const std::string& message, int upstreamStatus = 0)
    : ServiceError(code, message), upstreamStatus_(upstreamStatus) {}

  // HTTP status returned by the upstream service, 0 when none was received.
  int upstreamStatus() const { return upstreamStatus_; }

private:
  int upstreamStatus_;
};

class StorageError : public ServiceError {
public:
  explicit StorageError(const std::string& message)
    : ServiceError(ErrorCode::StorageError, message) {}
};

class BucketAlreadyExistsError : public StorageError {
public:
  explicit BucketAlreadyExistsError(const std::string& bucket)
    : StorageError("bucket already exists: " + bucket) {}
};

class ObjectExistsError : public StorageError {
public:
  explicit ObjectExistsError(const std::string& path)
    : StorageError("object already exists: " + path) {}
};

} // namespace wam
