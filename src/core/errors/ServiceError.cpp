#include "ServiceError.hpp"

namespace wam {

const char* to_string(ErrorCode code) {
  switch (code) {
    case ErrorCode::AuthFailed:              return "AUTH_FAILED";
    case ErrorCode::ValidationError:         return "VALIDATION_ERROR";
    case ErrorCode::NotFound:                return "NOT_FOUND";
    case ErrorCode::ReplicateError:          return "REPLICATE_ERROR";
    case ErrorCode::BackgroundRemovalFailed: return "BACKGROUND_REMOVAL_FAILED";
    case ErrorCode::StorageError:            return "STORAGE_ERROR";
    case ErrorCode::MethodNotAllowed:        return "METHOD_NOT_ALLOWED";
    case ErrorCode::InternalError:           return "INTERNAL_ERROR";
  }
  return "INTERNAL_ERROR";
}

int default_http_status(ErrorCode code) {
  switch (code) {
    case ErrorCode::AuthFailed:              return 401;
    case ErrorCode::ValidationError:         return 400;
    case ErrorCode::NotFound:                return 404;
    case ErrorCode::MethodNotAllowed:        return 405;
    case ErrorCode::ReplicateError:
    case ErrorCode::BackgroundRemovalFailed: return 502;
    case ErrorCode::StorageError:
    case ErrorCode::InternalError:           return 500;
  }
  return 500;
}

} // namespace wam
