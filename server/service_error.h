#pragma once

#include <stdexcept>
#include <string>

namespace parley {

// Failure taxonomy shared by the auth, chat and runtime layers. The HTTP
// layer maps each code to a status; nothing below it knows about HTTP.
enum class ErrorCode {
  kInvalidCredential,  // bad, expired or unresolvable token
  kUnauthorized,       // valid identity, chat owned by someone else
  kNotFound,           // chat id unknown
  kModelUnavailable,   // model artifact missing or unloadable
  kGenerationFailure,  // engine error mid-generation
  kConflict,           // structural operation racing a live generation
  kBadRequest,         // malformed caller input
};

const char* ErrorCodeName(ErrorCode code);

class ServiceError : public std::runtime_error {
 public:
  ServiceError(ErrorCode code, const std::string& message)
      : std::runtime_error(message), code_(code) {}

  ErrorCode code() const { return code_; }

 private:
  ErrorCode code_;
};

inline const char* ErrorCodeName(ErrorCode code) {
  switch (code) {
    case ErrorCode::kInvalidCredential:
      return "invalid_credential";
    case ErrorCode::kUnauthorized:
      return "unauthorized";
    case ErrorCode::kNotFound:
      return "not_found";
    case ErrorCode::kModelUnavailable:
      return "model_unavailable";
    case ErrorCode::kGenerationFailure:
      return "generation_failure";
    case ErrorCode::kConflict:
      return "conflict";
    case ErrorCode::kBadRequest:
      return "bad_request";
  }
  return "unknown";
}

}  // namespace parley
