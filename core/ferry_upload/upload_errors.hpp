// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef FERRY_UPLOAD_ERRORS_HPP
#define FERRY_UPLOAD_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace ferry {
namespace upload {

/**
 * Classification of every failure the write path can report
 */
enum class ErrorKind {
  SizeLimitExceeded,      // part count or object size would exceed the policy
  StagingIOError,         // local spool write/read failure
  BackendTransientError,  // retryable backend failure (throttling, timeouts)
  BackendPermanentError,  // auth, not found, malformed request
  SessionCanceled,        // caller-initiated cancellation
  InvalidConfiguration    // rejected size policy or store settings
};

inline const char* errorKindToString(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::SizeLimitExceeded:
      return "SizeLimitExceeded";
    case ErrorKind::StagingIOError:
      return "StagingIOError";
    case ErrorKind::BackendTransientError:
      return "BackendTransientError";
    case ErrorKind::BackendPermanentError:
      return "BackendPermanentError";
    case ErrorKind::SessionCanceled:
      return "SessionCanceled";
    case ErrorKind::InvalidConfiguration:
      return "InvalidConfiguration";
  }
  return "Unknown";
}

/**
 * Exception raised on the producer path (write, finish, cancel)
 */
class UploadError : public std::runtime_error {
public:
  UploadError(ErrorKind kind, const std::string& message)
      : std::runtime_error(std::string(errorKindToString(kind)) + ": " + message)
      , kind_(kind)
      , message_(message) {}

  ErrorKind kind() const {
    return kind_;
  }

  // what() without the kind prefix
  const std::string& message() const {
    return message_;
  }

private:
  ErrorKind kind_;
  std::string message_;
};

}  // namespace upload
}  // namespace ferry

#endif  // FERRY_UPLOAD_ERRORS_HPP
