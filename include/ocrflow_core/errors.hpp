#pragma once

#include <exception>
#include <string>

namespace ocrflow_core {

// Failure families surfaced to callers. Each family maps to one HTTP status class.
enum class ErrorKind { InvalidInput, ResourceExhausted, ToolFailure, DownstreamUnavailable, NotFound };

inline std::string to_string(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::InvalidInput: return "invalid_input";
    case ErrorKind::ResourceExhausted: return "resource_exhausted";
    case ErrorKind::ToolFailure: return "tool_failure";
    case ErrorKind::DownstreamUnavailable: return "downstream_unavailable";
    case ErrorKind::NotFound: return "not_found";
  }
  return "unknown";
}

class OcrflowError : public std::exception {
 public:
  OcrflowError(ErrorKind kind, const std::string &message) : kind_(kind), message_(message) {}

  const char *what() const noexcept override {
    return message_.c_str();
  }

  ErrorKind kind() const noexcept {
    return kind_;
  }

 private:
  ErrorKind kind_;
  std::string message_;
};

// --- InvalidInput: never retried ---

class InvalidInputError : public OcrflowError {
 public:
  explicit InvalidInputError(const std::string &message)
      : OcrflowError(ErrorKind::InvalidInput, message) {}
};

class InvalidDocumentError : public InvalidInputError {
 public:
  explicit InvalidDocumentError(const std::string &message) : InvalidInputError(message) {}
};

// --- ResourceExhausted: caller should back off ---

class ResourceExhaustedError : public OcrflowError {
 public:
  explicit ResourceExhaustedError(const std::string &message)
      : OcrflowError(ErrorKind::ResourceExhausted, message) {}
};

class FileTooLargeError : public ResourceExhaustedError {
 public:
  explicit FileTooLargeError(const std::string &message) : ResourceExhaustedError(message) {}
};

class ChunkTooLargeError : public ResourceExhaustedError {
 public:
  explicit ChunkTooLargeError(const std::string &message) : ResourceExhaustedError(message) {}
};

class InsufficientStorageError : public ResourceExhaustedError {
 public:
  explicit InsufficientStorageError(const std::string &message) : ResourceExhaustedError(message) {}
};

class QueueFullError : public ResourceExhaustedError {
 public:
  explicit QueueFullError(const std::string &message) : ResourceExhaustedError(message) {}
};

// --- ToolFailure: isolated per page / per chunk ---

class ToolFailureError : public OcrflowError {
 public:
  explicit ToolFailureError(const std::string &message)
      : OcrflowError(ErrorKind::ToolFailure, message) {}
};

class ConversionError : public ToolFailureError {
 public:
  explicit ConversionError(const std::string &message) : ToolFailureError(message) {}
};

// --- DownstreamUnavailable: circuit open or call timeout ---

class DownstreamUnavailableError : public OcrflowError {
 public:
  explicit DownstreamUnavailableError(const std::string &message)
      : OcrflowError(ErrorKind::DownstreamUnavailable, message) {}
};

class ServiceUnavailableError : public DownstreamUnavailableError {
 public:
  explicit ServiceUnavailableError(const std::string &message)
      : DownstreamUnavailableError(message) {}
};

class DownstreamTimeoutError : public DownstreamUnavailableError {
 public:
  explicit DownstreamTimeoutError(const std::string &message)
      : DownstreamUnavailableError(message) {}
};

class JobNotFoundError : public OcrflowError {
 public:
  explicit JobNotFoundError(const std::string &job_id)
      : OcrflowError(ErrorKind::NotFound, "Job not found: " + job_id) {}
};

}  // namespace ocrflow_core
