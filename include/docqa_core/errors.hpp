#pragma once

#include <exception>
#include <string>

namespace docqa_core {

enum class ErrorKind {
  InvalidParameters,
  EmbeddingUnavailable,
  IndexUnavailable,
  GenerationBackendFailure,
  StorageFailure,
  LimitExceeded,
  Internal
};

// Machine-readable names, used in stream error events and API responses
inline std::string to_string(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::InvalidParameters:
      return "invalid_parameters";
    case ErrorKind::EmbeddingUnavailable:
      return "embedding_unavailable";
    case ErrorKind::IndexUnavailable:
      return "index_unavailable";
    case ErrorKind::GenerationBackendFailure:
      return "generation_backend_failure";
    case ErrorKind::StorageFailure:
      return "storage_failure";
    case ErrorKind::LimitExceeded:
      return "limit_exceeded";
    default:
      return "internal";
  }
}

class DocqaError : public std::exception {
 public:
  DocqaError(ErrorKind kind, const std::string &message) : kind_(kind), message_(message) {}

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

class InvalidParametersError : public DocqaError {
 public:
  explicit InvalidParametersError(const std::string &message)
      : DocqaError(ErrorKind::InvalidParameters, message) {}
};

class EmbeddingUnavailableError : public DocqaError {
 public:
  explicit EmbeddingUnavailableError(const std::string &message)
      : DocqaError(ErrorKind::EmbeddingUnavailable, message) {}
};

class IndexUnavailableError : public DocqaError {
 public:
  explicit IndexUnavailableError(const std::string &message)
      : DocqaError(ErrorKind::IndexUnavailable, message) {}
};

class GenerationBackendError : public DocqaError {
 public:
  GenerationBackendError(const std::string &backend, const std::string &message)
      : DocqaError(ErrorKind::GenerationBackendFailure, backend + ": " + message),
        backend_(backend) {}

  const std::string &backend() const {
    return backend_;
  }

 private:
  std::string backend_;
};

class DocumentStoreError : public DocqaError {
 public:
  explicit DocumentStoreError(const std::string &message)
      : DocqaError(ErrorKind::StorageFailure, message) {}
};

class LimitExceededError : public DocqaError {
 public:
  explicit LimitExceededError(const std::string &message)
      : DocqaError(ErrorKind::LimitExceeded, message) {}
};

}  // namespace docqa_core
