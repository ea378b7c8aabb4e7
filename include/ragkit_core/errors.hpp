#pragma once

#include <exception>
#include <string>

namespace ragkit_core {

enum class ErrorKind { StoreUnavailable, EmbeddingUnavailable, GenerationUnavailable, RateLimited };

inline std::string to_string(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::StoreUnavailable:
      return "store_unavailable";
    case ErrorKind::EmbeddingUnavailable:
      return "embedding_unavailable";
    case ErrorKind::GenerationUnavailable:
      return "generation_unavailable";
    case ErrorKind::RateLimited:
      return "rate_limited";
  }
  return "unknown";
}

class ServiceError : public std::exception {
 public:
  ServiceError(ErrorKind kind, const std::string &message) : kind_(kind), message_(message) {}

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

class StoreUnavailable : public ServiceError {
 public:
  explicit StoreUnavailable(const std::string &message)
      : ServiceError(ErrorKind::StoreUnavailable, message) {}
};

class EmbeddingUnavailable : public ServiceError {
 public:
  explicit EmbeddingUnavailable(const std::string &message)
      : ServiceError(ErrorKind::EmbeddingUnavailable, message) {}
};

class GenerationUnavailable : public ServiceError {
 public:
  explicit GenerationUnavailable(const std::string &message)
      : ServiceError(ErrorKind::GenerationUnavailable, message) {}
};

class RateLimited : public ServiceError {
 public:
  explicit RateLimited(const std::string &scope)
      : ServiceError(ErrorKind::RateLimited,
                     "Rate limit exceeded for " + scope + ". Try again later."),
        scope_(scope) {}

  const std::string &scope() const {
    return scope_;
  }

 private:
  std::string scope_;
};

// Raised by the query pipeline when a collaborator fails; names the stage that was running.
class StageError : public ServiceError {
 public:
  StageError(const std::string &stage, const ServiceError &cause)
      : ServiceError(cause.kind(), stage + ": " + cause.what()), stage_(stage) {}

  const std::string &stage() const {
    return stage_;
  }

 private:
  std::string stage_;
};

}  // namespace ragkit_core
