#pragma once

#include <chrono>
#include <cstdint>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <utility>

namespace catalog {

using json = nlohmann::json;

// Type aliases
using SessionId = std::string;

using Timestamp = std::chrono::system_clock::time_point;

// Failure categories callers map onto their own status vocabulary
enum class ErrorKind {
  InvalidIdentifier,  // Malformed or unsafe session id
  NotFound,           // Nothing stored at a resolvable location
  CorruptData,        // Stored record present but unparsable
  IOFailure           // Storage unavailable or write failed
};

std::string to_string(ErrorKind kind);

struct Error {
  ErrorKind kind = ErrorKind::IOFailure;
  std::string message;
};

// Result type for operations that can fail
template <typename T>
struct Result {
  std::optional<T> value;
  std::optional<Error> error;

  bool ok() const {
    return value.has_value();
  }

  bool failed() const {
    return error.has_value();
  }

  ErrorKind kind() const {
    return error ? error->kind : ErrorKind::IOFailure;
  }

  static Result success(T val) {
    return Result{std::move(val), std::nullopt};
  }

  static Result failure(Error err) {
    return Result{std::nullopt, std::move(err)};
  }

  static Result failure(ErrorKind kind, std::string message) {
    return Result{std::nullopt, Error{kind, std::move(message)}};
  }
};

// Result of an operation with no value
struct Status {
  std::optional<Error> error;

  bool ok() const {
    return !error.has_value();
  }

  bool failed() const {
    return error.has_value();
  }

  ErrorKind kind() const {
    return error ? error->kind : ErrorKind::IOFailure;
  }

  static Status success() {
    return Status{};
  }

  static Status failure(Error err) {
    return Status{std::move(err)};
  }

  static Status failure(ErrorKind kind, std::string message) {
    return Status{Error{kind, std::move(message)}};
  }
};

}  // namespace catalog
