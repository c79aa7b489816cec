#pragma once

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

namespace cligate::common {

enum class ErrorCode {
  Internal,
  Configuration,
  Validation,
  Execution,
  Timeout,
  Cancelled,
  Infrastructure,
  Upstream,
};

[[nodiscard]] inline std::string_view error_code_to_string(const ErrorCode code) {
  switch (code) {
  case ErrorCode::Internal:
    return "internal";
  case ErrorCode::Configuration:
    return "configuration";
  case ErrorCode::Validation:
    return "validation";
  case ErrorCode::Execution:
    return "execution";
  case ErrorCode::Timeout:
    return "timeout";
  case ErrorCode::Cancelled:
    return "cancelled";
  case ErrorCode::Infrastructure:
    return "infrastructure";
  case ErrorCode::Upstream:
    return "upstream";
  }
  return "internal";
}

/// Failure description carried by Status and Result.
///
/// `exit_code` and `stderr_text` are only populated for process failures;
/// `stderr_text` is always sanitized before it gets here.
struct Error {
  ErrorCode code = ErrorCode::Internal;
  std::string message;
  std::optional<int> exit_code;
  std::string stderr_text;
  std::optional<std::uint16_t> http_status;

  [[nodiscard]] std::string to_string() const {
    std::string out = "[";
    out += error_code_to_string(code);
    out += "]";
    if (exit_code.has_value()) {
      out += " exit_code=" + std::to_string(*exit_code);
    }
    if (http_status.has_value()) {
      out += " status=" + std::to_string(*http_status);
    }
    if (!message.empty()) {
      out += " " + message;
    }
    return out;
  }
};

class Status {
public:
  static Status success() { return Status(true, Error{}); }
  static Status error(std::string message) {
    return Status(false, Error{.code = ErrorCode::Internal, .message = std::move(message)});
  }
  static Status error(Error error) { return Status(false, std::move(error)); }

  [[nodiscard]] bool ok() const { return ok_; }
  [[nodiscard]] const std::string &error() const { return error_.message; }
  [[nodiscard]] const Error &details() const { return error_; }
  [[nodiscard]] ErrorCode code() const { return error_.code; }

private:
  Status(bool ok, Error error) : ok_(ok), error_(std::move(error)) {}

  bool ok_;
  Error error_;
};

template <typename T> class Result {
public:
  static Result success(T value) { return Result(true, std::move(value), Error{}); }
  static Result failure(std::string message) {
    return Result(false, std::nullopt,
                  Error{.code = ErrorCode::Internal, .message = std::move(message)});
  }
  static Result failure(Error error) { return Result(false, std::nullopt, std::move(error)); }

  [[nodiscard]] bool ok() const { return ok_; }

  [[nodiscard]] const T &value() const {
    if (!ok_) {
      throw std::logic_error("Result has no value: " + error_.message);
    }
    return *value_;
  }

  [[nodiscard]] T &value() {
    if (!ok_) {
      throw std::logic_error("Result has no value: " + error_.message);
    }
    return *value_;
  }

  [[nodiscard]] const std::string &error() const { return error_.message; }
  [[nodiscard]] const Error &details() const { return error_; }
  [[nodiscard]] ErrorCode code() const { return error_.code; }

private:
  Result(bool ok, std::optional<T> value, Error error)
      : ok_(ok), value_(std::move(value)), error_(std::move(error)) {}

  bool ok_;
  std::optional<T> value_;
  Error error_;
};

template <> class Result<void> {
public:
  static Result success() { return Result(true, Error{}); }
  static Result failure(std::string message) {
    return Result(false, Error{.code = ErrorCode::Internal, .message = std::move(message)});
  }
  static Result failure(Error error) { return Result(false, std::move(error)); }

  [[nodiscard]] bool ok() const { return ok_; }
  [[nodiscard]] const std::string &error() const { return error_.message; }
  [[nodiscard]] const Error &details() const { return error_; }
  [[nodiscard]] ErrorCode code() const { return error_.code; }

private:
  Result(bool ok, Error error) : ok_(ok), error_(std::move(error)) {}

  bool ok_;
  Error error_;
};

} // namespace cligate::common
