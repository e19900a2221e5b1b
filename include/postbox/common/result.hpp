#pragma once

#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

namespace postbox::common {

enum class ErrorKind {
  None,
  Connect,
  Auth,
  Folder,
  Fetch,
  Send,
  Config,
  InvalidArgument,
};

[[nodiscard]] constexpr std::string_view error_kind_name(const ErrorKind kind) {
  switch (kind) {
  case ErrorKind::None:
    return "none";
  case ErrorKind::Connect:
    return "connect_error";
  case ErrorKind::Auth:
    return "auth_error";
  case ErrorKind::Folder:
    return "folder_error";
  case ErrorKind::Fetch:
    return "fetch_error";
  case ErrorKind::Send:
    return "send_error";
  case ErrorKind::Config:
    return "config_error";
  case ErrorKind::InvalidArgument:
    return "invalid_argument";
  }
  return "unknown";
}

class Status {
public:
  static Status success() { return Status(ErrorKind::None, ""); }
  static Status error(ErrorKind kind, std::string message) {
    return Status(kind, std::move(message));
  }

  [[nodiscard]] bool ok() const { return kind_ == ErrorKind::None; }
  [[nodiscard]] ErrorKind kind() const { return kind_; }
  [[nodiscard]] const std::string &error() const { return error_; }

private:
  Status(ErrorKind kind, std::string error) : kind_(kind), error_(std::move(error)) {}

  ErrorKind kind_;
  std::string error_;
};

template <typename T> class Result {
public:
  static Result success(T value) { return Result(ErrorKind::None, std::move(value), ""); }
  static Result failure(ErrorKind kind, std::string message) {
    return Result(kind, std::nullopt, std::move(message));
  }
  static Result failure(const Status &status) {
    return Result(status.kind(), std::nullopt, status.error());
  }

  [[nodiscard]] bool ok() const { return kind_ == ErrorKind::None; }
  [[nodiscard]] ErrorKind kind() const { return kind_; }

  [[nodiscard]] const T &value() const {
    if (!ok()) {
      throw std::logic_error("Result has no value: " + error_);
    }
    return *value_;
  }

  [[nodiscard]] T &value() {
    if (!ok()) {
      throw std::logic_error("Result has no value: " + error_);
    }
    return *value_;
  }

  [[nodiscard]] const std::string &error() const { return error_; }
  [[nodiscard]] Status status() const {
    return ok() ? Status::success() : Status::error(kind_, error_);
  }

private:
  Result(ErrorKind kind, std::optional<T> value, std::string error)
      : kind_(kind), value_(std::move(value)), error_(std::move(error)) {}

  ErrorKind kind_;
  std::optional<T> value_;
  std::string error_;
};

} // namespace postbox::common
