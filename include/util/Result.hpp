#pragma once
#include <optional>
#include <string>
#include <utility>

namespace autogrow::util {

// Error taxonomy. PollTimeout is handled like TransientPerVolume by callers.
enum class Errc { FatalStartup, TransientPerVolume, PollTimeout };

[[nodiscard]] inline const char* errc_name(Errc c) {
  switch (c) {
    case Errc::FatalStartup: return "fatal-startup";
    case Errc::TransientPerVolume: return "transient";
    case Errc::PollTimeout: return "poll-timeout";
  }
  return "unknown";
}

struct Error {
  Errc code{Errc::TransientPerVolume};
  std::string message;
};

// Outcome of an operation with no value
class Status {
public:
  Status() = default;
  static Status ok() { return Status{}; }
  static Status fail(Errc code, std::string message) { return Status(Error{code, std::move(message)}); }
  static Status transient(std::string message) { return fail(Errc::TransientPerVolume, std::move(message)); }
  static Status timeout(std::string message) { return fail(Errc::PollTimeout, std::move(message)); }
  static Status fatal(std::string message) { return fail(Errc::FatalStartup, std::move(message)); }

  [[nodiscard]] bool is_ok() const { return !error_.has_value(); }
  explicit operator bool() const { return is_ok(); }
  [[nodiscard]] const Error& error() const { return *error_; }
  [[nodiscard]] const std::string& message() const { return error_->message; }

private:
  explicit Status(Error e) : error_(std::move(e)) {}
  std::optional<Error> error_;
};

// Value or Error
template <typename T>
class Result {
public:
  Result(T value) : value_(std::move(value)) {}
  Result(Error error) : error_(std::move(error)) {}
  static Result fail(Errc code, std::string message) { return Result(Error{code, std::move(message)}); }
  static Result transient(std::string message) { return fail(Errc::TransientPerVolume, std::move(message)); }

  [[nodiscard]] bool is_ok() const { return value_.has_value(); }
  explicit operator bool() const { return is_ok(); }
  [[nodiscard]] const T& value() const { return *value_; }
  [[nodiscard]] T& value() { return *value_; }
  [[nodiscard]] const T* operator->() const { return &*value_; }
  [[nodiscard]] const T& operator*() const { return *value_; }
  [[nodiscard]] const Error& error() const { return error_; }
  [[nodiscard]] const std::string& message() const { return error_.message; }
  [[nodiscard]] Status status() const { return is_ok() ? Status::ok() : Status::fail(error_.code, error_.message); }

private:
  std::optional<T> value_;
  Error error_{};
};

} // namespace autogrow::util
