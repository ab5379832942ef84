#pragma once

#include <optional>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>

namespace tollgate::common {

class Status {
public:
  static Status success() { return Status(true, ""); }
  static Status error(std::string message) { return Status(false, std::move(message)); }

  [[nodiscard]] bool ok() const { return ok_; }
  [[nodiscard]] const std::string &error() const { return error_; }

private:
  Status(bool ok, std::string error) : ok_(ok), error_(std::move(error)) {}

  bool ok_;
  std::string error_;
};

namespace detail {

template <typename E> std::string describe_error(const E &error) {
  if constexpr (std::is_convertible_v<const E &, std::string>) {
    return std::string(error);
  } else if constexpr (requires { error.describe(); }) {
    return error.describe();
  } else {
    return error.message();
  }
}

} // namespace detail

/// Value-or-error. E is a plain message by default; typed errors expose message().
template <typename T, typename E = std::string> class Result {
public:
  using value_type = T;
  using error_type = E;

  static Result success(T value) { return Result(std::move(value), std::nullopt); }
  static Result failure(E error) { return Result(std::nullopt, std::move(error)); }

  [[nodiscard]] bool ok() const { return value_.has_value(); }

  [[nodiscard]] const T &value() const {
    if (!ok()) {
      throw std::logic_error("Result has no value: " + detail::describe_error(*error_));
    }
    return *value_;
  }

  [[nodiscard]] T &value() {
    if (!ok()) {
      throw std::logic_error("Result has no value: " + detail::describe_error(*error_));
    }
    return *value_;
  }

  [[nodiscard]] const E &error() const {
    if (ok()) {
      throw std::logic_error("Result has no error");
    }
    return *error_;
  }

  [[nodiscard]] std::string error_message() const {
    return ok() ? std::string() : detail::describe_error(*error_);
  }

private:
  Result(std::optional<T> value, std::optional<E> error)
      : value_(std::move(value)), error_(std::move(error)) {}

  std::optional<T> value_;
  std::optional<E> error_;
};

template <typename E> class Result<void, E> {
public:
  using value_type = void;
  using error_type = E;

  static Result success() { return Result(std::nullopt); }
  static Result failure(E error) { return Result(std::move(error)); }

  [[nodiscard]] bool ok() const { return !error_.has_value(); }

  [[nodiscard]] const E &error() const {
    if (ok()) {
      throw std::logic_error("Result has no error");
    }
    return *error_;
  }

  [[nodiscard]] std::string error_message() const {
    return ok() ? std::string() : detail::describe_error(*error_);
  }

private:
  explicit Result(std::optional<E> error) : error_(std::move(error)) {}

  std::optional<E> error_;
};

} // namespace tollgate::common
