#pragma once

#include <optional>
#include <stdexcept>
#include <string>
#include <utility>

namespace matrixnotify::common {

/// Value-or-error. E defaults to a plain message; delivery code uses a typed error.
template <typename T, typename E = std::string> class Result {
public:
  static Result success(T value) { return Result(std::move(value), std::nullopt); }
  static Result failure(E error) { return Result(std::nullopt, std::move(error)); }

  [[nodiscard]] bool ok() const { return value_.has_value(); }

  [[nodiscard]] const T &value() const {
    if (!ok()) {
      throw std::logic_error("Result has no value");
    }
    return *value_;
  }

  [[nodiscard]] T &value() {
    if (!ok()) {
      throw std::logic_error("Result has no value");
    }
    return *value_;
  }

  [[nodiscard]] const E &error() const {
    if (ok()) {
      throw std::logic_error("Result has no error");
    }
    return *error_;
  }

private:
  Result(std::optional<T> value, std::optional<E> error)
      : value_(std::move(value)), error_(std::move(error)) {}

  std::optional<T> value_;
  std::optional<E> error_;
};

} // namespace matrixnotify::common
