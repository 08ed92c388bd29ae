// typecraft/basic/result.hpp - Success-or-failure return value
//
// Returned by every operation whose failure is expected (bad input),
// as opposed to programmer errors which throw.
//
#pragma once

#include <cstddef>
#include <optional>
#include <stdexcept>
#include <utility>
#include <variant>

namespace typecraft
{

/**
 * Either a value of type T or an error of type E.
 *
 * Accessing the wrong alternative throws std::logic_error.
 */
template <typename T, typename E>
class Result
{
public:
  /// Create a successful result
  static Result ok(T value) { return Result(std::in_place_index<0>, std::move(value)); }

  /// Create a failed result
  static Result fail(E error) { return Result(std::in_place_index<1>, std::move(error)); }

  [[nodiscard]] bool is_ok() const noexcept { return storage_.index() == 0; }
  [[nodiscard]] bool is_error() const noexcept { return storage_.index() == 1; }
  explicit operator bool() const noexcept { return is_ok(); }

  [[nodiscard]] const T & value() const &
  {
    check(is_ok(), "value() called on a failed result");
    return std::get<0>(storage_);
  }

  [[nodiscard]] T & value() &
  {
    check(is_ok(), "value() called on a failed result");
    return std::get<0>(storage_);
  }

  [[nodiscard]] T && value() &&
  {
    check(is_ok(), "value() called on a failed result");
    return std::get<0>(std::move(storage_));
  }

  [[nodiscard]] const E & error() const &
  {
    check(is_error(), "error() called on a successful result");
    return std::get<1>(storage_);
  }

  [[nodiscard]] E && error() &&
  {
    check(is_error(), "error() called on a successful result");
    return std::get<1>(std::move(storage_));
  }

private:
  template <size_t I, typename U>
  Result(std::in_place_index_t<I> tag, U && v) : storage_(tag, std::forward<U>(v))
  {
  }

  static void check(bool condition, const char * message)
  {
    if (!condition) {
      throw std::logic_error(message);
    }
  }

  std::variant<T, E> storage_;
};

/**
 * Result with no success payload.
 */
template <typename E>
class Result<void, E>
{
public:
  static Result ok() { return Result(); }

  static Result fail(E error)
  {
    Result r;
    r.error_ = std::move(error);
    return r;
  }

  [[nodiscard]] bool is_ok() const noexcept { return !error_.has_value(); }
  [[nodiscard]] bool is_error() const noexcept { return error_.has_value(); }
  explicit operator bool() const noexcept { return is_ok(); }

  [[nodiscard]] const E & error() const &
  {
    if (!error_) {
      throw std::logic_error("error() called on a successful result");
    }
    return *error_;
  }

  [[nodiscard]] E && error() &&
  {
    if (!error_) {
      throw std::logic_error("error() called on a successful result");
    }
    return std::move(*error_);
  }

private:
  Result() = default;

  std::optional<E> error_;
};

}  // namespace typecraft
