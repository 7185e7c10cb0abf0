// pilc/basic/result.hpp - Success-or-error result type
#pragma once

#include <utility>
#include <variant>

namespace pilc
{

/**
 * Result type using std::variant.
 * Holds either a success value T or an error E.
 *
 * T and E must be distinct types.
 */
template <typename T, typename E>
class Result
{
public:
  using ValueType = T;
  using ErrorType = E;

  // Construct with success value
  Result(T value) : data_(std::in_place_index<0>, std::move(value)) {}

  // Construct with error
  Result(E error) : data_(std::in_place_index<1>, std::move(error)) {}

  [[nodiscard]] bool has_value() const noexcept { return data_.index() == 0; }

  [[nodiscard]] bool has_error() const noexcept { return data_.index() == 1; }

  explicit operator bool() const noexcept { return has_value(); }

  // Get the value (undefined behavior if has_error())
  T & value() & { return std::get<0>(data_); }
  [[nodiscard]] const T & value() const & { return std::get<0>(data_); }
  T && value() && { return std::get<0>(std::move(data_)); }

  // Get the error (undefined behavior if has_value())
  E & error() & { return std::get<1>(data_); }
  [[nodiscard]] const E & error() const & { return std::get<1>(data_); }
  E && error() && { return std::get<1>(std::move(data_)); }

  T * operator->() { return &value(); }
  const T * operator->() const { return &value(); }
  T & operator*() & { return value(); }
  const T & operator*() const & { return value(); }

private:
  std::variant<T, E> data_;
};

}  // namespace pilc
