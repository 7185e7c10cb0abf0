// pilc/number/number.hpp - Numeric primitives
//
// AbstractNumber: arbitrary precision integer used for literals and
//                 constant evaluation (GMP).
// FieldElement:   element of the Goldilocks field p = 2^64 - 2^32 + 1.
// DegreeType:     row index / column degree.
//
#pragma once

#include <gmpxx.h>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace pilc
{

using AbstractNumber = mpz_class;
using DegreeType = uint64_t;

class FieldElement
{
public:
  static constexpr uint64_t k_modulus = 0xFFFF'FFFF'0000'0001ULL;

  constexpr FieldElement() noexcept = default;

  /// Reduces `value` modulo the field prime
  constexpr explicit FieldElement(uint64_t value) noexcept
  : value_(value >= k_modulus ? value - k_modulus : value)
  {
  }

  [[nodiscard]] static constexpr FieldElement zero() noexcept { return FieldElement{}; }
  [[nodiscard]] static constexpr FieldElement one() noexcept { return FieldElement{1}; }

  /// Negative numbers wrap around the modulus
  [[nodiscard]] static FieldElement from_abstract(const AbstractNumber & n);
  [[nodiscard]] static FieldElement from_signed(int64_t n) noexcept;

  [[nodiscard]] constexpr uint64_t to_canonical() const noexcept { return value_; }
  [[nodiscard]] AbstractNumber to_abstract() const;
  [[nodiscard]] DegreeType to_degree() const noexcept { return value_; }

  [[nodiscard]] constexpr bool is_zero() const noexcept { return value_ == 0; }
  [[nodiscard]] constexpr bool is_one() const noexcept { return value_ == 1; }

  /// log2 of the canonical value if it is a power of two
  [[nodiscard]] std::optional<uint32_t> exact_log2() const noexcept;

  [[nodiscard]] std::optional<FieldElement> inverse() const noexcept;
  [[nodiscard]] FieldElement pow(uint64_t exponent) const noexcept;

  [[nodiscard]] std::string to_string() const;

  friend FieldElement operator+(FieldElement a, FieldElement b) noexcept;
  friend FieldElement operator-(FieldElement a, FieldElement b) noexcept;
  friend FieldElement operator*(FieldElement a, FieldElement b) noexcept;
  /// Division by zero yields zero; callers check `inverse()` first
  friend FieldElement operator/(FieldElement a, FieldElement b) noexcept;
  friend FieldElement operator-(FieldElement a) noexcept;

  FieldElement & operator+=(FieldElement other) noexcept { return *this = *this + other; }
  FieldElement & operator-=(FieldElement other) noexcept { return *this = *this - other; }
  FieldElement & operator*=(FieldElement other) noexcept { return *this = *this * other; }

  friend constexpr bool operator==(FieldElement a, FieldElement b) noexcept
  {
    return a.value_ == b.value_;
  }
  friend constexpr bool operator!=(FieldElement a, FieldElement b) noexcept
  {
    return a.value_ != b.value_;
  }
  friend constexpr bool operator<(FieldElement a, FieldElement b) noexcept
  {
    return a.value_ < b.value_;
  }

private:
  uint64_t value_ = 0;
};

/// Value as a row index, if it is non-negative and fits
[[nodiscard]] std::optional<DegreeType> abstract_to_degree(const AbstractNumber & n);

/// Parse a decimal or 0x-prefixed hexadecimal literal
[[nodiscard]] std::optional<AbstractNumber> parse_abstract(std::string_view text);

[[nodiscard]] AbstractNumber field_modulus();

}  // namespace pilc
