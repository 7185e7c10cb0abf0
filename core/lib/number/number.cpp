// pilc/number/number.cpp - Goldilocks field arithmetic
#include "pilc/number/number.hpp"

#include <string>

namespace pilc
{

namespace
{

using U128 = unsigned __int128;

uint64_t reduce128(U128 x) noexcept { return static_cast<uint64_t>(x % FieldElement::k_modulus); }

}  // namespace

AbstractNumber field_modulus() { return AbstractNumber{FieldElement::k_modulus}; }

FieldElement FieldElement::from_abstract(const AbstractNumber & n)
{
  AbstractNumber r = n % field_modulus();
  if (r < 0) {
    r += field_modulus();
  }
  return FieldElement{r.get_ui()};
}

FieldElement FieldElement::from_signed(int64_t n) noexcept
{
  if (n >= 0) {
    return FieldElement{static_cast<uint64_t>(n)};
  }
  // -(n + 1) does not overflow for INT64_MIN
  const auto magnitude = static_cast<uint64_t>(-(n + 1)) + 1;
  return -FieldElement{magnitude};
}

AbstractNumber FieldElement::to_abstract() const { return AbstractNumber{value_}; }

std::optional<uint32_t> FieldElement::exact_log2() const noexcept
{
  if (value_ == 0 || (value_ & (value_ - 1)) != 0) {
    return std::nullopt;
  }
  return static_cast<uint32_t>(__builtin_ctzll(value_));
}

std::optional<FieldElement> FieldElement::inverse() const noexcept
{
  if (is_zero()) {
    return std::nullopt;
  }
  // Fermat: a^(p-2)
  return pow(k_modulus - 2);
}

FieldElement FieldElement::pow(uint64_t exponent) const noexcept
{
  FieldElement result = one();
  FieldElement base = *this;
  while (exponent != 0) {
    if ((exponent & 1U) != 0) {
      result *= base;
    }
    base *= base;
    exponent >>= 1U;
  }
  return result;
}

std::string FieldElement::to_string() const { return std::to_string(value_); }

FieldElement operator+(FieldElement a, FieldElement b) noexcept
{
  return FieldElement{reduce128(static_cast<U128>(a.value_) + b.value_)};
}

FieldElement operator-(FieldElement a, FieldElement b) noexcept
{
  if (a.value_ >= b.value_) {
    return FieldElement{a.value_ - b.value_};
  }
  return FieldElement{FieldElement::k_modulus - (b.value_ - a.value_)};
}

FieldElement operator*(FieldElement a, FieldElement b) noexcept
{
  return FieldElement{reduce128(static_cast<U128>(a.value_) * b.value_)};
}

FieldElement operator/(FieldElement a, FieldElement b) noexcept
{
  const auto inv = b.inverse();
  return inv ? a * *inv : FieldElement::zero();
}

FieldElement operator-(FieldElement a) noexcept { return FieldElement{} - a; }

std::optional<DegreeType> abstract_to_degree(const AbstractNumber & n)
{
  if (n < 0 || !n.fits_ulong_p()) {
    return std::nullopt;
  }
  return static_cast<DegreeType>(n.get_ui());
}

std::optional<AbstractNumber> parse_abstract(std::string_view text)
{
  int base = 10;
  if (text.size() > 2 && text[0] == '0' && (text[1] == 'x' || text[1] == 'X')) {
    base = 16;
    text.remove_prefix(2);
  }

  std::string digits;
  digits.reserve(text.size());
  for (const char c : text) {
    if (c != '_') {
      digits += c;
    }
  }
  if (digits.empty()) {
    return std::nullopt;
  }

  AbstractNumber result;
  if (result.set_str(digits, base) != 0) {
    return std::nullopt;
  }
  return result;
}

}  // namespace pilc
