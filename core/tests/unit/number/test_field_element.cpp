// tests/number/test_field_element.cpp - Unit tests for Goldilocks field arithmetic
//
#include <gtest/gtest.h>

#include <cstdint>

#include "pilc/number/number.hpp"

using namespace pilc;

namespace
{

constexpr uint64_t k_p = FieldElement::k_modulus;

}  // namespace

TEST(NumberFieldElement, ReducesOnConstruction)
{
  EXPECT_EQ(FieldElement(k_p).to_canonical(), 0U);
  EXPECT_EQ(FieldElement(k_p + 5).to_canonical(), 5U);
  EXPECT_TRUE(FieldElement::zero().is_zero());
  EXPECT_TRUE(FieldElement::one().is_one());
}

TEST(NumberFieldElement, AdditionWrapsAroundModulus)
{
  const FieldElement max(k_p - 1);
  EXPECT_EQ(max + FieldElement(1), FieldElement::zero());
  EXPECT_EQ(max + max, FieldElement(k_p - 2));
}

TEST(NumberFieldElement, SubtractionAndNegation)
{
  EXPECT_EQ(FieldElement(3) - FieldElement(5), FieldElement(k_p - 2));
  EXPECT_EQ(-FieldElement(1), FieldElement(k_p - 1));
  EXPECT_EQ(-FieldElement::zero(), FieldElement::zero());
  EXPECT_EQ(FieldElement::from_signed(-1), FieldElement(k_p - 1));
  EXPECT_EQ(FieldElement::from_signed(INT64_MIN) + FieldElement(uint64_t{1} << 63), FieldElement());
}

TEST(NumberFieldElement, MultiplicationUsesFullWidth)
{
  // (p - 1)^2 = 1 mod p
  const FieldElement minus_one(k_p - 1);
  EXPECT_EQ(minus_one * minus_one, FieldElement::one());
  EXPECT_EQ(FieldElement(1ULL << 32) * FieldElement(1ULL << 32), FieldElement((1ULL << 32) - 1));
}

TEST(NumberFieldElement, DivisionAndInverse)
{
  const FieldElement seven(7);
  const auto inv = seven.inverse();
  ASSERT_TRUE(inv.has_value());
  EXPECT_EQ(seven * *inv, FieldElement::one());
  EXPECT_EQ(FieldElement(21) / seven, FieldElement(3));

  EXPECT_FALSE(FieldElement::zero().inverse().has_value());
  EXPECT_EQ(FieldElement(5) / FieldElement::zero(), FieldElement::zero());
}

TEST(NumberFieldElement, Pow)
{
  EXPECT_EQ(FieldElement(2).pow(10), FieldElement(1024));
  EXPECT_EQ(FieldElement(9).pow(0), FieldElement::one());
  // Fermat's little theorem
  EXPECT_EQ(FieldElement(12345).pow(k_p - 1), FieldElement::one());
}

TEST(NumberFieldElement, ExactLog2)
{
  EXPECT_EQ(FieldElement(1).exact_log2(), 0U);
  EXPECT_EQ(FieldElement(256).exact_log2(), 8U);
  EXPECT_EQ(FieldElement(1ULL << 63).exact_log2(), 63U);
  EXPECT_FALSE(FieldElement(0).exact_log2().has_value());
  EXPECT_FALSE(FieldElement(6).exact_log2().has_value());
}

TEST(NumberFieldElement, AbstractConversions)
{
  EXPECT_EQ(FieldElement::from_abstract(AbstractNumber(-1)), FieldElement(k_p - 1));
  EXPECT_EQ(FieldElement::from_abstract(field_modulus() * 3 + 4), FieldElement(4));
  EXPECT_EQ(FieldElement(42).to_abstract(), AbstractNumber(42));
  EXPECT_EQ(FieldElement(k_p - 1).to_string(), "18446744069414584320");
}

TEST(NumberFieldElement, ParseAbstract)
{
  const auto dec = parse_abstract("1_000");
  ASSERT_TRUE(dec.has_value());
  EXPECT_EQ(*dec, AbstractNumber(1000));

  const auto hex = parse_abstract("0xff");
  ASSERT_TRUE(hex.has_value());
  EXPECT_EQ(*hex, AbstractNumber(255));

  const auto big = parse_abstract("0x10000000000000000");
  ASSERT_TRUE(big.has_value());
  EXPECT_FALSE(abstract_to_degree(*big).has_value());

  EXPECT_FALSE(parse_abstract("").has_value());
  EXPECT_FALSE(parse_abstract("12a").has_value());
}

TEST(NumberFieldElement, AbstractToDegree)
{
  EXPECT_EQ(abstract_to_degree(AbstractNumber(8)), DegreeType{8});
  EXPECT_FALSE(abstract_to_degree(AbstractNumber(-1)).has_value());
}
