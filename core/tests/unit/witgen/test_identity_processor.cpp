// tests/witgen/test_identity_processor.cpp - Unit tests for single-identity evaluation
//
#include <gtest/gtest.h>

#include <memory>
#include <optional>
#include <vector>

#include "pilc/test_support/pil_builder.hpp"
#include "pilc/witgen/fixed_data.hpp"
#include "pilc/witgen/identity_processor.hpp"

using namespace pilc;
using test_support::PilBuilder;

namespace
{

using Row = std::vector<std::optional<FieldElement>>;

/**
 * Main(4) with ID = i, SQ = i * i, DUP = [1, 1, 2, 2]; witness x, y.
 *
 *   0: x' = x
 *   1: { x, y } in { ID, SQ }
 *   2: { x, y } in { DUP, ID }
 *   3: { x } in { DUP }
 *   4: 0 { x } in { ID }
 *   5: [ x ] connect [ y ]
 *   6: x + 2 * y = 3
 */
class IdentityProcessorTest : public ::testing::Test
{
protected:
  void SetUp() override
  {
    PilBuilder & b = builder;
    b.ns("Main", 4)
      .fixed_mapping("ID", "i", b.ref("i"))
      .fixed_mapping("SQ", "i", b.mul(b.ref("i"), b.ref("i")))
      .fixed_array("DUP", {{{b.num(1), b.num(1), b.num(2), b.num(2)}, false}})
      .commit({"x", "y"})
      .identity(b.next("x"), b.ref("x"))
      .plookup(b.selected({b.ref("x"), b.ref("y")}), b.selected({b.ref("ID"), b.ref("SQ")}))
      .plookup(b.selected({b.ref("x"), b.ref("y")}), b.selected({b.ref("DUP"), b.ref("ID")}))
      .plookup(b.selected({b.ref("x")}), b.selected({b.ref("DUP")}))
      .plookup(b.selected(b.num(0), {b.ref("x")}), b.selected({b.ref("ID")}))
      .connect({b.ref("x")}, {b.ref("y")})
      .identity(b.add(b.ref("x"), b.mul(b.num(2), b.ref("y"))), b.num(3));
    DiagnosticBag diags;
    auto analysis = b.analyze(diags);
    ASSERT_TRUE(analysis.success);
    analyzed = std::move(analysis.analyzed);
    auto fixed_data = build_fixed_data(*analyzed);
    ASSERT_TRUE(fixed_data) << fixed_data.error();
    fixed = std::make_unique<FixedData>(std::move(fixed_data).value());
    processor = std::make_unique<IdentityProcessor>(*fixed);
  }

  EvalResult process(size_t identity, const Row & current, const Row & next, DegreeType row = 1)
  {
    const Identity & id = analyzed->identities.at(identity);
    const EvaluationMode mode =
      id.contains_next_ref() ? EvaluationMode::Next : EvaluationMode::Row;
    const SymbolicWitnessEvaluator witness(*fixed, row, current, next, mode);
    return processor->process(id, witness, constraints);
  }

  PilBuilder builder;
  std::unique_ptr<Analyzed> analyzed;
  std::unique_ptr<FixedData> fixed;
  std::unique_ptr<IdentityProcessor> processor;
  BitConstraintMap constraints;
};

Constraint assign(uint64_t value) { return Constraint::make_assignment(FieldElement(value)); }

}  // namespace

// ============================================================================
// Polynomial identities
// ============================================================================

TEST_F(IdentityProcessorTest, UnknownPreviousValue)
{
  const auto result = process(0, Row{std::nullopt, std::nullopt}, Row{std::nullopt, std::nullopt});
  ASSERT_TRUE(result);
  EXPECT_TRUE(result->is_empty());
  ASSERT_FALSE(result->is_complete());
  EXPECT_EQ(result->status.cause().kind(), IncompleteCauseKind::PreviousValueUnknown);
  EXPECT_EQ(result->status.cause().text(), "Main.x");
}

TEST_F(IdentityProcessorTest, CopiesPreviousValue)
{
  const Row current{FieldElement(5), std::nullopt};
  const auto result = process(0, current, Row{std::nullopt, std::nullopt});
  ASSERT_TRUE(result);
  EXPECT_TRUE(result->is_complete());
  ASSERT_EQ(result->constraints.size(), 1U);
  EXPECT_EQ(result->constraints[0], std::make_pair(size_t{0}, assign(5)));
}

TEST_F(IdentityProcessorTest, UsesBitConstraints)
{
  const Row unknown{std::nullopt, std::nullopt};
  const auto without = process(6, {}, unknown);
  ASSERT_TRUE(without);
  EXPECT_FALSE(without->is_complete());

  constraints.add(0, BitConstraint::from_mask(0x1));
  constraints.add(1, BitConstraint::from_mask(0x1));
  const auto with = process(6, {}, unknown);
  ASSERT_TRUE(with);
  EXPECT_TRUE(with->is_complete());
  ASSERT_EQ(with->constraints.size(), 2U);
  EXPECT_EQ(with->constraints[0].second, assign(1));
  EXPECT_EQ(with->constraints[1].second, assign(1));
}

TEST_F(IdentityProcessorTest, ContradictionIsAnError)
{
  const auto result = process(6, {}, Row{FieldElement(1), FieldElement(5)});
  ASSERT_FALSE(result);
  EXPECT_EQ(result.error().kind(), EvalErrorKind::ConstraintUnsatisfiable);
}

// ============================================================================
// Lookups
// ============================================================================

TEST_F(IdentityProcessorTest, LookupSidesOfDifferentLength)
{
  Identity lookup = analyzed->identities.at(1);
  lookup.right.expressions = lookup.right.expressions.first(1);
  const Row current{FieldElement(3), FieldElement(100)};
  const SymbolicWitnessEvaluator witness(*fixed, 1, current, current, EvaluationMode::Row);
  const auto result = processor->process(lookup, witness, constraints);
  ASSERT_FALSE(result);
  EXPECT_EQ(result.error().kind(), EvalErrorKind::Generic);
  EXPECT_EQ(result.error().message(), "Lookup identity with 2 and 1 expressions");
}

TEST_F(IdentityProcessorTest, LookupUniqueMatchSolvesRest)
{
  const auto result = process(1, {}, Row{FieldElement(3), std::nullopt});
  ASSERT_TRUE(result);
  EXPECT_TRUE(result->is_complete());
  ASSERT_EQ(result->constraints.size(), 1U);
  EXPECT_EQ(result->constraints[0], std::make_pair(size_t{1}, assign(9)));
}

TEST_F(IdentityProcessorTest, LookupWithoutMatchFails)
{
  const auto result = process(1, {}, Row{FieldElement(3), FieldElement(8)});
  ASSERT_FALSE(result);
  EXPECT_EQ(result.error().kind(), EvalErrorKind::FixedLookupFailed);
  EXPECT_FALSE(result.error().is_fatal());
}

TEST_F(IdentityProcessorTest, LookupWithSeveralMatches)
{
  // Everything known: any match will do
  const auto known = process(3, {}, Row{FieldElement(2), std::nullopt});
  ASSERT_TRUE(known);
  EXPECT_TRUE(known->is_complete());

  // y cannot be chosen among rows 0 and 1
  const auto open = process(2, {}, Row{FieldElement(1), std::nullopt});
  ASSERT_TRUE(open);
  ASSERT_FALSE(open->is_complete());
  EXPECT_EQ(open->status.cause().kind(), IncompleteCauseKind::MultipleLookupMatches);
}

TEST_F(IdentityProcessorTest, InactiveLeftSelector)
{
  const auto result = process(4, {}, Row{FieldElement(99), std::nullopt});
  ASSERT_TRUE(result);
  EXPECT_TRUE(result->is_complete());
  EXPECT_TRUE(result->is_empty());
}

// ============================================================================
// Connect identities
// ============================================================================

TEST_F(IdentityProcessorTest, ConnectEqualizesPairs)
{
  const auto result = process(5, {}, Row{std::nullopt, FieldElement(4)});
  ASSERT_TRUE(result);
  EXPECT_TRUE(result->is_complete());
  ASSERT_EQ(result->constraints.size(), 1U);
  EXPECT_EQ(result->constraints[0], std::make_pair(size_t{0}, assign(4)));
}
