// tests/witgen/test_fixed_data.cpp - Unit tests for fixed column generation and lookup
//
#include <gtest/gtest.h>

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "pilc/test_support/pil_builder.hpp"
#include "pilc/witgen/fixed_data.hpp"
#include "pilc/witgen/fixed_lookup.hpp"

using namespace pilc;
using test_support::PilBuilder;

namespace
{

std::vector<uint64_t> canonical(const std::vector<FieldElement> & values)
{
  std::vector<uint64_t> result;
  for (const auto & v : values) {
    result.push_back(v.to_canonical());
  }
  return result;
}

bool contains(const std::string & text, std::string_view part)
{
  return text.find(part) != std::string::npos;
}

}  // namespace

// ============================================================================
// Fixed columns
// ============================================================================

TEST(WitgenFixedData, GeneratesMappingsAndArrays)
{
  PilBuilder b;
  b.ns("Main", 4)
    .fixed_mapping("F", "i", b.mul(b.ref("i"), b.num(2)))
    .fixed_array("A", {{{b.num(7)}, false}, {{b.num(1), b.num(2)}, false}, {{b.num(9)}, true}})
    .commit({"x"});
  DiagnosticBag diags;
  auto analysis = b.analyze(diags);
  ASSERT_TRUE(analysis.success);

  auto fixed = build_fixed_data(*analysis.analyzed);
  ASSERT_TRUE(fixed) << fixed.error();
  const FixedData & data = fixed.value();

  EXPECT_EQ(data.degree(), 4U);
  ASSERT_EQ(data.fixed_columns().size(), 2U);
  EXPECT_EQ(data.fixed_columns()[0].name, "Main.F");
  EXPECT_EQ(canonical(data.fixed_column("Main.F")->values), (std::vector<uint64_t>{0, 2, 4, 6}));
  EXPECT_EQ(canonical(data.fixed_column("Main.A")->values), (std::vector<uint64_t>{7, 1, 2, 9}));
  EXPECT_EQ(data.fixed_column("Main.x"), nullptr);
}

TEST(WitgenFixedData, MappingsCallOtherColumnsWithWrappingRows)
{
  PilBuilder b;
  b.ns("Main", 4)
    .fixed_mapping("G", "i", b.call("F", {b.add(b.ref("i"), b.num(1))}))
    .fixed_mapping("F", "i", b.mul(b.ref("i"), b.num(2)))
    .commit({"x"});
  DiagnosticBag diags;
  auto analysis = b.analyze(diags);
  ASSERT_TRUE(analysis.success);

  auto fixed = build_fixed_data(*analysis.analyzed);
  ASSERT_TRUE(fixed) << fixed.error();
  EXPECT_EQ(
    canonical(fixed->fixed_column("Main.G")->values), (std::vector<uint64_t>{2, 4, 6, 0}));
}

TEST(WitgenFixedData, NegativeValuesReduceIntoTheField)
{
  PilBuilder b;
  b.ns("Main", 2).fixed_mapping("N", "i", b.sub(b.ref("i"), b.num(1))).commit({"x"});
  DiagnosticBag diags;
  auto analysis = b.analyze(diags);
  ASSERT_TRUE(analysis.success);

  auto fixed = build_fixed_data(*analysis.analyzed);
  ASSERT_TRUE(fixed) << fixed.error();
  EXPECT_EQ(fixed->fixed_value("Main.N", 0), -FieldElement(1));
  EXPECT_EQ(fixed->fixed_value("Main.N", 1), FieldElement(0));
  // Rows wrap around
  EXPECT_EQ(fixed->fixed_value("Main.N", 3), FieldElement(0));
  EXPECT_FALSE(fixed->fixed_value("Main.missing", 0).has_value());
}

TEST(WitgenFixedData, CyclicDefinitionsFail)
{
  PilBuilder b;
  b.ns("Main", 2)
    .fixed_mapping("A", "i", b.call("B", {b.ref("i")}))
    .fixed_mapping("B", "i", b.call("A", {b.ref("i")}))
    .commit({"x"});
  DiagnosticBag diags;
  auto analysis = b.analyze(diags);
  ASSERT_TRUE(analysis.success);

  auto fixed = build_fixed_data(*analysis.analyzed);
  ASSERT_FALSE(fixed);
  EXPECT_TRUE(contains(fixed.error(), "Cyclic definition of fixed column Main.A"));
}

TEST(WitgenFixedData, DeclaredOnlyColumnFails)
{
  PilBuilder b;
  b.ns("Main", 2).constant_decl({"C"}).commit({"x"});
  DiagnosticBag diags;
  auto analysis = b.analyze(diags);
  ASSERT_TRUE(analysis.success);

  auto fixed = build_fixed_data(*analysis.analyzed);
  ASSERT_FALSE(fixed);
  EXPECT_EQ(fixed.error(), "Fixed column Main.C has no definition");
}

TEST(WitgenFixedData, EvaluationErrorNamesColumnAndRow)
{
  PilBuilder b;
  b.ns("Main", 4).fixed_mapping("D", "i", b.div(b.num(6), b.sub(b.ref("i"), b.num(2))));
  b.commit({"x"});
  DiagnosticBag diags;
  auto analysis = b.analyze(diags);
  ASSERT_TRUE(analysis.success);

  auto fixed = build_fixed_data(*analysis.analyzed);
  ASSERT_FALSE(fixed);
  EXPECT_TRUE(contains(fixed.error(), "Error evaluating fixed column Main.D at row 2"));
  EXPECT_TRUE(contains(fixed.error(), "Division by zero"));
}

// ============================================================================
// Degree
// ============================================================================

TEST(WitgenFixedData, DegreesMustAgree)
{
  PilBuilder b;
  b.ns("A", 4).commit({"x"}).ns("B", 8).commit({"y"});
  DiagnosticBag diags;
  auto analysis = b.analyze(diags);
  ASSERT_TRUE(analysis.success);

  const auto degree = common_degree(*analysis.analyzed);
  ASSERT_FALSE(degree);
  EXPECT_EQ(degree.error(), "Polynomials have different degrees: A.x has 4, B.y has 8");
}

TEST(WitgenFixedData, EmptyProgramHasNoDegree)
{
  PilBuilder b;
  b.constant_def("N", b.num(4));
  DiagnosticBag diags;
  auto analysis = b.analyze(diags);
  ASSERT_TRUE(analysis.success);

  const auto degree = common_degree(*analysis.analyzed);
  ASSERT_FALSE(degree);
  EXPECT_EQ(degree.error(), "Program declares no polynomials");
}

TEST(WitgenFixedData, ZeroDegreeIsRejected)
{
  PilBuilder b;
  b.ns("Main", b.num(0)).commit({"x"});
  DiagnosticBag diags;
  auto analysis = b.analyze(diags);
  ASSERT_TRUE(analysis.success);

  const auto degree = common_degree(*analysis.analyzed);
  ASSERT_FALSE(degree);
  EXPECT_EQ(degree.error(), "Degree must be positive");
}

// ============================================================================
// Witness layout
// ============================================================================

TEST(WitgenFixedData, WitnessColumnsFollowDeclarationOrder)
{
  PilBuilder b;
  b.ns("Main", 2).commit({"x"}).commit_array("a", 2).commit_query("q", "i", b.ref("i"));
  DiagnosticBag diags;
  auto analysis = b.analyze(diags);
  ASSERT_TRUE(analysis.success);

  auto fixed = build_fixed_data(*analysis.analyzed);
  ASSERT_TRUE(fixed) << fixed.error();
  const FixedData & data = fixed.value();

  ASSERT_EQ(data.witness_count(), 4U);
  EXPECT_EQ(data.witness_column(0).name, "Main.x");
  EXPECT_EQ(data.witness_column(1).name, "Main.a[0]");
  EXPECT_EQ(data.witness_column(2).name, "Main.a[1]");
  EXPECT_EQ(data.witness_column(2).index, uint64_t{1});
  EXPECT_EQ(data.witness_column(3).name, "Main.q");
  EXPECT_EQ(data.witness_column(0).query, nullptr);
  EXPECT_NE(data.witness_column(3).query, nullptr);

  const PolynomialReference element("Main.a", 1, false);
  EXPECT_EQ(data.witness_id(element), size_t{2});
  const PolynomialReference out_of_range("Main.a", 2, false);
  EXPECT_FALSE(data.witness_id(out_of_range).has_value());
  const PolynomialReference unknown("Main.nope", std::nullopt, false);
  EXPECT_FALSE(data.witness_id(unknown).has_value());
}

// ============================================================================
// FixedLookup
// ============================================================================

class FixedLookupTest : public ::testing::Test
{
protected:
  void SetUp() override
  {
    builder.ns("Main", 4)
      .fixed_mapping("ID", "i", builder.ref("i"))
      .fixed_array(
        "DUP", {{{builder.num(1), builder.num(1), builder.num(2), builder.num(2)}, false}})
      .commit({"x"});
    DiagnosticBag diags;
    auto analysis = builder.analyze(diags);
    ASSERT_TRUE(analysis.success);
    analyzed = std::move(analysis.analyzed);
    auto fixed_data = build_fixed_data(*analyzed);
    ASSERT_TRUE(fixed_data) << fixed_data.error();
    fixed = std::make_unique<FixedData>(std::move(fixed_data).value());
  }

  PilBuilder builder;
  std::unique_ptr<Analyzed> analyzed;
  std::unique_ptr<FixedData> fixed;
};

TEST_F(FixedLookupTest, Outcomes)
{
  FixedLookup lookup(*fixed);
  const std::vector<std::string_view> id{"Main.ID"};
  const std::vector<std::string_view> dup{"Main.DUP"};

  const std::vector<FieldElement> two{FieldElement(2)};
  auto unique = lookup.find(id, two);
  ASSERT_TRUE(unique) << unique.error();
  EXPECT_EQ(unique->outcome, LookupOutcome::Unique);
  EXPECT_EQ(unique->row, 2U);

  EXPECT_EQ(lookup.find(dup, two)->outcome, LookupOutcome::Multiple);

  const std::vector<FieldElement> nine{FieldElement(9)};
  EXPECT_EQ(lookup.find(id, nine)->outcome, LookupOutcome::None);
}

TEST_F(FixedLookupTest, MultiColumnKey)
{
  FixedLookup lookup(*fixed);
  const std::vector<std::string_view> columns{"Main.DUP", "Main.ID"};
  const std::vector<FieldElement> values{FieldElement(2), FieldElement(3)};

  auto match = lookup.find(columns, values);
  ASSERT_TRUE(match) << match.error();
  EXPECT_EQ(match->outcome, LookupOutcome::Unique);
  EXPECT_EQ(match->row, 3U);

  const std::vector<FieldElement> mismatch{FieldElement(1), FieldElement(3)};
  EXPECT_EQ(lookup.find(columns, mismatch)->outcome, LookupOutcome::None);
}

TEST_F(FixedLookupTest, IndicesAreBuiltOncePerColumnSet)
{
  FixedLookup lookup(*fixed);
  const std::vector<std::string_view> id{"Main.ID"};
  const std::vector<FieldElement> zero{FieldElement(0)};
  EXPECT_EQ(lookup.index_count(), 0U);
  EXPECT_TRUE(lookup.find(id, zero));
  EXPECT_TRUE(lookup.find(id, zero));
  EXPECT_EQ(lookup.index_count(), 1U);
}

TEST_F(FixedLookupTest, Errors)
{
  FixedLookup lookup(*fixed);
  const std::vector<std::string_view> witness{"Main.x"};
  const std::vector<FieldElement> zero{FieldElement(0)};

  auto not_fixed = lookup.find(witness, zero);
  ASSERT_FALSE(not_fixed);
  EXPECT_EQ(not_fixed.error(), "Main.x is not a fixed column");

  const std::vector<FieldElement> none;
  auto mismatch = lookup.find(witness, none);
  ASSERT_FALSE(mismatch);
  EXPECT_EQ(mismatch.error(), "Lookup with 1 columns but 0 values");
}
