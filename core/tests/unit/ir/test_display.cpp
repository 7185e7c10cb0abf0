// tests/ir/test_display.cpp - Unit tests for rendering the analyzed program
//
#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "pilc/ir/display.hpp"
#include "pilc/test_support/pil_builder.hpp"

using namespace pilc;
using test_support::PilBuilder;

// ============================================================================
// Expressions
// ============================================================================

TEST(IrDisplay, ExpressionKinds)
{
  IrContext ctx;
  const auto * x = ctx.create<PolynomialReference>("Main.x", std::nullopt, false);
  const auto * a_next = ctx.create<PolynomialReference>("Main.a", 2, true);
  const auto * one = ctx.create<Number>(FieldElement(1));

  EXPECT_EQ(format_expression(x), "Main.x");
  EXPECT_EQ(format_expression(a_next), "Main.a[2]'");
  EXPECT_EQ(format_expression(ctx.create<ConstantReference>("N")), "%N");
  EXPECT_EQ(format_expression(ctx.create<PublicReference>("out")), ":out");
  EXPECT_EQ(format_expression(ctx.create<LocalVariableReference>(0)), "$0");
  EXPECT_EQ(format_expression(ctx.create<StringLiteral>("hint")), "\"hint\"");
  EXPECT_EQ(
    format_expression(ctx.create<UnaryOperation>(UnaryOperator::Minus, x)), "-Main.x");
  EXPECT_EQ(format_expression(nullptr), "<none>");
}

TEST(IrDisplay, BinaryOperationsAreParenthesized)
{
  IrContext ctx;
  const auto * x = ctx.create<PolynomialReference>("Main.x", std::nullopt, false);
  const auto * two = ctx.create<Number>(FieldElement(2));
  const auto * sum = ctx.create<BinaryOperation>(x, BinaryOperator::Add, two);
  const auto * product = ctx.create<BinaryOperation>(sum, BinaryOperator::Mul, x);

  EXPECT_EQ(format_expression(product), "((Main.x + 2) * Main.x)");
  EXPECT_EQ(
    format_expression(ctx.create<BinaryOperation>(two, BinaryOperator::Pow, two)), "(2 ** 2)");
  EXPECT_EQ(
    format_expression(ctx.create<BinaryOperation>(x, BinaryOperator::ShiftLeft, two)),
    "(Main.x << 2)");
}

TEST(IrDisplay, TupleCallAndMatch)
{
  IrContext ctx;
  const auto * i = ctx.create<LocalVariableReference>(0);
  const std::vector<const Expression *> elements{ctx.create<StringLiteral>("hint"), i};
  const auto * tuple = ctx.create<Tuple>(ctx.copy_to_arena(elements));
  EXPECT_EQ(format_expression(tuple), "(\"hint\", $0)");

  const std::vector<const Expression *> args{i};
  EXPECT_EQ(
    format_expression(ctx.create<FunctionCall>("Main.F", ctx.copy_to_arena(args))), "Main.F($0)");

  const std::vector<MatchExpressionArm> arms{
    {FieldElement(0), ctx.create<Number>(FieldElement(7))},
    {std::nullopt, ctx.create<Number>(FieldElement(9))}};
  const auto * match = ctx.create<MatchExpression>(i, ctx.copy_to_arena(arms));
  EXPECT_EQ(format_expression(match), "match $0 { 0 => 7, _ => 9, }");
}

// ============================================================================
// Identities and programs
// ============================================================================

TEST(IrDisplay, IdentityKinds)
{
  PilBuilder b;
  b.ns("Main", 4).commit({"x", "y"}).fixed_mapping("F", "i", b.ref("i"));
  b.identity(b.next("x"), b.ref("y"));
  b.plookup(b.selected(b.ref("y"), {b.ref("x")}), b.selected({b.ref("F")}));
  b.permutation(b.selected({b.ref("x")}), b.selected({b.ref("y")}));
  b.connect({b.ref("x")}, {b.ref("F")});
  DiagnosticBag diags;
  const auto result = b.analyze(diags);
  ASSERT_TRUE(result.success);
  const auto & ids = result.analyzed->identities;
  ASSERT_EQ(ids.size(), 4U);

  EXPECT_EQ(format_identity(ids[0]), "(Main.x' - Main.y) = 0;");
  EXPECT_EQ(format_identity(ids[1]), "Main.y { Main.x } in { Main.F };");
  EXPECT_EQ(format_identity(ids[2]), "{ Main.x } is { Main.y };");
  EXPECT_EQ(format_identity(ids[3]), "{ Main.x } connect { Main.F };");
}

TEST(IrDisplay, WholeProgram)
{
  PilBuilder b;
  b.constant_def("N", b.num(4))
    .ns("Main", b.constant("N"))
    .commit({"x"})
    .fixed_array("L", {{{b.num(1)}, false}, {{b.num(0)}, true}})
    .fixed_mapping("F", "i", b.mul(b.ref("i"), b.num(2)))
    .intermediate("s", b.add(b.ref("x"), b.ref("L")))
    .commit_query("q", "i", b.tuple({b.str("hint"), b.ref("i")}))
    .identity(b.next("x"), b.add(b.ref("x"), b.num(1)))
    .public_decl("out", b.ref("x"), 3);
  DiagnosticBag diags;
  const auto result = b.analyze(diags);
  ASSERT_TRUE(result.success);

  const std::string expected =
    "constant %N = 4;\n"
    "namespace Main(4);\n"
    "    pol commit Main.x;\n"
    "    pol constant Main.L = [1] + [0]*;\n"
    "    pol constant Main.F(i) { ($0 * 2) };\n"
    "    pol Main.s = (Main.x + Main.L);\n"
    "    pol commit Main.q(i) query (\"hint\", $0);\n"
    "    (Main.x' - (Main.x + 1)) = 0;\n"
    "    public out = Main.x(3);\n";
  EXPECT_EQ(format_analyzed(*result.analyzed), expected);
}

TEST(IrDisplay, NamespaceHeaderOnChange)
{
  PilBuilder b;
  b.ns("A", 2).commit({"x"}).ns("B", 2).commit({"y"}).constant_decl({"C"});
  DiagnosticBag diags;
  const auto result = b.analyze(diags);
  ASSERT_TRUE(result.success);

  EXPECT_EQ(
    format_analyzed(*result.analyzed),
    "namespace A(2);\n"
    "    pol commit A.x;\n"
    "namespace B(2);\n"
    "    pol commit B.y;\n"
    "    pol constant B.C;\n");
}
