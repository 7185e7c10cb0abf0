// tests/sema/test_pil_analyzer.cpp - Unit tests for lowering PIL into Analyzed
//
#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "pilc/basic/casting.hpp"
#include "pilc/ir/display.hpp"
#include "pilc/sema/pil_analyzer.hpp"
#include "pilc/test_support/pil_builder.hpp"

using namespace pilc;
using test_support::PilBuilder;

namespace
{

bool has_message(const DiagnosticBag & diags, const std::string & text)
{
  for (const auto & d : diags) {
    if (d.message.find(text) != std::string::npos) {
      return true;
    }
  }
  return false;
}

}  // namespace

// ============================================================================
// Successful lowering
// ============================================================================

TEST(SemaPilAnalyzer, NamesAreNamespaced)
{
  PilBuilder b;
  b.ns("Fib", 8).commit({"x", "y"}).identity(b.next("x"), b.ref("y"));
  DiagnosticBag diags;
  const auto result = b.analyze(diags);
  ASSERT_TRUE(result.success);
  EXPECT_TRUE(diags.empty());

  const Definition * x = result.analyzed->find_definition("Fib.x");
  ASSERT_NE(x, nullptr);
  EXPECT_EQ(x->polynomial.degree, 8U);
  EXPECT_EQ(x->polynomial.poly_type, PolynomialType::Committed);
  EXPECT_FALSE(x->function.has_value());
}

TEST(SemaPilAnalyzer, EqualityBecomesDifference)
{
  PilBuilder b;
  b.ns("Main", 4).commit({"x"}).identity(b.next("x"), b.add(b.ref("x"), b.num(1)));
  b.identity(b.mul(b.ref("x"), b.sub(b.num(1), b.ref("x"))));
  DiagnosticBag diags;
  const auto result = b.analyze(diags);
  ASSERT_TRUE(result.success);

  const auto & ids = result.analyzed->identities;
  ASSERT_EQ(ids.size(), 2U);
  const auto * diff = dyn_cast<BinaryOperation>(ids[0].expression());
  ASSERT_NE(diff, nullptr);
  EXPECT_EQ(diff->op, BinaryOperator::Sub);
  EXPECT_TRUE(ids[0].right.expressions.empty());
  // A bare expression stays as it is
  EXPECT_EQ(format_expression(ids[1].expression()), "(Main.x * (1 - Main.x))");
}

TEST(SemaPilAnalyzer, QualifiedReferencesKeepTheirNamespace)
{
  PilBuilder b;
  b.ns("A", 4).commit({"x"}).ns("B", 4).commit({"y"}).identity(b.ref("A.x"), b.ref("y"));
  DiagnosticBag diags;
  const auto result = b.analyze(diags);
  ASSERT_TRUE(result.success);
  EXPECT_EQ(
    format_identity(result.analyzed->identities[0]), "(A.x - B.y) = 0;");
}

TEST(SemaPilAnalyzer, ForwardReferencesResolve)
{
  PilBuilder b;
  b.ns("Main", 4).identity(b.ref("later"), b.num(0)).commit({"later"});
  DiagnosticBag diags;
  const auto result = b.analyze(diags);
  EXPECT_TRUE(result.success);
}

TEST(SemaPilAnalyzer, ConstantsAndDegreeExpressions)
{
  PilBuilder b;
  b.constant_def("BITS", b.num(3))
    .constant_def("N", b.pow(b.num(2), b.constant("BITS")))
    .ns("Main", b.constant("N"))
    .commit({"x"});
  DiagnosticBag diags;
  const auto result = b.analyze(diags);
  ASSERT_TRUE(result.success);

  EXPECT_EQ(result.analyzed->find_constant("N"), FieldElement(8));
  EXPECT_EQ(result.analyzed->find_definition("Main.x")->polynomial.degree, 8U);
}

TEST(SemaPilAnalyzer, MappingParametersBecomeLocals)
{
  PilBuilder b;
  b.ns("Main", 4).fixed_mapping("F", "i", b.add(b.ref("i"), b.num(1)));
  DiagnosticBag diags;
  const auto result = b.analyze(diags);
  ASSERT_TRUE(result.success);

  const Definition * f = result.analyzed->find_definition("Main.F");
  ASSERT_NE(f, nullptr);
  ASSERT_TRUE(f->function.has_value());
  EXPECT_EQ(f->function->kind(), FunctionValueKind::Mapping);
  EXPECT_EQ(format_expression(f->function->expression()), "($0 + 1)");
}

TEST(SemaPilAnalyzer, QueryIsAttachedToCommittedColumn)
{
  PilBuilder b;
  b.ns("Main", 4).commit_query("q", "i", b.tuple({b.str("input"), b.ref("i")}));
  DiagnosticBag diags;
  const auto result = b.analyze(diags);
  ASSERT_TRUE(result.success);

  const Definition * q = result.analyzed->find_definition("Main.q");
  ASSERT_NE(q, nullptr);
  EXPECT_EQ(q->polynomial.poly_type, PolynomialType::Committed);
  ASSERT_TRUE(q->function.has_value());
  EXPECT_EQ(q->function->kind(), FunctionValueKind::Query);
}

TEST(SemaPilAnalyzer, RepeatedSegmentFillsDegree)
{
  PilBuilder b;
  b.ns("Main", 8).fixed_array("P", {{{b.num(1), b.num(2)}, false}, {{b.num(0), b.num(7)}, true}});
  DiagnosticBag diags;
  const auto result = b.analyze(diags);
  ASSERT_TRUE(result.success);

  const auto & arrays = result.analyzed->find_definition("Main.P")->function->arrays();
  ASSERT_EQ(arrays.size(), 2U);
  EXPECT_EQ(arrays[1].repetitions(), 3U);
}

TEST(SemaPilAnalyzer, RepeatedSegmentWithNoRowsLeft)
{
  PilBuilder b;
  b.ns("Main", 4).fixed_array(
    "P", {{{b.num(1), b.num(2), b.num(3), b.num(4)}, false}, {{b.num(0)}, true}});
  DiagnosticBag diags;
  const auto result = b.analyze(diags);
  ASSERT_TRUE(result.success);
  EXPECT_FALSE(diags.has_errors());

  const auto & arrays = result.analyzed->find_definition("Main.P")->function->arrays();
  ASSERT_EQ(arrays.size(), 1U);
  EXPECT_EQ(arrays[0].size(), 4U);
}

TEST(SemaPilAnalyzer, PublicDeclaration)
{
  PilBuilder b;
  b.ns("Main", 4).commit_array("a", 2).public_decl("last", b.at("a", 1), 3);
  DiagnosticBag diags;
  const auto result = b.analyze(diags);
  ASSERT_TRUE(result.success);

  const PublicDeclaration * pub = result.analyzed->find_public_declaration("last");
  ASSERT_NE(pub, nullptr);
  EXPECT_EQ(pub->polynomial->name, "Main.a");
  EXPECT_EQ(pub->polynomial->index, uint64_t{1});
  EXPECT_EQ(pub->index, 3U);
}

TEST(SemaPilAnalyzer, SourceReferences)
{
  SourceRegistry sources;
  const FileId file =
    sources.register_file("t.pil", "namespace T(2);\npol commit x;\nx = 1;\n");

  PilBuilder b;
  auto * stmt =
    b.context().create<PolynomialIdentityStmt>(b.ref("x"), b.num(1), SourceRange(file, 30, 36));
  b.ns("T", 2).commit({"x"}).statement(stmt);
  DiagnosticBag diags;
  const auto result = b.analyze(diags, &sources);
  ASSERT_TRUE(result.success);

  const Identity & identity = result.analyzed->identities.at(0);
  EXPECT_EQ(identity.source.file, "t.pil");
  EXPECT_EQ(identity.source.line, 3U);
}

// ============================================================================
// Diagnostics
// ============================================================================

TEST(SemaPilAnalyzer, DeclarationBeforeNamespaceDegree)
{
  PilBuilder b;
  b.commit({"x"});
  DiagnosticBag diags;
  const auto result = b.analyze(diags);
  EXPECT_FALSE(result.success);
  ASSERT_NE(result.analyzed, nullptr);
  EXPECT_EQ(diags.count(DiagCode::MissingDegree), 1U);
  EXPECT_TRUE(has_message(diags, "declared before any namespace degree"));
}

TEST(SemaPilAnalyzer, DuplicatePolynomial)
{
  PilBuilder b;
  b.ns("Main", 4).commit({"x"}).constant_decl({"x"});
  DiagnosticBag diags;
  const auto result = b.analyze(diags);
  EXPECT_FALSE(result.success);
  EXPECT_EQ(diags.count(DiagCode::DuplicateSymbol), 1U);
  EXPECT_TRUE(has_message(diags, "Polynomial 'Main.x' already declared"));
}

TEST(SemaPilAnalyzer, DuplicateConstantAndPublic)
{
  PilBuilder b;
  b.constant_def("N", b.num(1)).constant_def("N", b.num(2));
  b.ns("Main", 4).commit({"x"});
  b.public_decl("p", b.ref("x"), 0).public_decl("p", b.ref("x"), 1);
  DiagnosticBag diags;
  const auto result = b.analyze(diags);
  EXPECT_FALSE(result.success);
  EXPECT_EQ(diags.count(DiagCode::DuplicateSymbol), 2U);
  EXPECT_EQ(result.analyzed->find_constant("N"), FieldElement(1));
}

TEST(SemaPilAnalyzer, UnknownReferences)
{
  PilBuilder b;
  b.ns("Main", 4).commit({"x"});
  b.identity(b.ref("y"), b.constant("MISSING"));
  b.identity(b.call("G", {b.num(1)}), b.pub("nobody"));
  DiagnosticBag diags;
  const auto result = b.analyze(diags);
  EXPECT_FALSE(result.success);
  EXPECT_EQ(diags.count(DiagCode::UnknownSymbol), 4U);
  EXPECT_TRUE(has_message(diags, "Unknown polynomial 'Main.y'"));
  EXPECT_TRUE(has_message(diags, "Unknown constant %MISSING"));
  EXPECT_TRUE(has_message(diags, "Unknown function 'Main.G'"));
  EXPECT_TRUE(has_message(diags, "Unknown public 'nobody'"));
}

TEST(SemaPilAnalyzer, ArrayIndexChecks)
{
  PilBuilder b;
  b.ns("Main", 4).commit({"x"}).commit_array("a", 2);
  b.identity(b.at("x", 0));
  b.identity(b.at("a", 2));
  b.identity(b.ref("a"));
  DiagnosticBag diags;
  const auto result = b.analyze(diags);
  EXPECT_FALSE(result.success);
  EXPECT_EQ(diags.count(DiagCode::InvalidArrayIndex), 3U);
  EXPECT_TRUE(has_message(diags, "Polynomial 'Main.x' is not an array"));
  EXPECT_TRUE(has_message(diags, "Index 2 out of bounds for 'Main.a' of length 2"));
  EXPECT_TRUE(has_message(diags, "Array 'Main.a' must be indexed"));
}

TEST(SemaPilAnalyzer, ArrayLengthMustMatchDegree)
{
  PilBuilder b;
  b.ns("Main", 4)
    .fixed_array("SHORT", {{{b.num(1), b.num(2)}, false}})
    .fixed_array("ODD", {{{b.num(1)}, false}, {{b.num(0), b.num(0)}, true}})
    .fixed_array("LONG", {{{b.num(1), b.num(1), b.num(1), b.num(1), b.num(1)}, false}});
  DiagnosticBag diags;
  const auto result = b.analyze(diags);
  EXPECT_FALSE(result.success);
  EXPECT_EQ(diags.count(DiagCode::DegreeMismatch), 3U);
  EXPECT_TRUE(has_message(diags, "Array has 2 elements but the degree is 4"));
  EXPECT_TRUE(has_message(diags, "Repeated segment of length 2 cannot fill the remaining 3 rows"));
  EXPECT_EQ(result.analyzed->find_definition("Main.SHORT"), nullptr);
}

TEST(SemaPilAnalyzer, OnlyOneRepeatedSegment)
{
  PilBuilder b;
  b.ns("Main", 4).fixed_array("P", {{{b.num(1)}, true}, {{b.num(0)}, true}});
  b.fixed_array("E", {{{}, true}});
  DiagnosticBag diags;
  const auto result = b.analyze(diags);
  EXPECT_FALSE(result.success);
  EXPECT_EQ(diags.count(DiagCode::InvalidArrayValue), 2U);
  EXPECT_TRUE(has_message(diags, "Only one repeated array segment is allowed"));
  EXPECT_TRUE(has_message(diags, "Repeated array segment is empty"));
}

TEST(SemaPilAnalyzer, NonConstantDegreeAndConstant)
{
  PilBuilder b;
  b.ns("Main", 4).commit({"x"});
  b.constant_def("C", b.ref("x"));
  b.ns("Other", b.ref("Main.x"));
  DiagnosticBag diags;
  const auto result = b.analyze(diags);
  EXPECT_FALSE(result.success);
  EXPECT_EQ(diags.count(DiagCode::NotAConstant), 2U);
  EXPECT_TRUE(has_message(diags, "Expression is not constant: Main.x"));
  EXPECT_TRUE(has_message(diags, "Invalid namespace degree"));
}

TEST(SemaPilAnalyzer, MatchPatternsMustBeConstant)
{
  PilBuilder b;
  b.ns("Main", 4).commit({"x"});
  b.fixed_mapping(
    "F", "i", b.match(b.ref("i"), {b.arm(b.ref("x"), b.num(1)), b.arm(nullptr, b.num(0))}));
  DiagnosticBag diags;
  const auto result = b.analyze(diags);
  EXPECT_FALSE(result.success);
  EXPECT_EQ(diags.count(DiagCode::NotAConstant), 1U);
  EXPECT_EQ(result.analyzed->find_definition("Main.F"), nullptr);
}

TEST(SemaPilAnalyzer, ConnectSidesMustHaveSameLength)
{
  PilBuilder b;
  b.ns("Main", 4).commit({"x", "y"});
  b.connect({b.ref("x"), b.ref("y")}, {b.ref("x")});
  DiagnosticBag diags;
  const auto result = b.analyze(diags);
  EXPECT_FALSE(result.success);
  EXPECT_EQ(diags.count(DiagCode::InvalidIdentity), 1U);
  EXPECT_TRUE(result.analyzed->identities.empty());
}

TEST(SemaPilAnalyzer, LookupSidesMustHaveSameLength)
{
  PilBuilder b;
  b.ns("Main", 4).commit({"a", "b"}).constant_decl({"ID"});
  b.plookup(b.selected({b.ref("a"), b.ref("b")}), b.selected({b.ref("ID")}));
  b.permutation(b.selected({b.ref("a")}), b.selected({b.ref("ID"), b.ref("ID")}));
  DiagnosticBag diags;
  const auto result = b.analyze(diags);
  EXPECT_FALSE(result.success);
  EXPECT_EQ(diags.count(DiagCode::InvalidIdentity), 2U);
  EXPECT_TRUE(result.analyzed->identities.empty());
}

TEST(SemaPilAnalyzer, QueryNeedsScalarColumn)
{
  PilBuilder b;
  auto & ctx = b.context();
  std::vector<PolyDeclName *> names{
    ctx.create<PolyDeclName>(ctx.intern("q"), b.num(2))};
  std::vector<std::string_view> params{ctx.intern("i")};
  auto * query = ctx.create<FunctionDef>(
    FunctionDefKind::Query, ctx.copy_to_arena(params), b.ref("i"), gsl::span<ArrayValue *>{});
  b.ns("Main", 4).statement(
    ctx.create<PolynomialCommitDeclarationStmt>(ctx.copy_to_arena(names), query));
  DiagnosticBag diags;
  const auto result = b.analyze(diags);
  EXPECT_FALSE(result.success);
  EXPECT_EQ(diags.count(DiagCode::UnsupportedExpression), 1U);
}

TEST(SemaPilAnalyzer, AnalysisContinuesAfterErrors)
{
  PilBuilder b;
  b.ns("Main", 4).commit({"x"}).commit({"x"}).commit({"y"});
  b.identity(b.ref("y"), b.ref("x"));
  DiagnosticBag diags;
  const auto result = b.analyze(diags);
  EXPECT_FALSE(result.success);
  EXPECT_NE(result.analyzed->find_definition("Main.y"), nullptr);
  EXPECT_EQ(result.analyzed->identities.size(), 1U);
}
