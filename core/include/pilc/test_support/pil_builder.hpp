// pilc/test_support/pil_builder.hpp - helpers for unit tests
//
// Builds PIL programs directly as AST nodes, so analyzer and witness
// generation tests do not depend on a parser. All names are interned in
// the builder's AstContext; the builder must outlive the Program it returns.
//
#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "pilc/ast/ast_context.hpp"
#include "pilc/basic/diagnostic.hpp"
#include "pilc/sema/pil_analyzer.hpp"

namespace pilc::test_support
{

/**
 * Fluent builder for PIL programs.
 *
 * @code
 *   PilBuilder b;
 *   b.ns("Main", 4).commit({"x"}).identity(b.next("x"), b.ref("x"));
 *   DiagnosticBag diags;
 *   auto result = b.analyze(diags);
 * @endcode
 */
class PilBuilder
{
public:
  struct Segment
  {
    std::vector<Expr *> values;
    bool repeated = false;
  };

  // ==========================================================================
  // Expressions
  // ==========================================================================

  Expr * num(uint64_t value) { return literal(std::to_string(value)); }

  /// Literal kept as written, e.g. "0x10"
  Expr * literal(std::string_view text)
  {
    return ctx_->create<NumberLiteralExpr>(ctx_->intern(text));
  }

  Expr * str(std::string_view value)
  {
    return ctx_->create<StringLiteralExpr>(ctx_->intern(value));
  }

  /// `%name`
  Expr * constant(std::string_view name)
  {
    return ctx_->create<ConstantRefExpr>(ctx_->intern(name));
  }

  /// `name` or `Namespace.name`
  PolyRefExpr * ref(std::string_view name) { return poly_ref(name, nullptr, false); }

  /// `name'`
  PolyRefExpr * next(std::string_view name) { return poly_ref(name, nullptr, true); }

  /// `name[index]` or `name[index]'`
  PolyRefExpr * at(std::string_view name, uint64_t index, bool is_next = false)
  {
    return poly_ref(name, num(index), is_next);
  }

  /// `:name`
  Expr * pub(std::string_view name) { return ctx_->create<PublicRefExpr>(ctx_->intern(name)); }

  Expr * call(std::string_view name, const std::vector<Expr *> & args)
  {
    return ctx_->create<FunctionCallExpr>(ctx_->intern(name), ctx_->copy_to_arena(args));
  }

  Expr * tuple(const std::vector<Expr *> & elements)
  {
    return ctx_->create<TupleExpr>(ctx_->copy_to_arena(elements));
  }

  Expr * bin(Expr * lhs, BinaryOperator op, Expr * rhs)
  {
    return ctx_->create<BinaryExpr>(lhs, op, rhs);
  }

  Expr * add(Expr * lhs, Expr * rhs) { return bin(lhs, BinaryOperator::Add, rhs); }
  Expr * sub(Expr * lhs, Expr * rhs) { return bin(lhs, BinaryOperator::Sub, rhs); }
  Expr * mul(Expr * lhs, Expr * rhs) { return bin(lhs, BinaryOperator::Mul, rhs); }
  Expr * div(Expr * lhs, Expr * rhs) { return bin(lhs, BinaryOperator::Div, rhs); }
  Expr * pow(Expr * lhs, Expr * rhs) { return bin(lhs, BinaryOperator::Pow, rhs); }

  Expr * neg(Expr * operand) { return ctx_->create<UnaryExpr>(UnaryOperator::Minus, operand); }

  /// `pattern => value`; a null pattern is the wildcard arm
  MatchArm * arm(Expr * pattern, Expr * value) { return ctx_->create<MatchArm>(pattern, value); }

  Expr * match(Expr * scrutinee, const std::vector<MatchArm *> & arms)
  {
    return ctx_->create<MatchExpr>(scrutinee, ctx_->copy_to_arena(arms));
  }

  /// `selector { e1, e2 }`; selector may be null
  SelectedExprs * selected(Expr * selector, const std::vector<Expr *> & expressions)
  {
    return ctx_->create<SelectedExprs>(selector, ctx_->copy_to_arena(expressions));
  }

  SelectedExprs * selected(const std::vector<Expr *> & expressions)
  {
    return selected(nullptr, expressions);
  }

  // ==========================================================================
  // Statements
  // ==========================================================================

  /// `namespace name(degree);`
  PilBuilder & ns(std::string_view name, uint64_t degree)
  {
    return ns(name, num(degree));
  }

  PilBuilder & ns(std::string_view name, Expr * degree)
  {
    return statement(ctx_->create<NamespaceStmt>(ctx_->intern(name), degree));
  }

  /// `constant %name = value;`
  PilBuilder & constant_def(std::string_view name, Expr * value)
  {
    return statement(ctx_->create<ConstantDefinitionStmt>(ctx_->intern(name), value));
  }

  /// `pol commit a, b;`
  PilBuilder & commit(const std::vector<std::string_view> & names)
  {
    return statement(
      ctx_->create<PolynomialCommitDeclarationStmt>(decl_names(names), nullptr));
  }

  /// `pol commit name[size];`
  PilBuilder & commit_array(std::string_view name, uint64_t size)
  {
    std::vector<PolyDeclName *> decls{ctx_->create<PolyDeclName>(ctx_->intern(name), num(size))};
    return statement(
      ctx_->create<PolynomialCommitDeclarationStmt>(ctx_->copy_to_arena(decls), nullptr));
  }

  /// `pol commit name(param) query body;`
  PilBuilder & commit_query(std::string_view name, std::string_view param, Expr * body)
  {
    auto * query = function(FunctionDefKind::Query, param, body);
    return statement(ctx_->create<PolynomialCommitDeclarationStmt>(decl_names({name}), query));
  }

  /// `pol constant a, b;`
  PilBuilder & constant_decl(const std::vector<std::string_view> & names)
  {
    return statement(ctx_->create<PolynomialConstantDeclarationStmt>(decl_names(names)));
  }

  /// `pol constant name(param) { body };`
  PilBuilder & fixed_mapping(std::string_view name, std::string_view param, Expr * body)
  {
    auto * def = function(FunctionDefKind::Mapping, param, body);
    return statement(ctx_->create<PolynomialConstantDefinitionStmt>(ctx_->intern(name), def));
  }

  /// `pol constant name = [..] + [..]*;`
  PilBuilder & fixed_array(std::string_view name, const std::vector<Segment> & segments)
  {
    std::vector<ArrayValue *> values;
    values.reserve(segments.size());
    for (const Segment & s : segments) {
      values.push_back(ctx_->create<ArrayValue>(ctx_->copy_to_arena(s.values), s.repeated));
    }
    auto * def = ctx_->create<FunctionDef>(
      FunctionDefKind::Array, gsl::span<std::string_view>{}, nullptr,
      ctx_->copy_to_arena(values));
    return statement(ctx_->create<PolynomialConstantDefinitionStmt>(ctx_->intern(name), def));
  }

  /// `pol name = value;`
  PilBuilder & intermediate(std::string_view name, Expr * value)
  {
    return statement(ctx_->create<PolynomialDefinitionStmt>(ctx_->intern(name), value));
  }

  /// `public name = poly(row);`
  PilBuilder & public_decl(std::string_view name, PolyRefExpr * poly, uint64_t row)
  {
    return statement(ctx_->create<PublicDeclarationStmt>(ctx_->intern(name), poly, num(row)));
  }

  /// `lhs = rhs;`, or `lhs;` when rhs is null
  PilBuilder & identity(Expr * lhs, Expr * rhs = nullptr)
  {
    return statement(ctx_->create<PolynomialIdentityStmt>(lhs, rhs));
  }

  PilBuilder & plookup(SelectedExprs * left, SelectedExprs * right)
  {
    return statement(ctx_->create<PlookupIdentityStmt>(left, right));
  }

  PilBuilder & permutation(SelectedExprs * left, SelectedExprs * right)
  {
    return statement(ctx_->create<PermutationIdentityStmt>(left, right));
  }

  PilBuilder & connect(const std::vector<Expr *> & left, const std::vector<Expr *> & right)
  {
    return statement(
      ctx_->create<ConnectIdentityStmt>(ctx_->copy_to_arena(left), ctx_->copy_to_arena(right)));
  }

  PilBuilder & statement(Stmt * stmt)
  {
    statements_.push_back(stmt);
    return *this;
  }

  // ==========================================================================
  // Output
  // ==========================================================================

  [[nodiscard]] const Program & program()
  {
    program_ = ctx_->create<Program>(ctx_->copy_to_arena(statements_));
    return *program_;
  }

  [[nodiscard]] AnalysisResult analyze(
    DiagnosticBag & diags, const SourceRegistry * sources = nullptr)
  {
    PilAnalyzer analyzer(sources, diags);
    return analyzer.analyze(program());
  }

  [[nodiscard]] AstContext & context() noexcept { return *ctx_; }

private:
  PolyRefExpr * poly_ref(std::string_view name, Expr * index, bool is_next)
  {
    return ctx_->create<PolyRefExpr>(std::string_view{}, ctx_->intern(name), index, is_next);
  }

  gsl::span<PolyDeclName *> decl_names(const std::vector<std::string_view> & names)
  {
    std::vector<PolyDeclName *> decls;
    decls.reserve(names.size());
    for (const auto name : names) {
      decls.push_back(ctx_->create<PolyDeclName>(ctx_->intern(name), nullptr));
    }
    return ctx_->copy_to_arena(decls);
  }

  FunctionDef * function(FunctionDefKind kind, std::string_view param, Expr * body)
  {
    std::vector<std::string_view> params{ctx_->intern(param)};
    return ctx_->create<FunctionDef>(
      kind, ctx_->copy_to_arena(params), body, gsl::span<ArrayValue *>{});
  }

  std::unique_ptr<AstContext> ctx_ = std::make_unique<AstContext>();
  std::vector<Stmt *> statements_;
  Program * program_ = nullptr;
};

}  // namespace pilc::test_support
