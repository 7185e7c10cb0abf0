// pilc/ast/ast.hpp - PIL AST node class definitions
//
// Input of the analyzer. Produced by a PIL front end (or by the builder in
// test_support), allocated in an AstContext. LLVM-style classof() RTTI.
//
#pragma once

#include <gsl/span>
#include <string_view>

#include "pilc/ast/ast_enums.hpp"
#include "pilc/basic/casting.hpp"
#include "pilc/basic/source_manager.hpp"

namespace pilc
{

// ============================================================================
// Base Classes
// ============================================================================

/**
 * Base class for all AST nodes.
 *
 * Nodes are non-copyable and owned by AstContext.
 */
class AstNode
{
public:
  const NodeKind kind;
  SourceRange range_;

  AstNode(const AstNode &) = delete;
  AstNode & operator=(const AstNode &) = delete;
  AstNode(AstNode &&) = delete;
  AstNode & operator=(AstNode &&) = delete;

  [[nodiscard]] NodeKind get_kind() const noexcept { return kind; }

  [[nodiscard]] SourceRange get_range() const noexcept { return range_; }

protected:
  explicit AstNode(NodeKind k, SourceRange r = {}) : kind(k), range_(r) {}
  ~AstNode() = default;
};

/**
 * CRTP base implementing classof() for a single NodeKind.
 */
template <typename Derived, typename Base, NodeKind K>
class NodeBase : public Base
{
public:
  static constexpr NodeKind kind = K;

  static bool classof(const AstNode * node) { return node->get_kind() == K; }

protected:
  explicit NodeBase(SourceRange r = {}) : Base(K, r) {}
};

class Expr : public AstNode
{
public:
  static bool classof(const AstNode * node) { return is_expr_kind(node->kind); }

protected:
  explicit Expr(NodeKind k, SourceRange r = {}) : AstNode(k, r) {}
};

class Stmt : public AstNode
{
public:
  static bool classof(const AstNode * node) { return is_stmt_kind(node->kind); }

protected:
  explicit Stmt(NodeKind k, SourceRange r = {}) : AstNode(k, r) {}
};

class MatchArm;
class SelectedExprs;
class ArrayValue;
class FunctionDef;
class PolyDeclName;

// ============================================================================
// Expression Nodes
// ============================================================================

/// Integer literal, kept as source text (decimal or 0x hex) until analysis.
class NumberLiteralExpr : public NodeBase<NumberLiteralExpr, Expr, NodeKind::NumberLiteral>
{
public:
  std::string_view text;

  explicit NumberLiteralExpr(std::string_view t, SourceRange r = {}) : NodeBase(r), text(t) {}
};

class StringLiteralExpr : public NodeBase<StringLiteralExpr, Expr, NodeKind::StringLiteral>
{
public:
  std::string_view value;

  explicit StringLiteralExpr(std::string_view v, SourceRange r = {}) : NodeBase(r), value(v) {}
};

/// `%name`
class ConstantRefExpr : public NodeBase<ConstantRefExpr, Expr, NodeKind::ConstantRef>
{
public:
  std::string_view name;

  explicit ConstantRefExpr(std::string_view n, SourceRange r = {}) : NodeBase(r), name(n) {}
};

/**
 * `[ns.]name[index]['']`
 *
 * A bare name may also denote a parameter of the enclosing function
 * definition; the analyzer decides.
 */
class PolyRefExpr : public NodeBase<PolyRefExpr, Expr, NodeKind::PolyRef>
{
public:
  std::string_view namespace_name;  ///< empty: current namespace
  std::string_view name;
  Expr * index = nullptr;
  bool next = false;

  PolyRefExpr(
    std::string_view ns, std::string_view n, Expr * idx, bool nxt, SourceRange r = {})
  : NodeBase(r), namespace_name(ns), name(n), index(idx), next(nxt)
  {
  }
};

/// `:name`
class PublicRefExpr : public NodeBase<PublicRefExpr, Expr, NodeKind::PublicRef>
{
public:
  std::string_view name;

  explicit PublicRefExpr(std::string_view n, SourceRange r = {}) : NodeBase(r), name(n) {}
};

class FunctionCallExpr : public NodeBase<FunctionCallExpr, Expr, NodeKind::FunctionCall>
{
public:
  std::string_view name;
  gsl::span<Expr *> arguments;

  FunctionCallExpr(std::string_view n, gsl::span<Expr *> args, SourceRange r = {})
  : NodeBase(r), name(n), arguments(args)
  {
  }
};

class TupleExpr : public NodeBase<TupleExpr, Expr, NodeKind::Tuple>
{
public:
  gsl::span<Expr *> elements;

  explicit TupleExpr(gsl::span<Expr *> elems, SourceRange r = {}) : NodeBase(r), elements(elems)
  {
  }
};

class BinaryExpr : public NodeBase<BinaryExpr, Expr, NodeKind::Binary>
{
public:
  Expr * lhs;
  BinaryOperator op;
  Expr * rhs;

  BinaryExpr(Expr * l, BinaryOperator o, Expr * r_, SourceRange r = {})
  : NodeBase(r), lhs(l), op(o), rhs(r_)
  {
  }
};

class UnaryExpr : public NodeBase<UnaryExpr, Expr, NodeKind::Unary>
{
public:
  UnaryOperator op;
  Expr * operand;

  UnaryExpr(UnaryOperator o, Expr * e, SourceRange r = {}) : NodeBase(r), op(o), operand(e) {}
};

/// `match scrutinee { pattern => value, _ => value }`
class MatchExpr : public NodeBase<MatchExpr, Expr, NodeKind::Match>
{
public:
  Expr * scrutinee;
  gsl::span<MatchArm *> arms;

  MatchExpr(Expr * s, gsl::span<MatchArm *> a, SourceRange r = {})
  : NodeBase(r), scrutinee(s), arms(a)
  {
  }
};

// ============================================================================
// Supporting Nodes
// ============================================================================

class MatchArm : public NodeBase<MatchArm, AstNode, NodeKind::MatchArm>
{
public:
  Expr * pattern = nullptr;  ///< nullptr: wildcard arm
  Expr * value;

  MatchArm(Expr * p, Expr * v, SourceRange r = {}) : NodeBase(r), pattern(p), value(v) {}
};

/// `sel { e1, e2 }`
class SelectedExprs : public NodeBase<SelectedExprs, AstNode, NodeKind::SelectedExprs>
{
public:
  Expr * selector = nullptr;
  gsl::span<Expr *> expressions;

  SelectedExprs(Expr * sel, gsl::span<Expr *> exprs, SourceRange r = {})
  : NodeBase(r), selector(sel), expressions(exprs)
  {
  }
};

/// One segment of an array definition: `[a, b]` or `[a, b]*`
class ArrayValue : public NodeBase<ArrayValue, AstNode, NodeKind::ArrayValue>
{
public:
  gsl::span<Expr *> elements;
  bool repeated = false;

  ArrayValue(gsl::span<Expr *> elems, bool rep, SourceRange r = {})
  : NodeBase(r), elements(elems), repeated(rep)
  {
  }
};

class FunctionDef : public NodeBase<FunctionDef, AstNode, NodeKind::FunctionDef>
{
public:
  FunctionDefKind def_kind;
  gsl::span<std::string_view> params;  ///< Mapping / Query
  Expr * body = nullptr;               ///< Mapping / Query
  gsl::span<ArrayValue *> segments;    ///< Array

  FunctionDef(
    FunctionDefKind k, gsl::span<std::string_view> ps, Expr * b, gsl::span<ArrayValue *> segs,
    SourceRange r = {})
  : NodeBase(r), def_kind(k), params(ps), body(b), segments(segs)
  {
  }
};

/// `name` or `name[size]` in a declaration list
class PolyDeclName : public NodeBase<PolyDeclName, AstNode, NodeKind::PolyDeclName>
{
public:
  std::string_view name;
  Expr * array_size = nullptr;

  PolyDeclName(std::string_view n, Expr * size, SourceRange r = {})
  : NodeBase(r), name(n), array_size(size)
  {
  }
};

// ============================================================================
// Statement Nodes
// ============================================================================

/// `namespace Name(degree);`
class NamespaceStmt : public NodeBase<NamespaceStmt, Stmt, NodeKind::Namespace>
{
public:
  std::string_view name;
  Expr * degree;

  NamespaceStmt(std::string_view n, Expr * d, SourceRange r = {})
  : NodeBase(r), name(n), degree(d)
  {
  }
};

/// `constant %name = value;`
class ConstantDefinitionStmt
: public NodeBase<ConstantDefinitionStmt, Stmt, NodeKind::ConstantDefinition>
{
public:
  std::string_view name;
  Expr * value;

  ConstantDefinitionStmt(std::string_view n, Expr * v, SourceRange r = {})
  : NodeBase(r), name(n), value(v)
  {
  }
};

/// `pol name = expr;` (intermediate polynomial)
class PolynomialDefinitionStmt
: public NodeBase<PolynomialDefinitionStmt, Stmt, NodeKind::PolynomialDefinition>
{
public:
  std::string_view name;
  Expr * value;

  PolynomialDefinitionStmt(std::string_view n, Expr * v, SourceRange r = {})
  : NodeBase(r), name(n), value(v)
  {
  }
};

/// `public name = poly(index);`
class PublicDeclarationStmt
: public NodeBase<PublicDeclarationStmt, Stmt, NodeKind::PublicDeclaration>
{
public:
  std::string_view name;
  PolyRefExpr * polynomial;
  Expr * index;

  PublicDeclarationStmt(std::string_view n, PolyRefExpr * p, Expr * i, SourceRange r = {})
  : NodeBase(r), name(n), polynomial(p), index(i)
  {
  }
};

/// `pol constant a, b[2];`
class PolynomialConstantDeclarationStmt
: public NodeBase<
    PolynomialConstantDeclarationStmt, Stmt, NodeKind::PolynomialConstantDeclaration>
{
public:
  gsl::span<PolyDeclName *> names;

  explicit PolynomialConstantDeclarationStmt(gsl::span<PolyDeclName *> ns, SourceRange r = {})
  : NodeBase(r), names(ns)
  {
  }
};

/// `pol constant name(i) { .. }` or `pol constant name = [..];`
class PolynomialConstantDefinitionStmt
: public NodeBase<
    PolynomialConstantDefinitionStmt, Stmt, NodeKind::PolynomialConstantDefinition>
{
public:
  std::string_view name;
  FunctionDef * definition;

  PolynomialConstantDefinitionStmt(std::string_view n, FunctionDef * d, SourceRange r = {})
  : NodeBase(r), name(n), definition(d)
  {
  }
};

/// `pol commit a, b[2];` or `pol commit x(i) query expr;`
class PolynomialCommitDeclarationStmt
: public NodeBase<PolynomialCommitDeclarationStmt, Stmt, NodeKind::PolynomialCommitDeclaration>
{
public:
  gsl::span<PolyDeclName *> names;
  FunctionDef * query = nullptr;  ///< only with a single scalar name

  PolynomialCommitDeclarationStmt(
    gsl::span<PolyDeclName *> ns, FunctionDef * q, SourceRange r = {})
  : NodeBase(r), names(ns), query(q)
  {
  }
};

/// `lhs = rhs;` or a bare `expr;` (meaning `expr = 0`)
class PolynomialIdentityStmt
: public NodeBase<PolynomialIdentityStmt, Stmt, NodeKind::PolynomialIdentity>
{
public:
  Expr * lhs;
  Expr * rhs = nullptr;

  PolynomialIdentityStmt(Expr * l, Expr * r_, SourceRange r = {})
  : NodeBase(r), lhs(l), rhs(r_)
  {
  }
};

/// `left in right;`
class PlookupIdentityStmt : public NodeBase<PlookupIdentityStmt, Stmt, NodeKind::PlookupIdentity>
{
public:
  SelectedExprs * left;
  SelectedExprs * right;

  PlookupIdentityStmt(SelectedExprs * l, SelectedExprs * r_, SourceRange r = {})
  : NodeBase(r), left(l), right(r_)
  {
  }
};

/// `left is right;`
class PermutationIdentityStmt
: public NodeBase<PermutationIdentityStmt, Stmt, NodeKind::PermutationIdentity>
{
public:
  SelectedExprs * left;
  SelectedExprs * right;

  PermutationIdentityStmt(SelectedExprs * l, SelectedExprs * r_, SourceRange r = {})
  : NodeBase(r), left(l), right(r_)
  {
  }
};

/// `{ a, b } connect { c, d };`
class ConnectIdentityStmt : public NodeBase<ConnectIdentityStmt, Stmt, NodeKind::ConnectIdentity>
{
public:
  gsl::span<Expr *> left;
  gsl::span<Expr *> right;

  ConnectIdentityStmt(gsl::span<Expr *> l, gsl::span<Expr *> r_, SourceRange r = {})
  : NodeBase(r), left(l), right(r_)
  {
  }
};

// ============================================================================
// Top-level
// ============================================================================

class Program : public NodeBase<Program, AstNode, NodeKind::Program>
{
public:
  gsl::span<Stmt *> statements;

  explicit Program(gsl::span<Stmt *> stmts, SourceRange r = {}) : NodeBase(r), statements(stmts)
  {
  }
};

}  // namespace pilc
