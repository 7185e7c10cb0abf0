// pilc/ir/analyzed.hpp - Analyzed PIL program
//
// The lowered, name-resolved form of a PIL program. Built once by the
// PilAnalyzer and read-only afterwards; every consumer takes it by const
// reference. Expression nodes and names live in the program's IrContext.
//
#pragma once

#include <cstdint>
#include <gsl/span>
#include <memory>
#include <optional>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "pilc/ast/ast_enums.hpp"
#include "pilc/basic/casting.hpp"
#include "pilc/ir/ir_context.hpp"
#include "pilc/number/number.hpp"

namespace pilc
{

// ============================================================================
// Expressions
// ============================================================================

enum class ExpressionKind : uint8_t {
  ConstantReference,
  PolynomialReference,
  LocalVariableReference,
  PublicReference,
  Number,
  StringLiteral,
  Tuple,
  BinaryOperation,
  UnaryOperation,
  FunctionCall,
  MatchExpression,
};

class Expression
{
public:
  const ExpressionKind kind;

  Expression(const Expression &) = delete;
  Expression & operator=(const Expression &) = delete;
  Expression(Expression &&) = delete;
  Expression & operator=(Expression &&) = delete;

  [[nodiscard]] ExpressionKind get_kind() const noexcept { return kind; }

protected:
  explicit Expression(ExpressionKind k) : kind(k) {}
  ~Expression() = default;
};

template <typename Derived, ExpressionKind K>
class ExpressionBase : public Expression
{
public:
  static bool classof(const Expression * expr) { return expr->get_kind() == K; }

protected:
  ExpressionBase() : Expression(K) {}
};

/// `%name`; constants are not namespaced
class ConstantReference
: public ExpressionBase<ConstantReference, ExpressionKind::ConstantReference>
{
public:
  std::string_view name;

  explicit ConstantReference(std::string_view n) : name(n) {}
};

class PolynomialReference
: public ExpressionBase<PolynomialReference, ExpressionKind::PolynomialReference>
{
public:
  std::string_view name;  ///< absolute name, e.g. "Main.x"
  std::optional<uint64_t> index;
  bool next = false;

  PolynomialReference(std::string_view n, std::optional<uint64_t> idx, bool nxt)
  : name(n), index(idx), next(nxt)
  {
  }
};

/// Parameter of the enclosing function definition, by position
class LocalVariableReference
: public ExpressionBase<LocalVariableReference, ExpressionKind::LocalVariableReference>
{
public:
  uint64_t index;

  explicit LocalVariableReference(uint64_t i) : index(i) {}
};

class PublicReference : public ExpressionBase<PublicReference, ExpressionKind::PublicReference>
{
public:
  std::string_view name;

  explicit PublicReference(std::string_view n) : name(n) {}
};

class Number : public ExpressionBase<Number, ExpressionKind::Number>
{
public:
  FieldElement value;

  explicit Number(FieldElement v) : value(v) {}
};

class StringLiteral : public ExpressionBase<StringLiteral, ExpressionKind::StringLiteral>
{
public:
  std::string_view value;

  explicit StringLiteral(std::string_view v) : value(v) {}
};

class Tuple : public ExpressionBase<Tuple, ExpressionKind::Tuple>
{
public:
  gsl::span<const Expression *> elements;

  explicit Tuple(gsl::span<const Expression *> elems) : elements(elems) {}
};

class BinaryOperation : public ExpressionBase<BinaryOperation, ExpressionKind::BinaryOperation>
{
public:
  const Expression * left;
  BinaryOperator op;
  const Expression * right;

  BinaryOperation(const Expression * l, BinaryOperator o, const Expression * r)
  : left(l), op(o), right(r)
  {
  }
};

class UnaryOperation : public ExpressionBase<UnaryOperation, ExpressionKind::UnaryOperation>
{
public:
  UnaryOperator op;
  const Expression * operand;

  UnaryOperation(UnaryOperator o, const Expression * e) : op(o), operand(e) {}
};

/// Call to a non-macro function, e.g. a constant polynomial
class FunctionCall : public ExpressionBase<FunctionCall, ExpressionKind::FunctionCall>
{
public:
  std::string_view name;
  gsl::span<const Expression *> arguments;

  FunctionCall(std::string_view n, gsl::span<const Expression *> args) : name(n), arguments(args)
  {
  }
};

struct MatchExpressionArm
{
  std::optional<FieldElement> pattern;  ///< nullopt: default arm
  const Expression * value = nullptr;
};

class MatchExpression : public ExpressionBase<MatchExpression, ExpressionKind::MatchExpression>
{
public:
  const Expression * scrutinee;
  gsl::span<const MatchExpressionArm> arms;

  MatchExpression(const Expression * s, gsl::span<const MatchExpressionArm> a)
  : scrutinee(s), arms(a)
  {
  }
};

/// Pre-order walk over `expr` and all of its sub-expressions
template <typename F>
void visit_expression(const Expression * expr, F && f)
{
  if (expr == nullptr) {
    return;
  }
  f(expr);
  switch (expr->get_kind()) {
    case ExpressionKind::Tuple:
      for (const auto * e : cast<Tuple>(expr)->elements) visit_expression(e, f);
      break;
    case ExpressionKind::BinaryOperation: {
      const auto * bin = cast<BinaryOperation>(expr);
      visit_expression(bin->left, f);
      visit_expression(bin->right, f);
      break;
    }
    case ExpressionKind::UnaryOperation:
      visit_expression(cast<UnaryOperation>(expr)->operand, f);
      break;
    case ExpressionKind::FunctionCall:
      for (const auto * e : cast<FunctionCall>(expr)->arguments) visit_expression(e, f);
      break;
    case ExpressionKind::MatchExpression: {
      const auto * m = cast<MatchExpression>(expr);
      visit_expression(m->scrutinee, f);
      for (const auto & arm : m->arms) visit_expression(arm.value, f);
      break;
    }
    case ExpressionKind::ConstantReference:
    case ExpressionKind::PolynomialReference:
    case ExpressionKind::LocalVariableReference:
    case ExpressionKind::PublicReference:
    case ExpressionKind::Number:
    case ExpressionKind::StringLiteral:
      break;
  }
}

// ============================================================================
// Declarations
// ============================================================================

struct SourceRef
{
  std::string_view file;
  uint32_t line = 0;
};

enum class PolynomialType : uint8_t {
  Committed,     ///< witness column
  Constant,      ///< fixed column
  Intermediate,  ///< derived, not a witness
};

[[nodiscard]] std::string_view to_string(PolynomialType type) noexcept;

struct Polynomial
{
  uint64_t id = 0;
  SourceRef source;
  std::string_view absolute_name;
  PolynomialType poly_type = PolynomialType::Committed;
  DegreeType degree = 0;
  std::optional<DegreeType> length;

  [[nodiscard]] bool is_array() const noexcept { return length.has_value(); }
};

struct PublicDeclaration
{
  uint64_t id = 0;
  SourceRef source;
  std::string_view name;
  const PolynomialReference * polynomial = nullptr;
  /// Evaluation point (row), not the array index
  DegreeType index = 0;
};

enum class IdentityKind : uint8_t {
  Polynomial,
  Plookup,
  Permutation,
  Connect,
};

[[nodiscard]] std::string_view to_string(IdentityKind kind) noexcept;

struct SelectedExpressions
{
  const Expression * selector = nullptr;  ///< nullptr: always active
  gsl::span<const Expression *> expressions;
};

struct Identity
{
  /// Counted separately per kind
  uint64_t id = 0;
  IdentityKind kind = IdentityKind::Polynomial;
  SourceRef source;
  /// For a polynomial identity the selector holds the expression itself
  SelectedExpressions left;
  SelectedExpressions right;

  /// Polynomial identity expression (`left.selector`)
  [[nodiscard]] const Expression * expression() const noexcept { return left.selector; }

  [[nodiscard]] bool contains_next_ref() const;
};

// ============================================================================
// Function values
// ============================================================================

/**
 * An array segment whose values are repeated as a whole.
 *
 * repetitions == 0 requires no values; no values require repetitions <= 1.
 */
class RepeatedArray
{
public:
  [[nodiscard]] static std::optional<RepeatedArray> create(
    gsl::span<const Expression *> values, DegreeType repetitions);

  [[nodiscard]] gsl::span<const Expression *> values() const noexcept { return values_; }
  [[nodiscard]] DegreeType repetitions() const noexcept { return repetitions_; }

  /// Number of elements including repetitions
  [[nodiscard]] DegreeType size() const noexcept { return values_.size() * repetitions_; }

private:
  RepeatedArray(gsl::span<const Expression *> values, DegreeType repetitions)
  : values_(values), repetitions_(repetitions)
  {
  }

  gsl::span<const Expression *> values_;
  DegreeType repetitions_;
};

enum class FunctionValueKind : uint8_t {
  Mapping,
  Array,
  Query,
};

class FunctionValueDefinition
{
public:
  [[nodiscard]] static FunctionValueDefinition make_mapping(const Expression * expr);
  [[nodiscard]] static FunctionValueDefinition make_array(std::vector<RepeatedArray> arrays);
  [[nodiscard]] static FunctionValueDefinition make_query(const Expression * expr);

  [[nodiscard]] FunctionValueKind kind() const noexcept { return kind_; }

  /// Mapping / Query expression, nullptr for arrays
  [[nodiscard]] const Expression * expression() const noexcept { return expression_; }

  [[nodiscard]] const std::vector<RepeatedArray> & arrays() const noexcept { return arrays_; }

  /// Total element count of an Array definition
  [[nodiscard]] DegreeType array_size() const noexcept;

private:
  FunctionValueDefinition(
    FunctionValueKind kind, const Expression * expr, std::vector<RepeatedArray> arrays)
  : kind_(kind), expression_(expr), arrays_(std::move(arrays))
  {
  }

  FunctionValueKind kind_;
  const Expression * expression_;
  std::vector<RepeatedArray> arrays_;
};

struct Definition
{
  Polynomial polynomial;
  std::optional<FunctionValueDefinition> function;
};

// ============================================================================
// Source order
// ============================================================================

class StatementIdentifier
{
public:
  enum class Kind : uint8_t { Definition, PublicDeclaration, Identity };

  [[nodiscard]] static StatementIdentifier definition(std::string_view name)
  {
    return {Kind::Definition, name, 0};
  }
  [[nodiscard]] static StatementIdentifier public_declaration(std::string_view name)
  {
    return {Kind::PublicDeclaration, name, 0};
  }
  [[nodiscard]] static StatementIdentifier identity(size_t index)
  {
    return {Kind::Identity, {}, index};
  }

  [[nodiscard]] Kind kind() const noexcept { return kind_; }
  [[nodiscard]] std::string_view name() const noexcept { return name_; }
  /// Position in Analyzed::identities
  [[nodiscard]] size_t identity_index() const noexcept { return identity_index_; }

private:
  StatementIdentifier(Kind kind, std::string_view name, size_t index)
  : kind_(kind), name_(name), identity_index_(index)
  {
  }

  Kind kind_;
  std::string_view name_;
  size_t identity_index_;
};

// ============================================================================
// Analyzed
// ============================================================================

/**
 * A fully analyzed PIL program.
 *
 * The maps carry no meaningful iteration order. Everything that must be
 * deterministic (column layout, printing, export) walks `source_order`.
 */
class Analyzed
{
public:
  Analyzed();

  /// Not namespaced
  std::unordered_map<std::string_view, FieldElement> constants;
  std::unordered_map<std::string_view, Definition> definitions;
  std::unordered_map<std::string_view, PublicDeclaration> public_declarations;
  std::vector<Identity> identities;
  std::vector<StatementIdentifier> source_order;

  /// Number of committed polynomials, counting array elements
  [[nodiscard]] size_t commitment_count() const;
  /// Number of intermediate polynomials, counting array elements
  [[nodiscard]] size_t intermediate_count() const;
  /// Number of constant polynomials, counting array elements
  [[nodiscard]] size_t constant_count() const;

  [[nodiscard]] std::vector<const Definition *> definitions_in_source_order(
    PolynomialType poly_type) const;
  [[nodiscard]] std::vector<const Definition *> committed_polys_in_source_order() const;
  [[nodiscard]] std::vector<const Definition *> constant_polys_in_source_order() const;
  [[nodiscard]] std::vector<const Definition *> intermediate_polys_in_source_order() const;

  [[nodiscard]] const Definition * find_definition(std::string_view name) const;
  [[nodiscard]] const PublicDeclaration * find_public_declaration(std::string_view name) const;
  [[nodiscard]] std::optional<FieldElement> find_constant(std::string_view name) const;

  [[nodiscard]] IrContext & context() noexcept { return *context_; }

private:
  [[nodiscard]] size_t declaration_type_count(PolynomialType poly_type) const;

  std::unique_ptr<IrContext> context_;
};

}  // namespace pilc
