// pilc/witgen/eval_result.hpp - Outcome of evaluating an identity or query
//
// Constraint:      what was learned about one cell
// IncompleteCause: why an evaluation could not finish (retry later)
// EvalStatus:      Complete | Incomplete(cause)
// EvalValue:       learned constraints + status
// EvalError:       hard failure of one evaluation attempt
//
#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

#include "pilc/basic/result.hpp"
#include "pilc/number/number.hpp"
#include "pilc/witgen/bit_constraints.hpp"

namespace pilc
{

// ============================================================================
// Constraint
// ============================================================================

enum class ConstraintKind : uint8_t {
  Assignment,     ///< value pinned
  BitConstraint,  ///< bits narrowed, value not pinned
};

class Constraint
{
public:
  static Constraint make_assignment(FieldElement value)
  {
    Constraint c;
    c.kind_ = ConstraintKind::Assignment;
    c.value_ = value;
    return c;
  }

  static Constraint make_bit_constraint(BitConstraint constraint)
  {
    Constraint c;
    c.kind_ = ConstraintKind::BitConstraint;
    c.bit_constraint_ = constraint;
    return c;
  }

  [[nodiscard]] ConstraintKind kind() const noexcept { return kind_; }
  [[nodiscard]] bool is_assignment() const noexcept { return kind_ == ConstraintKind::Assignment; }

  /// Only valid if is_assignment()
  [[nodiscard]] FieldElement value() const noexcept { return value_; }

  /// Only valid for bit constraints
  [[nodiscard]] BitConstraint bit_constraint() const noexcept { return bit_constraint_; }

  /// " = 5" or ":& 0xff"
  [[nodiscard]] std::string to_string() const;

  friend bool operator==(const Constraint & a, const Constraint & b) noexcept;
  friend bool operator!=(const Constraint & a, const Constraint & b) noexcept
  {
    return !(a == b);
  }

private:
  Constraint() = default;

  ConstraintKind kind_ = ConstraintKind::Assignment;
  FieldElement value_;
  BitConstraint bit_constraint_ = BitConstraint::from_mask(0);
};

/// (cell id, constraint) in the order they were learned
using Constraints = std::vector<std::pair<size_t, Constraint>>;

// ============================================================================
// IncompleteCause
// ============================================================================

enum class IncompleteCauseKind : uint8_t {
  PreviousValueUnknown,              ///< column name
  BitUnconstrained,                  ///< cell ids
  OverlappingBitConstraints,
  MultipleLookupMatches,
  MultipleLinearSolutions,
  NoProgressTransferring,
  QuadraticTerm,
  DivisionTerm,
  ExponentiationTerm,
  NoQueryAnswer,                     ///< query rendering, column name
  NonConstantQueryMatchScrutinee,
  NonConstantLeftSelector,
  NonConstantWriteValue,
  ExpressionEvaluationUnimplemented,  ///< detail
  NoMatchArmFound,
  SolvingFailed,
  NotConcrete,
  Multiple,                          ///< never nested
};

class IncompleteCause
{
public:
  // ===========================================================================
  // Factory Methods
  // ===========================================================================

  static IncompleteCause make_previous_value_unknown(std::string column)
  {
    IncompleteCause c(IncompleteCauseKind::PreviousValueUnknown);
    c.text_ = std::move(column);
    return c;
  }

  static IncompleteCause make_bit_unconstrained(std::vector<size_t> ids)
  {
    IncompleteCause c(IncompleteCauseKind::BitUnconstrained);
    c.ids_ = std::move(ids);
    return c;
  }

  static IncompleteCause make_no_query_answer(std::string query, std::string column)
  {
    IncompleteCause c(IncompleteCauseKind::NoQueryAnswer);
    c.text_ = std::move(query);
    c.column_ = std::move(column);
    return c;
  }

  static IncompleteCause make_expression_evaluation_unimplemented(std::string detail)
  {
    IncompleteCause c(IncompleteCauseKind::ExpressionEvaluationUnimplemented);
    c.text_ = std::move(detail);
    return c;
  }

  /// Causes without payload
  template <IncompleteCauseKind Kind>
  static IncompleteCause make()
  {
    static_assert(!carries_payload(Kind), "use the factory of this cause kind");
    return IncompleteCause(Kind);
  }

  /// Kinds built by their own factory or by combine()
  static constexpr bool carries_payload(IncompleteCauseKind kind) noexcept
  {
    switch (kind) {
      case IncompleteCauseKind::PreviousValueUnknown:
      case IncompleteCauseKind::BitUnconstrained:
      case IncompleteCauseKind::NoQueryAnswer:
      case IncompleteCauseKind::ExpressionEvaluationUnimplemented:
      case IncompleteCauseKind::Multiple:
        return true;
      default:
        return false;
    }
  }

  /// Flattens nested Multiple causes
  static IncompleteCause make_multiple(std::vector<IncompleteCause> causes);

  // ===========================================================================
  // Accessors
  // ===========================================================================

  [[nodiscard]] IncompleteCauseKind kind() const noexcept { return kind_; }
  [[nodiscard]] bool is_multiple() const noexcept { return kind_ == IncompleteCauseKind::Multiple; }

  /// Column, query or detail text, depending on kind
  [[nodiscard]] const std::string & text() const noexcept { return text_; }
  /// Column of NoQueryAnswer
  [[nodiscard]] const std::string & column() const noexcept { return column_; }
  /// Cells of BitUnconstrained
  [[nodiscard]] const std::vector<size_t> & ids() const noexcept { return ids_; }
  /// Elements of Multiple
  [[nodiscard]] const std::vector<IncompleteCause> & causes() const noexcept { return causes_; }

  /// Always a flat Multiple of the leaves of both sides, in order
  [[nodiscard]] IncompleteCause combine(const IncompleteCause & other) const;

  [[nodiscard]] std::string to_string() const;

  friend bool operator==(const IncompleteCause & a, const IncompleteCause & b);
  friend bool operator!=(const IncompleteCause & a, const IncompleteCause & b)
  {
    return !(a == b);
  }

private:
  explicit IncompleteCause(IncompleteCauseKind kind) : kind_(kind) {}

  void append_leaves_to(std::vector<IncompleteCause> & out) const;

  IncompleteCauseKind kind_;
  std::string text_;
  std::string column_;
  std::vector<size_t> ids_;
  std::vector<IncompleteCause> causes_;
};

// ============================================================================
// EvalStatus / EvalValue
// ============================================================================

class EvalStatus
{
public:
  static EvalStatus make_complete() { return EvalStatus(); }
  static EvalStatus make_incomplete(IncompleteCause cause)
  {
    EvalStatus s;
    s.causes_.push_back(std::move(cause));
    return s;
  }

  [[nodiscard]] bool is_complete() const noexcept { return causes_.empty(); }

  /// Only valid if !is_complete()
  [[nodiscard]] const IncompleteCause & cause() const { return causes_.front(); }

  [[nodiscard]] EvalStatus combine(const EvalStatus & other) const;

  [[nodiscard]] std::string to_string() const;

  friend bool operator==(const EvalStatus & a, const EvalStatus & b)
  {
    return a.causes_ == b.causes_;
  }
  friend bool operator!=(const EvalStatus & a, const EvalStatus & b) { return !(a == b); }

private:
  EvalStatus() = default;

  // Empty when complete, otherwise exactly one cause
  std::vector<IncompleteCause> causes_;
};

struct EvalValue
{
  Constraints constraints;
  EvalStatus status = EvalStatus::make_complete();

  static EvalValue complete(Constraints constraints = {})
  {
    return {std::move(constraints), EvalStatus::make_complete()};
  }

  static EvalValue incomplete(IncompleteCause cause)
  {
    return {{}, EvalStatus::make_incomplete(std::move(cause))};
  }

  static EvalValue incomplete_with_constraints(Constraints constraints, IncompleteCause cause)
  {
    return {std::move(constraints), EvalStatus::make_incomplete(std::move(cause))};
  }

  [[nodiscard]] bool is_complete() const noexcept { return status.is_complete(); }
  /// Nothing was learned
  [[nodiscard]] bool is_empty() const noexcept { return constraints.empty(); }

  /// Appends `other`'s constraints and combines the statuses
  void combine(EvalValue other);

  friend bool operator==(const EvalValue & a, const EvalValue & b)
  {
    return a.constraints == b.constraints && a.status == b.status;
  }
};

// ============================================================================
// EvalError
// ============================================================================

enum class EvalErrorKind : uint8_t {
  RowsExhausted,
  ConstraintUnsatisfiable,  ///< detail
  ConflictingBitConstraints,
  FixedLookupFailed,
  Generic,  ///< message
  Multiple,
};

class EvalError
{
public:
  static EvalError make_rows_exhausted() { return EvalError(EvalErrorKind::RowsExhausted); }

  static EvalError make_constraint_unsatisfiable(std::string detail)
  {
    EvalError e(EvalErrorKind::ConstraintUnsatisfiable);
    e.message_ = std::move(detail);
    return e;
  }

  static EvalError make_conflicting_bit_constraints()
  {
    return EvalError(EvalErrorKind::ConflictingBitConstraints);
  }

  static EvalError make_fixed_lookup_failed()
  {
    return EvalError(EvalErrorKind::FixedLookupFailed);
  }

  static EvalError make_generic(std::string message)
  {
    EvalError e(EvalErrorKind::Generic);
    e.message_ = std::move(message);
    return e;
  }

  /// Flattens nested Multiple errors
  static EvalError make_multiple(std::vector<EvalError> errors);

  [[nodiscard]] EvalErrorKind kind() const noexcept { return kind_; }
  [[nodiscard]] const std::string & message() const noexcept { return message_; }
  [[nodiscard]] const std::vector<EvalError> & errors() const noexcept { return errors_; }

  /// Always a flat Multiple of the leaves of both sides, in order
  [[nodiscard]] EvalError combine(const EvalError & other) const;

  /// The program cannot be solved at all; stop solving
  [[nodiscard]] bool is_fatal() const;

  /// Multiple: one message per line
  [[nodiscard]] std::string to_string() const;

  friend bool operator==(const EvalError & a, const EvalError & b);
  friend bool operator!=(const EvalError & a, const EvalError & b) { return !(a == b); }

private:
  explicit EvalError(EvalErrorKind kind) : kind_(kind) {}

  void append_leaves_to(std::vector<EvalError> & out) const;

  EvalErrorKind kind_;
  std::string message_;
  std::vector<EvalError> errors_;
};

using EvalResult = Result<EvalValue, EvalError>;

}  // namespace pilc
