// pilc/witgen/eval_result.cpp - Evaluation result combination and rendering
#include "pilc/witgen/eval_result.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <iterator>

namespace pilc
{

// ============================================================================
// Constraint
// ============================================================================

std::string Constraint::to_string() const
{
  switch (kind_) {
    case ConstraintKind::Assignment:
      return fmt::format(" = {}", value_.to_string());
    case ConstraintKind::BitConstraint:
      return fmt::format(":& {}", bit_constraint_.to_string());
  }
  return {};
}

bool operator==(const Constraint & a, const Constraint & b) noexcept
{
  if (a.kind_ != b.kind_) {
    return false;
  }
  return a.kind_ == ConstraintKind::Assignment ? a.value_ == b.value_
                                               : a.bit_constraint_ == b.bit_constraint_;
}

// ============================================================================
// IncompleteCause
// ============================================================================

IncompleteCause IncompleteCause::make_multiple(std::vector<IncompleteCause> causes)
{
  IncompleteCause result(IncompleteCauseKind::Multiple);
  for (const auto & c : causes) {
    c.append_leaves_to(result.causes_);
  }
  return result;
}

void IncompleteCause::append_leaves_to(std::vector<IncompleteCause> & out) const
{
  if (kind_ != IncompleteCauseKind::Multiple) {
    out.push_back(*this);
    return;
  }
  for (const auto & c : causes_) {
    c.append_leaves_to(out);
  }
}

IncompleteCause IncompleteCause::combine(const IncompleteCause & other) const
{
  IncompleteCause result(IncompleteCauseKind::Multiple);
  append_leaves_to(result.causes_);
  other.append_leaves_to(result.causes_);
  return result;
}

std::string IncompleteCause::to_string() const
{
  switch (kind_) {
    case IncompleteCauseKind::PreviousValueUnknown:
      return fmt::format("Previous value of column {} is not yet known", text_);
    case IncompleteCauseKind::BitUnconstrained:
      return fmt::format(
        "Cells [{}] are not bit-constrained", fmt::join(ids_.begin(), ids_.end(), ", "));
    case IncompleteCauseKind::OverlappingBitConstraints:
      return "Bit constraints of the variables overlap";
    case IncompleteCauseKind::MultipleLookupMatches:
      return "More than one row matches the lookup";
    case IncompleteCauseKind::MultipleLinearSolutions:
      return "Linear constraint has more than one unknown";
    case IncompleteCauseKind::NoProgressTransferring:
      return "No progress transferring constraints";
    case IncompleteCauseKind::QuadraticTerm:
      return "Expression contains a quadratic term";
    case IncompleteCauseKind::DivisionTerm:
      return "Expression contains a division by a non-constant";
    case IncompleteCauseKind::ExponentiationTerm:
      return "Expression contains a non-constant exponentiation";
    case IncompleteCauseKind::NoQueryAnswer:
      return fmt::format("No answer to query {} for column {}", text_, column_);
    case IncompleteCauseKind::NonConstantQueryMatchScrutinee:
      return "Match scrutinee is not constant";
    case IncompleteCauseKind::NonConstantLeftSelector:
      return "Left selector is not constant";
    case IncompleteCauseKind::NonConstantWriteValue:
      return "Value to write is not constant";
    case IncompleteCauseKind::ExpressionEvaluationUnimplemented:
      return fmt::format("Cannot evaluate: {}", text_);
    case IncompleteCauseKind::NoMatchArmFound:
      return "No match arm matches the scrutinee";
    case IncompleteCauseKind::SolvingFailed:
      return "Solving failed";
    case IncompleteCauseKind::NotConcrete:
      return "Constraints learned, but no concrete value";
    case IncompleteCauseKind::Multiple: {
      std::vector<std::string> parts;
      parts.reserve(causes_.size());
      std::transform(
        causes_.begin(), causes_.end(), std::back_inserter(parts),
        [](const IncompleteCause & c) { return c.to_string(); });
      return fmt::format("{}", fmt::join(parts, "; "));
    }
  }
  return {};
}

bool operator==(const IncompleteCause & a, const IncompleteCause & b)
{
  return a.kind_ == b.kind_ && a.text_ == b.text_ && a.column_ == b.column_ &&
         a.ids_ == b.ids_ && a.causes_ == b.causes_;
}

// ============================================================================
// EvalStatus / EvalValue
// ============================================================================

EvalStatus EvalStatus::combine(const EvalStatus & other) const
{
  if (is_complete()) {
    return other;
  }
  if (other.is_complete()) {
    return *this;
  }
  return make_incomplete(cause().combine(other.cause()));
}

std::string EvalStatus::to_string() const
{
  return is_complete() ? "Complete" : fmt::format("Incomplete: {}", cause().to_string());
}

void EvalValue::combine(EvalValue other)
{
  constraints.insert(
    constraints.end(), std::make_move_iterator(other.constraints.begin()),
    std::make_move_iterator(other.constraints.end()));
  status = status.combine(other.status);
}

// ============================================================================
// EvalError
// ============================================================================

EvalError EvalError::make_multiple(std::vector<EvalError> errors)
{
  EvalError result(EvalErrorKind::Multiple);
  for (const auto & e : errors) {
    e.append_leaves_to(result.errors_);
  }
  return result;
}

void EvalError::append_leaves_to(std::vector<EvalError> & out) const
{
  if (kind_ != EvalErrorKind::Multiple) {
    out.push_back(*this);
    return;
  }
  for (const auto & e : errors_) {
    e.append_leaves_to(out);
  }
}

EvalError EvalError::combine(const EvalError & other) const
{
  EvalError result(EvalErrorKind::Multiple);
  append_leaves_to(result.errors_);
  other.append_leaves_to(result.errors_);
  return result;
}

bool EvalError::is_fatal() const
{
  switch (kind_) {
    case EvalErrorKind::RowsExhausted:
    case EvalErrorKind::ConstraintUnsatisfiable:
    case EvalErrorKind::ConflictingBitConstraints:
      return true;
    case EvalErrorKind::FixedLookupFailed:
    case EvalErrorKind::Generic:
      return false;
    case EvalErrorKind::Multiple:
      return std::any_of(
        errors_.begin(), errors_.end(), [](const EvalError & e) { return e.is_fatal(); });
  }
  return false;
}

std::string EvalError::to_string() const
{
  switch (kind_) {
    case EvalErrorKind::RowsExhausted:
      return "Table rows exhausted";
    case EvalErrorKind::ConstraintUnsatisfiable:
      return fmt::format("Linear constraint is not satisfiable: {}", message_);
    case EvalErrorKind::ConflictingBitConstraints:
      return "Bit constraints in the expression are conflicting or do not match the constant / "
             "offset.";
    case EvalErrorKind::FixedLookupFailed:
      return "Lookup into fixed columns failed: no match";
    case EvalErrorKind::Generic:
      return message_;
    case EvalErrorKind::Multiple: {
      std::vector<std::string> lines;
      lines.reserve(errors_.size());
      std::transform(
        errors_.begin(), errors_.end(), std::back_inserter(lines),
        [](const EvalError & e) { return e.to_string(); });
      return fmt::format("{}", fmt::join(lines, "\n"));
    }
  }
  return {};
}

bool operator==(const EvalError & a, const EvalError & b)
{
  return a.kind_ == b.kind_ && a.message_ == b.message_ && a.errors_ == b.errors_;
}

}  // namespace pilc
