// pilc/witgen/affine_expression.cpp - Affine expression arithmetic and solving
#include "pilc/witgen/affine_expression.hpp"

#include <fmt/format.h>

#include <utility>

namespace pilc
{

AffineExpression AffineExpression::from_constant(FieldElement value)
{
  AffineExpression e;
  e.offset_ = value;
  return e;
}

AffineExpression AffineExpression::from_variable(size_t id)
{
  AffineExpression e;
  e.coefficients_.emplace(id, FieldElement::one());
  return e;
}

std::optional<FieldElement> AffineExpression::constant_value() const
{
  if (!is_constant()) {
    return std::nullopt;
  }
  return offset_;
}

std::vector<size_t> AffineExpression::variables() const
{
  std::vector<size_t> ids;
  ids.reserve(coefficients_.size());
  for (const auto & [id, coeff] : coefficients_) {
    ids.push_back(id);
  }
  return ids;
}

// ============================================================================
// Arithmetic
// ============================================================================

AffineExpression operator+(AffineExpression a, const AffineExpression & b)
{
  for (const auto & [id, coeff] : b.coefficients_) {
    FieldElement & slot = a.coefficients_[id];
    slot += coeff;
    if (slot.is_zero()) {
      a.coefficients_.erase(id);
    }
  }
  a.offset_ += b.offset_;
  return a;
}

AffineExpression operator-(AffineExpression a) { return std::move(a) * -FieldElement::one(); }

AffineExpression operator-(AffineExpression a, const AffineExpression & b)
{
  return std::move(a) + -AffineExpression(b);
}

AffineExpression operator*(AffineExpression a, FieldElement factor)
{
  if (factor.is_zero()) {
    return AffineExpression{};
  }
  for (auto & [id, coeff] : a.coefficients_) {
    coeff *= factor;
  }
  a.offset_ *= factor;
  return a;
}

// ============================================================================
// Solving
// ============================================================================

EvalResult AffineExpression::solve() const
{
  switch (coefficients_.size()) {
    case 0:
      if (offset_.is_zero()) {
        return EvalValue::complete();
      }
      return EvalError::make_constraint_unsatisfiable(fmt::format("{} != 0", to_string()));
    case 1: {
      const auto & [id, coeff] = *coefficients_.begin();
      const FieldElement value = -offset_ / coeff;
      return EvalValue::complete({{id, Constraint::make_assignment(value)}});
    }
    default:
      return EvalValue::incomplete(
        IncompleteCause::make<IncompleteCauseKind::MultipleLinearSolutions>());
  }
}

std::optional<std::pair<size_t, Constraint>> AffineExpression::transfer_constraints(
  const KnownConstraints & known) const
{
  if (!offset_.is_zero()) {
    return std::nullopt;
  }

  std::optional<size_t> target;
  for (const auto & [id, constraint] : known) {
    if (constraint) {
      continue;
    }
    if (target) {
      return std::nullopt;
    }
    target = id;
  }
  if (!target || known.size() < 2) {
    return std::nullopt;
  }

  // target = sum(-c_i / c_target * v_i)
  const FieldElement target_coeff = coefficients_.at(*target);
  auto combined = BitConstraint::from_mask(0);
  for (const auto & [id, constraint] : known) {
    if (id == *target) {
      continue;
    }
    const auto shifted = constraint->multiple(-coefficients_.at(id) / target_coeff);
    if (!shifted || !shifted->disjoint(combined)) {
      return std::nullopt;
    }
    combined = combined.disjunction(*shifted);
  }
  return std::make_pair(*target, Constraint::make_bit_constraint(combined));
}

EvalResult AffineExpression::solve_through_constraints(const KnownConstraints & known) const
{
  std::vector<size_t> unconstrained;
  for (const auto & [id, constraint] : known) {
    if (!constraint) {
      unconstrained.push_back(id);
    }
  }
  if (!unconstrained.empty()) {
    return EvalValue::incomplete(IncompleteCause::make_bit_unconstrained(std::move(unconstrained)));
  }

  struct Part
  {
    size_t id;
    uint32_t shift;
    uint64_t mask;
  };
  std::vector<Part> parts;
  parts.reserve(known.size());
  uint64_t covered = 0;
  for (const auto & [id, constraint] : known) {
    const FieldElement coeff = coefficients_.at(id);
    const auto shifted = constraint->multiple(coeff);
    if (!shifted) {
      return EvalValue::incomplete(IncompleteCause::make<IncompleteCauseKind::SolvingFailed>());
    }
    if ((shifted->mask() & covered) != 0) {
      return EvalValue::incomplete(
        IncompleteCause::make<IncompleteCauseKind::OverlappingBitConstraints>());
    }
    covered |= shifted->mask();
    parts.push_back(Part{id, *coeff.exact_log2(), shifted->mask()});
  }

  const uint64_t value = (-offset_).to_canonical();
  if ((value & ~covered) != 0) {
    return EvalError::make_conflicting_bit_constraints();
  }

  Constraints assignments;
  assignments.reserve(parts.size());
  for (const Part & part : parts) {
    assignments.emplace_back(
      part.id, Constraint::make_assignment(FieldElement((value & part.mask) >> part.shift)));
  }
  return EvalValue::complete(std::move(assignments));
}

// ============================================================================
// Rendering
// ============================================================================

std::string AffineExpression::format(const std::function<std::string(size_t)> & name_of) const
{
  std::vector<std::string> terms;
  for (const auto & [id, coeff] : coefficients_) {
    if (coeff.is_one()) {
      terms.push_back(name_of(id));
    } else if ((-coeff).is_one()) {
      terms.push_back(fmt::format("-{}", name_of(id)));
    } else {
      terms.push_back(fmt::format("{} * {}", coeff.to_string(), name_of(id)));
    }
  }
  if (!offset_.is_zero() || terms.empty()) {
    terms.push_back(offset_.to_string());
  }
  return fmt::format("{}", fmt::join(terms, " + "));
}

std::string AffineExpression::to_string() const
{
  return format([](size_t id) { return fmt::format("v{}", id); });
}

}  // namespace pilc
