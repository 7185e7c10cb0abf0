// pilc/witgen/identity_processor.cpp - Evaluation of one identity on one row
#include "pilc/witgen/identity_processor.hpp"

#include <fmt/format.h>

#include <optional>
#include <string_view>
#include <utility>
#include <vector>

#include "pilc/basic/casting.hpp"
#include "pilc/ir/display.hpp"

namespace pilc
{

namespace
{

/// Merges `result` into the running value or error
void accumulate(EvalValue & value, std::optional<EvalError> & error, EvalResult result)
{
  if (result) {
    value.combine(std::move(result).value());
    return;
  }
  error = error ? error->combine(result.error()) : std::move(result).error();
}

/// Name of a plain current-row reference to a fixed column
std::optional<std::string_view> fixed_column_name(
  const Expression * expr, const FixedData & fixed_data)
{
  const auto * ref = dyn_cast<PolynomialReference>(expr);
  if (ref == nullptr || ref->next || ref->index || fixed_data.fixed_column(ref->name) == nullptr) {
    return std::nullopt;
  }
  return ref->name;
}

}  // namespace

EvalResult IdentityProcessor::process(
  const Identity & identity, const SymbolicWitnessEvaluator & witness,
  const BitConstraintMap & constraints)
{
  switch (identity.kind) {
    case IdentityKind::Polynomial:
      return process_polynomial(identity, witness, constraints);
    case IdentityKind::Plookup:
    case IdentityKind::Permutation:
      return process_lookup(identity, witness);
    case IdentityKind::Connect:
      return process_connect(identity, witness);
  }
  return EvalError::make_generic("Unknown identity kind");
}

EvalResult IdentityProcessor::process_polynomial(
  const Identity & identity, const SymbolicWitnessEvaluator & witness,
  const BitConstraintMap & constraints) const
{
  auto evaluated = witness.evaluate(identity.expression());
  if (!evaluated) {
    return EvalValue::incomplete(std::move(evaluated).error());
  }
  return evaluated->solve_with_bit_constraints(constraints);
}

EvalResult IdentityProcessor::process_lookup(
  const Identity & identity, const SymbolicWitnessEvaluator & witness)
{
  if (identity.left.selector != nullptr) {
    auto selector = witness.evaluate(identity.left.selector);
    if (!selector) {
      return EvalValue::incomplete(std::move(selector).error());
    }
    const auto value = selector->constant_value();
    if (!value) {
      return EvalValue::incomplete(
        IncompleteCause::make<IncompleteCauseKind::NonConstantLeftSelector>());
    }
    if (value->is_zero()) {
      return EvalValue::complete();
    }
  }

  // Right side: fixed columns, optionally selected by a fixed column
  std::vector<std::string_view> columns;
  std::vector<FieldElement> values;
  if (identity.right.selector != nullptr) {
    const auto selector = fixed_column_name(identity.right.selector, fixed_data_);
    if (!selector) {
      return EvalValue::incomplete(IncompleteCause::make_expression_evaluation_unimplemented(
        fmt::format("lookup selector {}", format_expression(identity.right.selector))));
    }
    columns.push_back(*selector);
    values.push_back(FieldElement::one());
  }
  if (identity.left.expressions.size() != identity.right.expressions.size()) {
    return EvalError::make_generic(fmt::format(
      "Lookup identity with {} and {} expressions", identity.left.expressions.size(),
      identity.right.expressions.size()));
  }
  std::vector<std::string_view> right;
  right.reserve(identity.right.expressions.size());
  for (const Expression * e : identity.right.expressions) {
    const auto column = fixed_column_name(e, fixed_data_);
    if (!column) {
      return EvalValue::incomplete(IncompleteCause::make_expression_evaluation_unimplemented(
        fmt::format(
          "lookup into non-fixed columns {}", format_selected_expressions(identity.right))));
    }
    right.push_back(*column);
  }

  // Left side: known values become the key, the rest is solved afterwards
  std::optional<IncompleteCause> cause;
  std::vector<std::pair<std::string_view, AffineExpression>> unknown;
  for (size_t i = 0; i < right.size(); ++i) {
    auto evaluated = witness.evaluate(identity.left.expressions[i]);
    if (!evaluated) {
      cause = cause ? cause->combine(evaluated.error()) : std::move(evaluated).error();
      continue;
    }
    if (const auto value = evaluated->constant_value()) {
      columns.push_back(right[i]);
      values.push_back(*value);
    } else {
      unknown.emplace_back(right[i], std::move(evaluated).value());
    }
  }
  if (cause) {
    return EvalValue::incomplete(std::move(*cause));
  }

  auto found = lookup_.find(columns, values);
  if (!found) {
    return EvalError::make_generic(std::move(found).error());
  }
  switch (found->outcome) {
    case LookupOutcome::None:
      return EvalError::make_fixed_lookup_failed();
    case LookupOutcome::Multiple:
      if (unknown.empty()) {
        return EvalValue::complete();
      }
      return EvalValue::incomplete(
        IncompleteCause::make<IncompleteCauseKind::MultipleLookupMatches>());
    case LookupOutcome::Unique:
      break;
  }

  EvalValue result = EvalValue::complete();
  std::optional<EvalError> error;
  for (const auto & [column, expr] : unknown) {
    const auto value = fixed_data_.fixed_value(column, found->row);
    accumulate(result, error, (expr - AffineExpression::from_constant(*value)).solve());
  }
  if (error) {
    return std::move(*error);
  }
  return result;
}

EvalResult IdentityProcessor::process_connect(
  const Identity & identity, const SymbolicWitnessEvaluator & witness) const
{
  const auto & left = identity.left.expressions;
  const auto & right = identity.right.expressions;
  if (left.size() != right.size()) {
    return EvalError::make_generic(
      fmt::format("Connect identity with {} and {} expressions", left.size(), right.size()));
  }

  EvalValue result = EvalValue::complete();
  std::optional<EvalError> error;
  for (size_t i = 0; i < left.size(); ++i) {
    auto l = witness.evaluate(left[i]);
    auto r = witness.evaluate(right[i]);
    if (!l || !r) {
      IncompleteCause cause = !l && !r ? l.error().combine(r.error())
                              : !l     ? std::move(l).error()
                                       : std::move(r).error();
      result.combine(EvalValue::incomplete(std::move(cause)));
      continue;
    }
    accumulate(result, error, (std::move(l).value() - r.value()).solve());
  }
  if (error) {
    return std::move(*error);
  }
  return result;
}

}  // namespace pilc
