// pilc/witgen/symbolic_witness_evaluator.cpp - Column values for one row transition
#include "pilc/witgen/symbolic_witness_evaluator.hpp"

#include <fmt/format.h>

#include "pilc/ir/display.hpp"
#include "pilc/witgen/expression_evaluator.hpp"

namespace pilc
{

namespace
{

constexpr uint32_t k_max_intermediate_depth = 64;

}  // namespace

SymbolicWitnessEvaluator::SymbolicWitnessEvaluator(
  const FixedData & fixed_data, DegreeType row,
  gsl::span<const std::optional<FieldElement>> current,
  gsl::span<const std::optional<FieldElement>> next, EvaluationMode mode)
: fixed_data_(fixed_data), row_(row), current_(current), next_(next), mode_(mode)
{
}

std::optional<FieldElement> SymbolicWitnessEvaluator::constant(std::string_view name) const
{
  return fixed_data_.analyzed().find_constant(name);
}

AffineResult SymbolicWitnessEvaluator::evaluate(
  const Expression * expr, gsl::span<const FieldElement> locals) const
{
  return ExpressionEvaluator<SymbolicWitnessEvaluator>(*this, locals).evaluate(expr);
}

AffineResult SymbolicWitnessEvaluator::value(const PolynomialReference & ref) const
{
  const Definition * def = fixed_data_.analyzed().find_definition(ref.name);
  if (def == nullptr) {
    return IncompleteCause::make_expression_evaluation_unimplemented(
      fmt::format("unknown polynomial {}", ref.name));
  }
  switch (def->polynomial.poly_type) {
    case PolynomialType::Constant:
      return fixed_value(ref);
    case PolynomialType::Committed:
      return witness_value(ref);
    case PolynomialType::Intermediate:
      return intermediate_value(ref, *def);
  }
  return IncompleteCause::make<IncompleteCauseKind::SolvingFailed>();
}

AffineResult SymbolicWitnessEvaluator::fixed_value(const PolynomialReference & ref) const
{
  const DegreeType degree = fixed_data_.degree();
  DegreeType row = row_;
  if (mode_ == EvaluationMode::Next && !ref.next) {
    row = (row_ + degree - 1) % degree;
  } else if (mode_ == EvaluationMode::Row && ref.next) {
    row = (row_ + 1) % degree;
  }
  const auto value = fixed_data_.fixed_value(ref.name, row);
  if (!value) {
    return IncompleteCause::make_expression_evaluation_unimplemented(
      fmt::format("fixed column {} has no values", ref.name));
  }
  return AffineExpression::from_constant(*value);
}

AffineResult SymbolicWitnessEvaluator::witness_value(const PolynomialReference & ref) const
{
  const auto id = fixed_data_.witness_id(ref);
  if (!id || *id >= next_.size()) {
    return IncompleteCause::make_expression_evaluation_unimplemented(format_expression(&ref));
  }

  if (mode_ == EvaluationMode::Row && ref.next) {
    return IncompleteCause::make_expression_evaluation_unimplemented(
      fmt::format("next-row reference {} in a row evaluation", format_expression(&ref)));
  }

  const bool solved_row = ref.next || mode_ == EvaluationMode::Row;
  if (solved_row) {
    if (const auto & known = next_[*id]) {
      return AffineExpression::from_constant(*known);
    }
    return AffineExpression::from_variable(*id);
  }

  if (*id < current_.size() && current_[*id]) {
    return AffineExpression::from_constant(*current_[*id]);
  }
  return IncompleteCause::make_previous_value_unknown(fixed_data_.witness_column(*id).name);
}

AffineResult SymbolicWitnessEvaluator::intermediate_value(
  const PolynomialReference & ref, const Definition & def) const
{
  if (!def.function || def.function->expression() == nullptr) {
    return IncompleteCause::make_expression_evaluation_unimplemented(
      fmt::format("intermediate polynomial {} has no definition", ref.name));
  }
  if (depth_ >= k_max_intermediate_depth) {
    return IncompleteCause::make_expression_evaluation_unimplemented(
      fmt::format("intermediate polynomial {} is nested too deeply", ref.name));
  }

  SymbolicWitnessEvaluator inner = *this;
  inner.depth_ = depth_ + 1;
  if (ref.next) {
    if (mode_ == EvaluationMode::Row) {
      return IncompleteCause::make_expression_evaluation_unimplemented(
        fmt::format("next-row reference {}' in a row evaluation", ref.name));
    }
    // The definition is evaluated one row further down
    inner.mode_ = EvaluationMode::Row;
  }
  return inner.evaluate(def.function->expression());
}

std::string SymbolicWitnessEvaluator::format(const AffineExpression & expr) const
{
  return expr.format([this](size_t id) {
    if (id < fixed_data_.witness_count()) {
      return fixed_data_.witness_column(id).name;
    }
    return fmt::format("v{}", id);
  });
}

}  // namespace pilc
