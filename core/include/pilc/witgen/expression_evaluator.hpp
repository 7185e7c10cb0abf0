// pilc/witgen/expression_evaluator.hpp - Analyzed expression to affine expression
#pragma once

#include <fmt/format.h>

#include <gsl/span>
#include <optional>
#include <string_view>

#include "pilc/basic/casting.hpp"
#include "pilc/ir/analyzed.hpp"
#include "pilc/ir/display.hpp"
#include "pilc/witgen/affine_expression.hpp"
#include "pilc/witgen/eval_result.hpp"

namespace pilc
{

/**
 * Evaluates an expression into an AffineExpression over unknown cells.
 *
 * SymbolicVariables resolves everything that depends on the row:
 * @code
 *   AffineResult value(const PolynomialReference & ref) const;
 *   std::optional<FieldElement> constant(std::string_view name) const;
 * @endcode
 *
 * Products of two non-constant factors, non-constant divisions and
 * exponentiations are not affine and yield the matching IncompleteCause.
 * A product with a constant zero factor is zero even if the other factor
 * cannot be evaluated.
 */
template <typename SymbolicVariables>
class ExpressionEvaluator
{
public:
  explicit ExpressionEvaluator(
    const SymbolicVariables & variables, gsl::span<const FieldElement> locals = {})
  : variables_(variables), locals_(locals)
  {
  }

  [[nodiscard]] AffineResult evaluate(const Expression * expr) const
  {
    switch (expr->get_kind()) {
      case ExpressionKind::Number:
        return AffineExpression::from_constant(cast<Number>(expr)->value);

      case ExpressionKind::ConstantReference: {
        const auto name = cast<ConstantReference>(expr)->name;
        if (const auto value = variables_.constant(name)) {
          return AffineExpression::from_constant(*value);
        }
        return IncompleteCause::make_expression_evaluation_unimplemented(
          fmt::format("unknown constant %{}", name));
      }

      case ExpressionKind::PolynomialReference:
        return variables_.value(*cast<PolynomialReference>(expr));

      case ExpressionKind::LocalVariableReference: {
        const auto index = cast<LocalVariableReference>(expr)->index;
        if (index >= locals_.size()) {
          return IncompleteCause::make_expression_evaluation_unimplemented(
            fmt::format("local variable ${} is not bound", index));
        }
        return AffineExpression::from_constant(locals_[index]);
      }

      case ExpressionKind::BinaryOperation:
        return evaluate_binary(cast<BinaryOperation>(expr));

      case ExpressionKind::UnaryOperation: {
        const auto * un = cast<UnaryOperation>(expr);
        auto operand = evaluate(un->operand);
        if (!operand || un->op == UnaryOperator::Plus) {
          return operand;
        }
        return -std::move(operand).value();
      }

      case ExpressionKind::MatchExpression:
        return evaluate_match(cast<MatchExpression>(expr));

      case ExpressionKind::PublicReference:
      case ExpressionKind::StringLiteral:
      case ExpressionKind::Tuple:
      case ExpressionKind::FunctionCall:
        break;
    }
    return IncompleteCause::make_expression_evaluation_unimplemented(format_expression(expr));
  }

private:
  [[nodiscard]] AffineResult evaluate_binary(const BinaryOperation * bin) const
  {
    auto left = evaluate(bin->left);
    auto right = evaluate(bin->right);

    if (bin->op == BinaryOperator::Mul && (is_zero(left) || is_zero(right))) {
      return AffineExpression{};
    }
    if (!left && !right) {
      return left.error().combine(right.error());
    }
    if (!left) {
      return left;
    }
    if (!right) {
      return right;
    }

    const auto lc = left->constant_value();
    const auto rc = right->constant_value();
    switch (bin->op) {
      case BinaryOperator::Add:
        return std::move(left).value() + right.value();
      case BinaryOperator::Sub:
        return std::move(left).value() - right.value();
      case BinaryOperator::Mul:
        if (lc) {
          return std::move(right).value() * *lc;
        }
        if (rc) {
          return std::move(left).value() * *rc;
        }
        return IncompleteCause::make<IncompleteCauseKind::QuadraticTerm>();
      case BinaryOperator::Div:
        if (!lc || !rc) {
          return IncompleteCause::make<IncompleteCauseKind::DivisionTerm>();
        }
        if (rc->is_zero()) {
          return IncompleteCause::make_expression_evaluation_unimplemented(
            fmt::format("division by zero in {}", format_expression(bin)));
        }
        return AffineExpression::from_constant(*lc / *rc);
      case BinaryOperator::Pow:
        if (!lc || !rc) {
          return IncompleteCause::make<IncompleteCauseKind::ExponentiationTerm>();
        }
        return AffineExpression::from_constant(lc->pow(rc->to_canonical()));
      case BinaryOperator::Mod:
      case BinaryOperator::BinaryAnd:
      case BinaryOperator::BinaryXor:
      case BinaryOperator::BinaryOr:
      case BinaryOperator::ShiftLeft:
      case BinaryOperator::ShiftRight:
        break;
    }

    if (!lc || !rc || (bin->op == BinaryOperator::Mod && rc->is_zero())) {
      return IncompleteCause::make_expression_evaluation_unimplemented(format_expression(bin));
    }
    return AffineExpression::from_constant(integer_operation(bin->op, *lc, *rc));
  }

  [[nodiscard]] AffineResult evaluate_match(const MatchExpression * match) const
  {
    auto scrutinee = evaluate(match->scrutinee);
    if (!scrutinee) {
      return scrutinee;
    }
    const auto value = scrutinee->constant_value();
    if (!value) {
      return IncompleteCause::make<IncompleteCauseKind::NonConstantQueryMatchScrutinee>();
    }
    for (const auto & arm : match->arms) {
      if (!arm.pattern || *arm.pattern == *value) {
        return evaluate(arm.value);
      }
    }
    return IncompleteCause::make<IncompleteCauseKind::NoMatchArmFound>();
  }

  static bool is_zero(const AffineResult & result)
  {
    if (!result) {
      return false;
    }
    const auto value = result->constant_value();
    return value && value->is_zero();
  }

  /// Operators on the canonical integer representation
  static FieldElement integer_operation(BinaryOperator op, FieldElement lhs, FieldElement rhs)
  {
    const uint64_t l = lhs.to_canonical();
    const uint64_t r = rhs.to_canonical();
    switch (op) {
      case BinaryOperator::Mod:
        return FieldElement(l % r);
      case BinaryOperator::BinaryAnd:
        return FieldElement(l & r);
      case BinaryOperator::BinaryXor:
        return FieldElement(l ^ r);
      case BinaryOperator::BinaryOr:
        return FieldElement(l | r);
      case BinaryOperator::ShiftLeft:
        // reduced in the field, not modulo 2^64
        return lhs * FieldElement(2).pow(r);
      case BinaryOperator::ShiftRight:
        return FieldElement(r >= 64 ? 0 : l >> r);
      default:
        break;
    }
    return FieldElement::zero();
  }

  const SymbolicVariables & variables_;
  gsl::span<const FieldElement> locals_;
};

}  // namespace pilc
