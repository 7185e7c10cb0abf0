// pilc/sema/const_evaluator.cpp - Constant expression evaluator
#include "pilc/sema/const_evaluator.hpp"

#include <fmt/core.h>

#include "pilc/ir/display.hpp"

namespace pilc
{

namespace
{

/// Shift amounts and exponents must fit a machine word
std::optional<unsigned long> small_operand(const AbstractNumber & n)
{
  if (n < 0 || !n.fits_ulong_p()) {
    return std::nullopt;
  }
  return n.get_ui();
}

}  // namespace

ConstantEvaluator::ConstantEvaluator(
  const std::unordered_map<std::string_view, FieldElement> & constants,
  FunctionResolver resolver)
: constants_(constants), resolver_(std::move(resolver))
{
}

ConstResult ConstantEvaluator::evaluate(
  const Expression * expr, gsl::span<const AbstractNumber> locals) const
{
  switch (expr->get_kind()) {
    case ExpressionKind::Number:
      return cast<Number>(expr)->value.to_abstract();

    case ExpressionKind::ConstantReference: {
      const auto * ref = cast<ConstantReference>(expr);
      const auto it = constants_.find(ref->name);
      if (it == constants_.end()) {
        return fmt::format("Constant %{} not found", ref->name);
      }
      return it->second.to_abstract();
    }

    case ExpressionKind::LocalVariableReference: {
      const auto index = cast<LocalVariableReference>(expr)->index;
      if (index >= locals.size()) {
        return fmt::format("Local variable ${} is not bound", index);
      }
      return locals[index];
    }

    case ExpressionKind::BinaryOperation:
      return eval_binary(cast<BinaryOperation>(expr), locals);

    case ExpressionKind::UnaryOperation: {
      const auto * un = cast<UnaryOperation>(expr);
      auto operand = evaluate(un->operand, locals);
      if (!operand || un->op == UnaryOperator::Plus) {
        return operand;
      }
      return AbstractNumber(-operand.value());
    }

    case ExpressionKind::FunctionCall:
      return eval_call(cast<FunctionCall>(expr), locals);

    case ExpressionKind::MatchExpression:
      return eval_match(cast<MatchExpression>(expr), locals);

    case ExpressionKind::PolynomialReference:
    case ExpressionKind::PublicReference:
    case ExpressionKind::StringLiteral:
    case ExpressionKind::Tuple:
      break;
  }
  return fmt::format("Expression is not constant: {}", format_expression(expr));
}

Result<DegreeType, std::string> ConstantEvaluator::evaluate_degree(const Expression * expr) const
{
  auto value = evaluate(expr);
  if (!value) {
    return std::move(value).error();
  }
  const auto degree = abstract_to_degree(value.value());
  if (!degree) {
    return fmt::format("Value {} is not a valid row count", value.value().get_str());
  }
  return *degree;
}

ConstResult ConstantEvaluator::eval_binary(
  const BinaryOperation * bin, gsl::span<const AbstractNumber> locals) const
{
  auto left_result = evaluate(bin->left, locals);
  if (!left_result) {
    return left_result;
  }
  auto right_result = evaluate(bin->right, locals);
  if (!right_result) {
    return right_result;
  }
  const AbstractNumber & l = left_result.value();
  const AbstractNumber & r = right_result.value();

  switch (bin->op) {
    case BinaryOperator::Add:
      return AbstractNumber(l + r);
    case BinaryOperator::Sub:
      return AbstractNumber(l - r);
    case BinaryOperator::Mul:
      return AbstractNumber(l * r);
    case BinaryOperator::Div:
      if (r == 0) {
        return fmt::format("Division by zero in {}", format_expression(bin));
      }
      return AbstractNumber(l / r);
    case BinaryOperator::Mod:
      if (r == 0) {
        return fmt::format("Division by zero in {}", format_expression(bin));
      }
      return AbstractNumber(l % r);
    case BinaryOperator::Pow: {
      const auto exponent = small_operand(r);
      if (!exponent) {
        return fmt::format("Invalid exponent in {}", format_expression(bin));
      }
      AbstractNumber result;
      mpz_pow_ui(result.get_mpz_t(), l.get_mpz_t(), *exponent);
      return result;
    }
    case BinaryOperator::BinaryAnd:
      return AbstractNumber(l & r);
    case BinaryOperator::BinaryXor:
      return AbstractNumber(l ^ r);
    case BinaryOperator::BinaryOr:
      return AbstractNumber(l | r);
    case BinaryOperator::ShiftLeft:
    case BinaryOperator::ShiftRight: {
      const auto amount = small_operand(r);
      if (!amount) {
        return fmt::format("Invalid shift amount in {}", format_expression(bin));
      }
      if (bin->op == BinaryOperator::ShiftLeft) {
        return AbstractNumber(l << *amount);
      }
      return AbstractNumber(l >> *amount);
    }
  }
  return fmt::format("Unsupported operator in {}", format_expression(bin));
}

ConstResult ConstantEvaluator::eval_call(
  const FunctionCall * call, gsl::span<const AbstractNumber> locals) const
{
  if (call->arguments.size() != 1) {
    return fmt::format(
      "Function {} expects exactly one argument, got {}", call->name, call->arguments.size());
  }
  if (!resolver_) {
    return fmt::format("Function {} cannot be evaluated here", call->name);
  }
  auto argument = evaluate(call->arguments[0], locals);
  if (!argument) {
    return argument;
  }
  return resolver_(call->name, argument.value());
}

ConstResult ConstantEvaluator::eval_match(
  const MatchExpression * match, gsl::span<const AbstractNumber> locals) const
{
  auto scrutinee = evaluate(match->scrutinee, locals);
  if (!scrutinee) {
    return scrutinee;
  }
  const FieldElement key = FieldElement::from_abstract(scrutinee.value());
  for (const auto & arm : match->arms) {
    if (!arm.pattern || *arm.pattern == key) {
      return evaluate(arm.value, locals);
    }
  }
  return fmt::format("No match arm found for value {}", key.to_string());
}

}  // namespace pilc
