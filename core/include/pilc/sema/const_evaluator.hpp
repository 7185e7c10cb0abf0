// pilc/sema/const_evaluator.hpp - Constant expression evaluator
//
// Evaluates analyzed expressions over arbitrary precision integers. Used
// for namespace degrees, array lengths, public indices and `constant`
// definitions during analysis, and for generating fixed columns.
//
#pragma once

#include <functional>
#include <gsl/span>
#include <string>
#include <string_view>
#include <unordered_map>

#include "pilc/basic/result.hpp"
#include "pilc/ir/analyzed.hpp"
#include "pilc/number/number.hpp"

namespace pilc
{

using ConstResult = Result<AbstractNumber, std::string>;

/**
 * Evaluator for constant expressions.
 *
 * ## Evaluable expressions
 * - Numbers and `%constants`
 * - Local variables (function parameters), supplied per call
 * - Unary and binary arithmetic, including `** % & ^ | << >>`
 * - Calls `F(x)` to functions known by the resolver (constant columns)
 * - Match expressions
 *
 * Polynomial references, public references, strings and tuples are not
 * constant. Errors are returned as messages, never thrown.
 */
class ConstantEvaluator
{
public:
  /// Value of function `name` applied to `argument`
  using FunctionResolver =
    std::function<ConstResult(std::string_view name, const AbstractNumber & argument)>;

  explicit ConstantEvaluator(
    const std::unordered_map<std::string_view, FieldElement> & constants,
    FunctionResolver resolver = {});

  [[nodiscard]] ConstResult evaluate(
    const Expression * expr, gsl::span<const AbstractNumber> locals = {}) const;

  /// Evaluate as a row count / index: non-negative and 64-bit
  [[nodiscard]] Result<DegreeType, std::string> evaluate_degree(const Expression * expr) const;

private:
  [[nodiscard]] ConstResult eval_binary(
    const BinaryOperation * bin, gsl::span<const AbstractNumber> locals) const;
  [[nodiscard]] ConstResult eval_call(
    const FunctionCall * call, gsl::span<const AbstractNumber> locals) const;
  [[nodiscard]] ConstResult eval_match(
    const MatchExpression * match, gsl::span<const AbstractNumber> locals) const;

  const std::unordered_map<std::string_view, FieldElement> & constants_;
  FunctionResolver resolver_;
};

}  // namespace pilc
