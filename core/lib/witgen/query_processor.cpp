// pilc/witgen/query_processor.cpp - Values of query columns from an external oracle
#include "pilc/witgen/query_processor.hpp"

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <utility>
#include <vector>

#include "pilc/basic/casting.hpp"
#include "pilc/ir/display.hpp"

namespace pilc
{

QueryProcessor::QueryProcessor(QueryCallback callback) : callback_(std::move(callback)) {}

EvalResult QueryProcessor::process_witness_query(
  const WitnessColumn & column, const SymbolicWitnessEvaluator & witness) const
{
  if (column.query == nullptr) {
    return EvalError::make_generic(fmt::format("Column {} has no query", column.name));
  }
  auto query = render_query(column.query, witness);
  if (!query) {
    return EvalValue::incomplete(std::move(query).error());
  }

  std::optional<FieldElement> answer;
  if (callback_) {
    answer = callback_(query.value());
  }
  if (!answer) {
    return EvalValue::incomplete(
      IncompleteCause::make_no_query_answer(std::move(query).value(), column.name));
  }
  spdlog::trace("Query {} = {}", query.value(), answer->to_string());
  return EvalValue::complete({{column.id, Constraint::make_assignment(*answer)}});
}

Result<std::string, IncompleteCause> QueryProcessor::render_query(
  const Expression * query, const SymbolicWitnessEvaluator & witness) const
{
  const FieldElement locals[] = {FieldElement(witness.row())};
  return render(query, witness, locals);
}

Result<std::string, IncompleteCause> QueryProcessor::render(
  const Expression * expr, const SymbolicWitnessEvaluator & witness,
  gsl::span<const FieldElement> locals) const
{
  switch (expr->get_kind()) {
    case ExpressionKind::StringLiteral:
      return fmt::format("\"{}\"", cast<StringLiteral>(expr)->value);

    case ExpressionKind::Tuple: {
      std::vector<std::string> parts;
      for (const Expression * e : cast<Tuple>(expr)->elements) {
        auto part = render(e, witness, locals);
        if (!part) {
          return part;
        }
        parts.push_back(std::move(part).value());
      }
      return fmt::format("({})", fmt::join(parts, ", "));
    }

    case ExpressionKind::MatchExpression: {
      const auto * match = cast<MatchExpression>(expr);
      auto scrutinee = witness.evaluate(match->scrutinee, locals);
      if (!scrutinee) {
        return std::move(scrutinee).error();
      }
      const auto value = scrutinee->constant_value();
      if (!value) {
        return IncompleteCause::make<IncompleteCauseKind::NonConstantQueryMatchScrutinee>();
      }
      for (const auto & arm : match->arms) {
        if (!arm.pattern || *arm.pattern == *value) {
          return render(arm.value, witness, locals);
        }
      }
      return IncompleteCause::make<IncompleteCauseKind::NoMatchArmFound>();
    }

    default:
      break;
  }

  auto value = witness.evaluate(expr, locals);
  if (!value) {
    return std::move(value).error();
  }
  const auto constant = value->constant_value();
  if (!constant) {
    return IncompleteCause::make_expression_evaluation_unimplemented(
      fmt::format("query element {} is not known", format_expression(expr)));
  }
  return constant->to_string();
}

}  // namespace pilc
