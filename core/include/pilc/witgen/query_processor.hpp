// pilc/witgen/query_processor.hpp - Values of query columns from an external oracle
#pragma once

#include <functional>
#include <optional>
#include <string>
#include <string_view>

#include "pilc/number/number.hpp"
#include "pilc/witgen/eval_result.hpp"
#include "pilc/witgen/fixed_data.hpp"
#include "pilc/witgen/symbolic_witness_evaluator.hpp"

namespace pilc
{

/// Answers a rendered query, or nullopt when it has no answer (yet)
using QueryCallback = std::function<std::optional<FieldElement>(std::string_view query)>;

/**
 * Renders the query of a witness column for one row and asks the oracle.
 *
 * The query's parameter is the row index. Strings are quoted, tuples are
 * rendered as `(a, b)`, numbers in decimal and match expressions select
 * the arm of their scrutinee.
 */
class QueryProcessor
{
public:
  explicit QueryProcessor(QueryCallback callback);

  /// `witness` must evaluate in Row mode on the row to fill
  [[nodiscard]] EvalResult process_witness_query(
    const WitnessColumn & column, const SymbolicWitnessEvaluator & witness) const;

  /// Rendering of `query` on the row of `witness`, or why it is not known
  [[nodiscard]] Result<std::string, IncompleteCause> render_query(
    const Expression * query, const SymbolicWitnessEvaluator & witness) const;

private:
  [[nodiscard]] Result<std::string, IncompleteCause> render(
    const Expression * expr, const SymbolicWitnessEvaluator & witness,
    gsl::span<const FieldElement> locals) const;

  QueryCallback callback_;
};

}  // namespace pilc
