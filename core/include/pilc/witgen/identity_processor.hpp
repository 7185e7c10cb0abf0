// pilc/witgen/identity_processor.hpp - Evaluation of one identity on one row
#pragma once

#include "pilc/ir/analyzed.hpp"
#include "pilc/witgen/bit_constraints.hpp"
#include "pilc/witgen/eval_result.hpp"
#include "pilc/witgen/fixed_data.hpp"
#include "pilc/witgen/fixed_lookup.hpp"
#include "pilc/witgen/symbolic_witness_evaluator.hpp"

namespace pilc
{

/**
 * Learns cell values from a single identity.
 *
 * - Polynomial: solves `expression == 0`, using bit constraints
 * - Plookup / Permutation: looks the known left values up in the fixed
 *   columns of the right side and solves the rest against the matching row
 * - Connect: solves `left[i] == right[i]` for every pair
 *
 * Expressions that cannot be evaluated yet give an Incomplete value;
 * only contradictions and failed lookups are errors.
 */
class IdentityProcessor
{
public:
  explicit IdentityProcessor(const FixedData & fixed_data)
  : fixed_data_(fixed_data), lookup_(fixed_data)
  {
  }

  [[nodiscard]] EvalResult process(
    const Identity & identity, const SymbolicWitnessEvaluator & witness,
    const BitConstraintMap & constraints);

private:
  [[nodiscard]] EvalResult process_polynomial(
    const Identity & identity, const SymbolicWitnessEvaluator & witness,
    const BitConstraintMap & constraints) const;
  [[nodiscard]] EvalResult process_lookup(
    const Identity & identity, const SymbolicWitnessEvaluator & witness);
  [[nodiscard]] EvalResult process_connect(
    const Identity & identity, const SymbolicWitnessEvaluator & witness) const;

  const FixedData & fixed_data_;
  FixedLookup lookup_;
};

}  // namespace pilc
