// pilc/witgen/symbolic_witness_evaluator.hpp - Column values for one row transition
#pragma once

#include <cstdint>
#include <gsl/span>
#include <optional>
#include <string>
#include <string_view>

#include "pilc/ir/analyzed.hpp"
#include "pilc/number/number.hpp"
#include "pilc/witgen/affine_expression.hpp"
#include "pilc/witgen/fixed_data.hpp"

namespace pilc
{

enum class EvaluationMode : uint8_t {
  /// `x` is the row before the solved row, `x'` the solved row
  Next,
  /// `x` is the solved row; `x'` cannot be evaluated
  Row,
};

/**
 * Resolves column references while solving the cells of one row.
 *
 * Cells of the solved row that are not yet known become variables named
 * by their witness column id. Cells of the previous row must be known.
 * Intermediate polynomials are expanded into their definitions.
 */
class SymbolicWitnessEvaluator
{
public:
  /// `current` may be empty when the previous row is not available
  SymbolicWitnessEvaluator(
    const FixedData & fixed_data, DegreeType row,
    gsl::span<const std::optional<FieldElement>> current,
    gsl::span<const std::optional<FieldElement>> next, EvaluationMode mode);

  [[nodiscard]] AffineResult value(const PolynomialReference & ref) const;
  [[nodiscard]] std::optional<FieldElement> constant(std::string_view name) const;

  [[nodiscard]] AffineResult evaluate(
    const Expression * expr, gsl::span<const FieldElement> locals = {}) const;

  /// Index of the solved row
  [[nodiscard]] DegreeType row() const noexcept { return row_; }
  [[nodiscard]] EvaluationMode mode() const noexcept { return mode_; }
  [[nodiscard]] const FixedData & fixed_data() const noexcept { return fixed_data_; }

  /// Renders an affine expression with column names
  [[nodiscard]] std::string format(const AffineExpression & expr) const;

private:
  [[nodiscard]] AffineResult fixed_value(const PolynomialReference & ref) const;
  [[nodiscard]] AffineResult witness_value(const PolynomialReference & ref) const;
  [[nodiscard]] AffineResult intermediate_value(
    const PolynomialReference & ref, const Definition & def) const;

  const FixedData & fixed_data_;
  DegreeType row_;
  gsl::span<const std::optional<FieldElement>> current_;
  gsl::span<const std::optional<FieldElement>> next_;
  EvaluationMode mode_;
  uint32_t depth_ = 0;
};

}  // namespace pilc
