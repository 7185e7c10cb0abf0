// pilc/witgen/affine_expression.hpp - Linear combination of unknown cells
#pragma once

#include <functional>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "pilc/basic/result.hpp"
#include "pilc/number/number.hpp"
#include "pilc/witgen/bit_constraints.hpp"
#include "pilc/witgen/eval_result.hpp"

namespace pilc
{

/**
 * `c_1 * v_1 + ... + c_n * v_n + offset` over unknown cells `v_i`.
 *
 * Coefficients are kept sorted by cell id; zero coefficients are dropped.
 */
class AffineExpression
{
public:
  AffineExpression() = default;

  [[nodiscard]] static AffineExpression from_constant(FieldElement value);
  [[nodiscard]] static AffineExpression from_variable(size_t id);

  [[nodiscard]] bool is_constant() const noexcept { return coefficients_.empty(); }
  /// nullopt unless is_constant()
  [[nodiscard]] std::optional<FieldElement> constant_value() const;

  [[nodiscard]] FieldElement offset() const noexcept { return offset_; }
  [[nodiscard]] const std::map<size_t, FieldElement> & coefficients() const noexcept
  {
    return coefficients_;
  }
  [[nodiscard]] std::vector<size_t> variables() const;

  friend AffineExpression operator+(AffineExpression a, const AffineExpression & b);
  friend AffineExpression operator-(AffineExpression a, const AffineExpression & b);
  friend AffineExpression operator-(AffineExpression a);
  friend AffineExpression operator*(AffineExpression a, FieldElement factor);
  friend AffineExpression operator*(FieldElement factor, AffineExpression a)
  {
    return std::move(a) * factor;
  }

  friend bool operator==(const AffineExpression & a, const AffineExpression & b)
  {
    return a.offset_ == b.offset_ && a.coefficients_ == b.coefficients_;
  }

  /**
   * Solve `self == 0` for at most one unknown.
   *
   * - one unknown: Assignment
   * - no unknown: Complete if the offset is zero, else ConstraintUnsatisfiable
   * - more: Incomplete(MultipleLinearSolutions)
   */
  [[nodiscard]] EvalResult solve() const;

  /**
   * solve(), then use the bit constraints of the unknowns.
   *
   * `X = 2^a * Y + 2^b * Z` with Y, Z constrained and disjoint gives X a
   * bit constraint. Otherwise, with all unknowns constrained, the value is
   * split into the disjoint bit ranges of the unknowns.
   *
   * Store: `std::optional<BitConstraint> bit_constraint(size_t id) const`.
   */
  template <typename Store>
  [[nodiscard]] EvalResult solve_with_bit_constraints(const Store & store) const
  {
    auto result = solve();
    if (!result || result->is_complete()) {
      return result;
    }
    std::vector<std::pair<size_t, std::optional<BitConstraint>>> known;
    known.reserve(coefficients_.size());
    for (const auto & [id, coeff] : coefficients_) {
      known.emplace_back(id, store.bit_constraint(id));
    }
    if (auto transferred = transfer_constraints(known)) {
      return EvalValue::incomplete_with_constraints(
        Constraints{*transferred}, IncompleteCause::make<IncompleteCauseKind::NotConcrete>());
    }
    return solve_through_constraints(known);
  }

  /// "2 * v3 + v5 + 7"; `name_of` renders cell ids
  [[nodiscard]] std::string format(const std::function<std::string(size_t)> & name_of) const;
  [[nodiscard]] std::string to_string() const;

private:
  using KnownConstraints = std::vector<std::pair<size_t, std::optional<BitConstraint>>>;

  [[nodiscard]] std::optional<std::pair<size_t, Constraint>> transfer_constraints(
    const KnownConstraints & known) const;
  [[nodiscard]] EvalResult solve_through_constraints(const KnownConstraints & known) const;

  std::map<size_t, FieldElement> coefficients_;
  FieldElement offset_;
};

using AffineResult = Result<AffineExpression, IncompleteCause>;

}  // namespace pilc
