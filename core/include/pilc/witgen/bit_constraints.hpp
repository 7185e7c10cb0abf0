// pilc/witgen/bit_constraints.hpp - Bit constraints on witness cells
#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "pilc/number/number.hpp"

namespace pilc
{

/**
 * The set of bits a value may occupy. A value v satisfies the constraint
 * iff `v & ~mask == 0`. Narrows a value without pinning it.
 */
class BitConstraint
{
public:
  /// Bits 0..=max_bit (max_bit < 64)
  [[nodiscard]] static BitConstraint from_max_bit(uint32_t max_bit) noexcept;

  [[nodiscard]] static constexpr BitConstraint from_mask(uint64_t mask) noexcept
  {
    return BitConstraint(mask);
  }

  [[nodiscard]] constexpr uint64_t mask() const noexcept { return mask_; }

  [[nodiscard]] bool allows(FieldElement value) const noexcept
  {
    return (value.to_canonical() & ~mask_) == 0;
  }

  /// Constraint of `factor * v` for a power-of-two factor, if it still fits
  [[nodiscard]] std::optional<BitConstraint> multiple(FieldElement factor) const noexcept;

  [[nodiscard]] constexpr bool disjoint(BitConstraint other) const noexcept
  {
    return (mask_ & other.mask_) == 0;
  }

  [[nodiscard]] constexpr BitConstraint conjunction(BitConstraint other) const noexcept
  {
    return BitConstraint(mask_ & other.mask_);
  }

  [[nodiscard]] constexpr BitConstraint disjunction(BitConstraint other) const noexcept
  {
    return BitConstraint(mask_ | other.mask_);
  }

  /// e.g. "0xff"
  [[nodiscard]] std::string to_string() const;

  friend constexpr bool operator==(BitConstraint a, BitConstraint b) noexcept
  {
    return a.mask_ == b.mask_;
  }
  friend constexpr bool operator!=(BitConstraint a, BitConstraint b) noexcept
  {
    return a.mask_ != b.mask_;
  }

private:
  constexpr explicit BitConstraint(uint64_t mask) noexcept : mask_(mask) {}

  uint64_t mask_;
};

// ============================================================================
// Constraint store
// ============================================================================

/**
 * Bit constraints known for witness cells, keyed by cell id.
 *
 * Solvers accept any type with
 * `std::optional<BitConstraint> bit_constraint(size_t id) const`.
 */
class BitConstraintMap
{
public:
  [[nodiscard]] std::optional<BitConstraint> bit_constraint(size_t id) const;

  /// Intersects with an existing constraint on the same cell
  void add(size_t id, BitConstraint constraint);

  void remove(size_t id) { constraints_.erase(id); }

  [[nodiscard]] size_t size() const noexcept { return constraints_.size(); }
  [[nodiscard]] bool empty() const noexcept { return constraints_.empty(); }

  [[nodiscard]] auto begin() const { return constraints_.begin(); }
  [[nodiscard]] auto end() const { return constraints_.end(); }

private:
  std::unordered_map<size_t, BitConstraint> constraints_;
};

// ============================================================================
// Global constraints
// ============================================================================

class Analyzed;
class FixedData;

/**
 * Constraints that hold on every row, derived before solving.
 *
 * - a fixed column whose values all fit in n bits gets `from_max_bit(n - 1)`
 * - `{ x } in { F }` with a bit-constrained fixed column F constrains the
 *   witness column x; the lookup is dropped when F holds every allowed value
 * - `x * (1 - x) = 0` constrains x to one bit
 */
struct GlobalConstraints
{
  std::unordered_map<std::string_view, BitConstraint> fixed_constraints;
  /// Keyed by witness column id
  BitConstraintMap witness_constraints;
  /// Positions in Analyzed::identities still to be processed per row
  std::vector<size_t> retained_identities;
};

[[nodiscard]] GlobalConstraints determine_global_constraints(const FixedData & fixed_data);

}  // namespace pilc
