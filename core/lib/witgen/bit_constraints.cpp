// pilc/witgen/bit_constraints.cpp - Bit constraints and their global detection
#include "pilc/witgen/bit_constraints.hpp"

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <unordered_set>

#include "pilc/basic/casting.hpp"
#include "pilc/witgen/fixed_data.hpp"

namespace pilc
{

// ============================================================================
// BitConstraint
// ============================================================================

BitConstraint BitConstraint::from_max_bit(uint32_t max_bit) noexcept
{
  if (max_bit >= 63) {
    return BitConstraint(~uint64_t{0});
  }
  return BitConstraint((uint64_t{1} << (max_bit + 1)) - 1);
}

std::optional<BitConstraint> BitConstraint::multiple(FieldElement factor) const noexcept
{
  const auto shift = factor.exact_log2();
  if (!shift) {
    return std::nullopt;
  }
  if (*shift == 0) {
    return *this;
  }
  // Shifted values must stay below the modulus
  if ((mask_ >> (64 - *shift)) != 0) {
    return std::nullopt;
  }
  const uint64_t shifted = mask_ << *shift;
  if (shifted >= FieldElement::k_modulus) {
    return std::nullopt;
  }
  return BitConstraint(shifted);
}

std::string BitConstraint::to_string() const { return fmt::format("0x{:x}", mask_); }

// ============================================================================
// BitConstraintMap
// ============================================================================

std::optional<BitConstraint> BitConstraintMap::bit_constraint(size_t id) const
{
  const auto it = constraints_.find(id);
  if (it == constraints_.end()) {
    return std::nullopt;
  }
  return it->second;
}

void BitConstraintMap::add(size_t id, BitConstraint constraint)
{
  const auto [it, inserted] = constraints_.emplace(id, constraint);
  if (!inserted) {
    it->second = it->second.conjunction(constraint);
  }
}

// ============================================================================
// Global constraints
// ============================================================================

namespace
{

std::optional<BitConstraint> fixed_column_constraint(const FixedColumn & column)
{
  uint64_t max = 0;
  for (const FieldElement & v : column.values) {
    max = std::max(max, v.to_canonical());
  }
  if (max == 0) {
    return std::nullopt;
  }
  uint32_t max_bit = 63;
  while ((max >> max_bit) == 0) {
    --max_bit;
  }
  return BitConstraint::from_max_bit(max_bit);
}

/// A plain, current-row reference
const PolynomialReference * as_column(const Expression * expr)
{
  const auto * ref = dyn_cast<PolynomialReference>(expr);
  if (ref == nullptr || ref->next) {
    return nullptr;
  }
  return ref;
}

/// Column contains every value its bit constraint allows
bool covers_constraint(const FixedColumn & column, BitConstraint constraint)
{
  const uint64_t mask = constraint.mask();
  if (mask >= column.values.size()) {
    return false;
  }
  std::unordered_set<uint64_t> seen;
  for (const FieldElement & v : column.values) {
    seen.insert(v.to_canonical());
  }
  return seen.size() == mask + 1;
}

/// `{ x } in { F }` without selectors
std::optional<std::pair<size_t, BitConstraint>> lookup_constraint(
  const Identity & identity, const FixedData & fixed_data,
  const std::unordered_map<std::string_view, BitConstraint> & fixed_constraints)
{
  if (identity.kind != IdentityKind::Plookup || identity.left.selector != nullptr ||
      identity.right.selector != nullptr || identity.left.expressions.size() != 1 ||
      identity.right.expressions.size() != 1) {
    return std::nullopt;
  }
  const auto * witness = as_column(identity.left.expressions[0]);
  const auto * fixed = as_column(identity.right.expressions[0]);
  if (witness == nullptr || fixed == nullptr) {
    return std::nullopt;
  }
  const auto id = fixed_data.witness_id(*witness);
  const auto it = fixed_constraints.find(fixed->name);
  if (!id || it == fixed_constraints.end()) {
    return std::nullopt;
  }
  return std::make_pair(*id, it->second);
}

bool is_one(const Expression * expr)
{
  const auto * n = dyn_cast<Number>(expr);
  return n != nullptr && n->value.is_one();
}

bool same_column(const PolynomialReference * a, const PolynomialReference * b)
{
  return a != nullptr && b != nullptr && a->name == b->name && a->index == b->index;
}

/// `x * (1 - x) = 0` or `(1 - x) * x = 0`
std::optional<size_t> boolean_constraint(const Identity & identity, const FixedData & fixed_data)
{
  if (identity.kind != IdentityKind::Polynomial) {
    return std::nullopt;
  }
  const auto * mul = dyn_cast<BinaryOperation>(identity.expression());
  if (mul == nullptr || mul->op != BinaryOperator::Mul) {
    return std::nullopt;
  }
  const std::pair<const Expression *, const Expression *> orders[] = {
    {mul->left, mul->right}, {mul->right, mul->left}};
  for (const auto & [var, other] : orders) {
    const auto * x = as_column(var);
    const auto * sub = dyn_cast<BinaryOperation>(other);
    if (
      x != nullptr && sub != nullptr && sub->op == BinaryOperator::Sub && is_one(sub->left) &&
      same_column(x, as_column(sub->right))) {
      return fixed_data.witness_id(*x);
    }
  }
  return std::nullopt;
}

}  // namespace

GlobalConstraints determine_global_constraints(const FixedData & fixed_data)
{
  GlobalConstraints result;

  for (const FixedColumn & column : fixed_data.fixed_columns()) {
    if (const auto constraint = fixed_column_constraint(column)) {
      result.fixed_constraints.emplace(column.name, *constraint);
    }
  }

  const auto & identities = fixed_data.analyzed().identities;
  for (size_t i = 0; i < identities.size(); ++i) {
    const Identity & identity = identities[i];
    if (const auto found = lookup_constraint(identity, fixed_data, result.fixed_constraints)) {
      result.witness_constraints.add(found->first, found->second);
      // Only a column holding every allowed value makes the lookup redundant
      const auto * fixed = cast<PolynomialReference>(identity.right.expressions[0]);
      if (covers_constraint(*fixed_data.fixed_column(fixed->name), found->second)) {
        continue;
      }
    }
    if (const auto id = boolean_constraint(identity, fixed_data)) {
      result.witness_constraints.add(*id, BitConstraint::from_max_bit(0));
      continue;
    }
    result.retained_identities.push_back(i);
  }

  for (const auto & [id, constraint] : result.witness_constraints) {
    spdlog::debug(
      "Global constraint: {} {}", fixed_data.witness_column(id).name, constraint.to_string());
  }
  return result;
}

}  // namespace pilc
