// pilc/ir/analyzed.cpp - Analyzed program queries
#include "pilc/ir/analyzed.hpp"

#include <numeric>

namespace pilc
{

std::string_view to_string(PolynomialType type) noexcept
{
  switch (type) {
    case PolynomialType::Committed:
      return "committed";
    case PolynomialType::Constant:
      return "constant";
    case PolynomialType::Intermediate:
      return "intermediate";
  }
  return "";
}

std::string_view to_string(IdentityKind kind) noexcept
{
  switch (kind) {
    case IdentityKind::Polynomial:
      return "polynomial";
    case IdentityKind::Plookup:
      return "plookup";
    case IdentityKind::Permutation:
      return "permutation";
    case IdentityKind::Connect:
      return "connect";
  }
  return "";
}

bool Identity::contains_next_ref() const
{
  bool found = false;
  const auto check = [&found](const Expression * e) {
    if (const auto * ref = dyn_cast<PolynomialReference>(e); ref != nullptr && ref->next) {
      found = true;
    }
  };
  for (const SelectedExpressions * side : {&left, &right}) {
    visit_expression(side->selector, check);
    for (const auto * e : side->expressions) {
      visit_expression(e, check);
    }
  }
  return found;
}

// ============================================================================
// Function values
// ============================================================================

std::optional<RepeatedArray> RepeatedArray::create(
  gsl::span<const Expression *> values, DegreeType repetitions)
{
  if (repetitions == 0 && !values.empty()) {
    return std::nullopt;
  }
  if (values.empty() && repetitions > 1) {
    return std::nullopt;
  }
  return RepeatedArray(values, repetitions);
}

FunctionValueDefinition FunctionValueDefinition::make_mapping(const Expression * expr)
{
  return {FunctionValueKind::Mapping, expr, {}};
}

FunctionValueDefinition FunctionValueDefinition::make_array(std::vector<RepeatedArray> arrays)
{
  return {FunctionValueKind::Array, nullptr, std::move(arrays)};
}

FunctionValueDefinition FunctionValueDefinition::make_query(const Expression * expr)
{
  return {FunctionValueKind::Query, expr, {}};
}

DegreeType FunctionValueDefinition::array_size() const noexcept
{
  return std::accumulate(
    arrays_.begin(), arrays_.end(), DegreeType{0},
    [](DegreeType acc, const RepeatedArray & a) { return acc + a.size(); });
}

// ============================================================================
// Analyzed
// ============================================================================

Analyzed::Analyzed() : context_(std::make_unique<IrContext>()) {}

size_t Analyzed::commitment_count() const
{
  return declaration_type_count(PolynomialType::Committed);
}

size_t Analyzed::intermediate_count() const
{
  return declaration_type_count(PolynomialType::Intermediate);
}

size_t Analyzed::constant_count() const { return declaration_type_count(PolynomialType::Constant); }

std::vector<const Definition *> Analyzed::definitions_in_source_order(
  PolynomialType poly_type) const
{
  std::vector<const Definition *> result;
  for (const auto & statement : source_order) {
    if (statement.kind() != StatementIdentifier::Kind::Definition) {
      continue;
    }
    const auto it = definitions.find(statement.name());
    if (it != definitions.end() && it->second.polynomial.poly_type == poly_type) {
      result.push_back(&it->second);
    }
  }
  return result;
}

std::vector<const Definition *> Analyzed::committed_polys_in_source_order() const
{
  return definitions_in_source_order(PolynomialType::Committed);
}

std::vector<const Definition *> Analyzed::constant_polys_in_source_order() const
{
  return definitions_in_source_order(PolynomialType::Constant);
}

std::vector<const Definition *> Analyzed::intermediate_polys_in_source_order() const
{
  return definitions_in_source_order(PolynomialType::Intermediate);
}

const Definition * Analyzed::find_definition(std::string_view name) const
{
  const auto it = definitions.find(name);
  return it == definitions.end() ? nullptr : &it->second;
}

const PublicDeclaration * Analyzed::find_public_declaration(std::string_view name) const
{
  const auto it = public_declarations.find(name);
  return it == public_declarations.end() ? nullptr : &it->second;
}

std::optional<FieldElement> Analyzed::find_constant(std::string_view name) const
{
  const auto it = constants.find(name);
  if (it == constants.end()) {
    return std::nullopt;
  }
  return it->second;
}

size_t Analyzed::declaration_type_count(PolynomialType poly_type) const
{
  size_t count = 0;
  for (const auto & [name, def] : definitions) {
    if (def.polynomial.poly_type == poly_type) {
      count += static_cast<size_t>(def.polynomial.length.value_or(1));
    }
  }
  return count;
}

}  // namespace pilc
