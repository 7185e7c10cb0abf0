// pilc/witgen/fixed_data.cpp - Fixed column generation
#include "pilc/witgen/fixed_data.hpp"

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <unordered_set>
#include <utility>

#include "pilc/sema/const_evaluator.hpp"

namespace pilc
{

namespace
{

/// Generates constant columns on demand, so mappings can call each other
class ColumnGenerator
{
public:
  ColumnGenerator(const Analyzed & analyzed, DegreeType degree)
  : analyzed_(analyzed),
    degree_(degree),
    evaluator_(analyzed.constants, [this](std::string_view name, const AbstractNumber & arg) {
      return call(name, arg);
    })
  {
  }

  Result<const std::vector<FieldElement> *, std::string> column(const Definition & def)
  {
    const std::string_view name = def.polynomial.absolute_name;
    if (const auto it = done_.find(name); it != done_.end()) {
      return &it->second;
    }
    if (def.polynomial.poly_type != PolynomialType::Constant) {
      return fmt::format("{} is not a constant polynomial", name);
    }
    if (def.polynomial.is_array() || !def.function) {
      return fmt::format("Fixed column {} has no definition", name);
    }
    if (!in_progress_.insert(name).second) {
      return fmt::format("Cyclic definition of fixed column {}", name);
    }

    auto values = def.function->kind() == FunctionValueKind::Array ? generate_array(def)
                                                                    : generate_mapping(def);
    in_progress_.erase(name);
    if (!values) {
      return std::move(values).error();
    }
    return &done_.emplace(name, std::move(values).value()).first->second;
  }

private:
  using Values = Result<std::vector<FieldElement>, std::string>;

  Values generate_mapping(const Definition & def)
  {
    if (def.function->kind() != FunctionValueKind::Mapping) {
      return fmt::format(
        "Fixed column {} cannot be defined by a query", def.polynomial.absolute_name);
    }
    std::vector<FieldElement> values;
    values.reserve(degree_);
    for (DegreeType row = 0; row < degree_; ++row) {
      const AbstractNumber locals[] = {AbstractNumber(static_cast<unsigned long>(row))};
      auto value = evaluator_.evaluate(def.function->expression(), locals);
      if (!value) {
        return fmt::format(
          "Error evaluating fixed column {} at row {}: {}", def.polynomial.absolute_name, row,
          value.error());
      }
      values.push_back(FieldElement::from_abstract(value.value()));
    }
    return values;
  }

  Values generate_array(const Definition & def)
  {
    const DegreeType size = def.function->array_size();
    if (size != degree_) {
      return fmt::format(
        "Array {} has {} elements but the degree is {}", def.polynomial.absolute_name, size,
        degree_);
    }
    std::vector<FieldElement> values;
    values.reserve(degree_);
    for (const RepeatedArray & segment : def.function->arrays()) {
      std::vector<FieldElement> once;
      once.reserve(segment.values().size());
      for (const Expression * e : segment.values()) {
        auto value = evaluator_.evaluate(e);
        if (!value) {
          return fmt::format(
            "Error evaluating array {}: {}", def.polynomial.absolute_name, value.error());
        }
        once.push_back(FieldElement::from_abstract(value.value()));
      }
      for (DegreeType r = 0; r < segment.repetitions(); ++r) {
        values.insert(values.end(), once.begin(), once.end());
      }
    }
    return values;
  }

  ConstResult call(std::string_view name, const AbstractNumber & argument)
  {
    const Definition * def = analyzed_.find_definition(name);
    if (def == nullptr) {
      return fmt::format("Unknown function {}", name);
    }
    auto values = column(*def);
    if (!values) {
      return std::move(values).error();
    }
    // Rows wrap around
    AbstractNumber row = argument % AbstractNumber(static_cast<unsigned long>(degree_));
    if (row < 0) {
      row += AbstractNumber(static_cast<unsigned long>(degree_));
    }
    const auto index = abstract_to_degree(row);
    if (!index) {
      return fmt::format("Invalid row {} for {}", argument.get_str(), name);
    }
    return (*values.value())[*index].to_abstract();
  }

  const Analyzed & analyzed_;
  DegreeType degree_;
  ConstantEvaluator evaluator_;
  std::unordered_map<std::string_view, std::vector<FieldElement>> done_;
  std::unordered_set<std::string_view> in_progress_;
};

}  // namespace

// ============================================================================
// FixedData
// ============================================================================

FixedData::FixedData(
  const Analyzed & analyzed, DegreeType degree, std::vector<FixedColumn> fixed_columns)
: analyzed_(&analyzed), degree_(degree), fixed_columns_(std::move(fixed_columns))
{
  for (size_t i = 0; i < fixed_columns_.size(); ++i) {
    fixed_index_.emplace(fixed_columns_[i].name, i);
  }

  witness_columns_.resize(analyzed.commitment_count());
  for (const Definition * def : analyzed.committed_polys_in_source_order()) {
    const Polynomial & poly = def->polynomial;
    const Expression * query = nullptr;
    if (def->function && def->function->kind() == FunctionValueKind::Query) {
      query = def->function->expression();
    }
    if (!poly.is_array()) {
      witness_columns_.at(poly.id) =
        WitnessColumn{poly.id, std::string(poly.absolute_name), poly.absolute_name, {}, query};
      continue;
    }
    for (uint64_t i = 0; i < *poly.length; ++i) {
      witness_columns_.at(poly.id + i) = WitnessColumn{
        poly.id + i, fmt::format("{}[{}]", poly.absolute_name, i), poly.absolute_name, i, query};
    }
  }
}

const FixedColumn * FixedData::fixed_column(std::string_view name) const
{
  const auto it = fixed_index_.find(name);
  return it == fixed_index_.end() ? nullptr : &fixed_columns_[it->second];
}

std::optional<FieldElement> FixedData::fixed_value(std::string_view name, DegreeType row) const
{
  const FixedColumn * column = fixed_column(name);
  if (column == nullptr || column->values.empty()) {
    return std::nullopt;
  }
  return column->values[row % column->values.size()];
}

std::optional<size_t> FixedData::witness_id(const PolynomialReference & ref) const
{
  const Definition * def = analyzed_->find_definition(ref.name);
  if (def == nullptr || def->polynomial.poly_type != PolynomialType::Committed) {
    return std::nullopt;
  }
  const Polynomial & poly = def->polynomial;
  if (!poly.is_array()) {
    if (ref.index) {
      return std::nullopt;
    }
    return poly.id;
  }
  if (!ref.index || *ref.index >= *poly.length) {
    return std::nullopt;
  }
  return poly.id + *ref.index;
}

// ============================================================================
// Generation
// ============================================================================

Result<DegreeType, std::string> common_degree(const Analyzed & analyzed)
{
  std::optional<DegreeType> degree;
  std::string_view first;
  for (const auto & statement : analyzed.source_order) {
    if (statement.kind() != StatementIdentifier::Kind::Definition) {
      continue;
    }
    const Definition * def = analyzed.find_definition(statement.name());
    if (def == nullptr) {
      continue;
    }
    const Polynomial & poly = def->polynomial;
    if (!degree) {
      degree = poly.degree;
      first = poly.absolute_name;
    } else if (*degree != poly.degree) {
      return fmt::format(
        "Polynomials have different degrees: {} has {}, {} has {}", first, *degree,
        poly.absolute_name, poly.degree);
    }
  }
  if (!degree) {
    return std::string("Program declares no polynomials");
  }
  if (*degree == 0) {
    return std::string("Degree must be positive");
  }
  return *degree;
}

Result<std::vector<FixedColumn>, std::string> generate_fixed_columns(
  const Analyzed & analyzed, DegreeType degree)
{
  ColumnGenerator generator(analyzed, degree);
  std::vector<FixedColumn> columns;
  for (const Definition * def : analyzed.constant_polys_in_source_order()) {
    auto values = generator.column(*def);
    if (!values) {
      return std::move(values).error();
    }
    columns.push_back(FixedColumn{def->polynomial.absolute_name, *values.value()});
  }
  spdlog::debug("Generated {} fixed columns of degree {}", columns.size(), degree);
  return columns;
}

Result<FixedData, std::string> build_fixed_data(const Analyzed & analyzed)
{
  auto degree = common_degree(analyzed);
  if (!degree) {
    return std::move(degree).error();
  }
  auto columns = generate_fixed_columns(analyzed, degree.value());
  if (!columns) {
    return std::move(columns).error();
  }
  return FixedData(analyzed, degree.value(), std::move(columns).value());
}

}  // namespace pilc
