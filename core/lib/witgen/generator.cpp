// pilc/witgen/generator.cpp - Row-by-row witness generation
#include "pilc/witgen/generator.hpp"

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <map>
#include <utility>

#include "pilc/ir/display.hpp"
#include "pilc/witgen/symbolic_witness_evaluator.hpp"

namespace pilc
{

Generator::Generator(
  const FixedData & fixed_data, QueryCallback query_callback, WitgenOptions options)
: fixed_data_(fixed_data),
  options_(options),
  global_(determine_global_constraints(fixed_data)),
  identity_processor_(fixed_data),
  query_processor_(std::move(query_callback))
{
}

Result<std::vector<WitnessColumnValues>, std::string> Generator::generate()
{
  const size_t width = fixed_data_.witness_count();
  std::vector<WitnessColumnValues> columns;
  columns.reserve(width);
  for (const WitnessColumn & column : fixed_data_.witness_columns()) {
    columns.push_back(WitnessColumnValues{column.name, {}});
    columns.back().values.reserve(fixed_data_.degree());
  }

  spdlog::debug(
    "Generating {} witness columns over {} rows, {} of {} identities retained", width,
    fixed_data_.degree(), global_.retained_identities.size(),
    fixed_data_.analyzed().identities.size());

  std::vector<FieldElement> previous;
  for (DegreeType row = 0; row < fixed_data_.degree(); ++row) {
    auto values = compute_row(row, previous);
    if (!values) {
      return std::move(values).error();
    }
    previous = std::move(values).value();
    for (size_t id = 0; id < width; ++id) {
      columns[id].values.push_back(previous[id]);
    }
  }
  return columns;
}

Result<std::vector<FieldElement>, std::string> Generator::compute_row(
  DegreeType row, const std::vector<FieldElement> & previous)
{
  const auto & identities = fixed_data_.analyzed().identities;
  const size_t width = fixed_data_.witness_count();

  Row current(previous.begin(), previous.end());
  Row next(width);
  BitConstraintMap constraints = global_.witness_constraints;

  std::vector<size_t> pending = global_.retained_identities;
  std::map<size_t, EvalError> errors;
  std::map<size_t, IncompleteCause> causes;

  const auto failure = [&](size_t index, const std::string & message) {
    return fmt::format(
      "Row {}: identity `{}`: {}", row, format_identity(identities[index]), message);
  };

  uint32_t pass = 0;
  for (; pass < options_.max_passes; ++pass) {
    bool progress = false;
    std::vector<size_t> still_pending;

    for (const size_t index : pending) {
      const Identity & identity = identities[index];
      const EvaluationMode mode =
        identity.contains_next_ref() ? EvaluationMode::Next : EvaluationMode::Row;
      const SymbolicWitnessEvaluator witness(fixed_data_, row, current, next, mode);

      auto result = identity_processor_.process(identity, witness, constraints);
      if (!result) {
        if (result.error().is_fatal()) {
          return failure(index, result.error().to_string());
        }
        errors.insert_or_assign(index, std::move(result).error());
        still_pending.push_back(index);
        continue;
      }
      errors.erase(index);
      if (auto conflict = apply(result.value(), next, constraints, progress)) {
        return failure(index, *conflict);
      }
      if (result->is_complete()) {
        causes.erase(index);
        progress = true;
      } else {
        causes.insert_or_assign(index, result->status.cause());
        still_pending.push_back(index);
      }
    }

    for (const WitnessColumn & column : fixed_data_.witness_columns()) {
      if (column.query == nullptr || next[column.id]) {
        continue;
      }
      const SymbolicWitnessEvaluator witness(fixed_data_, row, current, next, EvaluationMode::Row);
      auto result = query_processor_.process_witness_query(column, witness);
      std::optional<std::string> problem;
      if (!result) {
        problem = result.error().to_string();
      } else {
        problem = apply(result.value(), next, constraints, progress);
      }
      if (problem) {
        return fmt::format("Row {}: query of {}: {}", row, column.name, *problem);
      }
    }

    pending = std::move(still_pending);
    if (!progress) {
      break;
    }
  }
  spdlog::trace("Row {}: {} passes, {} identities incomplete", row, pass, pending.size());

  if (!errors.empty()) {
    const auto & [index, error] = *errors.begin();
    return failure(index, error.to_string());
  }

  std::vector<std::string> unknown;
  for (size_t id = 0; id < width; ++id) {
    if (!next[id]) {
      unknown.push_back(fixed_data_.witness_column(id).name);
    }
  }
  if (!unknown.empty()) {
    EvalStatus status = EvalStatus::make_incomplete(
      IncompleteCause::make<IncompleteCauseKind::NoProgressTransferring>());
    for (const auto & [index, cause] : causes) {
      status = status.combine(EvalStatus::make_incomplete(cause));
    }
    spdlog::warn(
      "Row {}: could not determine {}: {}", row, fmt::join(unknown, ", "), status.to_string());
    if (!options_.default_unknown_to_zero) {
      return fmt::format("Row {}: could not determine {}", row, fmt::join(unknown, ", "));
    }
  }

  std::vector<FieldElement> values;
  values.reserve(width);
  for (const auto & cell : next) {
    values.push_back(cell.value_or(FieldElement::zero()));
  }
  return values;
}

std::optional<std::string> Generator::apply(
  const EvalValue & value, Row & next, BitConstraintMap & constraints, bool & progress) const
{
  for (const auto & [id, constraint] : value.constraints) {
    if (id >= next.size()) {
      return fmt::format("Constraint on unknown cell {}", id);
    }
    const std::string & name = fixed_data_.witness_column(id).name;
    if (!constraint.is_assignment()) {
      const auto before = constraints.bit_constraint(id);
      constraints.add(id, constraint.bit_constraint());
      progress = progress || before != constraints.bit_constraint(id);
      spdlog::trace("{}{}", name, constraint.to_string());
      continue;
    }
    if (next[id]) {
      if (*next[id] != constraint.value()) {
        return fmt::format(
          "Conflicting values for {}: {} and {}", name, next[id]->to_string(),
          constraint.value().to_string());
      }
      continue;
    }
    const auto bits = constraints.bit_constraint(id);
    if (bits && !bits->allows(constraint.value())) {
      return fmt::format(
        "Value {} of {} violates bit constraint {}", constraint.value().to_string(), name,
        bits->to_string());
    }
    next[id] = constraint.value();
    progress = true;
    spdlog::trace("{}{}", name, constraint.to_string());
  }
  return std::nullopt;
}

}  // namespace pilc
