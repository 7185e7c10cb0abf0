// pilc/witgen/generator.hpp - Row-by-row witness generation
#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "pilc/basic/result.hpp"
#include "pilc/number/number.hpp"
#include "pilc/witgen/bit_constraints.hpp"
#include "pilc/witgen/fixed_data.hpp"
#include "pilc/witgen/identity_processor.hpp"
#include "pilc/witgen/query_processor.hpp"

namespace pilc
{

struct WitgenOptions
{
  /// Upper bound on identity passes per row
  uint32_t max_passes = 64;
  /// Cells nobody could determine become zero instead of an error
  bool default_unknown_to_zero = false;
};

struct WitnessColumnValues
{
  std::string name;
  std::vector<FieldElement> values;
};

/**
 * Computes all witness columns, one row at a time.
 *
 * Each row is solved by repeatedly evaluating the identities that are not
 * yet complete, plus the queries of unknown query columns, until all
 * identities are complete or a pass learns nothing new. Identities with
 * next-row references are evaluated as the transition from the previous
 * row, all others on the row itself.
 *
 * Fatal evaluation errors abort the whole generation. Other errors are
 * retried in later passes and only fail the row if they persist.
 */
class Generator
{
public:
  Generator(
    const FixedData & fixed_data, QueryCallback query_callback, WitgenOptions options = {});

  /// One entry per witness column, in column id order
  [[nodiscard]] Result<std::vector<WitnessColumnValues>, std::string> generate();

private:
  using Row = std::vector<std::optional<FieldElement>>;

  [[nodiscard]] Result<std::vector<FieldElement>, std::string> compute_row(
    DegreeType row, const std::vector<FieldElement> & previous);

  [[nodiscard]] std::optional<std::string> apply(
    const EvalValue & value, Row & next, BitConstraintMap & constraints, bool & progress) const;

  const FixedData & fixed_data_;
  WitgenOptions options_;
  GlobalConstraints global_;
  IdentityProcessor identity_processor_;
  QueryProcessor query_processor_;
};

}  // namespace pilc
