// pilc/witgen/fixed_data.hpp - Fixed column values and witness column layout
#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "pilc/basic/result.hpp"
#include "pilc/ir/analyzed.hpp"
#include "pilc/number/number.hpp"

namespace pilc
{

struct FixedColumn
{
  std::string_view name;
  std::vector<FieldElement> values;
};

/// One witness cell per row; array elements are separate columns
struct WitnessColumn
{
  size_t id = 0;
  std::string name;  ///< "Main.x" or "Main.a[2]"
  std::string_view poly_name;
  std::optional<uint64_t> index;
  /// Query expression attached to the column, if any
  const Expression * query = nullptr;
};

/**
 * Everything the row solver reads but never writes: the analyzed program,
 * the common degree, the generated fixed columns and the witness layout.
 *
 * Witness column ids are the committed polynomial ids (plus the array
 * index), so they follow declaration order.
 */
class FixedData
{
public:
  FixedData(const Analyzed & analyzed, DegreeType degree, std::vector<FixedColumn> fixed_columns);

  [[nodiscard]] const Analyzed & analyzed() const noexcept { return *analyzed_; }
  [[nodiscard]] DegreeType degree() const noexcept { return degree_; }

  [[nodiscard]] const std::vector<FixedColumn> & fixed_columns() const noexcept
  {
    return fixed_columns_;
  }
  [[nodiscard]] const FixedColumn * fixed_column(std::string_view name) const;

  /// Row index is taken modulo the degree
  [[nodiscard]] std::optional<FieldElement> fixed_value(
    std::string_view name, DegreeType row) const;

  [[nodiscard]] const std::vector<WitnessColumn> & witness_columns() const noexcept
  {
    return witness_columns_;
  }
  [[nodiscard]] size_t witness_count() const noexcept { return witness_columns_.size(); }
  [[nodiscard]] const WitnessColumn & witness_column(size_t id) const
  {
    return witness_columns_.at(id);
  }

  /// nullopt unless `ref` names a committed polynomial (element)
  [[nodiscard]] std::optional<size_t> witness_id(const PolynomialReference & ref) const;

private:
  const Analyzed * analyzed_;
  DegreeType degree_;
  std::vector<FixedColumn> fixed_columns_;
  std::unordered_map<std::string_view, size_t> fixed_index_;
  std::vector<WitnessColumn> witness_columns_;
};

/// Degree shared by every polynomial of the program
[[nodiscard]] Result<DegreeType, std::string> common_degree(const Analyzed & analyzed);

/**
 * Values of all constant polynomials for rows `0..degree`, in source order.
 *
 * Mappings are evaluated per row with the row index as their parameter
 * and may call other constant polynomials; cycles are reported. Arrays
 * must contain exactly `degree` elements.
 */
[[nodiscard]] Result<std::vector<FixedColumn>, std::string> generate_fixed_columns(
  const Analyzed & analyzed, DegreeType degree);

/// common_degree + generate_fixed_columns
[[nodiscard]] Result<FixedData, std::string> build_fixed_data(const Analyzed & analyzed);

}  // namespace pilc
