// pilc/witgen/fixed_lookup.hpp - Row lookup in fixed columns
#pragma once

#include <cstdint>
#include <gsl/span>
#include <map>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "pilc/basic/result.hpp"
#include "pilc/number/number.hpp"
#include "pilc/witgen/fixed_data.hpp"

namespace pilc
{

enum class LookupOutcome : uint8_t {
  Unique,
  None,
  Multiple,
};

struct LookupMatch
{
  LookupOutcome outcome = LookupOutcome::None;
  /// Valid if outcome == Unique
  DegreeType row = 0;
};

/**
 * Finds the row of a set of fixed columns holding given values.
 *
 * An index is built per distinct column set on first use.
 */
class FixedLookup
{
public:
  explicit FixedLookup(const FixedData & fixed_data) : fixed_data_(fixed_data) {}

  /// `columns` and `values` pair up; an unknown column is an error
  [[nodiscard]] Result<LookupMatch, std::string> find(
    gsl::span<const std::string_view> columns, gsl::span<const FieldElement> values);

  [[nodiscard]] size_t index_count() const noexcept { return indices_.size(); }

private:
  struct Entry
  {
    DegreeType row;
    bool multiple;
  };
  using Index = std::map<std::vector<uint64_t>, Entry>;

  Result<const Index *, std::string> index_for(gsl::span<const std::string_view> columns);

  const FixedData & fixed_data_;
  std::unordered_map<std::string, Index> indices_;
};

}  // namespace pilc
