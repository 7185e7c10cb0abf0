// pilc/witgen/fixed_lookup.cpp - Row lookup in fixed columns
#include "pilc/witgen/fixed_lookup.hpp"

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <utility>

namespace pilc
{

Result<LookupMatch, std::string> FixedLookup::find(
  gsl::span<const std::string_view> columns, gsl::span<const FieldElement> values)
{
  if (columns.size() != values.size()) {
    return fmt::format("Lookup with {} columns but {} values", columns.size(), values.size());
  }
  auto index = index_for(columns);
  if (!index) {
    return std::move(index).error();
  }

  std::vector<uint64_t> key;
  key.reserve(values.size());
  for (const FieldElement & v : values) {
    key.push_back(v.to_canonical());
  }

  const Index & rows = *index.value();
  const auto it = rows.find(key);
  if (it == rows.end()) {
    return LookupMatch{LookupOutcome::None, 0};
  }
  if (it->second.multiple) {
    return LookupMatch{LookupOutcome::Multiple, 0};
  }
  return LookupMatch{LookupOutcome::Unique, it->second.row};
}

Result<const FixedLookup::Index *, std::string> FixedLookup::index_for(
  gsl::span<const std::string_view> columns)
{
  const std::string name = fmt::format("{}", fmt::join(columns.begin(), columns.end(), ","));
  if (const auto it = indices_.find(name); it != indices_.end()) {
    return &it->second;
  }

  std::vector<const FixedColumn *> fixed;
  fixed.reserve(columns.size());
  for (const std::string_view column : columns) {
    const FixedColumn * c = fixed_data_.fixed_column(column);
    if (c == nullptr) {
      return fmt::format("{} is not a fixed column", column);
    }
    fixed.push_back(c);
  }

  Index index;
  for (DegreeType row = 0; row < fixed_data_.degree(); ++row) {
    std::vector<uint64_t> key;
    key.reserve(fixed.size());
    for (const FixedColumn * c : fixed) {
      key.push_back(c->values[row].to_canonical());
    }
    const auto [it, inserted] = index.emplace(std::move(key), Entry{row, false});
    if (!inserted) {
      it->second.multiple = true;
    }
  }

  spdlog::debug("Built lookup index on [{}] with {} keys", name, index.size());
  return &indices_.emplace(name, std::move(index)).first->second;
}

}  // namespace pilc
