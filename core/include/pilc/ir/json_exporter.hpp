// pilc/ir/json_exporter.hpp - pil-stark style JSON export
#pragma once

#include <nlohmann/json.hpp>
#include <string>

#include "pilc/basic/result.hpp"
#include "pilc/ir/analyzed.hpp"

namespace pilc
{

/**
 * Export an analyzed program in the JSON layout consumed by pil-stark:
 * polynomial counts, `references`, a flat `expressions` table (intermediate
 * polynomials first, indexed by their id), `publics` and one list per
 * identity kind referring into the expression table.
 *
 * Only `+ - *`, negation, numbers, column references, intermediate
 * references and public references can be exported. Anything else yields
 * an error naming the offending expression.
 */
[[nodiscard]] Result<nlohmann::json, std::string> export_json(const Analyzed & analyzed);

}  // namespace pilc
