// pilc/ir/ir_context.hpp - Owner of analyzed expressions and names
#pragma once

#include <gsl/span>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>

#include "pilc/basic/arena.hpp"

namespace pilc
{

class Expression;

/**
 * Arena backing one Analyzed program: expression nodes, interned
 * polynomial names and source file names.
 */
class IrContext
{
public:
  template <typename T, typename... Args>
  const T * create(Args &&... args)
  {
    static_assert(std::is_base_of_v<Expression, T>, "T must derive from Expression");
    return arena_.make<T>(std::forward<Args>(args)...);
  }

  [[nodiscard]] std::string_view intern(std::string_view s) { return arena_.intern(s); }

  template <typename T>
  [[nodiscard]] gsl::span<T> copy_to_arena(const std::vector<T> & vec)
  {
    return arena_.copy_to_arena(vec);
  }

private:
  Arena arena_;
};

}  // namespace pilc
