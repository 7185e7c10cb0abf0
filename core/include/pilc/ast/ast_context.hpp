// pilc/ast/ast_context.hpp - Owner of PIL AST nodes
#pragma once

#include <gsl/span>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>

#include "pilc/ast/ast.hpp"
#include "pilc/basic/arena.hpp"

namespace pilc
{

/**
 * Owns all AST nodes and interned strings of one parse.
 *
 * Example:
 * @code
 *   AstContext ctx;
 *   auto * lit = ctx.create<NumberLiteralExpr>(ctx.intern("42"));
 * @endcode
 */
class AstContext
{
public:
  template <typename T, typename... Args>
  T * create(Args &&... args)
  {
    static_assert(std::is_base_of_v<AstNode, T>, "T must derive from AstNode");
    return arena_.make<T>(std::forward<Args>(args)...);
  }

  [[nodiscard]] std::string_view intern(std::string_view s) { return arena_.intern(s); }

  template <typename T>
  [[nodiscard]] gsl::span<T> copy_to_arena(const std::vector<T> & vec)
  {
    return arena_.copy_to_arena(vec);
  }

  [[nodiscard]] size_t get_string_count() const noexcept { return arena_.get_string_count(); }

private:
  Arena arena_;
};

}  // namespace pilc
