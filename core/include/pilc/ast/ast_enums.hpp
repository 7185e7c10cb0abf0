// pilc/ast/ast_enums.hpp - AST enumeration definitions
//
// Node kinds, operators and function-definition kinds shared by the PIL
// AST and the analyzed IR.
//
#pragma once

#include <cstdint>
#include <string_view>

namespace pilc
{

// ============================================================================
// NodeKind - Identifies all AST node types
// ============================================================================

/**
 * Node kind enumeration for LLVM-style RTTI.
 * Nodes are grouped by category for range-based classof checks.
 * Generated from ast_nodes.def.
 */
enum class NodeKind : uint8_t {
// === Expressions ===
#define AST_NODE_EXPR(Class, Kind, Snake) Kind,
#include "pilc/ast/ast_nodes.def"

// === Statements ===
#define AST_NODE_STMT(Class, Kind, Snake) Kind,
#include "pilc/ast/ast_nodes.def"

// === Supporting nodes ===
#define AST_NODE_SUPPORT(Class, Kind, Snake) Kind,
#include "pilc/ast/ast_nodes.def"

// === Top-level ===
#define AST_NODE_TOP(Class, Kind, Snake) Kind,
#include "pilc/ast/ast_nodes.def"
};

// ============================================================================
// Operators
// ============================================================================

enum class BinaryOperator : uint8_t {
  Add,         ///< +
  Sub,         ///< -
  Mul,         ///< *
  Div,         ///< /
  Mod,         ///< %
  Pow,         ///< **
  BinaryAnd,   ///< &
  BinaryXor,   ///< ^
  BinaryOr,    ///< |
  ShiftLeft,   ///< <<
  ShiftRight,  ///< >>
};

enum class UnaryOperator : uint8_t {
  Plus,   ///< +
  Minus,  ///< -
};

/// Shape of a function-valued polynomial definition
enum class FunctionDefKind : uint8_t {
  Mapping,  ///< pol constant F(i) { expr }
  Array,    ///< pol constant F = [..] + [..]*
  Query,    ///< pol commit x(i) query expr
};

// ============================================================================
// to_string() Helper Functions
// ============================================================================

[[nodiscard]] constexpr std::string_view to_string(BinaryOperator op) noexcept
{
  switch (op) {
    case BinaryOperator::Add:
      return "+";
    case BinaryOperator::Sub:
      return "-";
    case BinaryOperator::Mul:
      return "*";
    case BinaryOperator::Div:
      return "/";
    case BinaryOperator::Mod:
      return "%";
    case BinaryOperator::Pow:
      return "**";
    case BinaryOperator::BinaryAnd:
      return "&";
    case BinaryOperator::BinaryXor:
      return "^";
    case BinaryOperator::BinaryOr:
      return "|";
    case BinaryOperator::ShiftLeft:
      return "<<";
    case BinaryOperator::ShiftRight:
      return ">>";
  }
  return "";
}

[[nodiscard]] constexpr std::string_view to_string(UnaryOperator op) noexcept
{
  switch (op) {
    case UnaryOperator::Plus:
      return "+";
    case UnaryOperator::Minus:
      return "-";
  }
  return "";
}

// ============================================================================
// NodeKind Range Helpers
// ============================================================================

namespace detail
{

inline constexpr NodeKind k_first_expr_kind = NodeKind::NumberLiteral;
inline constexpr NodeKind k_last_expr_kind = NodeKind::Match;

inline constexpr NodeKind k_first_stmt_kind = NodeKind::Namespace;
inline constexpr NodeKind k_last_stmt_kind = NodeKind::ConnectIdentity;

}  // namespace detail

[[nodiscard]] constexpr bool is_expr_kind(NodeKind kind) noexcept
{
  return kind >= detail::k_first_expr_kind && kind <= detail::k_last_expr_kind;
}

[[nodiscard]] constexpr bool is_stmt_kind(NodeKind kind) noexcept
{
  return kind >= detail::k_first_stmt_kind && kind <= detail::k_last_stmt_kind;
}

[[nodiscard]] constexpr bool is_identity_stmt_kind(NodeKind kind) noexcept
{
  return kind >= NodeKind::PolynomialIdentity && kind <= NodeKind::ConnectIdentity;
}

}  // namespace pilc
