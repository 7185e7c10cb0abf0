// pilc/ir/display.cpp - Textual rendering of the analyzed program
#include "pilc/ir/display.hpp"

#include <fmt/core.h>
#include <fmt/format.h>

#include <algorithm>
#include <string_view>
#include <vector>

namespace pilc
{

namespace
{

std::string join_expressions(gsl::span<const Expression *> exprs)
{
  std::vector<std::string> parts;
  parts.reserve(exprs.size());
  for (const auto * e : exprs) {
    parts.push_back(format_expression(e));
  }
  return fmt::format("{}", fmt::join(parts, ", "));
}

std::string format_repeated_array(const RepeatedArray & array)
{
  return fmt::format(
    "[{}]{}", join_expressions(array.values()), array.repetitions() == 1 ? "" : "*");
}

std::string_view namespace_of(std::string_view absolute_name)
{
  const auto dot = absolute_name.find('.');
  return dot == std::string_view::npos ? std::string_view{} : absolute_name.substr(0, dot);
}

std::string format_declared_name(const Polynomial & poly)
{
  if (poly.length) {
    return fmt::format("{}[{}]", poly.absolute_name, *poly.length);
  }
  return std::string(poly.absolute_name);
}

std::string format_definition(const Definition & def)
{
  const Polynomial & poly = def.polynomial;
  const auto & function = def.function;

  switch (poly.poly_type) {
    case PolynomialType::Committed:
      if (function && function->kind() == FunctionValueKind::Query) {
        return fmt::format(
          "pol commit {}(i) query {};", poly.absolute_name,
          format_expression(function->expression()));
      }
      return fmt::format("pol commit {};", format_declared_name(poly));
    case PolynomialType::Constant:
      if (!function) {
        return fmt::format("pol constant {};", format_declared_name(poly));
      }
      if (function->kind() == FunctionValueKind::Array) {
        std::vector<std::string> segments;
        for (const auto & array : function->arrays()) {
          segments.push_back(format_repeated_array(array));
        }
        return fmt::format(
          "pol constant {} = {};", poly.absolute_name, fmt::join(segments, " + "));
      }
      return fmt::format(
        "pol constant {}(i) {{ {} }};", poly.absolute_name,
        format_expression(function->expression()));
    case PolynomialType::Intermediate:
      return fmt::format(
        "pol {} = {};", poly.absolute_name,
        function ? format_expression(function->expression()) : std::string("0"));
  }
  return {};
}

}  // namespace

std::string format_expression(const Expression * expr)
{
  if (expr == nullptr) {
    return "<none>";
  }

  switch (expr->get_kind()) {
    case ExpressionKind::ConstantReference:
      return fmt::format("%{}", cast<ConstantReference>(expr)->name);
    case ExpressionKind::PolynomialReference: {
      const auto * ref = cast<PolynomialReference>(expr);
      std::string out(ref->name);
      if (ref->index) {
        out += fmt::format("[{}]", *ref->index);
      }
      if (ref->next) {
        out += '\'';
      }
      return out;
    }
    case ExpressionKind::LocalVariableReference:
      return fmt::format("${}", cast<LocalVariableReference>(expr)->index);
    case ExpressionKind::PublicReference:
      return fmt::format(":{}", cast<PublicReference>(expr)->name);
    case ExpressionKind::Number:
      return cast<Number>(expr)->value.to_string();
    case ExpressionKind::StringLiteral:
      return fmt::format("\"{}\"", cast<StringLiteral>(expr)->value);
    case ExpressionKind::Tuple:
      return fmt::format("({})", join_expressions(cast<Tuple>(expr)->elements));
    case ExpressionKind::BinaryOperation: {
      const auto * bin = cast<BinaryOperation>(expr);
      return fmt::format(
        "({} {} {})", format_expression(bin->left), to_string(bin->op),
        format_expression(bin->right));
    }
    case ExpressionKind::UnaryOperation: {
      const auto * un = cast<UnaryOperation>(expr);
      return fmt::format("{}{}", to_string(un->op), format_expression(un->operand));
    }
    case ExpressionKind::FunctionCall: {
      const auto * call = cast<FunctionCall>(expr);
      return fmt::format("{}({})", call->name, join_expressions(call->arguments));
    }
    case ExpressionKind::MatchExpression: {
      const auto * m = cast<MatchExpression>(expr);
      std::string out = fmt::format("match {} {{ ", format_expression(m->scrutinee));
      for (const auto & arm : m->arms) {
        out += fmt::format(
          "{} => {}, ", arm.pattern ? arm.pattern->to_string() : std::string("_"),
          format_expression(arm.value));
      }
      out += '}';
      return out;
    }
  }
  return {};
}

std::string format_selected_expressions(const SelectedExpressions & sel)
{
  std::string out;
  if (sel.selector != nullptr) {
    out = format_expression(sel.selector) + " ";
  }
  out += fmt::format("{{ {} }}", join_expressions(sel.expressions));
  return out;
}

std::string format_identity(const Identity & identity)
{
  switch (identity.kind) {
    case IdentityKind::Polynomial:
      return fmt::format("{} = 0;", format_expression(identity.expression()));
    case IdentityKind::Plookup:
      return fmt::format(
        "{} in {};", format_selected_expressions(identity.left),
        format_selected_expressions(identity.right));
    case IdentityKind::Permutation:
      return fmt::format(
        "{} is {};", format_selected_expressions(identity.left),
        format_selected_expressions(identity.right));
    case IdentityKind::Connect:
      return fmt::format(
        "{} connect {};", format_selected_expressions(identity.left),
        format_selected_expressions(identity.right));
  }
  return {};
}

std::string format_analyzed(const Analyzed & analyzed)
{
  std::string out;

  std::vector<std::string_view> constant_names;
  constant_names.reserve(analyzed.constants.size());
  for (const auto & [name, value] : analyzed.constants) {
    constant_names.push_back(name);
  }
  std::sort(constant_names.begin(), constant_names.end());
  for (const auto name : constant_names) {
    out += fmt::format("constant %{} = {};\n", name, analyzed.constants.at(name).to_string());
  }

  std::string_view current_namespace;
  for (const auto & statement : analyzed.source_order) {
    switch (statement.kind()) {
      case StatementIdentifier::Kind::Definition: {
        const Definition * def = analyzed.find_definition(statement.name());
        if (def == nullptr) {
          break;
        }
        const auto ns = namespace_of(def->polynomial.absolute_name);
        if (ns != current_namespace) {
          current_namespace = ns;
          out += fmt::format("namespace {}({});\n", ns, def->polynomial.degree);
        }
        out += fmt::format("    {}\n", format_definition(*def));
        break;
      }
      case StatementIdentifier::Kind::PublicDeclaration: {
        const PublicDeclaration * decl = analyzed.find_public_declaration(statement.name());
        if (decl == nullptr) {
          break;
        }
        out += fmt::format(
          "    public {} = {}({});\n", decl->name, format_expression(decl->polynomial),
          decl->index);
        break;
      }
      case StatementIdentifier::Kind::Identity:
        out += fmt::format(
          "    {}\n", format_identity(analyzed.identities.at(statement.identity_index())));
        break;
    }
  }
  return out;
}

}  // namespace pilc
