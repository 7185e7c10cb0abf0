// pilc/ir/json_exporter.cpp - pil-stark style JSON export
#include "pilc/ir/json_exporter.hpp"

#include <fmt/core.h>

#include <algorithm>
#include <optional>
#include <vector>

#include "pilc/ir/display.hpp"

namespace pilc
{
namespace
{

using nlohmann::json;

const char * pol_type_name(PolynomialType type)
{
  switch (type) {
    case PolynomialType::Committed:
      return "cmP";
    case PolynomialType::Constant:
      return "constP";
    case PolynomialType::Intermediate:
      return "imP";
  }
  return "";
}

class Exporter
{
public:
  explicit Exporter(const Analyzed & analyzed) : analyzed_(analyzed) {}

  Result<json, std::string> run()
  {
    json out;
    out["nCommitments"] = analyzed_.commitment_count();
    out["nQ"] = 0;
    out["nIm"] = analyzed_.intermediate_count();
    out["nConstants"] = analyzed_.constant_count();
    out["references"] = references();

    // Intermediate polynomial ids index the first expressions
    const auto intermediates = analyzed_.intermediate_polys_in_source_order();
    expressions_ = json::array();
    for (size_t i = 0; i < intermediates.size(); ++i) {
      expressions_.push_back(nullptr);
    }
    for (const Definition * def : intermediates) {
      if (!def->function) {
        continue;
      }
      auto expr = expression(def->function->expression());
      if (!expr) {
        return expr.error();
      }
      expressions_.at(def->polynomial.id) = std::move(expr).value();
    }

    json publics = json::array();
    json pol_identities = json::array();
    json plookup_identities = json::array();
    json permutation_identities = json::array();
    json connection_identities = json::array();

    for (const auto & statement : analyzed_.source_order) {
      if (statement.kind() == StatementIdentifier::Kind::PublicDeclaration) {
        const PublicDeclaration * decl = analyzed_.find_public_declaration(statement.name());
        if (decl == nullptr) {
          continue;
        }
        auto pub = public_declaration(*decl);
        if (!pub) {
          return pub.error();
        }
        publics.push_back(std::move(pub).value());
        continue;
      }
      if (statement.kind() != StatementIdentifier::Kind::Identity) {
        continue;
      }

      const Identity & identity = analyzed_.identities.at(statement.identity_index());
      json entry{{"fileName", std::string(identity.source.file)}, {"line", identity.source.line}};

      switch (identity.kind) {
        case IdentityKind::Polynomial: {
          auto idx = add_expression(identity.expression());
          if (!idx) {
            return idx.error();
          }
          entry["e"] = idx.value();
          pol_identities.push_back(std::move(entry));
          break;
        }
        case IdentityKind::Plookup:
        case IdentityKind::Permutation: {
          auto left = selected(identity.left, "selF", "f", entry);
          if (!left) {
            return left.error();
          }
          auto right = selected(identity.right, "selT", "t", entry);
          if (!right) {
            return right.error();
          }
          (identity.kind == IdentityKind::Plookup ? plookup_identities : permutation_identities)
            .push_back(std::move(entry));
          break;
        }
        case IdentityKind::Connect: {
          auto left = selected(identity.left, "", "pols", entry);
          if (!left) {
            return left.error();
          }
          auto right = selected(identity.right, "", "connections", entry);
          if (!right) {
            return right.error();
          }
          connection_identities.push_back(std::move(entry));
          break;
        }
      }
    }

    out["publics"] = std::move(publics);
    out["expressions"] = std::move(expressions_);
    out["polIdentities"] = std::move(pol_identities);
    out["plookupIdentities"] = std::move(plookup_identities);
    out["permutationIdentities"] = std::move(permutation_identities);
    out["connectionIdentities"] = std::move(connection_identities);
    return out;
  }

private:
  json references() const
  {
    json refs = json::object();
    for (const auto type :
         {PolynomialType::Committed, PolynomialType::Constant, PolynomialType::Intermediate}) {
      for (const Definition * def : analyzed_.definitions_in_source_order(type)) {
        const Polynomial & poly = def->polynomial;
        json ref{
          {"type", pol_type_name(poly.poly_type)},
          {"id", poly.id},
          {"polDeg", poly.degree},
          {"isArray", poly.is_array()},
          {"elementType", nullptr},
          {"len", nullptr}};
        if (poly.length) {
          ref["len"] = *poly.length;
        }
        refs[std::string(poly.absolute_name)] = std::move(ref);
      }
    }
    return refs;
  }

  Result<json, std::string> public_declaration(const PublicDeclaration & decl) const
  {
    const Definition * def = analyzed_.find_definition(decl.polynomial->name);
    if (def == nullptr) {
      return fmt::format("Public '{}' refers to unknown polynomial", decl.name);
    }
    return json{
      {"polType", pol_type_name(def->polynomial.poly_type)},
      {"polId", def->polynomial.id + decl.polynomial->index.value_or(0)},
      {"idx", decl.index},
      {"id", decl.id},
      {"name", std::string(decl.name)}};
  }

  Result<size_t, std::string> add_expression(const Expression * expr)
  {
    auto e = expression(expr);
    if (!e) {
      return e.error();
    }
    expressions_.push_back(std::move(e).value());
    return expressions_.size() - 1;
  }

  /// Adds selector (when `sel_key` is non-empty) and expression indices to `entry`
  Result<bool, std::string> selected(
    const SelectedExpressions & sel, const char * sel_key, const char * list_key, json & entry)
  {
    if (sel_key[0] != '\0') {
      entry[sel_key] = nullptr;
      if (sel.selector != nullptr) {
        auto idx = add_expression(sel.selector);
        if (!idx) {
          return idx.error();
        }
        entry[sel_key] = idx.value();
      }
    }
    json list = json::array();
    for (const auto * e : sel.expressions) {
      auto idx = add_expression(e);
      if (!idx) {
        return idx.error();
      }
      list.push_back(idx.value());
    }
    entry[list_key] = std::move(list);
    return true;
  }

  static uint64_t degree_of(const json & e) { return e.at("deg").get<uint64_t>(); }

  Result<json, std::string> expression(const Expression * expr) const
  {
    const auto unsupported = [expr]() {
      return fmt::format("Unsupported expression in JSON export: {}", format_expression(expr));
    };

    switch (expr->get_kind()) {
      case ExpressionKind::Number:
        return json{
          {"op", "number"}, {"deg", 0}, {"value", cast<Number>(expr)->value.to_string()}};
      case ExpressionKind::ConstantReference: {
        const auto value = analyzed_.find_constant(cast<ConstantReference>(expr)->name);
        if (!value) {
          return unsupported();
        }
        return json{{"op", "number"}, {"deg", 0}, {"value", value->to_string()}};
      }
      case ExpressionKind::PublicReference: {
        const auto * decl =
          analyzed_.find_public_declaration(cast<PublicReference>(expr)->name);
        if (decl == nullptr) {
          return unsupported();
        }
        return json{{"op", "public"}, {"deg", 0}, {"id", decl->id}};
      }
      case ExpressionKind::PolynomialReference: {
        const auto * ref = cast<PolynomialReference>(expr);
        const Definition * def = analyzed_.find_definition(ref->name);
        if (def == nullptr) {
          return unsupported();
        }
        const Polynomial & poly = def->polynomial;
        const uint64_t id = poly.id + ref->index.value_or(0);
        switch (poly.poly_type) {
          case PolynomialType::Committed:
            return json{{"op", "cm"}, {"deg", 1}, {"id", id}, {"next", ref->next}};
          case PolynomialType::Constant:
            return json{{"op", "const"}, {"deg", 1}, {"id", id}, {"next", ref->next}};
          case PolynomialType::Intermediate: {
            const auto & target = expressions_.at(id);
            const uint64_t deg = target.is_null() ? 1 : degree_of(target);
            return json{{"op", "exp"}, {"deg", deg}, {"id", id}, {"next", ref->next}};
          }
        }
        return unsupported();
      }
      case ExpressionKind::BinaryOperation: {
        const auto * bin = cast<BinaryOperation>(expr);
        const char * op = nullptr;
        switch (bin->op) {
          case BinaryOperator::Add:
            op = "add";
            break;
          case BinaryOperator::Sub:
            op = "sub";
            break;
          case BinaryOperator::Mul:
            op = "mul";
            break;
          default:
            return unsupported();
        }
        auto left = expression(bin->left);
        if (!left) {
          return left;
        }
        auto right = expression(bin->right);
        if (!right) {
          return right;
        }
        const uint64_t deg = bin->op == BinaryOperator::Mul
                               ? degree_of(*left) + degree_of(*right)
                               : std::max(degree_of(*left), degree_of(*right));
        return json{
          {"op", op},
          {"deg", deg},
          {"values", json::array({std::move(left).value(), std::move(right).value()})}};
      }
      case ExpressionKind::UnaryOperation: {
        const auto * un = cast<UnaryOperation>(expr);
        auto operand = expression(un->operand);
        if (!operand || un->op == UnaryOperator::Plus) {
          return operand;
        }
        const uint64_t deg = degree_of(*operand);
        return json{
          {"op", "neg"}, {"deg", deg}, {"values", json::array({std::move(operand).value()})}};
      }
      case ExpressionKind::LocalVariableReference:
      case ExpressionKind::StringLiteral:
      case ExpressionKind::Tuple:
      case ExpressionKind::FunctionCall:
      case ExpressionKind::MatchExpression:
        return unsupported();
    }
    return unsupported();
  }

  const Analyzed & analyzed_;
  json expressions_ = json::array();
};

}  // namespace

Result<nlohmann::json, std::string> export_json(const Analyzed & analyzed)
{
  return Exporter(analyzed).run();
}

}  // namespace pilc
