// pilc/sema/pil_analyzer.cpp - Lowering of the PIL AST into Analyzed
#include "pilc/sema/pil_analyzer.hpp"

#include <fmt/core.h>
#include <spdlog/spdlog.h>

#include <algorithm>

#include "pilc/sema/const_evaluator.hpp"

namespace pilc
{

namespace
{

size_t type_index(PolynomialType type) { return static_cast<size_t>(type); }

size_t kind_index(IdentityKind kind) { return static_cast<size_t>(kind); }

}  // namespace

PilAnalyzer::PilAnalyzer(const SourceRegistry * sources, DiagnosticBag & diags)
: sources_(sources), diags_(diags)
{
}

AnalysisResult PilAnalyzer::analyze(const Program & program)
{
  analyzed_ = std::make_unique<Analyzed>();
  namespace_ = "Global";
  degree_.reset();
  next_poly_id_ = {};
  next_public_id_ = 0;
  next_identity_id_ = {};
  pending_.clear();

  const size_t errors_before = diags_.errors().size();

  for (const Stmt * stmt : program.statements) {
    handle_statement(stmt);
  }
  check_references();

  const bool success = diags_.errors().size() == errors_before;
  spdlog::debug(
    "analyzed {} definitions, {} public declarations, {} identities ({} errors)",
    analyzed_->definitions.size(), analyzed_->public_declarations.size(),
    analyzed_->identities.size(), diags_.errors().size() - errors_before);

  return AnalysisResult{std::move(analyzed_), success};
}

// ============================================================================
// Statements
// ============================================================================

void PilAnalyzer::handle_statement(const Stmt * stmt)
{
  switch (stmt->get_kind()) {
    case NodeKind::Namespace:
      handle_namespace(cast<NamespaceStmt>(stmt));
      break;
    case NodeKind::ConstantDefinition:
      handle_constant_definition(cast<ConstantDefinitionStmt>(stmt));
      break;
    case NodeKind::PolynomialDefinition:
      handle_polynomial_definition(cast<PolynomialDefinitionStmt>(stmt));
      break;
    case NodeKind::PublicDeclaration:
      handle_public_declaration(cast<PublicDeclarationStmt>(stmt));
      break;
    case NodeKind::PolynomialConstantDeclaration:
      handle_constant_declaration(cast<PolynomialConstantDeclarationStmt>(stmt));
      break;
    case NodeKind::PolynomialConstantDefinition:
      handle_constant_definition_fn(cast<PolynomialConstantDefinitionStmt>(stmt));
      break;
    case NodeKind::PolynomialCommitDeclaration:
      handle_commit_declaration(cast<PolynomialCommitDeclarationStmt>(stmt));
      break;
    case NodeKind::PolynomialIdentity:
    case NodeKind::PlookupIdentity:
    case NodeKind::PermutationIdentity:
    case NodeKind::ConnectIdentity:
      handle_identity(stmt);
      break;
    default:
      diags_.report_error(stmt->get_range(), "Unsupported statement")
        .with_code(DiagCode::UnsupportedExpression);
      break;
  }
}

void PilAnalyzer::handle_namespace(const NamespaceStmt * stmt)
{
  namespace_ = analyzed_->context().intern(stmt->name);
  degree_ = evaluate_degree(stmt->degree, "namespace degree");
}

void PilAnalyzer::handle_constant_definition(const ConstantDefinitionStmt * stmt)
{
  const std::string_view name = analyzed_->context().intern(stmt->name);
  if (analyzed_->constants.count(name) != 0) {
    diags_.report_error(stmt->get_range(), fmt::format("Constant %{} already defined", name))
      .with_code(DiagCode::DuplicateSymbol);
    return;
  }

  const Expression * value = lower_expr(stmt->value);
  if (value == nullptr) {
    return;
  }
  const ConstantEvaluator evaluator(analyzed_->constants);
  auto result = evaluator.evaluate(value);
  if (!result) {
    diags_.report_error(stmt->value->get_range(), result.error(), "not a constant")
      .with_code(DiagCode::NotAConstant);
    return;
  }
  analyzed_->constants.emplace(name, FieldElement::from_abstract(result.value()));
}

void PilAnalyzer::handle_polynomial_definition(const PolynomialDefinitionStmt * stmt)
{
  const Expression * value = lower_expr(stmt->value);
  if (value == nullptr) {
    return;
  }
  declare_polynomial(
    stmt, stmt->name, PolynomialType::Intermediate, std::nullopt,
    FunctionValueDefinition::make_mapping(value));
}

void PilAnalyzer::handle_public_declaration(const PublicDeclarationStmt * stmt)
{
  const std::string_view name = analyzed_->context().intern(stmt->name);
  if (analyzed_->public_declarations.count(name) != 0) {
    diags_.report_error(stmt->get_range(), fmt::format("Public '{}' already declared", name))
      .with_code(DiagCode::DuplicateSymbol);
    return;
  }

  const auto * polynomial = dyn_cast<PolynomialReference>(lower_expr(stmt->polynomial));
  const auto index = evaluate_degree(stmt->index, "public row index");
  if (polynomial == nullptr || !index) {
    if (stmt->polynomial != nullptr && polynomial == nullptr) {
      diags_.report_error(stmt->polynomial->get_range(), "Public must refer to a polynomial")
        .with_code(DiagCode::UnknownSymbol);
    }
    return;
  }

  const PublicDeclaration decl{
    next_public_id_++, source_ref(stmt->get_range()), name, polynomial, *index};
  analyzed_->public_declarations.emplace(name, decl);
  analyzed_->source_order.push_back(StatementIdentifier::public_declaration(name));
}

void PilAnalyzer::handle_constant_declaration(const PolynomialConstantDeclarationStmt * stmt)
{
  for (const PolyDeclName * decl : stmt->names) {
    const auto length = array_length(decl);
    if (decl->array_size != nullptr && !length) {
      continue;
    }
    declare_polynomial(decl, decl->name, PolynomialType::Constant, length, std::nullopt);
  }
}

void PilAnalyzer::handle_constant_definition_fn(const PolynomialConstantDefinitionStmt * stmt)
{
  const FunctionDef * def = stmt->definition;
  std::optional<FunctionValueDefinition> function;

  switch (def->def_kind) {
    case FunctionDefKind::Mapping: {
      locals_.assign(def->params.begin(), def->params.end());
      const Expression * body = lower_expr(def->body);
      locals_.clear();
      if (body == nullptr) {
        return;
      }
      function = FunctionValueDefinition::make_mapping(body);
      break;
    }
    case FunctionDefKind::Array:
      function = lower_array(def, stmt->get_range());
      if (!function) {
        return;
      }
      break;
    case FunctionDefKind::Query:
      diags_.report_error(stmt->get_range(), "Constant polynomials cannot be queried")
        .with_code(DiagCode::UnsupportedExpression);
      return;
  }

  declare_polynomial(
    stmt, stmt->name, PolynomialType::Constant, std::nullopt, std::move(function));
}

void PilAnalyzer::handle_commit_declaration(const PolynomialCommitDeclarationStmt * stmt)
{
  if (stmt->query != nullptr) {
    if (stmt->names.size() != 1 || stmt->names[0]->array_size != nullptr) {
      diags_.report_error(stmt->get_range(), "A query must be attached to a single scalar column")
        .with_code(DiagCode::UnsupportedExpression);
      return;
    }
    locals_.assign(stmt->query->params.begin(), stmt->query->params.end());
    const Expression * body = lower_expr(stmt->query->body);
    locals_.clear();
    if (body == nullptr) {
      return;
    }
    declare_polynomial(
      stmt->names[0], stmt->names[0]->name, PolynomialType::Committed, std::nullopt,
      FunctionValueDefinition::make_query(body));
    return;
  }

  for (const PolyDeclName * decl : stmt->names) {
    const auto length = array_length(decl);
    if (decl->array_size != nullptr && !length) {
      continue;
    }
    declare_polynomial(decl, decl->name, PolynomialType::Committed, length, std::nullopt);
  }
}

void PilAnalyzer::handle_identity(const Stmt * stmt)
{
  if (const auto * poly = dyn_cast<PolynomialIdentityStmt>(stmt)) {
    const Expression * lhs = lower_expr(poly->lhs);
    const Expression * expr = lhs;
    if (poly->rhs != nullptr) {
      const Expression * rhs = lower_expr(poly->rhs);
      if (lhs == nullptr || rhs == nullptr) {
        return;
      }
      expr = analyzed_->context().create<BinaryOperation>(lhs, BinaryOperator::Sub, rhs);
    }
    if (expr == nullptr) {
      return;
    }
    add_identity(stmt, IdentityKind::Polynomial, SelectedExpressions{expr, {}}, {});
    return;
  }

  if (const auto * lookup = dyn_cast<PlookupIdentityStmt>(stmt)) {
    if (!check_selected_lengths(stmt, "Lookup", lookup->left, lookup->right)) {
      return;
    }
    add_identity(
      stmt, IdentityKind::Plookup, lower_selected(lookup->left), lower_selected(lookup->right));
    return;
  }

  if (const auto * perm = dyn_cast<PermutationIdentityStmt>(stmt)) {
    if (!check_selected_lengths(stmt, "Permutation", perm->left, perm->right)) {
      return;
    }
    add_identity(
      stmt, IdentityKind::Permutation, lower_selected(perm->left), lower_selected(perm->right));
    return;
  }

  const auto * connect = cast<ConnectIdentityStmt>(stmt);
  if (connect->left.size() != connect->right.size()) {
    diags_
      .report_error(
        connect->get_range(),
        fmt::format(
          "Connect identity sides differ in length ({} vs {})", connect->left.size(),
          connect->right.size()))
      .with_code(DiagCode::InvalidIdentity);
    return;
  }
  add_identity(
    stmt, IdentityKind::Connect, SelectedExpressions{nullptr, lower_list(connect->left)},
    SelectedExpressions{nullptr, lower_list(connect->right)});
}

// ============================================================================
// Declarations
// ============================================================================

void PilAnalyzer::declare_polynomial(
  const AstNode * node, std::string_view name, PolynomialType type,
  std::optional<DegreeType> length, std::optional<FunctionValueDefinition> function)
{
  if (!degree_) {
    diags_
      .report_error(
        node->get_range(),
        fmt::format("Polynomial '{}' declared before any namespace degree", name))
      .with_code(DiagCode::MissingDegree)
      .with_help("start the file with 'namespace Name(degree);'");
    return;
  }

  const std::string_view abs_name =
    analyzed_->context().intern(absolute_name(namespace_, name));
  if (analyzed_->definitions.count(abs_name) != 0) {
    diags_
      .report_error(node->get_range(), fmt::format("Polynomial '{}' already declared", abs_name))
      .with_code(DiagCode::DuplicateSymbol);
    return;
  }

  auto & next_id = next_poly_id_[type_index(type)];
  Polynomial poly{next_id, source_ref(node->get_range()), abs_name, type, *degree_, length};
  next_id += length.value_or(1);

  analyzed_->definitions.emplace(abs_name, Definition{poly, std::move(function)});
  analyzed_->source_order.push_back(StatementIdentifier::definition(abs_name));
}

std::optional<DegreeType> PilAnalyzer::array_length(const PolyDeclName * decl)
{
  if (decl->array_size == nullptr) {
    return std::nullopt;
  }
  return evaluate_degree(decl->array_size, "array length");
}

std::optional<FunctionValueDefinition> PilAnalyzer::lower_array(
  const FunctionDef * def, SourceRange range)
{
  if (!degree_) {
    diags_.report_error(range, "Array defined before any namespace degree")
      .with_code(DiagCode::MissingDegree);
    return std::nullopt;
  }

  const ArrayValue * repeated = nullptr;
  DegreeType fixed_size = 0;
  for (const ArrayValue * segment : def->segments) {
    if (!segment->repeated) {
      fixed_size += segment->elements.size();
      continue;
    }
    if (repeated != nullptr) {
      diags_.report_error(segment->get_range(), "Only one repeated array segment is allowed")
        .with_code(DiagCode::InvalidArrayValue)
        .with_secondary_label(repeated->get_range(), "first repeated segment");
      return std::nullopt;
    }
    if (segment->elements.empty()) {
      diags_.report_error(segment->get_range(), "Repeated array segment is empty")
        .with_code(DiagCode::InvalidArrayValue);
      return std::nullopt;
    }
    repeated = segment;
  }

  const DegreeType degree = *degree_;
  DegreeType repetitions = 0;
  if (fixed_size > degree) {
    diags_
      .report_error(
        range, fmt::format("Array has {} elements but the degree is {}", fixed_size, degree))
      .with_code(DiagCode::DegreeMismatch);
    return std::nullopt;
  }
  if (repeated != nullptr) {
    const DegreeType remaining = degree - fixed_size;
    if (remaining % repeated->elements.size() != 0) {
      diags_
        .report_error(
          repeated->get_range(),
          fmt::format(
            "Repeated segment of length {} cannot fill the remaining {} rows",
            repeated->elements.size(), remaining))
        .with_code(DiagCode::DegreeMismatch);
      return std::nullopt;
    }
    repetitions = remaining / repeated->elements.size();
  } else if (fixed_size != degree) {
    diags_
      .report_error(
        range, fmt::format("Array has {} elements but the degree is {}", fixed_size, degree))
      .with_code(DiagCode::DegreeMismatch)
      .with_help("append a repeated segment such as '[0]*'");
    return std::nullopt;
  }

  std::vector<RepeatedArray> arrays;
  for (const ArrayValue * segment : def->segments) {
    if (segment == repeated && repetitions == 0) {
      continue;
    }
    const auto values = lower_list(segment->elements);
    const auto array =
      RepeatedArray::create(values, segment == repeated ? repetitions : DegreeType{1});
    if (!array) {
      diags_.report_error(segment->get_range(), "Invalid array segment")
        .with_code(DiagCode::InvalidArrayValue);
      return std::nullopt;
    }
    arrays.push_back(*array);
  }
  return FunctionValueDefinition::make_array(std::move(arrays));
}

void PilAnalyzer::add_identity(
  const Stmt * stmt, IdentityKind kind, SelectedExpressions left, SelectedExpressions right)
{
  Identity identity;
  identity.id = next_identity_id_[kind_index(kind)]++;
  identity.kind = kind;
  identity.source = source_ref(stmt->get_range());
  identity.left = left;
  identity.right = right;

  analyzed_->source_order.push_back(
    StatementIdentifier::identity(analyzed_->identities.size()));
  analyzed_->identities.push_back(identity);
}

bool PilAnalyzer::check_selected_lengths(
  const Stmt * stmt, std::string_view what, const SelectedExprs * left,
  const SelectedExprs * right)
{
  if (left->expressions.size() == right->expressions.size()) {
    return true;
  }
  diags_
    .report_error(
      stmt->get_range(),
      fmt::format(
        "{} identity sides differ in length ({} vs {})", what, left->expressions.size(),
        right->expressions.size()))
    .with_code(DiagCode::InvalidIdentity)
    .with_secondary_label(left->get_range(), "left side")
    .with_secondary_label(right->get_range(), "right side");
  return false;
}

// ============================================================================
// Expressions
// ============================================================================

const Expression * PilAnalyzer::lower_expr(const Expr * expr)
{
  if (expr == nullptr) {
    return nullptr;
  }
  IrContext & ctx = analyzed_->context();

  switch (expr->get_kind()) {
    case NodeKind::NumberLiteral: {
      const auto * lit = cast<NumberLiteralExpr>(expr);
      const auto value = parse_abstract(lit->text);
      if (!value) {
        diags_.report_error(lit->get_range(), fmt::format("Invalid number '{}'", lit->text))
          .with_code(DiagCode::NotAConstant);
        return nullptr;
      }
      return ctx.create<Number>(FieldElement::from_abstract(*value));
    }
    case NodeKind::StringLiteral:
      return ctx.create<StringLiteral>(ctx.intern(cast<StringLiteralExpr>(expr)->value));
    case NodeKind::ConstantRef: {
      const auto * ref =
        ctx.create<ConstantReference>(ctx.intern(cast<ConstantRefExpr>(expr)->name));
      pending_.push_back({PendingReference::Kind::Constant, ref, expr->get_range()});
      return ref;
    }
    case NodeKind::PolyRef:
      return lower_poly_ref(cast<PolyRefExpr>(expr));
    case NodeKind::PublicRef: {
      const auto * ref =
        ctx.create<PublicReference>(ctx.intern(cast<PublicRefExpr>(expr)->name));
      pending_.push_back({PendingReference::Kind::Public, ref, expr->get_range()});
      return ref;
    }
    case NodeKind::FunctionCall: {
      const auto * call = cast<FunctionCallExpr>(expr);
      const auto args = lower_list(call->arguments);
      const auto * lowered = ctx.create<FunctionCall>(
        ctx.intern(absolute_name(namespace_, call->name)), args);
      pending_.push_back({PendingReference::Kind::Function, lowered, expr->get_range()});
      return lowered;
    }
    case NodeKind::Tuple:
      return ctx.create<Tuple>(lower_list(cast<TupleExpr>(expr)->elements));
    case NodeKind::Binary: {
      const auto * bin = cast<BinaryExpr>(expr);
      const Expression * lhs = lower_expr(bin->lhs);
      const Expression * rhs = lower_expr(bin->rhs);
      if (lhs == nullptr || rhs == nullptr) {
        return nullptr;
      }
      return ctx.create<BinaryOperation>(lhs, bin->op, rhs);
    }
    case NodeKind::Unary: {
      const auto * un = cast<UnaryExpr>(expr);
      const Expression * operand = lower_expr(un->operand);
      if (operand == nullptr) {
        return nullptr;
      }
      return ctx.create<UnaryOperation>(un->op, operand);
    }
    case NodeKind::Match:
      return lower_match(cast<MatchExpr>(expr));
    default:
      break;
  }

  diags_.report_error(expr->get_range(), "Unsupported expression")
    .with_code(DiagCode::UnsupportedExpression);
  return nullptr;
}

const Expression * PilAnalyzer::lower_poly_ref(const PolyRefExpr * ref)
{
  IrContext & ctx = analyzed_->context();

  if (ref->namespace_name.empty() && ref->index == nullptr && !ref->next) {
    const auto it = std::find(locals_.begin(), locals_.end(), ref->name);
    if (it != locals_.end()) {
      return ctx.create<LocalVariableReference>(static_cast<uint64_t>(it - locals_.begin()));
    }
  }

  std::optional<uint64_t> index;
  if (ref->index != nullptr) {
    index = evaluate_degree(ref->index, "array index");
    if (!index) {
      return nullptr;
    }
  }

  const std::string_view ns = ref->namespace_name.empty() ? namespace_ : ref->namespace_name;
  const auto * lowered =
    ctx.create<PolynomialReference>(ctx.intern(absolute_name(ns, ref->name)), index, ref->next);
  pending_.push_back({PendingReference::Kind::Polynomial, lowered, ref->get_range()});
  return lowered;
}

const Expression * PilAnalyzer::lower_match(const MatchExpr * match)
{
  const Expression * scrutinee = lower_expr(match->scrutinee);
  if (scrutinee == nullptr) {
    return nullptr;
  }

  std::vector<MatchExpressionArm> arms;
  arms.reserve(match->arms.size());
  for (const MatchArm * arm : match->arms) {
    MatchExpressionArm lowered;
    if (arm->pattern != nullptr) {
      const Expression * pattern = lower_expr(arm->pattern);
      if (pattern == nullptr) {
        return nullptr;
      }
      const ConstantEvaluator evaluator(analyzed_->constants);
      auto value = evaluator.evaluate(pattern);
      if (!value) {
        diags_.report_error(arm->pattern->get_range(), value.error(), "pattern must be constant")
          .with_code(DiagCode::NotAConstant);
        return nullptr;
      }
      lowered.pattern = FieldElement::from_abstract(value.value());
    }
    lowered.value = lower_expr(arm->value);
    if (lowered.value == nullptr) {
      return nullptr;
    }
    arms.push_back(lowered);
  }

  return analyzed_->context().create<MatchExpression>(
    scrutinee, analyzed_->context().copy_to_arena(arms));
}

gsl::span<const Expression *> PilAnalyzer::lower_list(gsl::span<Expr *> exprs)
{
  std::vector<const Expression *> lowered;
  lowered.reserve(exprs.size());
  for (const Expr * e : exprs) {
    const Expression * l = lower_expr(e);
    if (l != nullptr) {
      lowered.push_back(l);
    }
  }
  return analyzed_->context().copy_to_arena(lowered);
}

SelectedExpressions PilAnalyzer::lower_selected(const SelectedExprs * sel)
{
  SelectedExpressions result;
  if (sel == nullptr) {
    return result;
  }
  if (sel->selector != nullptr) {
    result.selector = lower_expr(sel->selector);
  }
  result.expressions = lower_list(sel->expressions);
  return result;
}

std::optional<DegreeType> PilAnalyzer::evaluate_degree(const Expr * expr, std::string_view what)
{
  const Expression * lowered = lower_expr(expr);
  if (lowered == nullptr) {
    return std::nullopt;
  }
  const ConstantEvaluator evaluator(analyzed_->constants);
  auto result = evaluator.evaluate_degree(lowered);
  if (!result) {
    diags_
      .report_error(
        expr->get_range(), fmt::format("Invalid {}: {}", what, result.error()), "not a constant")
      .with_code(DiagCode::NotAConstant);
    return std::nullopt;
  }
  return result.value();
}

// ============================================================================
// Reference checks
// ============================================================================

void PilAnalyzer::check_references()
{
  for (const auto & pending : pending_) {
    switch (pending.kind) {
      case PendingReference::Kind::Constant: {
        const auto name = cast<ConstantReference>(pending.expr)->name;
        if (analyzed_->constants.count(name) == 0) {
          diags_.report_error(pending.range, fmt::format("Unknown constant %{}", name))
            .with_code(DiagCode::UnknownSymbol);
        }
        break;
      }
      case PendingReference::Kind::Public: {
        const auto name = cast<PublicReference>(pending.expr)->name;
        if (analyzed_->public_declarations.count(name) == 0) {
          diags_.report_error(pending.range, fmt::format("Unknown public '{}'", name))
            .with_code(DiagCode::UnknownSymbol);
        }
        break;
      }
      case PendingReference::Kind::Function: {
        const auto name = cast<FunctionCall>(pending.expr)->name;
        const Definition * def = analyzed_->find_definition(name);
        if (def == nullptr || !def->function) {
          diags_.report_error(pending.range, fmt::format("Unknown function '{}'", name))
            .with_code(DiagCode::UnknownSymbol);
        }
        break;
      }
      case PendingReference::Kind::Polynomial: {
        const auto * ref = cast<PolynomialReference>(pending.expr);
        const Definition * def = analyzed_->find_definition(ref->name);
        if (def == nullptr) {
          diags_
            .report_error(
              pending.range, fmt::format("Unknown polynomial '{}'", ref->name), "not declared")
            .with_code(DiagCode::UnknownSymbol);
          break;
        }
        const Polynomial & poly = def->polynomial;
        if (ref->index && !poly.is_array()) {
          diags_
            .report_error(
              pending.range, fmt::format("Polynomial '{}' is not an array", ref->name))
            .with_code(DiagCode::InvalidArrayIndex);
        } else if (ref->index && *ref->index >= *poly.length) {
          diags_
            .report_error(
              pending.range,
              fmt::format(
                "Index {} out of bounds for '{}' of length {}", *ref->index, ref->name,
                *poly.length))
            .with_code(DiagCode::InvalidArrayIndex);
        } else if (!ref->index && poly.is_array()) {
          diags_.report_error(pending.range, fmt::format("Array '{}' must be indexed", ref->name))
            .with_code(DiagCode::InvalidArrayIndex);
        }
        break;
      }
    }
  }
  pending_.clear();
}

// ============================================================================
// Helpers
// ============================================================================

std::string PilAnalyzer::absolute_name(std::string_view ns, std::string_view name) const
{
  // Already qualified
  if (name.find('.') != std::string_view::npos) {
    return std::string(name);
  }
  return fmt::format("{}.{}", ns, name);
}

SourceRef PilAnalyzer::source_ref(SourceRange range)
{
  if (sources_ == nullptr || !range.is_valid()) {
    return {};
  }
  const std::string path = sources_->get_path(range.file_id()).string();
  return SourceRef{analyzed_->context().intern(path), sources_->line_of(range)};
}

}  // namespace pilc
