// pilc/sema/pil_analyzer.hpp - Lowering of the PIL AST into Analyzed
#pragma once

#include <array>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "pilc/ast/ast.hpp"
#include "pilc/basic/diagnostic.hpp"
#include "pilc/basic/source_manager.hpp"
#include "pilc/ir/analyzed.hpp"

namespace pilc
{

struct AnalysisResult
{
  /// Always present; partially filled when `success` is false
  std::unique_ptr<Analyzed> analyzed;
  bool success = false;
};

/**
 * Lowers a PIL Program into an Analyzed program.
 *
 * - `namespace N(degree);` sets the prefix and degree of later declarations
 *   (default namespace "Global", no default degree)
 * - names resolve to "Namespace.name"; constants stay un-namespaced
 * - polynomial ids are assigned per polynomial type in declaration order,
 *   an array of length n reserving n ids
 * - `a = b` becomes a polynomial identity over `a - b`
 * - a repeated array segment is sized to fill the degree
 *
 * References are checked once the whole program has been processed, so
 * identities may mention polynomials declared further down. All problems
 * are reported to the DiagnosticBag; analysis continues after errors.
 */
class PilAnalyzer
{
public:
  /// `sources` may be null; source references are then left empty
  PilAnalyzer(const SourceRegistry * sources, DiagnosticBag & diags);

  [[nodiscard]] AnalysisResult analyze(const Program & program);

private:
  // Statements
  void handle_statement(const Stmt * stmt);
  void handle_namespace(const NamespaceStmt * stmt);
  void handle_constant_definition(const ConstantDefinitionStmt * stmt);
  void handle_polynomial_definition(const PolynomialDefinitionStmt * stmt);
  void handle_public_declaration(const PublicDeclarationStmt * stmt);
  void handle_constant_declaration(const PolynomialConstantDeclarationStmt * stmt);
  void handle_constant_definition_fn(const PolynomialConstantDefinitionStmt * stmt);
  void handle_commit_declaration(const PolynomialCommitDeclarationStmt * stmt);
  void handle_identity(const Stmt * stmt);

  // Declarations
  void declare_polynomial(
    const AstNode * node, std::string_view name, PolynomialType type,
    std::optional<DegreeType> length, std::optional<FunctionValueDefinition> function);
  std::optional<DegreeType> array_length(const PolyDeclName * decl);
  std::optional<FunctionValueDefinition> lower_array(const FunctionDef * def, SourceRange range);
  void add_identity(
    const Stmt * stmt, IdentityKind kind, SelectedExpressions left, SelectedExpressions right);
  bool check_selected_lengths(
    const Stmt * stmt, std::string_view what, const SelectedExprs * left,
    const SelectedExprs * right);

  // Expressions
  const Expression * lower_expr(const Expr * expr);
  const Expression * lower_poly_ref(const PolyRefExpr * ref);
  const Expression * lower_match(const MatchExpr * match);
  gsl::span<const Expression *> lower_list(gsl::span<Expr *> exprs);
  SelectedExpressions lower_selected(const SelectedExprs * sel);
  std::optional<DegreeType> evaluate_degree(const Expr * expr, std::string_view what);

  // Reference checks after the whole program is lowered
  void check_references();

  [[nodiscard]] std::string absolute_name(std::string_view ns, std::string_view name) const;
  [[nodiscard]] SourceRef source_ref(SourceRange range);

  struct PendingReference
  {
    enum class Kind : uint8_t { Polynomial, Function, Public, Constant };
    Kind kind;
    const Expression * expr;
    SourceRange range;
  };

  const SourceRegistry * sources_;
  DiagnosticBag & diags_;

  std::unique_ptr<Analyzed> analyzed_;
  std::string_view namespace_ = "Global";
  std::optional<DegreeType> degree_;
  std::array<uint64_t, 3> next_poly_id_{};
  uint64_t next_public_id_ = 0;
  std::array<uint64_t, 4> next_identity_id_{};
  std::vector<std::string_view> locals_;
  std::vector<PendingReference> pending_;
};

}  // namespace pilc
