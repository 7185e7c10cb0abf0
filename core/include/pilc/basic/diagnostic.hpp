// pilc/basic/diagnostic.hpp - Diagnostics reported by PIL analysis
#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "pilc/basic/source_manager.hpp"

namespace pilc
{

// ============================================================================
// Core Structures
// ============================================================================

enum class Severity : uint8_t {
  Error,
  Warning,
  Note,
};

/**
 * Stable codes for analysis diagnostics. Printed as "E0xx".
 */
enum class DiagCode : uint8_t {
  None,
  DuplicateSymbol,        // E001
  UnknownSymbol,          // E002
  InvalidArrayIndex,      // E003
  NotAConstant,           // E004
  DegreeMismatch,         // E005
  InvalidArrayValue,      // E006
  InvalidIdentity,        // E007
  UnsupportedExpression,  // E008
  MissingDegree,          // E009
};

[[nodiscard]] std::string_view to_code_string(DiagCode code) noexcept;

enum class LabelStyle {
  Primary,
  Secondary,
};

struct Label
{
  SourceRange range;
  std::string message;
  LabelStyle style = LabelStyle::Primary;
};

struct Diagnostic
{
  Severity severity = Severity::Error;
  DiagCode code = DiagCode::None;
  std::string message;

  std::vector<Label> labels;
  std::optional<std::string> help_message;

  [[nodiscard]] const Label * primary_label() const noexcept;
  [[nodiscard]] SourceRange primary_range() const noexcept;
};

class DiagnosticBag;

// ============================================================================
// DiagnosticBuilder
// ============================================================================

/**
 * Fluent builder; the diagnostic is added to the bag when the builder dies.
 */
class DiagnosticBuilder
{
public:
  DiagnosticBuilder(DiagnosticBag & bag, Diagnostic diag);

  DiagnosticBuilder(const DiagnosticBuilder &) = delete;
  DiagnosticBuilder & operator=(const DiagnosticBuilder &) = delete;

  DiagnosticBuilder(DiagnosticBuilder && other) noexcept;

  ~DiagnosticBuilder();

  DiagnosticBuilder & with_code(DiagCode code);

  DiagnosticBuilder & with_secondary_label(SourceRange range, std::string msg);

  DiagnosticBuilder & with_help(std::string help_msg);

private:
  DiagnosticBag & bag_;
  Diagnostic diagnostic_;
  bool active_ = true;
};

// ============================================================================
// DiagnosticBag
// ============================================================================

class DiagnosticBag
{
public:
  DiagnosticBuilder report_error(
    SourceRange range, std::string message, std::string label_message = "");
  DiagnosticBuilder report_warning(
    SourceRange range, std::string message, std::string label_message = "");
  DiagnosticBuilder report_note(
    SourceRange range, std::string message, std::string label_message = "");

  void add(Diagnostic && diag);

  [[nodiscard]] const std::vector<Diagnostic> & all() const { return diagnostics_; }
  [[nodiscard]] bool empty() const { return diagnostics_.empty(); }
  [[nodiscard]] size_t size() const { return diagnostics_.size(); }

  [[nodiscard]] std::vector<Diagnostic> errors() const;
  [[nodiscard]] bool has_errors() const;
  [[nodiscard]] size_t count(DiagCode code) const;

  void merge(DiagnosticBag && other);

  [[nodiscard]] auto begin() const { return diagnostics_.begin(); }
  [[nodiscard]] auto end() const { return diagnostics_.end(); }

private:
  DiagnosticBuilder report(
    Severity severity, SourceRange range, std::string message, std::string label_message);

  std::vector<Diagnostic> diagnostics_;
};

}  // namespace pilc
