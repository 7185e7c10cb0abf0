// pilc/basic/diagnostic.cpp - Diagnostic implementation
#include "pilc/basic/diagnostic.hpp"

#include <algorithm>
#include <iterator>
#include <utility>

namespace pilc
{

std::string_view to_code_string(DiagCode code) noexcept
{
  switch (code) {
    case DiagCode::None:
      return "";
    case DiagCode::DuplicateSymbol:
      return "E001";
    case DiagCode::UnknownSymbol:
      return "E002";
    case DiagCode::InvalidArrayIndex:
      return "E003";
    case DiagCode::NotAConstant:
      return "E004";
    case DiagCode::DegreeMismatch:
      return "E005";
    case DiagCode::InvalidArrayValue:
      return "E006";
    case DiagCode::InvalidIdentity:
      return "E007";
    case DiagCode::UnsupportedExpression:
      return "E008";
    case DiagCode::MissingDegree:
      return "E009";
  }
  return "";
}

const Label * Diagnostic::primary_label() const noexcept
{
  for (const auto & l : labels) {
    if (l.style == LabelStyle::Primary) {
      return &l;
    }
  }
  if (!labels.empty()) {
    return &labels.front();
  }
  return nullptr;
}

SourceRange Diagnostic::primary_range() const noexcept
{
  const Label * l = primary_label();
  if (l == nullptr) {
    return {};
  }
  return l->range;
}

// ============================================================================
// DiagnosticBuilder
// ============================================================================

DiagnosticBuilder::DiagnosticBuilder(DiagnosticBag & bag, Diagnostic diag)
: bag_(bag), diagnostic_(std::move(diag))
{
}

DiagnosticBuilder::DiagnosticBuilder(DiagnosticBuilder && other) noexcept
: bag_(other.bag_), diagnostic_(std::move(other.diagnostic_)), active_(other.active_)
{
  other.active_ = false;
}

DiagnosticBuilder::~DiagnosticBuilder()
{
  if (active_) {
    bag_.add(std::move(diagnostic_));
  }
}

DiagnosticBuilder & DiagnosticBuilder::with_code(DiagCode code)
{
  diagnostic_.code = code;
  return *this;
}

DiagnosticBuilder & DiagnosticBuilder::with_secondary_label(SourceRange range, std::string msg)
{
  diagnostic_.labels.push_back(Label{range, std::move(msg), LabelStyle::Secondary});
  return *this;
}

DiagnosticBuilder & DiagnosticBuilder::with_help(std::string help_msg)
{
  diagnostic_.help_message = std::move(help_msg);
  return *this;
}

// ============================================================================
// DiagnosticBag
// ============================================================================

DiagnosticBuilder DiagnosticBag::report(
  Severity severity, SourceRange range, std::string message, std::string label_message)
{
  Diagnostic d;
  d.severity = severity;
  d.message = std::move(message);
  d.labels.push_back(Label{range, std::move(label_message), LabelStyle::Primary});
  return {*this, std::move(d)};
}

DiagnosticBuilder DiagnosticBag::report_error(
  SourceRange range, std::string message, std::string label_message)
{
  return report(Severity::Error, range, std::move(message), std::move(label_message));
}

DiagnosticBuilder DiagnosticBag::report_warning(
  SourceRange range, std::string message, std::string label_message)
{
  return report(Severity::Warning, range, std::move(message), std::move(label_message));
}

DiagnosticBuilder DiagnosticBag::report_note(
  SourceRange range, std::string message, std::string label_message)
{
  return report(Severity::Note, range, std::move(message), std::move(label_message));
}

void DiagnosticBag::add(Diagnostic && diag) { diagnostics_.push_back(std::move(diag)); }

std::vector<Diagnostic> DiagnosticBag::errors() const
{
  std::vector<Diagnostic> result;
  std::copy_if(
    diagnostics_.begin(), diagnostics_.end(), std::back_inserter(result),
    [](const Diagnostic & d) { return d.severity == Severity::Error; });
  return result;
}

bool DiagnosticBag::has_errors() const
{
  return std::any_of(diagnostics_.begin(), diagnostics_.end(), [](const Diagnostic & d) {
    return d.severity == Severity::Error;
  });
}

size_t DiagnosticBag::count(DiagCode code) const
{
  return static_cast<size_t>(std::count_if(
    diagnostics_.begin(), diagnostics_.end(),
    [code](const Diagnostic & d) { return d.code == code; }));
}

void DiagnosticBag::merge(DiagnosticBag && other)
{
  diagnostics_.insert(
    diagnostics_.end(), std::make_move_iterator(other.diagnostics_.begin()),
    std::make_move_iterator(other.diagnostics_.end()));
  other.diagnostics_.clear();
}

}  // namespace pilc
