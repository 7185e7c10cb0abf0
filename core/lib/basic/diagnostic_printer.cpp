// pilc/basic/diagnostic_printer.cpp - Diagnostic output
//
// Uses fmt for formatting and rang for terminal colors.
//
#include "pilc/basic/diagnostic_printer.hpp"

#include <fmt/core.h>
#include <fmt/ostream.h>

#include <algorithm>
#include <filesystem>
#include <ostream>
#include <rang.hpp>
#include <vector>

namespace pilc
{

namespace
{

std::string_view severity_name(Severity severity)
{
  switch (severity) {
    case Severity::Error:
      return "error";
    case Severity::Warning:
      return "warning";
    case Severity::Note:
      return "note";
  }
  return "error";
}

std::string display_path(const SourceRegistry & sources, FileId file_id)
{
  if (!file_id.is_valid()) {
    return "<unknown>";
  }
  const auto & abs_path = sources.get_path(file_id);
  std::error_code ec;
  auto rel_path = std::filesystem::relative(abs_path, std::filesystem::current_path(), ec);
  return ec || rel_path.empty() ? abs_path.string() : rel_path.string();
}

std::string expand_tabs(std::string_view line)
{
  std::string out;
  out.reserve(line.size());
  for (const char c : line) {
    if (c == '\t') {
      out += "    ";
    } else if (c != '\r' && c != '\n') {
      out += c;
    }
  }
  return out;
}

}  // namespace

DiagnosticPrinter::DiagnosticPrinter(std::ostream & os, bool use_color)
: os_(os), use_color_(use_color)
{
  if (!use_color_) {
    rang::setControlMode(rang::control::Off);
  }
}

void DiagnosticPrinter::print(const Diagnostic & diag, const SourceRegistry & sources)
{
  const SourceRange primary_range = diag.primary_range();
  const std::string filename = display_path(sources, primary_range.file_id());
  const FullSourceRange primary_fr = sources.get_full_range(primary_range);

  print_severity_header(diag);

  if (primary_fr.is_valid()) {
    fmt::print(
      os_, "{} {}:{}:{}\n", gutter("  -->"), filename, primary_fr.start_line,
      primary_fr.start_column);
  } else {
    fmt::print(os_, "{} {}\n", gutter("  -->"), filename);
  }
  fmt::print(os_, "{}\n", gutter("      |"));

  for (const auto & label : diag.labels) {
    print_label(label, sources);
  }

  if (diag.help_message) {
    print_trailer("help", *diag.help_message);
  }

  fmt::print(os_, "\n");
}

void DiagnosticPrinter::print_all(const DiagnosticBag & diags, const SourceRegistry & sources)
{
  std::vector<Diagnostic> sorted_diags(diags.begin(), diags.end());
  std::stable_sort(
    sorted_diags.begin(), sorted_diags.end(), [](const Diagnostic & a, const Diagnostic & b) {
      return a.primary_range().get_begin() < b.primary_range().get_begin();
    });

  for (const auto & d : sorted_diags) {
    print(d, sources);
  }
}

// =============================================================================
// Private helpers
// =============================================================================

void DiagnosticPrinter::print_severity_header(const Diagnostic & diag)
{
  const std::string_view code = to_code_string(diag.code);
  const std::string_view name = severity_name(diag.severity);

  if (use_color_) {
    os_ << rang::style::bold;
    switch (diag.severity) {
      case Severity::Error:
        os_ << rang::fg::red;
        break;
      case Severity::Warning:
        os_ << rang::fg::yellow;
        break;
      case Severity::Note:
        os_ << rang::fg::cyan;
        break;
    }
  }

  if (code.empty()) {
    fmt::print(os_, "{}", name);
  } else {
    fmt::print(os_, "{}[{}]", name, code);
  }

  if (use_color_) {
    os_ << rang::fg::reset;
  }
  fmt::print(os_, ": {}", diag.message);
  if (use_color_) {
    os_ << rang::style::reset;
  }
  fmt::print(os_, "\n");
}

void DiagnosticPrinter::print_label(const Label & label, const SourceRegistry & sources)
{
  const SourceFile * source = sources.get_file(label.range.file_id());
  const FullSourceRange fr = sources.get_full_range(label.range);
  if (source == nullptr || !fr.is_valid()) {
    if (!label.message.empty()) {
      print_trailer("note", label.message);
    }
    return;
  }

  const std::string_view raw_line = source->get_line(fr.start_line - 1);
  if (raw_line.empty()) {
    return;
  }

  fmt::print(os_, "{} {}\n", gutter(fmt::format(" {:>4} |", fr.start_line)), expand_tabs(raw_line));

  // Marker prefix keeps tab expansion aligned with the printed line
  std::string prefix;
  for (uint32_t i = 0; i + 1 < fr.start_column && i < raw_line.size(); ++i) {
    prefix += raw_line[i] == '\t' ? "    " : " ";
  }

  const uint32_t width = (fr.end_line == fr.start_line && fr.end_column > fr.start_column)
                           ? fr.end_column - fr.start_column
                           : 1;
  const char marker = label.style == LabelStyle::Primary ? '^' : '-';

  fmt::print(os_, "{} {}", gutter("      |"), prefix);
  if (use_color_) {
    os_ << (label.style == LabelStyle::Primary ? rang::fg::red : rang::fg::cyan)
        << rang::style::bold;
  }
  fmt::print(os_, "{}", std::string(width, marker));
  if (!label.message.empty()) {
    fmt::print(os_, " {}", label.message);
  }
  if (use_color_) {
    os_ << rang::style::reset << rang::fg::reset;
  }
  fmt::print(os_, "\n");
}

void DiagnosticPrinter::print_trailer(std::string_view kind, std::string_view message)
{
  fmt::print(os_, "{}\n", gutter("      |"));
  fmt::print(os_, "{} {}: {}\n", gutter("      ="), kind, message);
}

std::string DiagnosticPrinter::gutter(std::string_view text) const
{
  if (use_color_) {
    return fmt::format("\033[1;36m{}\033[0m", text);
  }
  return std::string(text);
}

}  // namespace pilc
