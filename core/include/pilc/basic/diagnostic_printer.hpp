// pilc/basic/diagnostic_printer.hpp
//
// Prints analysis diagnostics with file:line:col and an annotated source line.
//
#pragma once

#include <iosfwd>
#include <string>
#include <string_view>

#include "pilc/basic/diagnostic.hpp"
#include "pilc/basic/source_manager.hpp"

namespace pilc
{

/**
 * Prints diagnostics like:
 *   error[E002]: unknown polynomial 'Main.y'
 *     --> fib.pil:5:8
 *      |
 *    5 |     x' = y;
 *      |          ^ not declared
 *      |
 *      = help: declare it with 'pol commit y;'
 */
class DiagnosticPrinter
{
public:
  explicit DiagnosticPrinter(std::ostream & os, bool use_color = true);

  void print(const Diagnostic & diag, const SourceRegistry & sources);

  /// Print every diagnostic, ordered by primary location
  void print_all(const DiagnosticBag & diags, const SourceRegistry & sources);

private:
  void print_severity_header(const Diagnostic & diag);

  void print_label(const Label & label, const SourceRegistry & sources);

  void print_trailer(std::string_view kind, std::string_view message);

  [[nodiscard]] std::string gutter(std::string_view text) const;

  std::ostream & os_;
  bool use_color_;
};

}  // namespace pilc
