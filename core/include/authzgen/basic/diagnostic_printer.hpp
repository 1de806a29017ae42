// authzgen/basic/diagnostic_printer.hpp
//
// Prints diagnostics with source context in Rust-style format.
//
#pragma once

#include <iosfwd>
#include <string>
#include <string_view>

#include "authzgen/basic/diagnostic.hpp"
#include "authzgen/basic/source_manager.hpp"

namespace authzgen
{

/**
 * Prints diagnostics in Rust-style format.
 *
 * Produces output like:
 *   error[E1001]: expected ':' after relation name 'owner'
 *     --> schema.zed:3:18
 *      |
 *    3 |   relation owner user
 *      |                  ^^^^ expected ':', got identifier
 *      |
 *      = help: relations are declared as `relation <name>: <type>`
 */
class DiagnosticPrinter
{
public:
  explicit DiagnosticPrinter(std::ostream & os, bool use_color = true);

  void print(const Diagnostic & diag, const SourceRegistry & sources);

  /// Prints every diagnostic, ordered by primary location.
  void print_all(const DiagnosticBag & diags, const SourceRegistry & sources);

private:
  void print_severity_header(const Diagnostic & diag);
  void print_label_context(const Label & label, const SourceRegistry & sources);
  void print_source_line(
    const SourceFile & source, uint32_t line_index, uint32_t start_col, uint32_t end_col,
    LabelStyle style, std::string_view label_message);
  void print_trailer(std::string_view kind, std::string_view message);

  [[nodiscard]] std::string display_path(const SourceRegistry & sources, FileId id) const;
  [[nodiscard]] std::string gutter_arrow() const;
  [[nodiscard]] std::string gutter_pipe() const;

  std::ostream & os_;
  bool use_color_;
};

}  // namespace authzgen
