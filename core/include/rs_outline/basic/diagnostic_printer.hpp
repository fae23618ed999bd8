// rs_outline/basic/diagnostic_printer.hpp
//
// Prints diagnostics with source context, line/column information,
// and position markers in Rust-style format.
//
#pragma once

#include <cstdint>
#include <iosfwd>
#include <string>
#include <string_view>

#include "rs_outline/basic/diagnostic.hpp"
#include "rs_outline/basic/source_manager.hpp"

namespace rs_outline
{

/**
 * Prints diagnostics in Rust-style format.
 *
 * Produces output like:
 *   error[S001]: syntax error
 *     --> src/lib.rs:5:12
 *      |
 *    5 | fn main( {
 *      |          ^ unexpected input
 *      |
 */
class DiagnosticPrinter
{
public:
  /**
   * Create a diagnostic printer.
   *
   * @param os Output stream (the session log)
   * @param use_color Whether to use terminal colors
   */
  explicit DiagnosticPrinter(std::ostream & os, bool use_color = true);

  void print(const Diagnostic & diag, const SourceManager & source);

  /// Print all diagnostics sorted by primary location.
  void print_all(const DiagnosticBag & diags, const SourceManager & source);

private:
  void print_header(const Diagnostic & diag);

  void print_label_context(const Label & label, const SourceManager & source);

  void print_source_line(
    const SourceManager & source, uint32_t line_index, uint32_t start_col, uint32_t end_col,
    std::string_view label_message);

  [[nodiscard]] std::string gutter_arrow() const;
  [[nodiscard]] std::string gutter_pipe() const;
  [[nodiscard]] std::string gutter_pipe_only() const;

  std::ostream & os_;
  bool use_color_;
};

}  // namespace rs_outline
