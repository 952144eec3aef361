// qualsim/basic/diagnostic_printer.hpp
//
// Prints knowledge base diagnostics with the offending YAML line and
// position markers in Rust-style format.
//
#pragma once

#include <iosfwd>
#include <map>
#include <string>
#include <string_view>

#include "qualsim/basic/diagnostic.hpp"

namespace qualsim
{

/// File name -> full text of every document a diagnostic may point into.
using SourceTexts = std::map<std::string, std::string>;

/**
 * Prints diagnostics in Rust-style format.
 *
 * Produces output like:
 *   error[K004]: unknown attribute 'bulb.colour'
 *     --> kb/flashlight.yaml:12:18
 *      |
 *   12 |     target: bulb.colour
 *      |             ^ not declared on 'flashlight'
 *      |
 *      = help: declared attributes are bulb.state, bulb.brightness
 */
class DiagnosticPrinter
{
public:
  /**
   * Create a diagnostic printer.
   *
   * @param os Output stream (typically std::cerr)
   * @param use_color Whether to use terminal colors
   */
  explicit DiagnosticPrinter(std::ostream & os, bool use_color = true);

  /**
   * Print a single diagnostic.
   *
   * Snippets are taken from @p sources; labels pointing into unknown files
   * degrade to notes.
   */
  void print(const Diagnostic & diag, const SourceTexts & sources);

  /**
   * Print all diagnostics from a DiagnosticBag, ordered by file and line.
   */
  void print_all(const DiagnosticBag & diags, const SourceTexts & sources);

private:
  void print_severity_header(const Diagnostic & diag);

  void print_label_context(const Label & label, const SourceTexts & sources);

  void print_source_line(
    std::string_view line, uint32_t line_num, uint32_t column, LabelStyle style,
    std::string_view label_message);

  void print_help(std::string_view message);
  void print_note(std::string_view message);

  [[nodiscard]] std::string gutter_arrow() const;
  [[nodiscard]] std::string gutter_pipe() const;
  [[nodiscard]] std::string gutter_pipe_only() const;

  std::ostream & os_;
  bool use_color_;
};

}  // namespace qualsim
