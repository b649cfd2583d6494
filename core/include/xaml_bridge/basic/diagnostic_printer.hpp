// xaml_bridge/basic/diagnostic_printer.hpp
//
// Prints diagnostics with source context, line/column information,
// and position markers in Rust-style format.
//
#pragma once

#include <iosfwd>
#include <string>
#include <string_view>

#include "xaml_bridge/basic/diagnostic.hpp"
#include "xaml_bridge/basic/source_index.hpp"

namespace xaml_bridge
{

/**
 * Prints diagnostics in Rust-style format.
 *
 * Produces output like:
 *   warning[TYPE_MAPPING_NOT_FOUND]: no type mapping for 'Ribbon'
 *     --> Views/MainWindow.xaml:5:6
 *      |
 *    5 |     <Ribbon x:Name="Menu">
 *      |      ^
 *      |
 *      = help: the element name was left unchanged
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
   * @param source Index over the text the diagnostic refers to, or nullptr
   *               when no source snippet should be shown
   */
  void print(const Diagnostic & diag, const SourceIndex * source = nullptr);

  /**
   * Print all diagnostics from a DiagnosticBag, ordered by line.
   */
  void print_all(const DiagnosticBag & diags, const SourceIndex * source = nullptr);

  /**
   * Print a one-line count summary ("2 errors, 1 warning").
   */
  void print_summary(const DiagnosticBag & diags);

private:
  void print_severity_header(const Diagnostic & diag);

  void print_source_line(
    const SourceIndex & source, uint32_t line, uint32_t column, LabelStyle style,
    std::string_view label_message);

  void print_help(std::string_view message);

  [[nodiscard]] std::string gutter_arrow() const;
  [[nodiscard]] std::string gutter_pipe() const;
  [[nodiscard]] std::string gutter_pipe_only() const;

  std::ostream & os_;
  bool use_color_;
};

}  // namespace xaml_bridge
