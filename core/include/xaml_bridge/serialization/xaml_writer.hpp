// xaml_bridge/serialization/xaml_writer.hpp - Formatting-preserving markup writer
#pragma once

#include <cstddef>
#include <optional>
#include <string>

#include "xaml_bridge/ast/unified_ast.hpp"
#include "xaml_bridge/basic/diagnostic.hpp"

namespace xaml_bridge
{

struct XamlWriterOptions
{
  /// Re-emit recorded whitespace and raw text instead of computed layout
  bool preserve_formatting = true;
  bool preserve_comments = true;
  bool use_self_closing_tags = true;
  std::string indent_string = "    ";
  std::string new_line = "\n";
  bool include_xml_declaration = true;
  std::string encoding = "utf-8";
  bool sort_attributes = false;
  bool attributes_on_separate_lines = false;

  /// Computed layout wraps attributes onto separate lines beyond this width
  size_t max_line_length = 120;

  /// Write elements of the document default namespace in the target namespace
  bool use_target_namespace = false;

  /// Fixed target namespace; otherwise the rewritten namespace or the Avalonia one
  std::optional<std::string> target_namespace;

  /// Append the manual-review comment block summarizing errors and warnings
  bool annotate_diagnostics = false;
  size_t annotation_cap = 10;

  /// Precede transformed elements with a comment listing the applied rules
  bool add_transformation_comments = false;
};

/**
 * Writes a Unified AST document as markup text.
 *
 * With preserve_formatting, every node re-emits its recorded whitespace and,
 * when unchanged since parsing, its raw source text, so an untouched document
 * round-trips exactly (up to collapsed blank lines). Nodes without hints are
 * laid out with computed indentation.
 */
class XamlWriter
{
public:
  explicit XamlWriter(XamlWriterOptions options = {});

  [[nodiscard]] std::string write(const Document & doc) const;

  /// One subtree, laid out as if it were at depth 0
  [[nodiscard]] std::string write(const Element & elem) const;

  [[nodiscard]] const XamlWriterOptions & options() const noexcept { return options_; }

private:
  XamlWriterOptions options_;
};

/// Namespace written as the root default namespace in target mode
[[nodiscard]] std::string target_namespace_for(const Document & doc, const XamlWriterOptions & options);

/**
 * Body of the manual-review comment for the errors and warnings in `diags`
 * (at most `cap` of each), or nullopt when there are none.
 */
[[nodiscard]] std::optional<std::string> review_annotation(
  const DiagnosticBag & diags, size_t cap, const std::string & new_line = "\n");

/**
 * Place the manual-review comment for the diagnostics of `doc` after its root
 * as a synthetic (non-preserved) document comment, replacing one attached
 * earlier. The writer emits it when annotate_diagnostics is set.
 *
 * @return false when there is nothing to review
 */
bool attach_review_annotation(Document & doc, size_t cap, const std::string & new_line = "\n");

}  // namespace xaml_bridge
