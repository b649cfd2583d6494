// xaml_bridge/parser/structural_converter.hpp - Markup text to Unified AST
#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include "xaml_bridge/ast/unified_ast.hpp"
#include "xaml_bridge/basic/diagnostic.hpp"

namespace xaml_bridge
{

/**
 * Result of a structural conversion.
 *
 * `document` is null when the text is not well-formed XML; the error fields
 * then carry the parser message and position.
 */
struct StructuralParseResult
{
  std::unique_ptr<Document> document;
  std::string error_message;
  uint32_t error_line = 0;
  uint32_t error_column = 0;

  [[nodiscard]] bool ok() const noexcept { return document != nullptr; }
};

/**
 * Builds the Unified AST from raw markup using tinyxml2 for structure and
 * the WhitespaceExtractor for exact source fragments.
 *
 * Non-fatal findings (undeclared prefixes, malformed markup extensions) are
 * reported to the diagnostic bag given at construction.
 */
class StructuralConverter
{
public:
  explicit StructuralConverter(DiagnosticBag & diags) : diags_(diags) {}

  [[nodiscard]] StructuralParseResult convert(
    std::string_view text, const std::string & file_path = {});

private:
  DiagnosticBag & diags_;
};

}  // namespace xaml_bridge
