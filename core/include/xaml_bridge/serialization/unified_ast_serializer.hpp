// xaml_bridge/serialization/unified_ast_serializer.hpp - Document to text / XML tree
#pragma once

#include <memory>
#include <stdexcept>
#include <string>

#include "xaml_bridge/ast/unified_ast.hpp"
#include "xaml_bridge/basic/diagnostic.hpp"
#include "xaml_bridge/serialization/xaml_writer.hpp"

namespace tinyxml2
{
class XMLDocument;
}

namespace xaml_bridge
{

/// Writer output that is not well-formed markup
class SerializationError : public std::runtime_error
{
public:
  using std::runtime_error::runtime_error;
};

struct SerializationResult
{
  bool success = false;
  std::string text;
  DiagnosticBag diagnostics;
};

/**
 * Front end over XamlWriter.
 *
 * serialize_to_text() never throws: failures become a SERIALIZATION_FAILED
 * error in the result. serialize() produces a tinyxml2 tree of the same
 * output for callers that post-process markup structurally.
 */
class UnifiedAstSerializer
{
public:
  explicit UnifiedAstSerializer(XamlWriterOptions options = {});

  /// @throws SerializationError when the written text does not parse back
  [[nodiscard]] std::unique_ptr<tinyxml2::XMLDocument> serialize(const Document & doc) const;

  [[nodiscard]] SerializationResult serialize_to_text(const Document & doc) const;

  [[nodiscard]] const XamlWriterOptions & options() const noexcept { return writer_.options(); }

private:
  XamlWriter writer_;
};

}  // namespace xaml_bridge
