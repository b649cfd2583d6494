// xaml_bridge/serialization/unified_ast_serializer.cpp - Document to text / XML tree
//
#include "xaml_bridge/serialization/unified_ast_serializer.hpp"

#include <utility>

#include <fmt/format.h>

#include "tinyxml2.h"
#include "xaml_bridge/basic/diagnostic_codes.hpp"
#include "xaml_bridge/basic/logging.hpp"

namespace xaml_bridge
{

UnifiedAstSerializer::UnifiedAstSerializer(XamlWriterOptions options) : writer_(std::move(options))
{
}

std::unique_ptr<tinyxml2::XMLDocument> UnifiedAstSerializer::serialize(const Document & doc) const
{
  const std::string text = writer_.write(doc);
  const auto mode = writer_.options().preserve_formatting ? tinyxml2::PRESERVE_WHITESPACE
                                                          : tinyxml2::COLLAPSE_WHITESPACE;
  auto xml = std::make_unique<tinyxml2::XMLDocument>(true, mode);
  if (xml->Parse(text.data(), text.size()) != tinyxml2::XML_SUCCESS) {
    throw SerializationError(fmt::format(
      "written markup is not well-formed (line {}): {}", xml->ErrorLineNum(),
      xml->ErrorStr() ? xml->ErrorStr() : xml->ErrorName()));
  }
  return xml;
}

SerializationResult UnifiedAstSerializer::serialize_to_text(const Document & doc) const
{
  SerializationResult result;
  try {
    result.text = writer_.write(doc);
    result.success = true;
  } catch (const std::exception & e) {
    log_error("serialization of '{}' failed: {}", doc.file_path, e.what());
    result.diagnostics.add_error(
      codes::k_serialization_failed, fmt::format("Serialization failed: {}", e.what()),
      doc.file_path.empty() ? std::nullopt : std::optional<std::string>(doc.file_path));
  }
  return result;
}

}  // namespace xaml_bridge
