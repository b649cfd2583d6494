// xaml_bridge/ast/json_dump.hpp - JSON rendering of the Unified AST
//
// Produces nlohmann::json objects for inspection (`xbc dump`). The format is
// meant for people and tests, not for reloading.
//
#pragma once

#include <nlohmann/json.hpp>

#include "xaml_bridge/ast/unified_ast.hpp"
#include "xaml_bridge/basic/diagnostic.hpp"

namespace xaml_bridge
{

/**
 * Serialize any node (element, property, markup extension or comment).
 *
 * @param node Node to serialize; nullptr yields JSON null
 */
[[nodiscard]] nlohmann::json to_json(const UnifiedNode * node);

/// Whole document: declaration, comments, root, namespaces and trace
[[nodiscard]] nlohmann::json to_json(const Document & doc);

[[nodiscard]] nlohmann::json to_json(const DiagnosticBag & diags);

}  // namespace xaml_bridge
