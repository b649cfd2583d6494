// xaml_bridge/parser/hybrid_parser.hpp - Structural + semantic parse orchestration
#pragma once

#include <gsl/span>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "xaml_bridge/ast/unified_ast.hpp"
#include "xaml_bridge/basic/diagnostic.hpp"
#include "xaml_bridge/semantic/type_catalog.hpp"

namespace xaml_bridge
{

enum class HybridParseState : uint8_t {
  Idle,
  StructuralParsing,
  SemanticParsing,
  Merging,
  Done,
  StructuralOnly,
  Failed,
};

[[nodiscard]] std::string_view to_string(HybridParseState state) noexcept;

struct HybridParserOptions
{
  /// Run the type-resolving parse and enrich the structural tree
  bool enable_semantic = true;

  /// Reported in diagnostics and stored on the document
  std::string file_path;
};

struct HybridParseResult
{
  /// Null when the structural parse failed
  std::unique_ptr<Document> document;

  /// Every diagnostic of this parse (also merged into the document)
  DiagnosticBag diagnostics;

  HybridParseState final_state = HybridParseState::Idle;
  bool semantic_applied = false;
  size_t enriched_elements = 0;

  /// Structural parse succeeded (diagnostics may still be present)
  [[nodiscard]] bool success() const noexcept { return document != nullptr; }
};

/// One document of a group parse
struct ParseInput
{
  std::string text;
  std::string file_path;
};

/**
 * Runs the structural conversion and, optionally, the semantic parse plus
 * enrichment over one markup text.
 *
 * Only a structural failure is fatal. A failing semantic parse or merge
 * leaves the structural tree in place and is reported as a warning.
 */
class HybridParser
{
public:
  explicit HybridParser(const TypeCatalog & catalog, HybridParserOptions options = {})
  : catalog_(catalog), options_(std::move(options))
  {
  }

  [[nodiscard]] HybridParseResult parse(std::string_view text);
  [[nodiscard]] HybridParseResult parse(std::string_view text, const std::string & file_path);

  /// Independent parses of several documents (no state is shared between them)
  [[nodiscard]] std::vector<HybridParseResult> parse_group(gsl::span<const ParseInput> inputs);

  /// State reached by the most recent parse
  [[nodiscard]] HybridParseState state() const noexcept { return state_; }

  [[nodiscard]] const HybridParserOptions & options() const noexcept { return options_; }

private:
  void transition(HybridParseState next);

  const TypeCatalog & catalog_;
  HybridParserOptions options_;
  HybridParseState state_ = HybridParseState::Idle;
};

}  // namespace xaml_bridge
