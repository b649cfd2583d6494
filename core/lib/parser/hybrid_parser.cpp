// xaml_bridge/parser/hybrid_parser.cpp - Structural + semantic parse orchestration
//
#include "xaml_bridge/parser/hybrid_parser.hpp"

#include <fmt/format.h>

#include "xaml_bridge/basic/diagnostic_codes.hpp"
#include "xaml_bridge/basic/logging.hpp"
#include "xaml_bridge/formatting/whitespace_extractor.hpp"
#include "xaml_bridge/parser/structural_converter.hpp"
#include "xaml_bridge/semantic/semantic_converter.hpp"
#include "xaml_bridge/semantic/semantic_parser.hpp"

namespace xaml_bridge
{

namespace
{

std::optional<std::string> file_or_null(const std::string & path)
{
  if (path.empty()) return std::nullopt;
  return path;
}

}  // namespace

std::string_view to_string(HybridParseState state) noexcept
{
  switch (state) {
    case HybridParseState::Idle:
      return "Idle";
    case HybridParseState::StructuralParsing:
      return "StructuralParsing";
    case HybridParseState::SemanticParsing:
      return "SemanticParsing";
    case HybridParseState::Merging:
      return "Merging";
    case HybridParseState::Done:
      return "Done";
    case HybridParseState::StructuralOnly:
      return "StructuralOnly";
    case HybridParseState::Failed:
      return "Failed";
  }
  return "Unknown";
}

void HybridParser::transition(HybridParseState next)
{
  log_trace("hybrid parser: {} -> {}", to_string(state_), to_string(next));
  state_ = next;
}

HybridParseResult HybridParser::parse(std::string_view text)
{
  return parse(text, options_.file_path);
}

HybridParseResult HybridParser::parse(std::string_view text, const std::string & file_path)
{
  HybridParseResult result;
  DiagnosticBag & diags = result.diagnostics;
  const auto file = file_or_null(file_path);
  const std::string shown = file_path.empty() ? "<input>" : file_path;

  state_ = HybridParseState::Idle;
  diags.add_info(codes::k_parse_start, fmt::format("Starting hybrid parse of {}", shown), file);

  if (WhitespaceExtractor::is_all_whitespace(text)) {
    diags.add_error(codes::k_xaml_empty, "XAML content is empty", file);
    transition(HybridParseState::Failed);
    result.final_state = state_;
    return result;
  }

  // Structural layer (fatal on failure)
  transition(HybridParseState::StructuralParsing);
  StructuralConverter structural(diags);
  StructuralParseResult parsed = structural.convert(text, file_path);
  if (!parsed.ok()) {
    auto builder = diags.report_error(
      codes::k_xml_parse_error,
      fmt::format(
        "XML parse error at line {}, position {}: {}", parsed.error_line, parsed.error_column,
        parsed.error_message));
    builder.at(parsed.error_line, parsed.error_column);
    if (file) builder.with_file(*file);
    transition(HybridParseState::Failed);
    result.final_state = state_;
    log_warn("structural parse of {} failed at line {}", shown, parsed.error_line);
    return result;
  }
  std::unique_ptr<Document> doc = std::move(parsed.document);

  // Semantic layer (optional, non-fatal)
  std::unique_ptr<ObjectNode> graph;
  if (options_.enable_semantic) {
    transition(HybridParseState::SemanticParsing);
    try {
      SemanticParser semantic(catalog_, diags);
      graph = semantic.parse(text, file_path);
    } catch (const SemanticParseError & e) {
      auto builder = diags.report_warning(
        codes::k_semantic_parse_error,
        fmt::format("Semantic parsing failed, continuing with XML structure only: {}", e.what()));
      builder.at(e.line(), 0);
      if (file) builder.with_file(*file);
    }
  }

  transition(HybridParseState::Merging);
  if (graph) {
    try {
      result.enriched_elements = SemanticConverter{}.enrich(*graph, *doc, diags);
      result.semantic_applied = true;
      transition(HybridParseState::Done);
    } catch (const std::exception & e) {
      diags.add_warning(
        codes::k_merge_error,
        fmt::format("Merging semantic information failed, keeping XML structure: {}", e.what()),
        file);
      transition(HybridParseState::StructuralOnly);
    }
  } else {
    diags.add_info(
      codes::k_merge_xml_only, "Using XML structure only (no semantic information)", file);
    transition(HybridParseState::StructuralOnly);
  }

  const size_t element_count = doc->root() ? doc->root()->descendants().size() + 1 : 0;
  diags.add_info(
    codes::k_parse_success,
    fmt::format("Successfully parsed {} ({} elements)", shown, element_count), file);

  doc->diagnostics.merge(diags);
  result.document = std::move(doc);
  result.final_state = state_;
  return result;
}

std::vector<HybridParseResult> HybridParser::parse_group(gsl::span<const ParseInput> inputs)
{
  std::vector<HybridParseResult> results;
  results.reserve(inputs.size());
  size_t succeeded = 0;
  for (const auto & input : inputs) {
    results.push_back(parse(input.text, input.file_path));
    if (results.back().success()) ++succeeded;
  }
  log_info("Group parsing complete: {}/{} succeeded", succeeded, inputs.size());
  return results;
}

}  // namespace xaml_bridge
