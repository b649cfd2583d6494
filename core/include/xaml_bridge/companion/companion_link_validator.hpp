// xaml_bridge/companion/companion_link_validator.hpp - Checks markup against its code-behind class
#pragma once

#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "xaml_bridge/ast/unified_ast.hpp"
#include "xaml_bridge/basic/diagnostic.hpp"

namespace xaml_bridge
{

class MappingRepository;

/// A companion class as seen by the oracle
struct CompanionClass
{
  std::string qualified_name;
  std::vector<std::string> members;

  [[nodiscard]] bool has_member(std::string_view name) const;
};

/**
 * Source of truth about the imperative code that accompanies a document.
 */
class CompanionCodeOracle
{
public:
  virtual ~CompanionCodeOracle() = default;

  [[nodiscard]] virtual std::optional<CompanionClass> find_class(
    std::string_view qualified_name) const = 0;
};

class InMemoryCompanionOracle : public CompanionCodeOracle
{
public:
  void add_class(CompanionClass cls);

  [[nodiscard]] std::optional<CompanionClass> find_class(
    std::string_view qualified_name) const override;

private:
  std::map<std::string, CompanionClass, std::less<>> classes_;
};

/// Counts from one validation run
struct CompanionLinkReport
{
  bool has_class_directive = false;
  bool class_found = false;
  size_t named_elements_checked = 0;
  size_t handlers_checked = 0;
  size_t missing_members = 0;
};

/**
 * Validates the link between a document and its companion class.
 *
 * Checks that the root's x:Class resolves, that every x:Name has a matching
 * member and that every event handler attribute names an existing member.
 * A resolved class is stored in `Document::metadata.companion_class`. The
 * tree itself is never modified.
 *
 * An attribute counts as an event handler when the semantic layer resolved
 * it to an "event" property, or when the optional repository has an event
 * mapping for its name.
 */
class CompanionLinkValidator
{
public:
  explicit CompanionLinkValidator(
    const CompanionCodeOracle & oracle, const MappingRepository * mappings = nullptr)
  : oracle_(oracle), mappings_(mappings)
  {
  }

  CompanionLinkReport validate(Document & doc, DiagnosticBag & diags) const;

private:
  [[nodiscard]] bool is_event_handler(const Property & prop) const;

  const CompanionCodeOracle & oracle_;
  const MappingRepository * mappings_;
};

}  // namespace xaml_bridge
