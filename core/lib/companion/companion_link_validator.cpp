// xaml_bridge/companion/companion_link_validator.cpp - Code-behind link checks
//
#include "xaml_bridge/companion/companion_link_validator.hpp"

#include <algorithm>
#include <utility>

#include <fmt/format.h>

#include "xaml_bridge/basic/diagnostic_codes.hpp"
#include "xaml_bridge/basic/logging.hpp"
#include "xaml_bridge/mapping/mapping_repository.hpp"

namespace xaml_bridge
{

bool CompanionClass::has_member(std::string_view name) const
{
  return std::find(members.begin(), members.end(), name) != members.end();
}

void InMemoryCompanionOracle::add_class(CompanionClass cls)
{
  std::string key = cls.qualified_name;
  classes_.insert_or_assign(std::move(key), std::move(cls));
}

std::optional<CompanionClass> InMemoryCompanionOracle::find_class(
  std::string_view qualified_name) const
{
  auto it = classes_.find(qualified_name);
  if (it == classes_.end()) return std::nullopt;
  return it->second;
}

namespace
{

void warn_at(
  DiagnosticBag & diags, const Document & doc, const char * code, std::string message,
  const UnifiedNode & node)
{
  auto builder = diags.report_warning(code, std::move(message));
  builder.at(node.location.line, node.location.column);
  if (!doc.file_path.empty()) builder.with_file(doc.file_path);
}

std::optional<std::string> file_of(const Document & doc)
{
  if (doc.file_path.empty()) return std::nullopt;
  return doc.file_path;
}

}  // namespace

bool CompanionLinkValidator::is_event_handler(const Property & prop) const
{
  if (prop.kind == PropertyKind::PropertyElement || !prop.literal()) return false;
  if (prop.resolved_property && prop.resolved_property->property_type == "event") return true;
  if (!mappings_) return false;

  std::optional<std::string_view> owner;
  if (prop.attached_owner_type) {
    owner = *prop.attached_owner_type;
  } else if (const Element * elem = prop.owner_element()) {
    owner = elem->type_name;
  }
  return mappings_->find_event_mapping(prop.name, owner) != nullptr;
}

CompanionLinkReport CompanionLinkValidator::validate(Document & doc, DiagnosticBag & diags) const
{
  CompanionLinkReport report;
  Element * root = doc.root();
  if (!root) return report;

  if (!root->x_class) {
    diags.add_warning(
      codes::k_companion_no_class, "No x:Class directive found; code-behind linking skipped",
      file_of(doc), root->location.line, root->location.column);
    return report;
  }
  report.has_class_directive = true;

  auto cls = oracle_.find_class(*root->x_class);
  if (!cls) {
    diags.add_warning(
      codes::k_companion_class_missing,
      fmt::format("x:Class '{}' has no matching companion class", *root->x_class), file_of(doc),
      root->location.line, root->location.column);
    return report;
  }
  report.class_found = true;
  diags.add_info(
    codes::k_companion_class_valid,
    fmt::format("x:Class '{}' matches companion class", cls->qualified_name), file_of(doc));

  for (Element * elem : root->descendants_and_self()) {
    if (elem->x_name) {
      ++report.named_elements_checked;
      if (!cls->has_member(*elem->x_name)) {
        ++report.missing_members;
        warn_at(
          diags, doc, codes::k_companion_member_missing,
          fmt::format(
            "Named element '{}' ({}) has no member in class '{}'", *elem->x_name, elem->type_name,
            cls->qualified_name),
          *elem);
      }
    }

    for (const auto & prop : elem->properties()) {
      if (!is_event_handler(*prop)) continue;
      ++report.handlers_checked;
      const std::string & handler = *prop->literal();
      if (!cls->has_member(handler)) {
        ++report.missing_members;
        warn_at(
          diags, doc, codes::k_companion_member_missing,
          fmt::format(
            "Event handler '{}' for '{}' not found in class '{}'", handler, prop->name,
            cls->qualified_name),
          *prop);
      }
    }
  }

  diags.add_info(
    codes::k_companion_link_summary,
    fmt::format(
      "Companion link: {} named element(s), {} handler(s), {} missing member(s)",
      report.named_elements_checked, report.handlers_checked, report.missing_members),
    file_of(doc));
  log_debug("Linked {} to {}", doc.file_path, cls->qualified_name);

  doc.metadata.companion_class = CompanionClassRef{cls->qualified_name, cls->members};
  return report;
}

}  // namespace xaml_bridge
