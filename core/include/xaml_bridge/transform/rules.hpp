// xaml_bridge/transform/rules.hpp - Built-in transformation rules
#pragma once

#include <memory>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

#include "xaml_bridge/transform/transformation_rule.hpp"

namespace xaml_bridge
{

// ============================================================================
// Configurable renames
// ============================================================================

/**
 * Renames elements of one type, optionally restricted to a source namespace,
 * and optionally moves them to a target namespace.
 *
 * Subclasses adjust the renamed element's properties via rewrite_properties().
 */
class SimpleTypeRenameRule : public ElementRule
{
public:
  SimpleTypeRenameRule(
    std::string source_type, std::string target_type,
    std::optional<std::string> source_namespace = std::nullopt,
    std::optional<std::string> target_namespace = std::nullopt, int priority = 100);

  [[nodiscard]] std::string_view name() const override { return name_; }
  [[nodiscard]] int priority() const override { return priority_; }

  [[nodiscard]] bool can_apply(const Element & elem) const override;
  std::unique_ptr<Element> apply(std::unique_ptr<Element> elem, TransformationContext & ctx) override;

protected:
  virtual void rewrite_properties(Element & /*elem*/, TransformationContext & /*ctx*/) {}

private:
  std::string source_type_;
  std::string target_type_;
  std::optional<std::string> source_namespace_;
  std::optional<std::string> target_namespace_;
  int priority_;
  std::string name_;
};

/**
 * Renames a property, optionally only on elements of one type.
 *
 * Subclasses rewrite literal values via convert_value().
 */
class PropertyRenameRule : public PropertyRule
{
public:
  PropertyRenameRule(
    std::string source_property, std::string target_property,
    std::optional<std::string> element_scope = std::nullopt, int priority = 100);

  [[nodiscard]] std::string_view name() const override { return name_; }
  [[nodiscard]] int priority() const override { return priority_; }

  [[nodiscard]] bool can_apply(const Property & prop) const override;
  std::unique_ptr<Property> apply(
    std::unique_ptr<Property> prop, TransformationContext & ctx) override;

protected:
  /// New literal for `value` (unchanged by default)
  [[nodiscard]] virtual std::string convert_value(std::string_view value) const
  {
    return std::string(value);
  }

private:
  std::string source_property_;
  std::string target_property_;
  std::optional<std::string> element_scope_;
  int priority_;
  std::string name_;
};

// ============================================================================
// Mapping-driven rules
// ============================================================================

/**
 * Renames element types through the mapping repository.
 *
 * A missing mapping leaves the type untouched and reports
 * TYPE_MAPPING_NOT_FOUND; mappings flagged for manual review add a warning.
 */
class MappedElementRule : public ElementRule
{
public:
  [[nodiscard]] std::string_view name() const override { return "MappedElement"; }
  [[nodiscard]] int priority() const override { return 50; }

  [[nodiscard]] bool can_apply(const Element & elem) const override;
  std::unique_ptr<Element> apply(std::unique_ptr<Element> elem, TransformationContext & ctx) override;
};

/**
 * Renames properties and events through the mapping repository and converts
 * literal values by the mapping's conversion tag.
 */
class MappedPropertyRule : public PropertyRule
{
public:
  [[nodiscard]] std::string_view name() const override { return "MappedProperty"; }
  [[nodiscard]] int priority() const override { return 50; }

  [[nodiscard]] bool can_apply(const Property & prop) const override;
  std::unique_ptr<Property> apply(
    std::unique_ptr<Property> prop, TransformationContext & ctx) override;
};

/**
 * Rewrites the root's namespace declarations through the namespace mappings
 * and moves every element of a rewritten namespace along with it.
 */
class NamespaceRewriteRule : public ElementRule
{
public:
  [[nodiscard]] std::string_view name() const override { return "NamespaceRewrite"; }
  [[nodiscard]] int priority() const override { return 200; }

  [[nodiscard]] bool can_apply(const Element & elem) const override;
  std::unique_ptr<Element> apply(std::unique_ptr<Element> elem, TransformationContext & ctx) override;
};

/**
 * Removes Binding parameters the target framework does not support.
 *
 * Validation flags collapse into `EnableDataValidation=True`; every other
 * unsupported parameter is dropped with a warning.
 */
class UnsupportedBindingParameterRule : public MarkupExtensionRule
{
public:
  UnsupportedBindingParameterRule();

  [[nodiscard]] std::string_view name() const override { return "UnsupportedBindingParameter"; }
  [[nodiscard]] int priority() const override { return 100; }

  [[nodiscard]] bool can_apply(const MarkupExtension & ext) const override;
  std::unique_ptr<MarkupExtension> apply(
    std::unique_ptr<MarkupExtension> ext, TransformationContext & ctx) override;

private:
  std::set<std::string, std::less<>> removed_;
  std::set<std::string, std::less<>> validation_flags_;
};

/// MappedElementRule, MappedPropertyRule and UnsupportedBindingParameterRule
[[nodiscard]] std::vector<std::unique_ptr<TransformationRule>> default_rule_set();

}  // namespace xaml_bridge
