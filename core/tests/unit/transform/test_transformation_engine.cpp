#include <gtest/gtest.h>

#include <cctype>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include "xaml_bridge/basic/diagnostic_codes.hpp"
#include "xaml_bridge/mapping/mapping_repository.hpp"
#include "xaml_bridge/parser/structural_converter.hpp"
#include "xaml_bridge/serialization/xaml_writer.hpp"
#include "xaml_bridge/transform/rules.hpp"
#include "xaml_bridge/transform/transformation_context.hpp"
#include "xaml_bridge/transform/transformation_engine.hpp"

using namespace xaml_bridge;

namespace
{

constexpr const char * k_wpf = "http://schemas.microsoft.com/winfx/2006/xaml/presentation";

std::unique_ptr<Document> parse(const std::string & body)
{
  DiagnosticBag diags;
  StructuralConverter converter(diags);
  return std::move(converter.convert(body, "View.xaml").document);
}

/// Root element in the WPF namespace wrapping `inner`
std::string wpf(const std::string & root, const std::string & inner)
{
  return "<" + root + " xmlns=\"" + k_wpf + "\">" + inner + "</" + root + ">";
}

class DefaultRulesTest : public ::testing::Test
{
protected:
  void SetUp() override { register_default_mappings(repo_); }

  TransformationSummary run(Document & doc)
  {
    TransformationEngine engine;
    auto rules = default_rule_set();
    engine.add_rules(rules);
    TransformationContext ctx(doc, repo_);
    return engine.run(ctx);
  }

  InMemoryMappingRepository repo_;
};

/// Records the rule that handled each element
class TagRule : public ElementRule
{
public:
  TagRule(std::string tag, int priority) : tag_(std::move(tag)), priority_(priority) {}

  [[nodiscard]] std::string_view name() const override { return tag_; }
  [[nodiscard]] int priority() const override { return priority_; }
  [[nodiscard]] bool can_apply(const Element &) const override { return true; }

  std::unique_ptr<Element> apply(std::unique_ptr<Element> elem, TransformationContext &) override
  {
    elem->x_key = tag_;
    return elem;
  }

private:
  std::string tag_;
  int priority_;
};

class DropElementRule : public ElementRule
{
public:
  explicit DropElementRule(std::string type) : type_(std::move(type)) {}

  [[nodiscard]] std::string_view name() const override { return "DropElement"; }
  [[nodiscard]] bool can_apply(const Element & elem) const override
  {
    return elem.type_name == type_;
  }
  std::unique_ptr<Element> apply(std::unique_ptr<Element>, TransformationContext &) override
  {
    return nullptr;
  }

private:
  std::string type_;
};

class UpperCaseRename : public PropertyRenameRule
{
public:
  UpperCaseRename() : PropertyRenameRule("Label", "Caption", std::string("Chip")) {}

protected:
  [[nodiscard]] std::string convert_value(std::string_view value) const override
  {
    std::string out(value);
    for (auto & c : out) c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    return out;
  }
};

}  // namespace

// ============================================================================
// Mapping-driven rules
// ============================================================================

TEST_F(DefaultRulesTest, VisibilityBecomesIsVisible)
{
  auto doc = parse(wpf(
    "StackPanel",
    "<Button Visibility=\"Collapsed\"/><TextBlock Visibility=\"Visible\"/>"
    "<Border Visibility=\"Hidden\"/>"));
  ASSERT_NE(doc, nullptr);
  run(*doc);

  const auto & children = doc->root()->children();
  const Property * collapsed = children[0]->properties()[0].get();
  EXPECT_EQ(collapsed->name, "IsVisible");
  EXPECT_EQ(*collapsed->literal(), "False");
  EXPECT_EQ(*children[1]->properties()[0]->literal(), "True");
  EXPECT_EQ(*children[2]->properties()[0]->literal(), "False");
  EXPECT_TRUE(doc->diagnostics.has_code(codes::k_value_conversion_review));

  const std::string out = XamlWriter().write(*doc);
  EXPECT_NE(out.find("<Button IsVisible=\"False\"/>"), std::string::npos) << out;
  EXPECT_NE(out.find("<TextBlock IsVisible=\"True\"/>"), std::string::npos) << out;
}

TEST_F(DefaultRulesTest, NonLiteralConversionNeedsReview)
{
  auto doc = parse(wpf("Grid", "<Button Visibility=\"{Binding Shown}\"/>"));
  ASSERT_NE(doc, nullptr);
  run(*doc);

  const Property * prop = doc->root()->children()[0]->properties()[0].get();
  EXPECT_EQ(prop->name, "IsVisible");
  EXPECT_NE(prop->markup_extension(), nullptr);
  EXPECT_TRUE(doc->diagnostics.has_code(codes::k_value_conversion_review));
}

TEST_F(DefaultRulesTest, UnmappedTypeIsReportedAndKept)
{
  auto doc = parse(wpf("Grid", "<FancyChart/>"));
  ASSERT_NE(doc, nullptr);
  run(*doc);

  const Element * chart = doc->root()->children()[0].get();
  EXPECT_EQ(chart->type_name, "FancyChart");
  EXPECT_EQ(chart->state, TransformationState::Skipped);
  EXPECT_TRUE(doc->diagnostics.has_code(codes::k_type_mapping_not_found));
}

TEST_F(DefaultRulesTest, ReviewedTypeIsRenamed)
{
  auto doc = parse(wpf("Grid", "<ListView></ListView>"));
  ASSERT_NE(doc, nullptr);
  run(*doc);

  const Element * list = doc->root()->children()[0].get();
  EXPECT_EQ(list->type_name, "ListBox");
  EXPECT_EQ(list->state, TransformationState::RequiresManualReview);
  EXPECT_TRUE(doc->diagnostics.has_code(codes::k_type_requires_review));

  const std::string out = XamlWriter().write(*doc);
  EXPECT_NE(out.find("<ListBox></ListBox>"), std::string::npos) << out;
}

TEST_F(DefaultRulesTest, EventsFollowEventMappings)
{
  auto doc = parse(wpf("Grid", "<Button MouseLeftButtonDown=\"OnDown\" Loaded=\"OnLoaded\"/>"));
  ASSERT_NE(doc, nullptr);
  run(*doc);

  const Element * button = doc->root()->children()[0].get();
  EXPECT_NE(button->find_property("PointerPressed"), nullptr);
  EXPECT_NE(button->find_property("AttachedToVisualTree"), nullptr);
  EXPECT_EQ(button->find_property("Loaded"), nullptr);

  const auto warnings = doc->diagnostics.warnings();
  size_t event_reviews = 0;
  for (const auto & w : warnings) {
    if (w.code == codes::k_event_requires_review) ++event_reviews;
  }
  EXPECT_EQ(event_reviews, 1u);
}

TEST_F(DefaultRulesTest, BindingParametersRemoved)
{
  auto doc = parse(wpf(
    "Grid",
    "<TextBox Text=\"{Binding Name, UpdateSourceTrigger=PropertyChanged, "
    "ValidatesOnDataErrors=True}\"/>"));
  ASSERT_NE(doc, nullptr);
  run(*doc);

  const Property * text = doc->root()->children()[0]->find_property("Text");
  ASSERT_NE(text->markup_extension(), nullptr);
  EXPECT_EQ(text->markup_extension()->to_string(), "{Binding Name, EnableDataValidation=True}");

  size_t unsupported = 0;
  for (const auto & w : doc->diagnostics.warnings()) {
    if (w.code == codes::k_binding_parameter_unsupported) ++unsupported;
  }
  EXPECT_EQ(unsupported, 1u);
}

TEST_F(DefaultRulesTest, TraceAndStatisticsReported)
{
  auto doc = parse(wpf("Grid", "<ListView/>"));
  ASSERT_NE(doc, nullptr);
  const auto summary = run(*doc);

  EXPECT_TRUE(summary.had_root);
  EXPECT_EQ(summary.rules_applied, 2u);
  EXPECT_EQ(summary.nodes_deleted, 0u);
  ASSERT_EQ(doc->transformation_trace.size(), 1u);
  EXPECT_EQ(doc->transformation_trace[0].rule_name, "MappedElement");
  EXPECT_EQ(doc->transformation_trace[0].description, "Renamed ListView to ListBox");
  EXPECT_TRUE(doc->diagnostics.has_code(codes::k_transform_complete));
  EXPECT_TRUE(doc->diagnostics.has_code(codes::k_transform_rule_stats));
}

TEST_F(DefaultRulesTest, AttachedOwnerRenameIsTraced)
{
  TypeMapping legacy;
  legacy.source_type = "LegacyDock";
  legacy.target_type = "Avalonia.Controls.DockPanel";
  legacy.simple_type_name = "LegacyDock";
  legacy.type_name_changed = true;
  repo_.add(legacy);

  auto doc = parse(wpf("Grid", "<Button LegacyDock.Dock=\"Top\"/>"));
  ASSERT_NE(doc, nullptr);
  run(*doc);

  const Property * dock = doc->root()->children()[0]->properties()[0].get();
  EXPECT_EQ(dock->attached_owner_type, std::optional<std::string>("DockPanel"));
  EXPECT_EQ(dock->state, TransformationState::Transformed);

  ASSERT_EQ(doc->transformation_trace.size(), 1u);
  const TransformationRecord & record = doc->transformation_trace[0];
  EXPECT_EQ(record.rule_name, "MappedProperty");
  EXPECT_EQ(record.node_kind, "Property");
  EXPECT_EQ(record.description, "Renamed attached owner of Dock from LegacyDock to DockPanel");
  EXPECT_EQ(record.node_id, dock->id());

  const std::string out = XamlWriter().write(*doc);
  EXPECT_NE(out.find("<Button DockPanel.Dock=\"Top\"/>"), std::string::npos) << out;
}

TEST_F(DefaultRulesTest, SameInputTransformsIdentically)
{
  auto original = parse(
    std::string("<StackPanel xmlns=\"") + k_wpf +
    "\" xmlns:x=\"http://schemas.microsoft.com/winfx/2006/xaml\">"
    "\n  <ListView x:Name=\"Items\"/>"
    "\n  <Button Visibility=\"Collapsed\" MouseLeftButtonDown=\"OnDown\"/>"
    "\n  <TextBox Text=\"{Binding Name, UpdateSourceTrigger=PropertyChanged}\"/>"
    "\n</StackPanel>");
  ASSERT_NE(original, nullptr);
  auto copy = original->clone();

  run(*original);
  run(*copy);

  const std::string first = XamlWriter().write(*original);
  EXPECT_EQ(first, XamlWriter().write(*copy));
  EXPECT_NE(first.find("<ListBox x:Name=\"Items\""), std::string::npos) << first;

  ASSERT_FALSE(original->transformation_trace.empty());
  ASSERT_EQ(original->transformation_trace.size(), copy->transformation_trace.size());
  for (size_t i = 0; i < original->transformation_trace.size(); ++i) {
    const auto & a = original->transformation_trace[i];
    const auto & b = copy->transformation_trace[i];
    EXPECT_EQ(a.rule_name, b.rule_name) << i;
    EXPECT_EQ(a.node_kind, b.node_kind) << i;
    EXPECT_EQ(a.description, b.description) << i;
    EXPECT_EQ(a.line, b.line) << i;
  }
}

// ============================================================================
// Namespace rewrite
// ============================================================================

TEST(NamespaceRewriteRuleTest, RootDefaultNamespaceMovesToTarget)
{
  auto doc = parse(
    "<Window xmlns=\"urn:source\" xmlns:x=\"http://schemas.microsoft.com/winfx/2006/xaml\">"
    "<Grid/></Window>");
  ASSERT_NE(doc, nullptr);

  InMemoryMappingRepository repo;
  repo.add(NamespaceMapping{"urn:source", "urn:target", std::nullopt, false});

  TransformationEngine engine;
  engine.add_rule(std::make_unique<NamespaceRewriteRule>());
  TransformationContext ctx(*doc, repo);
  engine.run(ctx);

  EXPECT_EQ(doc->metadata.transformed_namespace, std::optional<std::string>("urn:target"));
  EXPECT_EQ(doc->root()->children()[0]->xml_namespace, std::optional<std::string>("urn:target"));

  XamlWriterOptions options;
  options.use_target_namespace = true;
  const std::string out = XamlWriter(options).write(*doc);
  EXPECT_EQ(out.rfind("<Window xmlns=\"urn:target\"", 0), 0u) << out;
  EXPECT_NE(out.find("xmlns:x=\"http://schemas.microsoft.com/winfx/2006/xaml\""), std::string::npos);
  EXPECT_EQ(out.find("urn:source"), std::string::npos);
}

TEST(NamespaceRewriteRuleTest, ReviewFlagWarns)
{
  auto doc = parse("<Window xmlns:local=\"clr-namespace:Legacy\"/>");
  ASSERT_NE(doc, nullptr);

  InMemoryMappingRepository repo;
  repo.add(NamespaceMapping{"clr-namespace:Legacy", "clr-namespace:Legacy", "check assembly", true});

  TransformationEngine engine;
  engine.add_rule(std::make_unique<NamespaceRewriteRule>());
  TransformationContext ctx(*doc, repo);
  engine.run(ctx);

  EXPECT_TRUE(doc->diagnostics.has_code(codes::k_namespace_requires_review));
  EXPECT_FALSE(doc->metadata.transformed_namespace.has_value());
}

// ============================================================================
// Engine behaviour
// ============================================================================

TEST(TransformationEngineTest, HighestPriorityRuleWins)
{
  auto doc = parse("<Grid/>");
  ASSERT_NE(doc, nullptr);
  InMemoryMappingRepository repo;

  TransformationEngine engine;
  engine.add_rule(std::make_unique<TagRule>("low", 10));
  engine.add_rule(std::make_unique<TagRule>("high", 20));
  TransformationContext ctx(*doc, repo);
  engine.run(ctx);

  EXPECT_EQ(doc->root()->x_key, std::optional<std::string>("high"));
  EXPECT_EQ(ctx.statistics().count("low"), 0u);
  EXPECT_EQ(ctx.statistics().at("high").applied, 1u);
}

TEST(TransformationEngineTest, EqualPriorityKeepsRegistrationOrder)
{
  TransformationEngine engine;
  engine.add_rule(std::make_unique<TagRule>("first", 5));
  engine.add_rule(std::make_unique<TagRule>("second", 5));
  engine.add_rule(std::make_unique<TagRule>("top", 9));

  const auto & rules = engine.rules();
  ASSERT_EQ(rules.size(), 3u);
  EXPECT_EQ(rules[0]->name(), "top");
  EXPECT_EQ(rules[1]->name(), "first");
  EXPECT_EQ(rules[2]->name(), "second");

  for (int i = 0; i < 3; ++i) {
    auto doc = parse("<Grid/>");
    InMemoryMappingRepository repo;
    TransformationEngine twin;
    twin.add_rule(std::make_unique<TagRule>("first", 5));
    twin.add_rule(std::make_unique<TagRule>("second", 5));
    TransformationContext ctx(*doc, repo);
    twin.run(ctx);
    EXPECT_EQ(doc->root()->x_key, std::optional<std::string>("first"));
  }
}

TEST(TransformationEngineTest, DeletionIsCounted)
{
  auto doc = parse("<Grid><Debug/><Button/><!-- tail --></Grid>");
  ASSERT_NE(doc, nullptr);
  InMemoryMappingRepository repo;

  TransformationEngine engine;
  engine.add_rule(std::make_unique<DropElementRule>("Debug"));
  TransformationContext ctx(*doc, repo);
  const auto summary = engine.run(ctx);

  EXPECT_EQ(summary.nodes_deleted, 1u);
  EXPECT_EQ(ctx.statistics().at("DropElement").deleted, 1u);
  ASSERT_EQ(doc->root()->children().size(), 1u);
  EXPECT_EQ(doc->root()->children()[0]->type_name, "Button");
  EXPECT_EQ(XamlWriter().write(*doc), "<Grid><Button/><!-- tail --></Grid>");
}

TEST(TransformationEngineTest, EmptyDocumentWarns)
{
  Document doc;
  InMemoryMappingRepository repo;
  TransformationEngine engine;
  auto rules = default_rule_set();
  engine.add_rules(rules);
  TransformationContext ctx(doc, repo);

  const auto summary = engine.run(ctx);
  EXPECT_FALSE(summary.had_root);
  EXPECT_TRUE(doc.diagnostics.has_code(codes::k_transform_no_root));
  EXPECT_FALSE(doc.diagnostics.has_code(codes::k_transform_complete));
}

// ============================================================================
// Configurable renames
// ============================================================================

TEST(RenameRuleTest, SimpleTypeRenameHonoursNamespace)
{
  auto doc = parse(wpf("Grid", "<Label/>"));
  ASSERT_NE(doc, nullptr);
  InMemoryMappingRepository repo;

  TransformationEngine engine;
  engine.add_rule(std::make_unique<SimpleTypeRenameRule>(
    "Label", "TextBlock", std::string(k_wpf), std::string("https://github.com/avaloniaui")));
  engine.add_rule(std::make_unique<SimpleTypeRenameRule>("Grid", "Panel", std::string("urn:other")));
  TransformationContext ctx(*doc, repo);
  engine.run(ctx);

  EXPECT_EQ(doc->root()->type_name, "Grid");
  const Element * label = doc->root()->children()[0].get();
  EXPECT_EQ(label->type_name, "TextBlock");
  EXPECT_EQ(label->hints.original_name, std::optional<std::string>("Label"));
  EXPECT_EQ(label->effective_namespace(), std::optional<std::string>("https://github.com/avaloniaui"));
}

TEST(RenameRuleTest, RootRenameWritesTargetNamespace)
{
  auto doc = parse(wpf("Window", "<Grid/>"));
  ASSERT_NE(doc, nullptr);
  InMemoryMappingRepository repo;

  TransformationEngine engine;
  engine.add_rule(std::make_unique<SimpleTypeRenameRule>(
    "Window", "Window", std::string(k_wpf), std::string("https://github.com/avaloniaui")));
  TransformationContext ctx(*doc, repo);
  engine.run(ctx);

  const std::string out = XamlWriter().write(*doc);
  EXPECT_EQ(
    out, std::string("<Window xmlns=\"https://github.com/avaloniaui\"><Grid xmlns=\"") + k_wpf +
           "\"/></Window>");
}

TEST(RenameRuleTest, PropertyRenameScopedToSourceType)
{
  auto doc = parse("<Panel><Chip Label=\"new\"/><Tag Label=\"old\"/></Panel>");
  ASSERT_NE(doc, nullptr);
  InMemoryMappingRepository repo;

  TransformationEngine engine;
  engine.add_rule(std::make_unique<SimpleTypeRenameRule>("Chip", "Badge"));
  engine.add_rule(std::make_unique<UpperCaseRename>());
  TransformationContext ctx(*doc, repo);
  engine.run(ctx);

  const Element * badge = doc->root()->children()[0].get();
  EXPECT_EQ(badge->type_name, "Badge");
  ASSERT_NE(badge->find_property("Caption"), nullptr);
  EXPECT_EQ(*badge->find_property("Caption")->literal(), "NEW");

  const Element * tag = doc->root()->children()[1].get();
  EXPECT_NE(tag->find_property("Label"), nullptr);
}
