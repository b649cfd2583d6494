#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>
#include <string>

#include "xaml_bridge/ast/unified_ast.hpp"
#include "xaml_bridge/mapping/mapping_repository.hpp"

using namespace xaml_bridge;
namespace fs = std::filesystem;

namespace
{

PropertyMapping property(const char * source, const char * target, const char * owner = nullptr)
{
  PropertyMapping m;
  m.source_property = source;
  m.target_property = target;
  if (owner) m.owner_type = owner;
  return m;
}

fs::path write_temp(const std::string & name, const std::string & content)
{
  const fs::path path = fs::temp_directory_path() / name;
  std::ofstream out(path);
  out << content;
  return path;
}

constexpr const char * k_database = R"({
  "Version": "2.1.0",
  "namespaceMappings": [
    {"wpfNamespace": "clr-namespace:Legacy", "avaloniaNamespace": "clr-namespace:Modern",
     "requiresManualReview": true, "notes": "moved"}
  ],
  "typeMappings": [
    {"WpfTypeName": "Legacy.Gauge", "avaloniaTypeName": "Modern.Meter",
     "simpleTypeName": "Gauge", "typeNameChanged": true}
  ],
  "propertyMappings": [
    {"wpfPropertyName": "Reading", "avaloniaPropertyName": "Value", "ownerTypeName": "Gauge"},
    {"wpfPropertyName": "IsHidden", "avaloniaPropertyName": "IsVisible",
     "valueConversionRule": "NegateBool", "typeChanged": false}
  ],
  "eventMappings": [
    {"wpfEventName": "Tick", "avaloniaEventName": "Elapsed", "isRoutedEvent": false}
  ]
})";

}  // namespace

TEST(InMemoryMappingRepositoryTest, OwnerSpecificBeatsGeneral)
{
  InMemoryMappingRepository repo;
  repo.add(property("Header", "Title"));
  repo.add(property("Header", "Caption", "Expander"));

  EXPECT_EQ(repo.find_property_mapping("Header", std::string_view("Expander"))->target_property, "Caption");
  EXPECT_EQ(repo.find_property_mapping("Header", std::string_view("TabItem"))->target_property, "Title");
  EXPECT_EQ(repo.find_property_mapping("Header")->target_property, "Title");
  EXPECT_EQ(repo.find_property_mapping("Footer"), nullptr);
}

TEST(InMemoryMappingRepositoryTest, OwnerOnlyMappingNeedsOwner)
{
  InMemoryMappingRepository repo;
  repo.add(property("Header", "Caption", "Expander"));
  EXPECT_EQ(repo.find_property_mapping("Header"), nullptr);
}

TEST(InMemoryMappingRepositoryTest, FirstMatchWins)
{
  InMemoryMappingRepository repo;
  repo.add(property("Header", "First"));
  repo.add(property("Header", "Second"));
  EXPECT_EQ(repo.find_property_mapping("Header")->target_property, "First");
}

TEST(InMemoryMappingRepositoryTest, TypeLookupFallsBackToSimpleName)
{
  InMemoryMappingRepository repo;
  TypeMapping m;
  m.source_type = "System.Windows.Controls.ListView";
  m.target_type = "ListBox";
  m.simple_type_name = "ListView";
  repo.add(m);

  EXPECT_NE(repo.find_type_mapping("System.Windows.Controls.ListView"), nullptr);
  EXPECT_NE(repo.find_type_mapping("ListView"), nullptr);
  EXPECT_EQ(repo.find_type_mapping("ListBox"), nullptr);
}

TEST(InMemoryMappingRepositoryTest, MergeAppendsRecords)
{
  InMemoryMappingRepository a;
  a.add(property("A", "B"));
  InMemoryMappingRepository b;
  b.add(property("C", "D"));
  b.add(EventMapping{"Tick", "Elapsed", std::nullopt, false, std::nullopt, std::nullopt, false});

  a.merge(b);
  EXPECT_EQ(a.all_property_mappings().size(), 2u);
  EXPECT_EQ(a.all_event_mappings().size(), 1u);
  EXPECT_FALSE(a.empty());
}

TEST(DefaultMappingsTest, CoreRecordsPresent)
{
  InMemoryMappingRepository repo;
  register_default_mappings(repo);

  const NamespaceMapping * ns = repo.find_namespace_mapping(k_wpf_presentation_namespace);
  ASSERT_NE(ns, nullptr);
  EXPECT_EQ(ns->target_namespace, k_avalonia_namespace);

  const TypeMapping * list_view = repo.find_type_mapping("ListView");
  ASSERT_NE(list_view, nullptr);
  EXPECT_EQ(list_view->target_type, "ListBox");
  EXPECT_TRUE(list_view->requires_manual_review);
  EXPECT_TRUE(list_view->type_name_changed);

  const PropertyMapping * visibility = repo.find_property_mapping("Visibility");
  ASSERT_NE(visibility, nullptr);
  EXPECT_EQ(visibility->target_property, "IsVisible");
  EXPECT_EQ(visibility->value_conversion_rule, std::optional<std::string>("VisibilityToBool"));

  const EventMapping * loaded = repo.find_event_mapping("Loaded");
  ASSERT_NE(loaded, nullptr);
  EXPECT_EQ(loaded->target_event, "AttachedToVisualTree");
  EXPECT_FALSE(loaded->requires_manual_review);
  EXPECT_TRUE(repo.find_event_mapping("MouseLeftButtonDown")->requires_manual_review);
}

TEST(JsonMappingRepositoryTest, LoadsAllSectionsCaseInsensitively)
{
  JsonMappingRepository repo;
  const auto result = repo.load_from_json(nlohmann::json::parse(k_database));
  ASSERT_TRUE(result.success) << result.error;
  EXPECT_EQ(result.records_loaded, 5u);
  EXPECT_EQ(result.version, "2.1.0");
  EXPECT_EQ(repo.version(), "2.1.0");

  const NamespaceMapping * ns = repo.find_namespace_mapping("clr-namespace:Legacy");
  ASSERT_NE(ns, nullptr);
  EXPECT_TRUE(ns->requires_manual_review);
  EXPECT_EQ(ns->notes, std::optional<std::string>("moved"));

  const TypeMapping * gauge = repo.find_type_mapping("Gauge");
  ASSERT_NE(gauge, nullptr);
  EXPECT_EQ(gauge->target_type, "Modern.Meter");

  EXPECT_EQ(repo.find_property_mapping("Reading"), nullptr);
  EXPECT_EQ(
    repo.find_property_mapping("Reading", std::string_view("Gauge"))->target_property, "Value");
  EXPECT_EQ(repo.find_event_mapping("Tick")->target_event, "Elapsed");
}

TEST(JsonMappingRepositoryTest, MissingRequiredFieldFailsAndClears)
{
  JsonMappingRepository repo;
  ASSERT_TRUE(repo.load_from_json(nlohmann::json::parse(k_database)).success);

  const auto result = repo.load_from_json(
    nlohmann::json::parse(R"({"typeMappings": [{"wpfTypeName": "Gauge"}]})"));
  EXPECT_FALSE(result.success);
  EXPECT_NE(result.error.find("avaloniaTypeName"), std::string::npos);
  EXPECT_TRUE(repo.empty());
}

TEST(JsonMappingRepositoryTest, RejectsNonObjectAndNonArraySections)
{
  JsonMappingRepository repo;
  EXPECT_FALSE(repo.load_from_json(nlohmann::json::array()).success);
  EXPECT_FALSE(repo.load_from_json(nlohmann::json::parse(R"({"typeMappings": {}})")).success);
}

TEST(JsonMappingRepositoryTest, MissingFileIsEmptyDatabase)
{
  JsonMappingRepository repo;
  const auto result = repo.load(fs::temp_directory_path() / "xaml_bridge_no_such_mappings.json");
  EXPECT_TRUE(result.success);
  EXPECT_EQ(result.records_loaded, 0u);
  EXPECT_TRUE(repo.empty());
}

TEST(JsonMappingRepositoryTest, LoadFromFileAndWriteBack)
{
  const fs::path path = write_temp("xaml_bridge_mappings_test.json", k_database);
  JsonMappingRepository repo;
  ASSERT_TRUE(repo.load(path).success);

  const nlohmann::json out = repo.to_json();
  EXPECT_EQ(out["version"], "2.1.0");
  ASSERT_EQ(out["propertyMappings"].size(), 2u);
  EXPECT_EQ(out["propertyMappings"][1]["valueConversionRule"], "NegateBool");
  EXPECT_FALSE(out["propertyMappings"][1].contains("ownerTypeName"));

  JsonMappingRepository reloaded;
  ASSERT_TRUE(reloaded.load_from_json(out).success);
  EXPECT_EQ(reloaded.all_type_mappings().size(), 1u);
  EXPECT_EQ(reloaded.all_event_mappings().size(), 1u);

  fs::remove(path);
}

TEST(JsonMappingRepositoryTest, MalformedFileFails)
{
  const fs::path path = write_temp("xaml_bridge_bad_mappings.json", "{ not json");
  JsonMappingRepository repo;
  const auto result = repo.load(path);
  EXPECT_FALSE(result.success);
  EXPECT_FALSE(result.error.empty());
  fs::remove(path);
}
