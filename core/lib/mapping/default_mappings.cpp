// xaml_bridge/mapping/default_mappings.cpp - Built-in WPF to Avalonia mappings
//
#include <initializer_list>

#include "xaml_bridge/ast/unified_ast.hpp"
#include "xaml_bridge/mapping/mapping_repository.hpp"

namespace xaml_bridge
{

namespace
{

constexpr const char * k_wpf_controls = "System.Windows.Controls";
constexpr const char * k_avalonia_controls = "Avalonia.Controls";

struct TypeEntry
{
  const char * source;
  const char * target;
  const char * notes;
  bool review;
};

struct EventEntry
{
  const char * source;
  const char * target;
  const char * notes;
};

}  // namespace

void register_default_mappings(InMemoryMappingRepository & repository)
{
  repository.add(NamespaceMapping{k_wpf_presentation_namespace, k_avalonia_namespace, {}, false});
  repository.add(NamespaceMapping{k_xaml_language_namespace, k_xaml_language_namespace, {}, false});

  const std::initializer_list<TypeEntry> types = {
    {"Window", "Window", nullptr, false},
    {"UserControl", "UserControl", nullptr, false},
    {"Button", "Button", nullptr, false},
    {"TextBox", "TextBox", nullptr, false},
    {"TextBlock", "TextBlock", nullptr, false},
    {"StackPanel", "StackPanel", nullptr, false},
    {"Grid", "Grid", nullptr, false},
    {"Border", "Border", nullptr, false},
    {"DockPanel", "DockPanel", nullptr, false},
    {"WrapPanel", "WrapPanel", nullptr, false},
    {"Canvas", "Canvas", nullptr, false},
    {"ScrollViewer", "ScrollViewer", nullptr, false},
    {"ContentControl", "ContentControl", nullptr, false},
    {"ItemsControl", "ItemsControl", nullptr, false},
    {"ListBox", "ListBox", nullptr, false},
    {"ListView", "ListBox",
     "ListView converted to ListBox; review View configuration (GridView is not available)", true},
    {"DataGrid", "DataGrid", nullptr, false},
    {"ComboBox", "ComboBox", nullptr, false},
    {"CheckBox", "CheckBox", nullptr, false},
    {"RadioButton", "RadioButton", nullptr, false},
    {"Image", "Image", nullptr, false},
    {"Label", "Label", nullptr, false},
    {"Menu", "Menu", nullptr, false},
    {"MenuItem", "MenuItem", nullptr, false},
    {"TabControl", "TabControl", nullptr, false},
    {"TabItem", "TabItem", nullptr, false},
    {"Expander", "Expander", nullptr, false},
    {"ProgressBar", "ProgressBar", nullptr, false},
    {"Slider", "Slider", nullptr, false},
    {"RowDefinition", "RowDefinition", nullptr, false},
    {"ColumnDefinition", "ColumnDefinition", nullptr, false},
    {"Style", "Style", "Style selectors differ; review TargetType and triggers", true},
    {"ResourceDictionary", "ResourceDictionary", nullptr, false},
    {"DataTemplate", "DataTemplate", nullptr, false},
  };
  for (const auto & t : types) {
    TypeMapping m;
    m.source_type = std::string(k_wpf_controls) + "." + t.source;
    m.target_type = t.target;
    m.source_namespace = k_wpf_presentation_namespace;
    m.target_namespace = k_avalonia_namespace;
    m.simple_type_name = t.source;
    m.type_name_changed = std::string_view(t.source) != t.target;
    m.category = k_avalonia_controls;
    if (t.notes) m.notes = t.notes;
    m.requires_manual_review = t.review;
    repository.add(std::move(m));
  }

  PropertyMapping visibility;
  visibility.source_property = "Visibility";
  visibility.target_property = "IsVisible";
  visibility.source_property_type = "Visibility";
  visibility.target_property_type = "Boolean";
  visibility.type_changed = true;
  visibility.value_conversion_rule = "VisibilityToBool";
  visibility.notes = "Hidden and Collapsed both map to False";
  repository.add(std::move(visibility));

  for (const char * name : {"HorizontalContentAlignment", "VerticalContentAlignment"}) {
    PropertyMapping m;
    m.source_property = name;
    m.target_property = name;
    repository.add(std::move(m));
  }

  const std::initializer_list<EventEntry> events = {
    {"MouseLeftButtonDown", "PointerPressed",
     "Use PointerPressed with e.GetCurrentPoint(this).Properties.IsLeftButtonPressed"},
    {"MouseLeftButtonUp", "PointerReleased", nullptr},
    {"MouseRightButtonDown", "PointerPressed",
     "Use PointerPressed with e.GetCurrentPoint(this).Properties.IsRightButtonPressed"},
    {"MouseRightButtonUp", "PointerReleased", nullptr},
    {"MouseMove", "PointerMoved", nullptr},
    {"MouseEnter", "PointerEntered", nullptr},
    {"MouseLeave", "PointerExited", nullptr},
    {"MouseWheel", "PointerWheelChanged", nullptr},
    {"TouchDown", "PointerPressed", "Touch events use pointer events"},
    {"TouchUp", "PointerReleased", "Touch events use pointer events"},
    {"TouchMove", "PointerMoved", "Touch events use pointer events"},
    {"PreviewKeyDown", "KeyDown", "Tunneling events are routed differently"},
    {"PreviewKeyUp", "KeyUp", "Tunneling events are routed differently"},
    {"GotKeyboardFocus", "GotFocus", "Keyboard focus is not distinguished"},
    {"LostKeyboardFocus", "LostFocus", "Keyboard focus is not distinguished"},
    {"Loaded", "AttachedToVisualTree", nullptr},
    {"Unloaded", "DetachedFromVisualTree", nullptr},
  };
  for (const auto & e : events) {
    EventMapping m;
    m.source_event = e.source;
    m.target_event = e.target;
    m.is_routed_event = true;
    if (e.notes) {
      m.notes = e.notes;
      m.requires_manual_review = true;
    }
    repository.add(std::move(m));
  }
}

}  // namespace xaml_bridge
