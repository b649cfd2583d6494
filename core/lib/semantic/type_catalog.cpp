// xaml_bridge/semantic/type_catalog.cpp - Known markup types for the semantic layer
//
#include "xaml_bridge/semantic/type_catalog.hpp"

#include <fstream>
#include <initializer_list>
#include <nlohmann/json.hpp>

#include "xaml_bridge/basic/logging.hpp"

namespace xaml_bridge
{

namespace
{

using nlohmann::json;

constexpr const char * k_controls_clr = "System.Windows.Controls";
constexpr const char * k_windows_clr = "System.Windows";
constexpr const char * k_markup_clr = "System.Windows.Markup";
constexpr const char * k_data_clr = "System.Windows.Data";
constexpr const char * k_media_clr = "System.Windows.Media";

PropertyDescriptor prop(const char * name, const char * type) { return {name, type, false}; }
PropertyDescriptor attached(const char * name, const char * type) { return {name, type, true}; }

void add(
  TypeCatalog & catalog, const char * clr, const char * name, const char * base,
  const char * content, std::initializer_list<PropertyDescriptor> properties)
{
  TypeDescriptor t;
  t.name = name;
  t.xml_namespace = k_wpf_presentation_namespace;
  t.clr_namespace = clr;
  if (base) t.base_type = base;
  if (content) t.content_property = content;
  t.properties.assign(properties.begin(), properties.end());
  catalog.register_type(std::move(t));
}

void add_extension(
  TypeCatalog & catalog, const char * xml_ns, const char * clr, const char * name,
  const char * positional, std::initializer_list<PropertyDescriptor> properties)
{
  TypeDescriptor t;
  t.name = name;
  t.xml_namespace = xml_ns;
  t.clr_namespace = clr;
  t.base_type = "MarkupExtension";
  t.is_markup_extension = true;
  if (positional) t.positional_parameter = positional;
  t.properties.assign(properties.begin(), properties.end());
  catalog.register_type(std::move(t));
}

template <typename T>
std::optional<T> optional_field(const json & j, const char * key)
{
  auto it = j.find(key);
  if (it == j.end() || it->is_null()) return std::nullopt;
  return it->get<T>();
}

}  // namespace

void TypeCatalog::register_type(TypeDescriptor type)
{
  auto key = std::make_pair(type.xml_namespace, type.name);
  types_[std::move(key)] = std::move(type);
}

void TypeCatalog::register_builtins()
{
  // Framework base chain
  add(*this, k_windows_clr, "DependencyObject", nullptr, nullptr, {});
  add(*this, k_windows_clr, "UIElement", "DependencyObject", nullptr,
      {prop("Visibility", "Visibility"), prop("IsEnabled", "Boolean"), prop("Opacity", "Double"),
       prop("IsHitTestVisible", "Boolean"), prop("Focusable", "Boolean"),
       prop("RenderTransform", "Transform"), prop("MouseDown", "event"),
       prop("MouseUp", "event"), prop("KeyDown", "event"), prop("KeyUp", "event")});
  add(*this, k_windows_clr, "FrameworkElement", "UIElement", nullptr,
      {prop("Width", "Double"), prop("Height", "Double"), prop("MinWidth", "Double"),
       prop("MinHeight", "Double"), prop("MaxWidth", "Double"), prop("MaxHeight", "Double"),
       prop("Margin", "Thickness"), prop("HorizontalAlignment", "HorizontalAlignment"),
       prop("VerticalAlignment", "VerticalAlignment"), prop("Name", "String"),
       prop("Style", "Style"), prop("DataContext", "Object"),
       prop("Resources", "ResourceDictionary"), prop("ToolTip", "Object"),
       prop("Tag", "Object"), prop("Cursor", "Cursor"), prop("FlowDirection", "FlowDirection"),
       prop("Loaded", "event"), prop("Unloaded", "event"), prop("SizeChanged", "event")});
  add(*this, k_controls_clr, "Control", "FrameworkElement", nullptr,
      {prop("Background", "Brush"), prop("Foreground", "Brush"), prop("BorderBrush", "Brush"),
       prop("BorderThickness", "Thickness"), prop("Padding", "Thickness"),
       prop("FontSize", "Double"), prop("FontWeight", "FontWeight"),
       prop("FontFamily", "FontFamily"), prop("FontStyle", "FontStyle"),
       prop("Template", "ControlTemplate"), prop("IsTabStop", "Boolean"),
       prop("TabIndex", "Int32"),
       prop("HorizontalContentAlignment", "HorizontalAlignment"),
       prop("VerticalContentAlignment", "VerticalAlignment")});
  add(*this, k_controls_clr, "ContentControl", "Control", "Content",
      {prop("Content", "Object"), prop("ContentTemplate", "DataTemplate")});
  add(*this, k_windows_clr, "Window", "ContentControl", nullptr,
      {prop("Title", "String"), prop("SizeToContent", "SizeToContent"),
       prop("WindowStartupLocation", "WindowStartupLocation"), prop("Icon", "ImageSource"),
       prop("ResizeMode", "ResizeMode"), prop("WindowState", "WindowState"),
       prop("WindowStyle", "WindowStyle"), prop("Topmost", "Boolean"),
       prop("ShowInTaskbar", "Boolean"), prop("Closing", "event"), prop("Closed", "event")});
  add(*this, k_controls_clr, "UserControl", "ContentControl", nullptr, {});
  add(*this, k_windows_clr, "Application", nullptr, nullptr,
      {prop("Resources", "ResourceDictionary"), prop("StartupUri", "Uri"),
       prop("Startup", "event"), prop("Exit", "event")});

  // Layout panels
  add(*this, k_controls_clr, "Panel", "FrameworkElement", "Children",
      {prop("Background", "Brush"), prop("Children", "UIElementCollection"),
       attached("ZIndex", "Int32")});
  add(*this, k_controls_clr, "Grid", "Panel", nullptr,
      {prop("RowDefinitions", "RowDefinitionCollection"),
       prop("ColumnDefinitions", "ColumnDefinitionCollection"),
       prop("ShowGridLines", "Boolean"), attached("Row", "Int32"), attached("Column", "Int32"),
       attached("RowSpan", "Int32"), attached("ColumnSpan", "Int32"),
       attached("IsSharedSizeScope", "Boolean")});
  add(*this, k_controls_clr, "RowDefinition", "FrameworkContentElement", nullptr,
      {prop("Height", "GridLength"), prop("MinHeight", "Double"), prop("MaxHeight", "Double"),
       prop("SharedSizeGroup", "String")});
  add(*this, k_controls_clr, "ColumnDefinition", "FrameworkContentElement", nullptr,
      {prop("Width", "GridLength"), prop("MinWidth", "Double"), prop("MaxWidth", "Double"),
       prop("SharedSizeGroup", "String")});
  add(*this, k_controls_clr, "StackPanel", "Panel", nullptr,
      {prop("Orientation", "Orientation")});
  add(*this, k_controls_clr, "WrapPanel", "Panel", nullptr,
      {prop("Orientation", "Orientation"), prop("ItemWidth", "Double"),
       prop("ItemHeight", "Double")});
  add(*this, k_controls_clr, "DockPanel", "Panel", nullptr,
      {prop("LastChildFill", "Boolean"), attached("Dock", "Dock")});
  add(*this, k_controls_clr, "Canvas", "Panel", nullptr,
      {attached("Left", "Double"), attached("Top", "Double"), attached("Right", "Double"),
       attached("Bottom", "Double")});
  add(*this, k_controls_clr, "UniformGrid", "Panel", nullptr,
      {prop("Rows", "Int32"), prop("Columns", "Int32")});
  add(*this, k_controls_clr, "Border", "FrameworkElement", "Child",
      {prop("Child", "UIElement"), prop("Background", "Brush"), prop("BorderBrush", "Brush"),
       prop("BorderThickness", "Thickness"), prop("CornerRadius", "CornerRadius"),
       prop("Padding", "Thickness")});
  add(*this, k_controls_clr, "ScrollViewer", "ContentControl", nullptr,
      {prop("HorizontalScrollBarVisibility", "ScrollBarVisibility"),
       prop("VerticalScrollBarVisibility", "ScrollBarVisibility")});
  add(*this, k_controls_clr, "Viewbox", "FrameworkElement", "Child",
      {prop("Child", "UIElement"), prop("Stretch", "Stretch")});

  // Controls
  add(*this, k_controls_clr, "TextBlock", "FrameworkElement", "Inlines",
      {prop("Text", "String"), prop("Inlines", "InlineCollection"),
       prop("FontSize", "Double"), prop("FontWeight", "FontWeight"),
       prop("FontFamily", "FontFamily"), prop("Foreground", "Brush"),
       prop("Background", "Brush"), prop("TextWrapping", "TextWrapping"),
       prop("TextAlignment", "TextAlignment"), prop("TextTrimming", "TextTrimming"),
       prop("Padding", "Thickness")});
  add(*this, k_controls_clr, "TextBox", "Control", "Text",
      {prop("Text", "String"), prop("AcceptsReturn", "Boolean"), prop("AcceptsTab", "Boolean"),
       prop("IsReadOnly", "Boolean"), prop("TextWrapping", "TextWrapping"),
       prop("MaxLength", "Int32"), prop("TextChanged", "event")});
  add(*this, k_controls_clr, "PasswordBox", "Control", nullptr,
      {prop("PasswordChar", "Char"), prop("MaxLength", "Int32")});
  add(*this, k_controls_clr, "Label", "ContentControl", nullptr, {prop("Target", "UIElement")});
  add(*this, "System.Windows.Controls.Primitives", "ButtonBase", "ContentControl", nullptr,
      {prop("Command", "ICommand"), prop("CommandParameter", "Object"),
       prop("ClickMode", "ClickMode"), prop("Click", "event")});
  add(*this, k_controls_clr, "Button", "ButtonBase", nullptr,
      {prop("IsDefault", "Boolean"), prop("IsCancel", "Boolean")});
  add(*this, "System.Windows.Controls.Primitives", "ToggleButton", "ButtonBase", nullptr,
      {prop("IsChecked", "Nullable<Boolean>"), prop("IsThreeState", "Boolean"),
       prop("Checked", "event"), prop("Unchecked", "event")});
  add(*this, k_controls_clr, "CheckBox", "ToggleButton", nullptr, {});
  add(*this, k_controls_clr, "RadioButton", "ToggleButton", nullptr,
      {prop("GroupName", "String")});
  add(*this, k_controls_clr, "ItemsControl", "Control", "Items",
      {prop("Items", "ItemCollection"), prop("ItemsSource", "IEnumerable"),
       prop("ItemTemplate", "DataTemplate"), prop("ItemsPanel", "ItemsPanelTemplate"),
       prop("DisplayMemberPath", "String"), prop("ItemContainerStyle", "Style")});
  add(*this, "System.Windows.Controls.Primitives", "Selector", "ItemsControl", nullptr,
      {prop("SelectedItem", "Object"), prop("SelectedIndex", "Int32"),
       prop("SelectedValue", "Object"), prop("SelectedValuePath", "String"),
       prop("SelectionChanged", "event")});
  add(*this, k_controls_clr, "ListBox", "Selector", nullptr,
      {prop("SelectionMode", "SelectionMode")});
  add(*this, k_controls_clr, "ListView", "ListBox", nullptr, {prop("View", "ViewBase")});
  add(*this, k_controls_clr, "ComboBox", "Selector", nullptr,
      {prop("IsEditable", "Boolean"), prop("IsDropDownOpen", "Boolean"),
       prop("Text", "String")});
  add(*this, k_controls_clr, "ListBoxItem", "ContentControl", nullptr,
      {prop("IsSelected", "Boolean")});
  add(*this, k_controls_clr, "ComboBoxItem", "ListBoxItem", nullptr, {});
  add(*this, k_controls_clr, "TabControl", "Selector", nullptr,
      {prop("TabStripPlacement", "Dock")});
  add(*this, "System.Windows.Controls", "HeaderedContentControl", "ContentControl", nullptr,
      {prop("Header", "Object"), prop("HeaderTemplate", "DataTemplate")});
  add(*this, k_controls_clr, "TabItem", "HeaderedContentControl", nullptr,
      {prop("IsSelected", "Boolean")});
  add(*this, k_controls_clr, "Expander", "HeaderedContentControl", nullptr,
      {prop("IsExpanded", "Boolean"), prop("ExpandDirection", "ExpandDirection")});
  add(*this, k_controls_clr, "GroupBox", "HeaderedContentControl", nullptr, {});
  add(*this, k_controls_clr, "Menu", "ItemsControl", nullptr, {});
  add(*this, k_controls_clr, "ContextMenu", "ItemsControl", nullptr, {});
  add(*this, k_controls_clr, "MenuItem", "ItemsControl", nullptr,
      {prop("Header", "Object"), prop("Command", "ICommand"), prop("Icon", "Object"),
       prop("InputGestureText", "String"), prop("IsCheckable", "Boolean"),
       prop("IsChecked", "Boolean"), prop("Click", "event")});
  add(*this, k_controls_clr, "Image", "FrameworkElement", nullptr,
      {prop("Source", "ImageSource"), prop("Stretch", "Stretch")});
  add(*this, "System.Windows.Controls.Primitives", "RangeBase", "Control", nullptr,
      {prop("Minimum", "Double"), prop("Maximum", "Double"), prop("Value", "Double"),
       prop("ValueChanged", "event")});
  add(*this, k_controls_clr, "Slider", "RangeBase", nullptr,
      {prop("Orientation", "Orientation"), prop("TickFrequency", "Double"),
       prop("IsSnapToTickEnabled", "Boolean")});
  add(*this, k_controls_clr, "ProgressBar", "RangeBase", nullptr,
      {prop("IsIndeterminate", "Boolean"), prop("Orientation", "Orientation")});
  add(*this, k_controls_clr, "DataGrid", "Selector", nullptr,
      {prop("Columns", "ObservableCollection<DataGridColumn>"),
       prop("AutoGenerateColumns", "Boolean"), prop("IsReadOnly", "Boolean")});

  // Resources, styles and templates
  add(*this, k_windows_clr, "ResourceDictionary", nullptr, nullptr,
      {prop("Source", "Uri"), prop("MergedDictionaries", "Collection<ResourceDictionary>")});
  add(*this, k_windows_clr, "Style", nullptr, "Setters",
      {prop("TargetType", "Type"), prop("BasedOn", "Style"),
       prop("Setters", "SetterBaseCollection"), prop("Triggers", "TriggerCollection")});
  add(*this, k_windows_clr, "Setter", nullptr, nullptr,
      {prop("Property", "DependencyProperty"), prop("Value", "Object"),
       prop("TargetName", "String")});
  add(*this, k_windows_clr, "Trigger", nullptr, "Setters",
      {prop("Property", "DependencyProperty"), prop("Value", "Object"),
       prop("Setters", "SetterBaseCollection")});
  add(*this, k_windows_clr, "DataTrigger", nullptr, "Setters",
      {prop("Binding", "BindingBase"), prop("Value", "Object"),
       prop("Setters", "SetterBaseCollection")});
  add(*this, k_windows_clr, "FrameworkTemplate", nullptr, "VisualTree",
      {prop("VisualTree", "FrameworkElementFactory"), prop("Resources", "ResourceDictionary")});
  add(*this, k_windows_clr, "DataTemplate", "FrameworkTemplate", nullptr,
      {prop("DataType", "Object"), prop("Triggers", "TriggerCollection")});
  add(*this, k_controls_clr, "ControlTemplate", "FrameworkTemplate", nullptr,
      {prop("TargetType", "Type"), prop("Triggers", "TriggerCollection")});
  add(*this, k_controls_clr, "ItemsPanelTemplate", "FrameworkTemplate", nullptr, {});
  add(*this, k_controls_clr, "ContentPresenter", "FrameworkElement", nullptr,
      {prop("Content", "Object"), prop("ContentTemplate", "DataTemplate")});
  add(*this, k_media_clr, "SolidColorBrush", nullptr, nullptr,
      {prop("Color", "Color"), prop("Opacity", "Double")});
  add(*this, k_data_clr, "BooleanToVisibilityConverter", nullptr, nullptr, {});

  // Markup extensions
  add_extension(*this, k_wpf_presentation_namespace, k_data_clr, "BindingExtension", "Path",
                {prop("Path", "PropertyPath"), prop("Mode", "BindingMode"),
                 prop("UpdateSourceTrigger", "UpdateSourceTrigger"),
                 prop("Converter", "IValueConverter"), prop("ConverterParameter", "Object"),
                 prop("StringFormat", "String"), prop("ElementName", "String"),
                 prop("RelativeSource", "RelativeSource"), prop("Source", "Object"),
                 prop("FallbackValue", "Object"), prop("TargetNullValue", "Object"),
                 prop("ValidatesOnDataErrors", "Boolean"),
                 prop("NotifyOnValidationError", "Boolean"),
                 prop("ValidatesOnExceptions", "Boolean")});
  add_extension(*this, k_wpf_presentation_namespace, k_data_clr, "MultiBindingExtension", nullptr,
                {prop("Converter", "IMultiValueConverter"), prop("StringFormat", "String"),
                 prop("Mode", "BindingMode")});
  add_extension(*this, k_wpf_presentation_namespace, k_windows_clr, "StaticResourceExtension",
                "ResourceKey", {prop("ResourceKey", "Object")});
  add_extension(*this, k_wpf_presentation_namespace, k_windows_clr, "DynamicResourceExtension",
                "ResourceKey", {prop("ResourceKey", "Object")});
  add_extension(*this, k_wpf_presentation_namespace, k_windows_clr, "TemplateBindingExtension",
                "Property", {prop("Property", "DependencyProperty"),
                             prop("Converter", "IValueConverter"),
                             prop("ConverterParameter", "Object")});
  add_extension(*this, k_wpf_presentation_namespace, k_data_clr, "RelativeSourceExtension", "Mode",
                {prop("Mode", "RelativeSourceMode"), prop("AncestorType", "Type"),
                 prop("AncestorLevel", "Int32")});
  add_extension(*this, k_xaml_language_namespace, k_markup_clr, "TypeExtension", "TypeName",
                {prop("TypeName", "String"), prop("Type", "Type")});
  add_extension(*this, k_xaml_language_namespace, k_markup_clr, "StaticExtension", "Member",
                {prop("Member", "String"), prop("MemberType", "Type")});
  add_extension(*this, k_xaml_language_namespace, k_markup_clr, "NullExtension", nullptr, {});
  add_extension(*this, k_xaml_language_namespace, k_markup_clr, "ArrayExtension", "Type",
                {prop("Type", "Type"), prop("Items", "IList")});

  log_debug("type catalog: {} builtin types registered", types_.size());
}

CatalogLoadResult TypeCatalog::load_json(const std::filesystem::path & path)
{
  std::ifstream in(path);
  if (!in) return CatalogLoadResult::fail("Cannot open type catalog: " + path.string());
  try {
    const json root = json::parse(in);
    return merge_json(root);
  } catch (const json::exception & e) {
    return CatalogLoadResult::fail(path.string() + ": " + e.what());
  }
}

CatalogLoadResult TypeCatalog::merge_json(const json & root)
{
  if (!root.is_object() || !root.contains("types") || !root["types"].is_array()) {
    return CatalogLoadResult::fail("Type catalog must be an object with a 'types' array");
  }

  size_t count = 0;
  try {
    for (const auto & entry : root["types"]) {
      TypeDescriptor t;
      t.name = entry.at("name").get<std::string>();
      t.xml_namespace = entry.value("xmlNamespace", std::string(k_wpf_presentation_namespace));
      t.clr_namespace = entry.value("clrNamespace", std::string());
      t.base_type = optional_field<std::string>(entry, "baseType");
      t.content_property = optional_field<std::string>(entry, "contentProperty");
      t.is_markup_extension = entry.value("isMarkupExtension", false);
      t.positional_parameter = optional_field<std::string>(entry, "positionalParameter");
      if (auto it = entry.find("properties"); it != entry.end() && it->is_array()) {
        for (const auto & p : *it) {
          t.properties.push_back(
            {p.at("name").get<std::string>(), p.value("type", std::string("Object")),
             p.value("isAttached", false)});
        }
      }
      register_type(std::move(t));
      ++count;
    }
  } catch (const json::exception & e) {
    return CatalogLoadResult::fail(std::string("Invalid type catalog entry: ") + e.what());
  }
  return CatalogLoadResult::ok(count);
}

const TypeDescriptor * TypeCatalog::find_type(
  std::string_view xml_namespace, std::string_view name) const
{
  auto it = types_.find(std::make_pair(std::string(xml_namespace), std::string(name)));
  return it == types_.end() ? nullptr : &it->second;
}

const TypeDescriptor * TypeCatalog::find_type(std::string_view name) const
{
  for (const auto & [key, type] : types_) {
    if (key.second == name) return &type;
  }
  return nullptr;
}

const TypeDescriptor * TypeCatalog::find_markup_extension(
  std::string_view xml_namespace, std::string_view name) const
{
  const std::string with_suffix = std::string(name) + "Extension";
  if (const auto * t = find_type(xml_namespace, with_suffix)) return t;
  return find_type(xml_namespace, name);
}

const TypeDescriptor * TypeCatalog::base_of(const TypeDescriptor & type) const
{
  if (!type.base_type) return nullptr;
  if (const auto * t = find_type(type.xml_namespace, *type.base_type)) return t;
  return find_type(*type.base_type);
}

std::optional<ResolvedProperty> TypeCatalog::resolve_property(
  const TypeDescriptor & type, std::string_view property_name) const
{
  // At most 32 base links are followed
  const TypeDescriptor * current = &type;
  for (int depth = 0; current && depth < 32; ++depth) {
    for (const auto & p : current->properties) {
      if (p.name == property_name) {
        return ResolvedProperty{p.name, current->name, p.type, p.is_attached};
      }
    }
    current = base_of(*current);
  }
  return std::nullopt;
}

std::optional<std::string> TypeCatalog::content_property(const TypeDescriptor & type) const
{
  const TypeDescriptor * current = &type;
  for (int depth = 0; current && depth < 32; ++depth) {
    if (current->content_property) return current->content_property;
    current = base_of(*current);
  }
  return std::nullopt;
}

ResolvedType TypeCatalog::to_resolved(const TypeDescriptor & type) const
{
  ResolvedType r;
  r.name = type.name;
  r.xml_namespace = type.xml_namespace;
  r.clr_name = type.clr_name();
  r.base_type = type.base_type;
  r.content_property = content_property(type);
  r.is_markup_extension = type.is_markup_extension;
  return r;
}

}  // namespace xaml_bridge
