// xaml_bridge/ast/unified_ast.hpp - Unified markup AST node definitions
//
// One mutable tree merging the structural view (exact text, whitespace,
// comments) and the semantic view (resolved types and property owners) of a
// XAML document. Parents own children through std::unique_ptr; the parent
// pointer on each node is a non-owning back-reference.
//
#pragma once

#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include "xaml_bridge/ast/formatting_hints.hpp"
#include "xaml_bridge/ast/symbol_table.hpp"
#include "xaml_bridge/basic/diagnostic.hpp"

namespace xaml_bridge
{

class Element;
class Property;
class MarkupExtension;
class Comment;

// ============================================================================
// Well-known namespaces
// ============================================================================

inline constexpr const char * k_wpf_presentation_namespace =
  "http://schemas.microsoft.com/winfx/2006/xaml/presentation";
inline constexpr const char * k_xaml_language_namespace =
  "http://schemas.microsoft.com/winfx/2006/xaml";
inline constexpr const char * k_avalonia_namespace = "https://github.com/avaloniaui";

// ============================================================================
// Enums and small value types
// ============================================================================

enum class NodeKind : uint8_t {
  Element,
  Property,
  MarkupExtension,
  Comment,
};

[[nodiscard]] std::string_view to_string(NodeKind kind) noexcept;

enum class TransformationState : uint8_t {
  Unanalyzed,
  Analyzed,
  Transformed,
  Skipped,
  Failed,
  RequiresManualReview,
};

enum class PropertyKind : uint8_t {
  Attribute,
  PropertyElement,
  AttachedProperty,
};

enum class MarkupExtensionKind : uint8_t {
  Binding,
  StaticResource,
  DynamicResource,
  TemplateBinding,
  RelativeSource,
  Type,
  Static,
  Null,
  Custom,
};

enum class CommentPlacement : uint8_t {
  Standalone,     ///< Document level, outside the root element
  BeforeElement,  ///< Inside a property element, before its value
  WithinContent,  ///< Among the child elements of an element
};

/// Source position of a node (line/column are 1-based; column points at the tag name)
struct Location
{
  uint32_t line = 0;
  uint32_t column = 0;
  uint32_t offset = UINT32_MAX;
  uint32_t length = 0;

  [[nodiscard]] bool is_valid() const noexcept { return line > 0; }
};

/// Type information attached by semantic enrichment
struct ResolvedType
{
  std::string name;
  std::string xml_namespace;
  std::string clr_name;  ///< Namespace-qualified CLR name
  std::optional<std::string> base_type;
  std::optional<std::string> content_property;
  bool is_markup_extension = false;
};

/// Property information attached by semantic enrichment
struct ResolvedProperty
{
  std::string name;
  std::string declaring_type;
  std::string property_type;
  bool is_attached = false;
};

// ============================================================================
// UnifiedNode - common base
// ============================================================================

/**
 * Base class for all Unified AST nodes.
 *
 * Nodes are non-copyable; use the clone() of the concrete class to obtain a
 * disjoint deep copy.
 */
class UnifiedNode
{
public:
  UnifiedNode(const UnifiedNode &) = delete;
  UnifiedNode & operator=(const UnifiedNode &) = delete;
  UnifiedNode(UnifiedNode &&) = delete;
  UnifiedNode & operator=(UnifiedNode &&) = delete;

  [[nodiscard]] NodeKind get_kind() const noexcept { return kind_; }

  /// Process-unique id (stable for the node's lifetime, never reused)
  [[nodiscard]] uint64_t id() const noexcept { return id_; }

  [[nodiscard]] UnifiedNode * parent() const noexcept { return parent_; }
  [[nodiscard]] size_t sibling_index() const noexcept { return sibling_index_; }

  void set_parent(UnifiedNode * parent, size_t index = 0) noexcept
  {
    parent_ = parent;
    sibling_index_ = index;
  }

  /// Nearest enclosing Element (nullptr at the root)
  [[nodiscard]] Element * enclosing_element() const noexcept;

  void add_diagnostic(Severity severity, std::string code, std::string message);

  Location location;
  FormattingHints hints;
  std::vector<Diagnostic> diagnostics;
  TransformationState state = TransformationState::Unanalyzed;

protected:
  explicit UnifiedNode(NodeKind k);
  ~UnifiedNode() = default;

  void copy_base_into(UnifiedNode & target) const;

private:
  const NodeKind kind_;
  const uint64_t id_;
  UnifiedNode * parent_ = nullptr;
  size_t sibling_index_ = 0;
};

/**
 * CRTP base class that implements classof().
 */
template <typename Derived, NodeKind K>
class NodeBase : public UnifiedNode
{
public:
  static constexpr NodeKind kind = K;

  static bool classof(const UnifiedNode * node) { return node->get_kind() == K; }

protected:
  NodeBase() : UnifiedNode(K) {}
};

// ============================================================================
// Comment
// ============================================================================

class Comment : public NodeBase<Comment, NodeKind::Comment>
{
public:
  Comment() = default;
  explicit Comment(std::string t, bool keep = true) : text(std::move(t)), preserve(keep) {}

  std::string text;

  /// false = synthesized (diagnostic output), never re-emitted as source comment
  bool preserve = true;

  CommentPlacement placement = CommentPlacement::WithinContent;

  [[nodiscard]] std::unique_ptr<Comment> clone() const;
};

// ============================================================================
// MarkupExtension
// ============================================================================

/// Payload for Binding-like extensions
struct BindingPayload
{
  std::optional<std::string> path;
  std::optional<std::string> mode;
  std::optional<std::string> update_source_trigger;
  std::optional<std::string> converter;
  std::optional<std::string> converter_parameter;
  std::optional<std::string> string_format;
  std::optional<std::string> element_name;
  std::optional<std::string> relative_source;
  std::optional<std::string> source;
  std::optional<std::string> fallback_value;
  std::optional<std::string> target_null_value;
};

/// Payload for StaticResource / DynamicResource
struct ResourcePayload
{
  std::string resource_key;
  bool is_dynamic = false;
};

/// Payload for x:Type
struct TypeReferencePayload
{
  std::string type_name;
  std::optional<std::string> prefix;
};

/// Payload for x:Static
struct StaticMemberPayload
{
  std::string member;  ///< As written, e.g. "local:Settings.Default"
  std::optional<std::string> owner_type;
  std::string member_name;
};

using MarkupExtensionPayload = std::variant<
  std::monostate, BindingPayload, ResourcePayload, TypeReferencePayload, StaticMemberPayload>;

/**
 * One positional or named argument of a markup extension.
 *
 * The value is either a literal string or a nested extension.
 */
struct MarkupExtensionArgument
{
  std::string name;  ///< Empty for the positional argument
  std::variant<std::string, std::unique_ptr<MarkupExtension>> value;
  char quote = 0;  ///< Quote character used in source (0 = unquoted)

  [[nodiscard]] bool is_nested() const noexcept { return value.index() == 1; }
  [[nodiscard]] const std::string * literal() const noexcept
  {
    return std::get_if<std::string>(&value);
  }
  [[nodiscard]] MarkupExtension * nested() const noexcept;

  [[nodiscard]] MarkupExtensionArgument clone() const;
};

class MarkupExtension : public NodeBase<MarkupExtension, NodeKind::MarkupExtension>
{
public:
  MarkupExtension() = default;
  explicit MarkupExtension(std::string n) : name(std::move(n)) {}

  /// Extension name as written, including a prefix ("Binding", "x:Type")
  std::string name;

  std::optional<MarkupExtensionArgument> positional;
  std::vector<MarkupExtensionArgument> parameters;

  /// Specialized view selected by name; recomputed by refresh_payload()
  MarkupExtensionPayload payload;

  std::optional<ResolvedType> resolved_type;

  [[nodiscard]] MarkupExtensionKind extension_kind() const noexcept;

  /// Name without namespace prefix ("x:Type" -> "Type")
  [[nodiscard]] std::string_view local_name() const noexcept;

  [[nodiscard]] const MarkupExtensionArgument * find_parameter(std::string_view key) const;
  [[nodiscard]] MarkupExtensionArgument * find_parameter(std::string_view key);

  /// Literal value of a named parameter, or of the positional argument for key ""
  [[nodiscard]] std::optional<std::string> literal_parameter(std::string_view key) const;

  void set_positional(std::string value, char quote = 0);
  void set_parameter(std::string key, std::string value, char quote = 0);
  void set_parameter(std::string key, std::unique_ptr<MarkupExtension> value);
  bool remove_parameter(std::string_view key);

  /// Recompute the specialized payload from name and arguments
  void refresh_payload();

  /// Canonical `{Name pos, k=v}` text
  [[nodiscard]] std::string to_string() const;

  [[nodiscard]] std::unique_ptr<MarkupExtension> clone() const;

  /// Fix parent pointers of nested extensions after argument edits
  void adopt_arguments();
};

[[nodiscard]] MarkupExtensionKind classify_markup_extension(std::string_view name) noexcept;

// ============================================================================
// Property
// ============================================================================

class Property : public NodeBase<Property, NodeKind::Property>
{
public:
  using Value = std::variant<
    std::monostate, std::string, std::unique_ptr<Element>, std::unique_ptr<MarkupExtension>>;

  Property();
  Property(std::string n, std::string literal_value, PropertyKind k = PropertyKind::Attribute);
  ~Property();

  std::string name;
  PropertyKind kind = PropertyKind::Attribute;

  /// Owner type of an attached property (or of a property element naming another type)
  std::optional<std::string> attached_owner_type;

  /// Namespace prefix written on the attribute ("x" for x:Uid), empty otherwise
  std::string prefix;

  std::optional<ResolvedProperty> resolved_property;

  /// Comments inside a property element (anchor 0 = before the value)
  std::vector<std::unique_ptr<Comment>> comments;

  // Value access
  [[nodiscard]] bool has_value() const noexcept { return value_.index() != 0; }
  [[nodiscard]] const std::string * literal() const noexcept
  {
    return std::get_if<std::string>(&value_);
  }
  [[nodiscard]] Element * element() const noexcept;
  [[nodiscard]] MarkupExtension * markup_extension() const noexcept;

  void set_value(std::string literal_value);
  void set_value(std::unique_ptr<Element> element_value);
  void set_value(std::unique_ptr<MarkupExtension> extension_value);
  void clear_value();

  std::unique_ptr<Element> take_element();
  std::unique_ptr<MarkupExtension> take_markup_extension();

  /// Element that owns this property
  [[nodiscard]] Element * owner_element() const noexcept;

  /// `Owner.Name` for attached properties and property elements, `Name` otherwise
  [[nodiscard]] std::string full_name() const;

  /// Attribute name as written in markup (prefix and owner included)
  [[nodiscard]] std::string attribute_name() const;

  void add_comment(std::unique_ptr<Comment> comment);

  [[nodiscard]] std::unique_ptr<Property> clone() const;

private:
  Value value_;
};

// ============================================================================
// Element
// ============================================================================

/// An xmlns declaration written on an element
struct NamespaceDeclaration
{
  std::string prefix;  ///< Empty for the default namespace
  std::string uri;
  std::optional<std::string> leading_whitespace;
  std::optional<std::string> original_text;

  [[nodiscard]] std::string attribute_name() const
  {
    return prefix.empty() ? std::string("xmlns") : "xmlns:" + prefix;
  }
};

class Element : public NodeBase<Element, NodeKind::Element>
{
public:
  Element();
  explicit Element(std::string type, std::optional<std::string> ns = std::nullopt);
  ~Element();

  std::string type_name;
  std::optional<std::string> xml_namespace;

  /// Prefix the element was written with ("local" for <local:Foo>)
  std::string prefix;

  std::optional<std::string> text_content;

  /// Formatting of the text content (raw text, position among the children)
  FormattingHints text_hints;

  std::optional<ResolvedType> resolved_type;

  // Directive fields
  std::optional<std::string> x_name;
  std::optional<std::string> x_key;
  std::optional<std::string> x_class;
  std::optional<std::string> x_field_modifier;
  std::optional<bool> x_shared;

  /// Prefix used for directive attributes (normally "x")
  std::string directive_prefix = "x";

  /// Source formatting of each directive attribute, keyed by directive name
  std::map<std::string, FormattingHints> directive_hints;

  std::vector<NamespaceDeclaration> namespace_declarations;

  /// Namespace forced by a rule, taking precedence over xml_namespace when writing
  std::optional<std::string> override_namespace;

  /// Container synthesized for a multi-valued property element
  bool synthetic_collection = false;

  std::vector<std::unique_ptr<Comment>> comments;

  // Properties
  [[nodiscard]] const std::vector<std::unique_ptr<Property>> & properties() const noexcept
  {
    return properties_;
  }
  Property & add_property(std::unique_ptr<Property> property);
  Property & add_property(std::string name, std::string value);
  Property & insert_property(size_t index, std::unique_ptr<Property> property);
  std::unique_ptr<Property> remove_property(size_t index);
  [[nodiscard]] Property * find_property(std::string_view name) const;
  [[nodiscard]] Property * find_property_by_full_name(std::string_view full_name) const;

  /// Detach all properties (parent pointers cleared), leaving the element without any
  std::vector<std::unique_ptr<Property>> release_properties();

  // Children
  [[nodiscard]] const std::vector<std::unique_ptr<Element>> & children() const noexcept
  {
    return children_;
  }
  Element & add_child(std::unique_ptr<Element> child);
  Element & insert_child(size_t index, std::unique_ptr<Element> child);
  std::unique_ptr<Element> remove_child(size_t index);
  std::unique_ptr<Element> replace_child(size_t index, std::unique_ptr<Element> child);

  /// Detach all children (parent pointers cleared), leaving the element without any
  std::vector<std::unique_ptr<Element>> release_children();

  void add_comment(std::unique_ptr<Comment> comment);

  /// Pre-order descendants, not including this element
  [[nodiscard]] std::vector<Element *> descendants() const;
  [[nodiscard]] std::vector<Element *> descendants_and_self();

  /// CLR-qualified type name when the namespace is a clr-namespace URI
  [[nodiscard]] std::string full_type_name() const;

  /// Namespace used for output (override first)
  [[nodiscard]] const std::optional<std::string> & effective_namespace() const noexcept
  {
    return override_namespace ? override_namespace : xml_namespace;
  }

  [[nodiscard]] bool has_directives() const noexcept
  {
    return x_name || x_key || x_class || x_field_modifier || x_shared;
  }

  /// Whether anything would be written between the start and end tags
  [[nodiscard]] bool has_content() const;

  [[nodiscard]] std::unique_ptr<Element> clone() const;

private:
  void reindex_properties();
  void reindex_children();

  std::vector<std::unique_ptr<Property>> properties_;
  std::vector<std::unique_ptr<Element>> children_;
};

// ============================================================================
// Document
// ============================================================================

struct XmlDeclaration
{
  std::string version = "1.0";
  std::optional<std::string> encoding;
  std::optional<std::string> standalone;
  std::optional<std::string> original_text;
};

/// Class symbol from the companion code unit linked through x:Class
struct CompanionClassRef
{
  std::string qualified_name;
  std::vector<std::string> members;
};

using MetadataValue = std::variant<bool, int64_t, std::string>;

/// Typed cross-pass facts stored on a document
struct DocumentMetadata
{
  /// Default namespace chosen by the namespace rewrite
  std::optional<std::string> transformed_namespace;

  std::optional<CompanionClassRef> companion_class;

  /// Open-ended facts for rules that need one-off values
  std::map<std::string, MetadataValue, std::less<>> values;
};

/// One entry of the transformation trace
struct TransformationRecord
{
  std::string rule_name;
  std::string node_kind;
  std::string description;
  uint64_t node_id = 0;
  uint32_t line = 0;
};

class Document
{
public:
  Document();
  ~Document();

  Document(const Document &) = delete;
  Document & operator=(const Document &) = delete;

  std::string file_path;

  std::optional<XmlDeclaration> declaration;
  bool has_bom = false;
  std::string encoding = "UTF-8";

  std::vector<std::unique_ptr<Comment>> leading_comments;
  std::vector<std::unique_ptr<Comment>> trailing_comments;

  /// Whitespace after the last top-level node
  std::optional<std::string> trailing_whitespace;

  SymbolTable symbols;
  DocumentMetadata metadata;
  std::vector<TransformationRecord> transformation_trace;
  DiagnosticBag diagnostics;

  [[nodiscard]] Element * root() const noexcept { return root_.get(); }
  void set_root(std::unique_ptr<Element> root);
  std::unique_ptr<Element> take_root();

  [[nodiscard]] bool has_declaration() const noexcept { return declaration.has_value(); }

  [[nodiscard]] std::vector<Element *> named_elements() const;
  [[nodiscard]] std::vector<Element *> elements_by_type(std::string_view type_name) const;
  [[nodiscard]] Element * find_element_by_name(std::string_view name) const;

  /// Document diagnostics plus every node diagnostic in the tree
  [[nodiscard]] DiagnosticBag collect_all_diagnostics() const;

  /// Rebuild the symbol table from the current tree
  void refresh_symbols();

  [[nodiscard]] std::unique_ptr<Document> clone() const;

private:
  std::unique_ptr<Element> root_;
};

}  // namespace xaml_bridge
