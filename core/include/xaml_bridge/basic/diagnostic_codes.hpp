// xaml_bridge/basic/diagnostic_codes.hpp - Diagnostic code constants
#pragma once

namespace xaml_bridge::codes
{

// Hybrid parser
inline constexpr const char * k_xaml_empty = "HYBRID_XAML_EMPTY";
inline constexpr const char * k_xml_parse_error = "HYBRID_XML_PARSE_ERROR";
inline constexpr const char * k_semantic_parse_error = "HYBRID_SEMANTIC_PARSE_ERROR";
inline constexpr const char * k_merge_error = "HYBRID_MERGE_ERROR";
inline constexpr const char * k_parse_start = "HYBRID_XAML_PARSE_START";
inline constexpr const char * k_parse_success = "HYBRID_XAML_PARSE_SUCCESS";
inline constexpr const char * k_merge_xml_only = "HYBRID_MERGE_XML_ONLY";

// Structural conversion
inline constexpr const char * k_markup_extension_invalid = "MARKUP_EXTENSION_INVALID";
inline constexpr const char * k_undeclared_prefix = "XML_UNDECLARED_PREFIX";
inline constexpr const char * k_mixed_content_flattened = "XML_MIXED_CONTENT_FLATTENED";

// Semantic layer
inline constexpr const char * k_semantic_type_unresolved = "SEMANTIC_TYPE_UNRESOLVED";
inline constexpr const char * k_semantic_child_mismatch = "SEMANTIC_CHILD_MISMATCH";

// Transformation
inline constexpr const char * k_transform_no_root = "TRANSFORM_NO_ROOT";
inline constexpr const char * k_transform_complete = "TRANSFORM_COMPLETE";
inline constexpr const char * k_transform_rule_stats = "TRANSFORM_RULE_STATS";
inline constexpr const char * k_transform_rule_failed = "TRANSFORM_RULE_FAILED";
inline constexpr const char * k_type_mapping_not_found = "TYPE_MAPPING_NOT_FOUND";
inline constexpr const char * k_type_requires_review = "TYPE_REQUIRES_MANUAL_REVIEW";
inline constexpr const char * k_property_mapping_not_found = "PROPERTY_MAPPING_NOT_FOUND";
inline constexpr const char * k_property_requires_review = "PROPERTY_REQUIRES_MANUAL_REVIEW";
inline constexpr const char * k_property_type_changed = "PROPERTY_TYPE_CHANGED";
inline constexpr const char * k_event_requires_review = "EVENT_REQUIRES_MANUAL_REVIEW";
inline constexpr const char * k_namespace_requires_review = "NAMESPACE_REQUIRES_MANUAL_REVIEW";
inline constexpr const char * k_value_conversion_unknown = "VALUE_CONVERSION_UNKNOWN";
inline constexpr const char * k_value_conversion_review = "VALUE_CONVERSION_REVIEW";
inline constexpr const char * k_binding_parameter_unsupported = "BINDING_PARAMETER_UNSUPPORTED";

// Companion code
inline constexpr const char * k_companion_class_missing = "COMPANION_CLASS_NOT_FOUND";
inline constexpr const char * k_companion_member_missing = "COMPANION_MEMBER_NOT_FOUND";
inline constexpr const char * k_companion_no_class = "COMPANION_NO_CLASS";
inline constexpr const char * k_companion_class_valid = "COMPANION_CLASS_VALID";
inline constexpr const char * k_companion_link_summary = "COMPANION_LINK_SUMMARY";

// Serialization
inline constexpr const char * k_serialization_failed = "SERIALIZATION_FAILED";

// Configuration / mappings
inline constexpr const char * k_mapping_load_failed = "MAPPING_LOAD_FAILED";

}  // namespace xaml_bridge::codes
