// swift_grapher/syntax/swift_node_kinds.hpp - tree-sitter-swift node and field names
//
// Only the grammar categories the extractor consumes are listed here.
//
#pragma once

#include <string_view>

namespace swift_grapher::node_kind
{

// Type declarations. class_declaration covers class, struct, enum, actor and
// extension; the keyword is exposed through the "declaration_kind" field.
inline constexpr std::string_view k_class_declaration = "class_declaration";
inline constexpr std::string_view k_protocol_declaration = "protocol_declaration";
inline constexpr std::string_view k_inheritance_specifier = "inheritance_specifier";

// Members
inline constexpr std::string_view k_property_declaration = "property_declaration";
inline constexpr std::string_view k_protocol_property_declaration =
  "protocol_property_declaration";
inline constexpr std::string_view k_function_declaration = "function_declaration";
inline constexpr std::string_view k_protocol_function_declaration =
  "protocol_function_declaration";
inline constexpr std::string_view k_parameter = "parameter";
inline constexpr std::string_view k_parameter_modifiers = "parameter_modifiers";
inline constexpr std::string_view k_function_value_parameters = "function_value_parameters";
inline constexpr std::string_view k_type_annotation = "type_annotation";

// Patterns
inline constexpr std::string_view k_simple_identifier = "simple_identifier";

// Expressions
inline constexpr std::string_view k_call_expression = "call_expression";
inline constexpr std::string_view k_call_suffix = "call_suffix";

}  // namespace swift_grapher::node_kind

namespace swift_grapher::field
{

inline constexpr std::string_view k_declaration_kind = "declaration_kind";
inline constexpr std::string_view k_name = "name";
inline constexpr std::string_view k_body = "body";
inline constexpr std::string_view k_inherits_from = "inherits_from";
inline constexpr std::string_view k_external_name = "external_name";
inline constexpr std::string_view k_type = "type";
inline constexpr std::string_view k_return_type = "return_type";
inline constexpr std::string_view k_bound_identifier = "bound_identifier";

}  // namespace swift_grapher::field
