// swift_grapher/extract/BuildSignature.cpp - Function signatures
#include <string>

#include "swift_grapher/extract/decl_reader.hpp"
#include "swift_grapher/syntax/swift_node_kinds.hpp"

namespace swift_grapher
{

Method DeclReader::build_method(ts_ll::Node function_decl) const
{
  Method method;
  method.name = trimmed_text(function_decl.child_by_field(field::k_name));
  method.parameters = read_parameters(function_decl);
  method.return_type = read_return_type(function_decl);
  return method;
}

std::vector<Parameter> DeclReader::read_parameters(ts_ll::Node function_decl) const
{
  std::vector<Parameter> params;

  for (uint32_t i = 0; i < function_decl.named_child_count(); ++i) {
    const ts_ll::Node c = function_decl.named_child(i);
    if (c.kind() == node_kind::k_parameter) {
      params.push_back(read_parameter(c));
    } else if (c.kind() == node_kind::k_function_value_parameters) {
      for (uint32_t j = 0; j < c.named_child_count(); ++j) {
        const ts_ll::Node p = c.named_child(j);
        if (p.kind() == node_kind::k_parameter) {
          params.push_back(read_parameter(p));
        }
      }
    }
  }

  return params;
}

Parameter DeclReader::read_parameter(ts_ll::Node parameter_node) const
{
  Parameter param;

  // `label name: T` declares both names; `name: T` only the internal one.
  const ts_ll::Node external = parameter_node.child_by_field(field::k_external_name);
  const ts_ll::Node internal = parameter_node.child_by_field(field::k_name);
  if (!external.is_null()) {
    param.external_name = trimmed_text(external);
  }
  param.internal_name = trimmed_text(internal);

  const auto type_span = field_span(parameter_node, field::k_type);
  if (!type_span) {
    return param;
  }

  // `inout`-style modifiers are siblings of the type in the grammar but part
  // of the parameter's written type.
  uint32_t type_begin = type_span->first;
  for (uint32_t i = 0; i < parameter_node.named_child_count(); ++i) {
    const ts_ll::Node c = parameter_node.named_child(i);
    if (c.kind() == node_kind::k_parameter_modifiers && c.start_byte() < type_begin) {
      type_begin = c.start_byte();
    }
  }

  const std::string type_text(trim(source_.get_slice(type_begin, type_span->second)));
  if (!type_text.empty()) {
    param.type = type_text;
  }
  return param;
}

std::optional<std::string> DeclReader::read_return_type(ts_ll::Node function_decl) const
{
  const auto span = field_span(function_decl, field::k_return_type);
  if (!span) {
    return std::nullopt;
  }
  std::string text(trim(source_.get_slice(span->first, span->second)));
  if (text.empty()) {
    return std::nullopt;
  }
  return text;
}

}  // namespace swift_grapher
