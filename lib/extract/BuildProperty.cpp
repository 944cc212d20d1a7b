// swift_grapher/extract/BuildProperty.cpp - Property bindings
#include <string>
#include <utility>

#include "swift_grapher/extract/decl_reader.hpp"
#include "swift_grapher/syntax/swift_node_kinds.hpp"

namespace swift_grapher
{

std::optional<std::string> DeclReader::pattern_identifier(ts_ll::Node pattern) const
{
  if (pattern.is_null()) {
    return std::nullopt;
  }
  if (pattern.kind() == node_kind::k_simple_identifier) {
    return non_empty_text(pattern);
  }

  const ts_ll::Node bound = pattern.child_by_field(field::k_bound_identifier);
  if (!bound.is_null()) {
    return non_empty_text(bound);
  }

  // Tuple and other destructuring patterns have no identifier at this level
  // and produce no property.
  for (uint32_t i = 0; i < pattern.named_child_count(); ++i) {
    const ts_ll::Node c = pattern.named_child(i);
    if (c.kind() == node_kind::k_simple_identifier) {
      return non_empty_text(c);
    }
  }
  return std::nullopt;
}

std::string DeclReader::annotation_type(ts_ll::Node type_annotation) const
{
  if (const auto span = field_span(type_annotation, field::k_type)) {
    return std::string(trim(source_.get_slice(span->first, span->second)));
  }

  std::string_view text = trim(node_text(type_annotation));
  if (!text.empty() && text.front() == ':') {
    text.remove_prefix(1);
  }
  return std::string(trim(text));
}

std::vector<Property> DeclReader::read_properties(ts_ll::Node property_decl) const
{
  std::vector<Property> properties;

  // `var a: Int = 1, b = 2` is one declaration with two bindings; each
  // "name" field starts a binding and a following type_annotation belongs to it.
  std::optional<Property> pending;
  auto flush = [&]() {
    if (pending) {
      properties.push_back(std::move(*pending));
      pending.reset();
    }
  };

  ts_ll::Cursor cursor(property_decl);
  if (!cursor.goto_first_child()) {
    return properties;
  }

  do {
    const ts_ll::Node c = cursor.current_node();
    if (cursor.current_field_name() == field::k_name) {
      flush();
      if (auto name = pattern_identifier(c)) {
        pending = Property{std::move(*name), k_unknown_type};
      }
    } else if (c.kind() == node_kind::k_type_annotation && pending) {
      std::string type = annotation_type(c);
      if (!type.empty()) {
        pending->type = std::move(type);
      }
    }
  } while (cursor.goto_next_sibling());

  flush();
  return properties;
}

}  // namespace swift_grapher
