// swift_grapher/extract/BuildEntity.cpp - Type declarations and inheritance clauses
#include <string>
#include <utility>

#include "swift_grapher/extract/decl_reader.hpp"
#include "swift_grapher/syntax/swift_node_kinds.hpp"

namespace swift_grapher
{

InheritanceSplit split_inheritance_clause(std::vector<std::string> clause)
{
  InheritanceSplit split;
  for (size_t i = 0; i < clause.size(); ++i) {
    if (i == 0) {
      split.inherited_types.push_back(std::move(clause[i]));
    } else {
      split.conformed_protocols.push_back(std::move(clause[i]));
    }
  }
  return split;
}

std::optional<EntityKind> DeclReader::declaration_kind(ts_ll::Node decl) const
{
  if (decl.is_null()) {
    return std::nullopt;
  }
  if (decl.kind() == node_kind::k_protocol_declaration) {
    return EntityKind::Protocol;
  }
  if (decl.kind() != node_kind::k_class_declaration) {
    return std::nullopt;
  }

  const ts_ll::Node keyword = decl.child_by_field(field::k_declaration_kind);
  if (!keyword.is_null()) {
    return entity_kind_from_keyword(node_text(keyword));
  }

  // Grammars without the field: the keyword is the first anonymous token that
  // names a declaration kind ("actor" maps to nothing).
  for (uint32_t i = 0; i < decl.child_count(); ++i) {
    const ts_ll::Node c = decl.child(i);
    if (c.is_named()) continue;
    const std::string_view t = node_text(c);
    if (t == "actor") return std::nullopt;
    if (auto kind = entity_kind_from_keyword(t)) return kind;
  }
  return std::nullopt;
}

std::vector<std::string> DeclReader::read_inheritance_clause(ts_ll::Node decl) const
{
  std::vector<std::string> clause;

  // The grammar gives every side of `Base & Proto` its own specifier node,
  // but the composition is one clause entry. Entries are separated by ","
  // and each is the source text from its first specifier to its last.
  std::optional<std::pair<uint32_t, uint32_t>> entry;
  auto flush = [&]() {
    if (entry) {
      std::string text(trim(source_.get_slice(entry->first, entry->second)));
      if (!text.empty()) {
        clause.push_back(std::move(text));
      }
      entry.reset();
    }
  };

  // Only direct children: nested declarations in the body have their own clauses.
  for (uint32_t i = 0; i < decl.child_count(); ++i) {
    const ts_ll::Node c = decl.child(i);
    if (c.kind() == node_kind::k_inheritance_specifier) {
      if (entry) {
        entry->second = c.end_byte();
      } else {
        entry.emplace(c.start_byte(), c.end_byte());
      }
    } else if (c.is_named() || node_text(c) != "&") {
      flush();
    }
  }
  flush();

  return clause;
}

std::optional<Entity> DeclReader::build_entity(ts_ll::Node decl, EntityKind kind) const
{
  Entity entity;
  entity.kind = kind;

  const ts_ll::Node name_node = decl.child_by_field(field::k_name);
  if (kind == EntityKind::Extension) {
    // `extension Foo.Bar: P` has no name of its own; it is keyed by the
    // extended type as written.
    const std::string extended = trimmed_text(name_node);
    entity.name = k_extension_prefix + (extended.empty() ? std::string("Unknown") : extended);
  } else {
    entity.name = trimmed_text(name_node);
    if (entity.name.empty()) {
      return std::nullopt;
    }
  }

  InheritanceSplit split = split_inheritance_clause(read_inheritance_clause(decl));
  entity.inherited_types = std::move(split.inherited_types);
  entity.conformed_protocols = std::move(split.conformed_protocols);
  return entity;
}

}  // namespace swift_grapher
