// swift_grapher/graph/code_graph.cpp - Graph store implementation
#include "swift_grapher/graph/code_graph.hpp"

#include <algorithm>
#include <iterator>
#include <utility>

namespace swift_grapher
{

std::string_view to_string(EntityKind kind) noexcept
{
  switch (kind) {
    case EntityKind::Class:
      return "class";
    case EntityKind::Struct:
      return "struct";
    case EntityKind::Enum:
      return "enum";
    case EntityKind::Protocol:
      return "protocol";
    case EntityKind::Extension:
      return "extension";
  }
  return "class";
}

std::optional<EntityKind> entity_kind_from_keyword(std::string_view keyword) noexcept
{
  if (keyword == "class") return EntityKind::Class;
  if (keyword == "struct") return EntityKind::Struct;
  if (keyword == "enum") return EntityKind::Enum;
  if (keyword == "protocol") return EntityKind::Protocol;
  if (keyword == "extension") return EntityKind::Extension;
  return std::nullopt;
}

std::string_view to_string(DuplicatePolicy policy) noexcept
{
  return policy == DuplicatePolicy::Merge ? "merge" : "overwrite";
}

bool operator==(const Property & a, const Property & b)
{
  return a.name == b.name && a.type == b.type;
}

bool operator==(const Parameter & a, const Parameter & b)
{
  return a.external_name == b.external_name && a.internal_name == b.internal_name &&
         a.type == b.type;
}

bool operator==(const Method & a, const Method & b)
{
  return a.name == b.name && a.parameters == b.parameters && a.return_type == b.return_type &&
         a.calls == b.calls;
}

bool operator==(const Entity & a, const Entity & b)
{
  return a.name == b.name && a.kind == b.kind && a.inherited_types == b.inherited_types &&
         a.conformed_protocols == b.conformed_protocols && a.properties == b.properties &&
         a.methods == b.methods;
}

// ============================================================================
// CodeGraph
// ============================================================================

namespace
{

void append_unique(std::vector<std::string> & target, std::vector<std::string> && incoming)
{
  for (auto & name : incoming) {
    if (std::find(target.begin(), target.end(), name) == target.end()) {
      target.push_back(std::move(name));
    }
  }
}

}  // namespace

void CodeGraph::merge_into(Entity & target, Entity && incoming)
{
  append_unique(target.inherited_types, std::move(incoming.inherited_types));
  append_unique(target.conformed_protocols, std::move(incoming.conformed_protocols));

  target.properties.insert(
    target.properties.end(), std::make_move_iterator(incoming.properties.begin()),
    std::make_move_iterator(incoming.properties.end()));
  target.methods.insert(
    target.methods.end(), std::make_move_iterator(incoming.methods.begin()),
    std::make_move_iterator(incoming.methods.end()));
}

Entity & CodeGraph::register_entity(Entity entity)
{
  auto it = entities_.find(entity.name);
  if (it == entities_.end()) {
    std::string key = entity.name;
    return entities_.emplace(std::move(key), std::move(entity)).first->second;
  }

  if (policy_ == DuplicatePolicy::Merge) {
    merge_into(it->second, std::move(entity));
  } else {
    it->second = std::move(entity);
  }
  return it->second;
}

Entity * CodeGraph::find(const std::string & name)
{
  auto it = entities_.find(name);
  return it == entities_.end() ? nullptr : &it->second;
}

const Entity * CodeGraph::find(const std::string & name) const
{
  auto it = entities_.find(name);
  return it == entities_.end() ? nullptr : &it->second;
}

bool CodeGraph::contains(const std::string & name) const { return entities_.count(name) > 0; }

std::vector<std::string> CodeGraph::sorted_names() const
{
  std::vector<std::string> names;
  names.reserve(entities_.size());
  for (const auto & entry : entities_) {
    names.push_back(entry.first);
  }
  std::sort(names.begin(), names.end());
  return names;
}

void CodeGraph::merge_from(const CodeGraph & other)
{
  for (const auto & name : other.sorted_names()) {
    register_entity(*other.find(name));
  }
}

void CodeGraph::merge_from(CodeGraph && other)
{
  for (const auto & name : other.sorted_names()) {
    register_entity(std::move(other.entities_.at(name)));
  }
  other.entities_.clear();
}

}  // namespace swift_grapher
