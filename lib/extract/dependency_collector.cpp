// swift_grapher/extract/dependency_collector.cpp - Traversal engine
#include "swift_grapher/extract/dependency_collector.hpp"

#include <utility>

#include "swift_grapher/syntax/swift_node_kinds.hpp"

namespace swift_grapher
{

bool DependencyCollector::is_type_declaration(ts_ll::Node node)
{
  const std::string_view k = node.kind();
  return k == node_kind::k_class_declaration || k == node_kind::k_protocol_declaration;
}

bool DependencyCollector::is_function_declaration(ts_ll::Node node)
{
  const std::string_view k = node.kind();
  return k == node_kind::k_function_declaration || k == node_kind::k_protocol_function_declaration;
}

void DependencyCollector::walk(ts_ll::Node root)
{
  if (root.is_null()) {
    return;
  }

  // Iterative pre-order walk with an explicit leave step, so deeply nested
  // expressions do not consume native stack.
  ts_ll::Cursor cursor(root);
  while (true) {
    enter(cursor.current_node());
    if (cursor.goto_first_child()) {
      continue;
    }

    while (true) {
      leave(cursor.current_node());
      if (cursor.goto_next_sibling()) {
        break;
      }
      if (!cursor.goto_parent()) {
        return;
      }
    }
  }
}

void DependencyCollector::enter(ts_ll::Node node)
{
  if (!node.is_named()) {
    return;
  }

  const std::string_view k = node.kind();
  if (is_type_declaration(node)) {
    enter_type_declaration(node);
  } else if (is_function_declaration(node)) {
    enter_function_declaration(node);
  } else if (
    k == node_kind::k_property_declaration || k == node_kind::k_protocol_property_declaration) {
    enter_property_declaration(node);
  } else if (k == node_kind::k_call_expression) {
    enter_call_expression(node);
  }
}

void DependencyCollector::leave(ts_ll::Node node)
{
  if (!node.is_named()) {
    return;
  }
  if ((is_type_declaration(node) || is_function_declaration(node)) && !scopes_.empty()) {
    scopes_.pop_back();
  }
}

void DependencyCollector::enter_type_declaration(ts_ll::Node node)
{
  Scope scope;
  scope.kind = Scope::Kind::Entity;

  if (const auto kind = reader_.declaration_kind(node)) {
    if (auto entity = reader_.build_entity(node, *kind)) {
      scope.entity = entity->name;
      graph_.register_entity(std::move(*entity));
      ++registered_;
    }
  }

  scopes_.push_back(std::move(scope));
}

void DependencyCollector::enter_function_declaration(ts_ll::Node node)
{
  Scope scope;
  scope.kind = Scope::Kind::Method;

  if (Entity * entity = current_entity()) {
    entity->methods.push_back(reader_.build_method(node));
    scope.entity = entity->name;
    scope.method_index = entity->methods.size() - 1;
  }

  scopes_.push_back(std::move(scope));
}

void DependencyCollector::enter_property_declaration(ts_ll::Node node)
{
  Entity * entity = current_entity();
  if (entity == nullptr) {
    return;
  }

  for (auto & property : reader_.read_properties(node)) {
    entity->properties.push_back(std::move(property));
  }
}

void DependencyCollector::enter_call_expression(ts_ll::Node node)
{
  Method * method = current_method();
  if (method == nullptr) {
    return;
  }

  if (auto callee = reader_.read_callee(node)) {
    method->calls.push_back(std::move(*callee));
  }
}

Entity * DependencyCollector::current_entity()
{
  for (auto it = scopes_.rbegin(); it != scopes_.rend(); ++it) {
    if (it->kind != Scope::Kind::Entity) continue;
    return it->entity ? graph_.find(*it->entity) : nullptr;
  }
  return nullptr;
}

Method * DependencyCollector::current_method()
{
  for (auto it = scopes_.rbegin(); it != scopes_.rend(); ++it) {
    // A type declared inside a method hides that method.
    if (it->kind == Scope::Kind::Entity) {
      return nullptr;
    }
    if (!it->method_index || !it->entity) {
      return nullptr;
    }

    Entity * entity = graph_.find(*it->entity);
    // A later declaration with the same name may have replaced the entity.
    if (entity == nullptr || *it->method_index >= entity->methods.size()) {
      return nullptr;
    }
    return &entity->methods[*it->method_index];
  }
  return nullptr;
}

void collect_dependencies(const ParsedUnit & unit, CodeGraph & graph)
{
  if (unit.tree.is_null() || unit.source == nullptr) {
    return;
  }

  DependencyCollector collector(graph, *unit.source);
  collector.walk(unit.root());
}

}  // namespace swift_grapher
