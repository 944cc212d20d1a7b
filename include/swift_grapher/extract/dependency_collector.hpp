// swift_grapher/extract/dependency_collector.hpp - Syntax tree -> dependency graph traversal
#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "swift_grapher/extract/decl_reader.hpp"
#include "swift_grapher/graph/code_graph.hpp"
#include "swift_grapher/syntax/frontend.hpp"
#include "swift_grapher/syntax/ts_ll.hpp"

namespace swift_grapher
{

/**
 * Walks one file's syntax tree depth-first and records what it finds into a
 * CodeGraph.
 *
 * - Type declarations become entities as soon as they are entered.
 * - Property and function declarations are attached to the innermost open
 *   entity.
 * - Call expressions are attached to the innermost open method of that entity.
 *
 * Open declarations are kept on a stack, so leaving a nested type or a local
 * function restores the enclosing entity and method. Actors and free
 * functions open scopes that record nothing, which keeps their contents from
 * being attributed to an outer entity.
 */
class DependencyCollector
{
public:
  DependencyCollector(CodeGraph & graph, const SourceFile & source)
  : graph_(graph), reader_(source)
  {
  }

  DependencyCollector(const DependencyCollector &) = delete;
  DependencyCollector & operator=(const DependencyCollector &) = delete;

  void walk(ts_ll::Node root);

  /// Number of entities registered by this collector (including overwrites).
  [[nodiscard]] size_t registered_count() const noexcept { return registered_; }

private:
  struct Scope
  {
    enum class Kind : uint8_t { Entity, Method };

    Kind kind = Kind::Entity;
    /// Name of the tracked entity (Entity scopes); nullopt for untracked declarations.
    std::optional<std::string> entity;
    /// Index into the entity's method list (Method scopes); nullopt when not recorded.
    std::optional<size_t> method_index;
  };

  void enter(ts_ll::Node node);
  void leave(ts_ll::Node node);

  void enter_type_declaration(ts_ll::Node node);
  void enter_function_declaration(ts_ll::Node node);
  void enter_property_declaration(ts_ll::Node node);
  void enter_call_expression(ts_ll::Node node);

  /// Innermost open entity, if it is tracked and still registered.
  [[nodiscard]] Entity * current_entity();
  /// Innermost open method belonging to the innermost open entity.
  [[nodiscard]] Method * current_method();

  [[nodiscard]] static bool is_type_declaration(ts_ll::Node node);
  [[nodiscard]] static bool is_function_declaration(ts_ll::Node node);

  CodeGraph & graph_;
  DeclReader reader_;
  std::vector<Scope> scopes_;
  size_t registered_ = 0;
};

/// Collect the dependencies of a parsed file into `graph`. Does nothing for a unit without a tree.
void collect_dependencies(const ParsedUnit & unit, CodeGraph & graph);

}  // namespace swift_grapher
