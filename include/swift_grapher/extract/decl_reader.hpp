// swift_grapher/extract/decl_reader.hpp - CST -> graph record readers
//
// Pure readers over tree-sitter-swift nodes. They never touch the graph
// store; DependencyCollector decides where their results go.
//
#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "swift_grapher/basic/source_manager.hpp"
#include "swift_grapher/graph/code_graph.hpp"
#include "swift_grapher/syntax/ts_ll.hpp"

namespace swift_grapher
{

/// Superclass/protocol split of an inheritance clause.
struct InheritanceSplit
{
  std::vector<std::string> inherited_types;
  std::vector<std::string> conformed_protocols;
};

/**
 * Split an inheritance clause by position: the first entry is taken as the
 * superclass and every other entry as a protocol.
 *
 * The grammar does not distinguish the two, so `struct S: Codable` reports
 * Codable as inherited. The result is approximate by construction.
 */
[[nodiscard]] InheritanceSplit split_inheritance_clause(std::vector<std::string> clause);

/// Remove leading and trailing whitespace.
[[nodiscard]] std::string_view trim(std::string_view s) noexcept;

class DeclReader
{
public:
  explicit DeclReader(const SourceFile & source) : source_(source) {}

  // Entities (BuildEntity.cpp)

  /// Kind of a type declaration node, or nullopt for declarations that are not
  /// tracked as entities (actors, recovered fragments).
  [[nodiscard]] std::optional<EntityKind> declaration_kind(ts_ll::Node decl) const;

  /// Entity for a type declaration, with its inheritance clause and no members.
  /// Returns nullopt when a named declaration lost its name to error recovery.
  [[nodiscard]] std::optional<Entity> build_entity(ts_ll::Node decl, EntityKind kind) const;

  [[nodiscard]] std::vector<std::string> read_inheritance_clause(ts_ll::Node decl) const;

  // Signatures (BuildSignature.cpp)

  [[nodiscard]] Method build_method(ts_ll::Node function_decl) const;
  [[nodiscard]] std::vector<Parameter> read_parameters(ts_ll::Node function_decl) const;
  [[nodiscard]] Parameter read_parameter(ts_ll::Node parameter_node) const;
  [[nodiscard]] std::optional<std::string> read_return_type(ts_ll::Node function_decl) const;

  // Properties (BuildProperty.cpp)

  /// One property per identifier binding, in declaration order.
  [[nodiscard]] std::vector<Property> read_properties(ts_ll::Node property_decl) const;

  // Calls (BuildCall.cpp)

  /// Trimmed text of the callee of a call expression, without its arguments.
  [[nodiscard]] std::optional<std::string> read_callee(ts_ll::Node call_expr) const;

private:
  [[nodiscard]] std::string_view node_text(ts_ll::Node n) const;
  [[nodiscard]] std::string trimmed_text(ts_ll::Node n) const;
  [[nodiscard]] std::optional<std::string> non_empty_text(ts_ll::Node n) const;

  /// Byte span covering every direct child of `n` stored under `field`. A
  /// written type such as `@Sendable () -> Void` or `UILabel!` is several
  /// sibling nodes sharing one field name.
  [[nodiscard]] std::optional<std::pair<uint32_t, uint32_t>> field_span(
    ts_ll::Node n, std::string_view field) const;

  [[nodiscard]] std::optional<std::string> pattern_identifier(ts_ll::Node pattern) const;
  [[nodiscard]] std::string annotation_type(ts_ll::Node type_annotation) const;

  const SourceFile & source_;
};

}  // namespace swift_grapher
