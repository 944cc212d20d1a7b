// swift_grapher/graph/code_graph.hpp - Dependency graph data model and store
//
// The graph maps the name of every top-level type declaration (class, struct,
// enum, protocol or extension) to what was extracted for it: inheritance
// clause, properties, method signatures and the calls made inside methods.
//
#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace swift_grapher
{

// ============================================================================
// Records
// ============================================================================

enum class EntityKind : uint8_t {
  Class,
  Struct,
  Enum,
  Protocol,
  Extension,
};

[[nodiscard]] std::string_view to_string(EntityKind kind) noexcept;

/// Map a declaration keyword ("class", "struct", ...) to its kind.
[[nodiscard]] std::optional<EntityKind> entity_kind_from_keyword(std::string_view keyword) noexcept;

/// Type recorded for a property declared without a type annotation.
inline constexpr const char * k_unknown_type = "Unknown";

/// Prefix of the synthesized name of an extension entity.
inline constexpr const char * k_extension_prefix = "Extension_of_";

struct Property
{
  std::string name;
  std::string type = k_unknown_type;
};

struct Parameter
{
  /// Only set when the declaration has distinct external and internal names.
  std::optional<std::string> external_name;
  std::string internal_name;
  std::optional<std::string> type;
};

struct Method
{
  std::string name;
  std::vector<Parameter> parameters;
  std::optional<std::string> return_type;
  /// Callee text of every call inside the body, in traversal order.
  std::vector<std::string> calls;
};

struct Entity
{
  std::string name;
  EntityKind kind = EntityKind::Class;
  /// First entry of the inheritance clause. Positional guess: it may be a protocol.
  std::vector<std::string> inherited_types;
  /// Remaining entries of the inheritance clause.
  std::vector<std::string> conformed_protocols;
  std::vector<Property> properties;
  std::vector<Method> methods;
};

bool operator==(const Property & a, const Property & b);
bool operator==(const Parameter & a, const Parameter & b);
bool operator==(const Method & a, const Method & b);
bool operator==(const Entity & a, const Entity & b);
inline bool operator!=(const Entity & a, const Entity & b) { return !(a == b); }

// ============================================================================
// CodeGraph - the graph store
// ============================================================================

/// What happens when an entity is registered under a name that already exists.
enum class DuplicatePolicy : uint8_t {
  Overwrite,  ///< The later declaration replaces the earlier one entirely.
  Merge,      ///< Members are appended; inheritance lists are unioned.
};

[[nodiscard]] std::string_view to_string(DuplicatePolicy policy) noexcept;

class CodeGraph
{
public:
  explicit CodeGraph(DuplicatePolicy policy = DuplicatePolicy::Overwrite) : policy_(policy) {}

  /**
   * Register an entity under its name, applying the duplicate policy.
   *
   * @return the stored entity (the merged one under DuplicatePolicy::Merge)
   */
  Entity & register_entity(Entity entity);

  [[nodiscard]] Entity * find(const std::string & name);
  [[nodiscard]] const Entity * find(const std::string & name) const;
  [[nodiscard]] bool contains(const std::string & name) const;

  [[nodiscard]] size_t size() const noexcept { return entities_.size(); }
  [[nodiscard]] bool empty() const noexcept { return entities_.empty(); }

  /// Entity names in lexicographic order, for reproducible output.
  [[nodiscard]] std::vector<std::string> sorted_names() const;

  /// Register every entity of `other` (in name order) into this graph.
  void merge_from(const CodeGraph & other);
  void merge_from(CodeGraph && other);

  [[nodiscard]] DuplicatePolicy policy() const noexcept { return policy_; }

  [[nodiscard]] const std::unordered_map<std::string, Entity> & entities() const noexcept
  {
    return entities_;
  }

private:
  static void merge_into(Entity & target, Entity && incoming);

  DuplicatePolicy policy_;
  std::unordered_map<std::string, Entity> entities_;
};

}  // namespace swift_grapher
