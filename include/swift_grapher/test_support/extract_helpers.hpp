// swift_grapher/test_support/extract_helpers.hpp - helpers for unit/integration tests
//
// Runs the single-file parse -> collect pipeline on an in-memory snippet.
// Ownership stays explicit (SourceRegistry + ParsedUnit + CodeGraph).
//
#pragma once

#include <filesystem>
#include <memory>
#include <string>
#include <utility>

#include "swift_grapher/basic/diagnostic.hpp"
#include "swift_grapher/basic/source_manager.hpp"
#include "swift_grapher/extract/dependency_collector.hpp"
#include "swift_grapher/graph/code_graph.hpp"
#include "swift_grapher/syntax/frontend.hpp"

namespace swift_grapher::test_support
{

struct TestExtractUnit
{
  SourceRegistry sources;
  std::unique_ptr<ParsedUnit> parsed;
  CodeGraph graph;

  [[nodiscard]] const DiagnosticBag & diags() const { return parsed->diags; }

  [[nodiscard]] const Entity * entity(const std::string & name) const { return graph.find(name); }
};

[[nodiscard]] inline std::unique_ptr<TestExtractUnit> extract(
  std::string src, const std::filesystem::path & virtual_path = "<test>.swift",
  DuplicatePolicy policy = DuplicatePolicy::Overwrite)
{
  // Heap-allocated: the parsed unit points into the registry.
  auto out = std::make_unique<TestExtractUnit>();
  out->graph = CodeGraph(policy);
  out->parsed = parse_source(out->sources, virtual_path, std::move(src));
  collect_dependencies(*out->parsed, out->graph);
  return out;
}

/// Method `method` of entity `entity`, or nullptr.
[[nodiscard]] inline const Method * find_method(
  const TestExtractUnit & unit, const std::string & entity, const std::string & method)
{
  const Entity * e = unit.graph.find(entity);
  if (!e) return nullptr;
  for (const auto & m : e->methods) {
    if (m.name == method) return &m;
  }
  return nullptr;
}

}  // namespace swift_grapher::test_support
