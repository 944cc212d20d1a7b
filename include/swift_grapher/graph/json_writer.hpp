// swift_grapher/graph/json_writer.hpp - JSON serialization of the dependency graph
//
// Output layout (keys sorted by entity name, absent optionals omitted):
//   {
//     "Player": {
//       "name": "Player", "kind": "class",
//       "inheritedTypes": ["NSObject"], "conformedProtocols": ["Playable"],
//       "properties": [{"name": "volume", "type": "Float"}],
//       "methods": [{"name": "play", "parameters": [...], "returnType": "Bool", "calls": [...]}]
//     }
//   }
//
#pragma once

#include <filesystem>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

#include "swift_grapher/basic/diagnostic.hpp"
#include "swift_grapher/graph/code_graph.hpp"

namespace swift_grapher
{

[[nodiscard]] nlohmann::ordered_json to_json(const Parameter & parameter);
[[nodiscard]] nlohmann::ordered_json to_json(const Method & method);
[[nodiscard]] nlohmann::ordered_json to_json(const Entity & entity);
[[nodiscard]] nlohmann::ordered_json to_json(const CodeGraph & graph);

/**
 * Encode the graph as text.
 *
 * @param indent spaces per level, or -1 for a single line
 * @return the encoded text, or std::nullopt (with an E005 diagnostic) when the
 *         graph contains text that is not valid UTF-8
 */
[[nodiscard]] std::optional<std::string> encode_graph(
  const CodeGraph & graph, int indent, DiagnosticBag & diags);

/**
 * Encode the graph and write it to `output_path`, replacing any existing file.
 *
 * @return true on success; failures are reported as E005/E006 diagnostics
 */
bool write_graph(
  const CodeGraph & graph, const std::filesystem::path & output_path, int indent,
  DiagnosticBag & diags);

}  // namespace swift_grapher
