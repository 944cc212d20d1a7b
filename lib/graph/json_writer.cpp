// swift_grapher/graph/json_writer.cpp - JSON serialization implementation
//
#include "swift_grapher/graph/json_writer.hpp"

#include <fstream>
#include <optional>
#include <string>

namespace swift_grapher
{

using nlohmann::ordered_json;

namespace
{

ordered_json j_strings(const std::vector<std::string> & values)
{
  ordered_json arr = ordered_json::array();
  for (const auto & v : values) {
    arr.push_back(v);
  }
  return arr;
}

}  // namespace

ordered_json to_json(const Parameter & parameter)
{
  ordered_json j = ordered_json::object();
  if (parameter.external_name) {
    j["externalName"] = *parameter.external_name;
  }
  j["internalName"] = parameter.internal_name;
  if (parameter.type) {
    j["type"] = *parameter.type;
  }
  return j;
}

ordered_json to_json(const Method & method)
{
  ordered_json params = ordered_json::array();
  for (const auto & p : method.parameters) {
    params.push_back(to_json(p));
  }

  ordered_json j;
  j["name"] = method.name;
  j["parameters"] = std::move(params);
  if (method.return_type) {
    j["returnType"] = *method.return_type;
  }
  j["calls"] = j_strings(method.calls);
  return j;
}

ordered_json to_json(const Entity & entity)
{
  ordered_json properties = ordered_json::array();
  for (const auto & p : entity.properties) {
    properties.push_back(ordered_json{{"name", p.name}, {"type", p.type}});
  }

  ordered_json methods = ordered_json::array();
  for (const auto & m : entity.methods) {
    methods.push_back(to_json(m));
  }

  ordered_json j;
  j["name"] = entity.name;
  j["kind"] = std::string(to_string(entity.kind));
  j["inheritedTypes"] = j_strings(entity.inherited_types);
  j["conformedProtocols"] = j_strings(entity.conformed_protocols);
  j["properties"] = std::move(properties);
  j["methods"] = std::move(methods);
  return j;
}

ordered_json to_json(const CodeGraph & graph)
{
  ordered_json j = ordered_json::object();
  for (const auto & name : graph.sorted_names()) {
    j[name] = to_json(*graph.find(name));
  }
  return j;
}

std::optional<std::string> encode_graph(
  const CodeGraph & graph, int indent, DiagnosticBag & diags)
{
  try {
    return to_json(graph).dump(indent);
  } catch (const nlohmann::json::exception & e) {
    diags.report_error(SourceRange{}, "failed to encode the graph: " + std::string(e.what()))
      .with_code(diag_code::k_encode_failure)
      .with_help("a declaration contains text that is not valid UTF-8");
    return std::nullopt;
  }
}

bool write_graph(
  const CodeGraph & graph, const std::filesystem::path & output_path, int indent,
  DiagnosticBag & diags)
{
  const auto text = encode_graph(graph, indent, diags);
  if (!text) {
    return false;
  }

  std::ofstream out(output_path, std::ios::binary | std::ios::trunc);
  if (!out.is_open()) {
    diags.report_error(SourceRange{}, "cannot open output file for writing")
      .with_code(diag_code::k_write_failure)
      .with_path(output_path);
    return false;
  }

  out << *text << '\n';
  out.flush();
  if (!out) {
    diags.report_error(SourceRange{}, "failed to write output file")
      .with_code(diag_code::k_write_failure)
      .with_path(output_path);
    return false;
  }
  return true;
}

}  // namespace swift_grapher
