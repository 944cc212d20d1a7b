// swift_grapher/project/project_config.cpp - Project configuration implementation
//
#include "swift_grapher/project/project_config.hpp"

#include <yaml-cpp/yaml.h>

#include "swift_grapher/driver/source_finder.hpp"

namespace swift_grapher
{

ProjectConfig::ProjectConfig() { scan.exclude = default_excluded_directories(); }

namespace
{

std::optional<std::string> parse_output(const YAML::Node & node, OutputConfig & out)
{
  if (!node.IsMap()) {
    return "'output' must be a map";
  }

  if (node["file"]) {
    out.file = node["file"].as<std::string>();
    if (out.file.empty()) {
      return "output.file must not be empty";
    }
  }

  if (node["location"]) {
    const auto location = node["location"].as<std::string>();
    if (location == "cwd") {
      out.location = OutputLocation::WorkingDirectory;
    } else if (location == "project") {
      out.location = OutputLocation::ProjectRoot;
    } else {
      return "invalid output.location: '" + location + "' (must be 'cwd' or 'project')";
    }
  }

  if (node["indent"]) {
    out.indent = node["indent"].as<int>();
    if (out.indent < -1) {
      return "output.indent must be -1 or greater";
    }
  }

  return std::nullopt;
}

std::optional<std::string> parse_extraction(const YAML::Node & node, ExtractionConfig & out)
{
  if (!node.IsMap()) {
    return "'extraction' must be a map";
  }

  if (node["duplicates"]) {
    const auto policy = node["duplicates"].as<std::string>();
    if (policy == "overwrite") {
      out.duplicates = DuplicatePolicy::Overwrite;
    } else if (policy == "merge") {
      out.duplicates = DuplicatePolicy::Merge;
    } else {
      return "invalid extraction.duplicates: '" + policy + "' (must be 'overwrite' or 'merge')";
    }
  }

  if (node["strict_syntax"]) {
    out.strict_syntax = node["strict_syntax"].as<bool>();
  }

  return std::nullopt;
}

std::optional<std::string> parse_scan(const YAML::Node & node, ScanConfig & out)
{
  if (!node.IsMap()) {
    return "'scan' must be a map";
  }

  if (node["exclude"]) {
    if (!node["exclude"].IsSequence()) {
      return "scan.exclude must be a list";
    }
    out.exclude.clear();
    for (const auto & dir : node["exclude"]) {
      out.exclude.push_back(dir.as<std::string>());
    }
  }

  if (node["jobs"]) {
    const int jobs = node["jobs"].as<int>();
    if (jobs < 1) {
      return "scan.jobs must be at least 1";
    }
    out.jobs = static_cast<unsigned>(jobs);
  }

  return std::nullopt;
}

}  // namespace

ConfigLoadResult load_project_config(const std::filesystem::path & config_path)
{
  namespace fs = std::filesystem;

  if (!fs::exists(config_path)) {
    return ConfigLoadResult::fail("configuration file not found: " + config_path.string());
  }

  YAML::Node root;
  try {
    root = YAML::LoadFile(config_path.string());
  } catch (const YAML::Exception & e) {
    return ConfigLoadResult::fail("failed to parse YAML: " + std::string(e.what()));
  }

  ProjectConfig config;
  config.config_path = fs::absolute(config_path);

  // An empty file is a valid configuration.
  if (root.IsNull()) {
    return ConfigLoadResult::ok(std::move(config));
  }
  if (!root.IsMap()) {
    return ConfigLoadResult::fail("configuration root must be a map");
  }

  try {
    std::optional<std::string> error;
    if (!error && root["output"]) error = parse_output(root["output"], config.output);
    if (!error && root["extraction"]) {
      error = parse_extraction(root["extraction"], config.extraction);
    }
    if (!error && root["scan"]) error = parse_scan(root["scan"], config.scan);
    if (!error && root["errors"]) {
      if (!root["errors"].IsMap()) {
        error = "'errors' must be a map";
      } else if (root["errors"]["fail_fast"]) {
        config.errors.fail_fast = root["errors"]["fail_fast"].as<bool>();
      }
    }
    if (error) {
      return ConfigLoadResult::fail(*error);
    }
  } catch (const YAML::Exception & e) {
    return ConfigLoadResult::fail("invalid configuration value: " + std::string(e.what()));
  }

  return ConfigLoadResult::ok(std::move(config));
}

std::optional<std::filesystem::path> find_project_config(const std::filesystem::path & start_dir)
{
  namespace fs = std::filesystem;

  std::error_code ec;
  fs::path current = fs::absolute(start_dir, ec);
  if (ec) {
    return std::nullopt;
  }

  if (fs::is_regular_file(current, ec)) {
    current = current.parent_path();
  }

  while (true) {
    fs::path candidate = current / k_project_config_file_name;
    if (fs::exists(candidate, ec)) {
      return candidate;
    }

    const fs::path parent = current.parent_path();
    if (parent == current) {
      break;
    }
    current = parent;
  }

  return std::nullopt;
}

}  // namespace swift_grapher
