// swift_grapher/project/project_config.hpp - Project configuration (swift-grapher.yaml)
//
// Optional per-project settings. Every value has a default, so a project
// without a configuration file behaves exactly like one with an empty file.
//
#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "swift_grapher/graph/code_graph.hpp"

namespace swift_grapher
{

// ============================================================================
// Configuration Structures
// ============================================================================

/// Directory a relative output file name is resolved against.
enum class OutputLocation {
  WorkingDirectory,  ///< The directory the tool was started from.
  ProjectRoot,       ///< The scanned directory.
};

struct OutputConfig
{
  std::filesystem::path file = "codegraph.json";
  OutputLocation location = OutputLocation::WorkingDirectory;
  /// Spaces per indentation level; -1 writes a single line.
  int indent = 2;
};

struct ExtractionConfig
{
  DuplicatePolicy duplicates = DuplicatePolicy::Overwrite;
  bool strict_syntax = false;
};

struct ScanConfig
{
  std::vector<std::string> exclude;
  /// Number of files parsed concurrently.
  unsigned jobs = 1;
};

struct ErrorConfig
{
  /// Abort the whole run on the first unreadable or unparsable file.
  bool fail_fast = false;
};

/**
 * Complete project configuration (swift-grapher.yaml).
 */
struct ProjectConfig
{
  ProjectConfig();

  OutputConfig output;
  ExtractionConfig extraction;
  ScanConfig scan;
  ErrorConfig errors;

  /// File the configuration was loaded from (empty for defaults).
  std::filesystem::path config_path;
};

// ============================================================================
// Configuration Loading Result
// ============================================================================

struct ConfigLoadResult
{
  /// Loaded configuration (only valid if success == true)
  ProjectConfig config;

  bool success = false;

  /// Error message if loading failed
  std::string error;

  static ConfigLoadResult ok(ProjectConfig cfg)
  {
    ConfigLoadResult r;
    r.config = std::move(cfg);
    r.success = true;
    return r;
  }

  static ConfigLoadResult fail(std::string msg)
  {
    ConfigLoadResult r;
    r.error = std::move(msg);
    r.success = false;
    return r;
  }
};

// ============================================================================
// Configuration Loading API
// ============================================================================

/**
 * Load a project configuration from a swift-grapher.yaml file.
 *
 * @param config_path Path to the configuration file
 * @return ConfigLoadResult with the loaded config or error message
 */
[[nodiscard]] ConfigLoadResult load_project_config(const std::filesystem::path & config_path);

/**
 * Find a project configuration file by searching upward from a directory.
 *
 * @param start_dir Directory to start searching from
 * @return Path to swift-grapher.yaml if found, std::nullopt otherwise
 */
[[nodiscard]] std::optional<std::filesystem::path> find_project_config(
  const std::filesystem::path & start_dir);

inline constexpr const char * k_project_config_file_name = "swift-grapher.yaml";

}  // namespace swift_grapher
