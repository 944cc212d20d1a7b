// swift_grapher/driver/grapher.hpp - Graph extraction driver
//
// Single entry point for the scan -> parse -> extract -> write pipeline.
// Used by the CLI and by the integration tests.
//
#pragma once

#include <filesystem>
#include <memory>
#include <optional>
#include <vector>

#include "swift_grapher/basic/diagnostic.hpp"
#include "swift_grapher/basic/source_manager.hpp"
#include "swift_grapher/graph/code_graph.hpp"
#include "swift_grapher/project/project_config.hpp"

namespace swift_grapher
{

// ============================================================================
// Options / Result
// ============================================================================

struct GraphOptions
{
  /// Directory to scan for Swift sources.
  std::filesystem::path project_root;

  /// Settings from swift-grapher.yaml (defaults when there is none).
  ProjectConfig config;

  /// Output file (overrides config.output when set).
  std::optional<std::filesystem::path> output_path;

  /// Write the graph to disk. Tests turn this off to inspect the graph only.
  bool write_output = true;

  /// Log discovery and parsing progress to stderr.
  bool verbose = false;
};

struct GraphResult
{
  /// No error was reported. Skipped files count as errors.
  bool success = false;

  DiagnosticBag diagnostics;

  /// Every file that was read; needed to render diagnostics with source context.
  std::unique_ptr<SourceRegistry> sources = std::make_unique<SourceRegistry>();

  CodeGraph graph;

  /// Swift files found under the project root, in processing order.
  std::vector<std::filesystem::path> files;

  /// Files left out of the graph because they could not be read or parsed.
  std::vector<std::filesystem::path> skipped_files;

  /// Where the graph was written (unset when nothing was written).
  std::optional<std::filesystem::path> output_path;
};

// ============================================================================
// Grapher
// ============================================================================

/**
 * Drives one run over a project directory.
 *
 * 1. Discover Swift files (sorted, excluded directories skipped)
 * 2. Read every file into a SourceRegistry
 * 3. Parse and extract each file, sequentially or on `scan.jobs` threads;
 *    per-file graphs are merged into the run graph in file order by the
 *    calling thread
 * 4. Write the JSON graph (skipped when no Swift file was found)
 *
 * A file that cannot be read or parsed aborts the run when `errors.fail_fast`
 * is set, and is otherwise reported and left out.
 */
class Grapher
{
public:
  [[nodiscard]] static GraphResult run(const GraphOptions & options);

  /// Output file for a run: the override, or config.output resolved against
  /// the working directory or the project root.
  [[nodiscard]] static std::filesystem::path resolve_output_path(const GraphOptions & options);

private:
  struct FileTask
  {
    std::filesystem::path path;
    FileId file_id = FileId::invalid();
  };

  static bool read_sources(
    const GraphOptions & options, GraphResult & result, std::vector<FileTask> & tasks);

  static bool extract_sequential(
    const GraphOptions & options, const std::vector<FileTask> & tasks, GraphResult & result);

  static bool extract_parallel(
    const GraphOptions & options, const std::vector<FileTask> & tasks, GraphResult & result);
};

}  // namespace swift_grapher
