// swift_grapher/driver/source_finder.hpp - Swift source discovery
//
#pragma once

#include <filesystem>
#include <functional>
#include <string>
#include <vector>

#include "swift_grapher/basic/diagnostic.hpp"

namespace swift_grapher
{

/// Directory names skipped during discovery unless configured otherwise.
[[nodiscard]] const std::vector<std::string> & default_excluded_directories();

struct SourceFinderOptions
{
  /// File extension to collect, including the dot.
  std::string extension = ".swift";

  /// Directory names (not paths) that are not descended into.
  std::vector<std::string> excluded_directories = default_excluded_directories();

  /// Called for every regular file seen, before extension filtering.
  std::function<void(const std::filesystem::path &)> on_file_found;
};

/**
 * Recursively collect source files under `root`.
 *
 * Unreadable subdirectories are skipped with a warning. The result is sorted
 * so that processing order does not depend on the filesystem.
 *
 * @return the sorted file list; empty with an E002 error when `root` is not a
 *         readable directory
 */
[[nodiscard]] std::vector<std::filesystem::path> find_source_files(
  const std::filesystem::path & root, const SourceFinderOptions & options, DiagnosticBag & diags);

}  // namespace swift_grapher
