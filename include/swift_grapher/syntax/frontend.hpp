// swift_grapher/syntax/frontend.hpp - High-level parse pipeline entry point
#pragma once

#include <filesystem>
#include <memory>
#include <string>

#include "swift_grapher/basic/diagnostic.hpp"
#include "swift_grapher/basic/source_manager.hpp"
#include "swift_grapher/syntax/ts_ll.hpp"

namespace swift_grapher
{

struct ParseOptions
{
  /// Treat recovered syntax errors (ERROR/MISSING nodes) as errors instead of warnings.
  bool strict_syntax = false;
};

/// A parsed Swift file: the concrete syntax tree plus the diagnostics it produced.
/// The tree refers to the registry's SourceFile, which must outlive the unit.
struct ParsedUnit
{
  FileId file_id = FileId::invalid();
  const SourceFile * source = nullptr;
  ts_ll::Tree tree;
  DiagnosticBag diags;

  /// True when a tree exists and no error was reported for it.
  [[nodiscard]] bool ok() const { return !tree.is_null() && !diags.has_errors(); }

  [[nodiscard]] ts_ll::Node root() const noexcept { return tree.root_node(); }
};

/**
 * Parse an already registered file.
 *
 * Only reads from the registry, so several files may be parsed concurrently
 * once registration is complete.
 */
[[nodiscard]] std::unique_ptr<ParsedUnit> parse_source(
  const SourceRegistry & sources, FileId file_id, const ParseOptions & options = {});

/// Register `source_text` under `path` and parse it.
[[nodiscard]] std::unique_ptr<ParsedUnit> parse_source(
  SourceRegistry & sources, const std::filesystem::path & path, std::string source_text,
  const ParseOptions & options = {});

}  // namespace swift_grapher
