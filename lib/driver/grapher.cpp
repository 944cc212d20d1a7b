// swift_grapher/driver/grapher.cpp - Graph extraction driver implementation
//
#include "swift_grapher/driver/grapher.hpp"

#include <algorithm>
#include <atomic>
#include <fstream>
#include <iostream>
#include <sstream>
#include <system_error>
#include <thread>

#include "swift_grapher/driver/source_finder.hpp"
#include "swift_grapher/extract/dependency_collector.hpp"
#include "swift_grapher/graph/json_writer.hpp"
#include "swift_grapher/syntax/frontend.hpp"

namespace fs = std::filesystem;

namespace swift_grapher
{

namespace
{

std::optional<std::string> read_file(const fs::path & path)
{
  std::ifstream file(path, std::ios::binary);
  if (!file.is_open()) {
    return std::nullopt;
  }

  std::stringstream buffer;
  buffer << file.rdbuf();
  if (file.bad()) {
    return std::nullopt;
  }
  return buffer.str();
}

/// What one worker produced for one file.
struct FileOutcome
{
  std::unique_ptr<CodeGraph> graph;
  DiagnosticBag diags;
  bool ok = false;
};

/// Parse one registered file and, when it parsed cleanly, collect it into `graph`.
bool extract_file(
  const SourceRegistry & sources, FileId file_id, const GraphOptions & options, CodeGraph & graph,
  DiagnosticBag & diags)
{
  ParseOptions parse_options;
  parse_options.strict_syntax = options.config.extraction.strict_syntax;

  const auto unit = parse_source(sources, file_id, parse_options);
  const bool ok = unit->ok();
  if (ok) {
    collect_dependencies(*unit, graph);
  }
  diags.merge(std::move(unit->diags));
  return ok;
}

}  // namespace

fs::path Grapher::resolve_output_path(const GraphOptions & options)
{
  if (options.output_path) {
    return *options.output_path;
  }

  const OutputConfig & out = options.config.output;
  if (out.file.is_absolute()) {
    return out.file;
  }
  if (out.location == OutputLocation::ProjectRoot) {
    return options.project_root / out.file;
  }
  return fs::current_path() / out.file;
}

GraphResult Grapher::run(const GraphOptions & options)
{
  GraphResult result;
  result.graph = CodeGraph(options.config.extraction.duplicates);

  // 1. Discovery
  SourceFinderOptions finder;
  finder.excluded_directories = options.config.scan.exclude;
  if (options.verbose) {
    finder.on_file_found = [](const fs::path & p) {
      std::cerr << "Found file: " << p.string() << "\n";
    };
  }

  result.files = find_source_files(options.project_root, finder, result.diagnostics);
  if (result.diagnostics.has_errors()) {
    return result;
  }

  if (result.files.empty()) {
    result.success = true;
    return result;
  }

  // 2. Read sources
  std::vector<FileTask> tasks;
  if (!read_sources(options, result, tasks)) {
    return result;
  }

  // 3. Parse + extract
  const bool extracted = (options.config.scan.jobs > 1 && tasks.size() > 1)
                           ? extract_parallel(options, tasks, result)
                           : extract_sequential(options, tasks, result);
  if (!extracted) {
    return result;
  }

  // 4. Write
  if (options.write_output) {
    const fs::path output_path = resolve_output_path(options);
    if (!write_graph(result.graph, output_path, options.config.output.indent, result.diagnostics)) {
      return result;
    }
    result.output_path = output_path;
  }

  result.success = !result.diagnostics.has_errors();
  return result;
}

bool Grapher::read_sources(
  const GraphOptions & options, GraphResult & result, std::vector<FileTask> & tasks)
{
  tasks.reserve(result.files.size());

  for (const auto & path : result.files) {
    auto content = read_file(path);
    FileId id = FileId::invalid();
    if (content) {
      id = result.sources->register_file(path, std::move(*content));
    }

    if (!id.is_valid()) {
      result.diagnostics
        .report_error(SourceRange{}, content ? "too many source files" : "cannot read file")
        .with_code(diag_code::k_read_failure)
        .with_path(path);
      if (options.config.errors.fail_fast) {
        return false;
      }
      result.skipped_files.push_back(path);
      continue;
    }

    tasks.push_back(FileTask{path, id});
  }

  return true;
}

bool Grapher::extract_sequential(
  const GraphOptions & options, const std::vector<FileTask> & tasks, GraphResult & result)
{
  for (const auto & task : tasks) {
    if (options.verbose) {
      std::cerr << "Parsing " << task.path.string() << "\n";
    }

    // Sequential runs collect straight into the run graph.
    if (!extract_file(*result.sources, task.file_id, options, result.graph, result.diagnostics)) {
      if (options.config.errors.fail_fast) {
        return false;
      }
      result.skipped_files.push_back(task.path);
    }
  }
  return true;
}

bool Grapher::extract_parallel(
  const GraphOptions & options, const std::vector<FileTask> & tasks, GraphResult & result)
{
  std::vector<FileOutcome> outcomes(tasks.size());
  std::atomic<size_t> next{0};
  const SourceRegistry & sources = *result.sources;

  // Workers only read the registry and write their own outcome slot.
  auto worker = [&]() {
    for (size_t i = next.fetch_add(1); i < tasks.size(); i = next.fetch_add(1)) {
      FileOutcome & outcome = outcomes[i];
      outcome.graph = std::make_unique<CodeGraph>(options.config.extraction.duplicates);
      outcome.ok = extract_file(sources, tasks[i].file_id, options, *outcome.graph, outcome.diags);
    }
  };

  const size_t thread_count = std::min<size_t>(options.config.scan.jobs, tasks.size());
  std::vector<std::thread> threads;
  threads.reserve(thread_count);
  try {
    for (size_t t = 0; t < thread_count; ++t) {
      threads.emplace_back(worker);
    }
  } catch (const std::system_error & e) {
    // Tasks are pulled from a shared counter, so the calling thread can take
    // over the share of the workers that could not be started.
    if (options.verbose) {
      std::cerr << "Started " << threads.size() << " of " << thread_count
                << " worker threads: " << e.what() << "\n";
    }
    worker();
  }
  for (auto & th : threads) {
    th.join();
  }

  // Single writer: merge in file order so duplicate names resolve exactly as
  // in a sequential run.
  for (size_t i = 0; i < tasks.size(); ++i) {
    if (options.verbose) {
      std::cerr << "Parsing " << tasks[i].path.string() << "\n";
    }

    FileOutcome & outcome = outcomes[i];
    result.diagnostics.merge(std::move(outcome.diags));

    if (!outcome.ok) {
      if (options.config.errors.fail_fast) {
        return false;
      }
      result.skipped_files.push_back(tasks[i].path);
      continue;
    }
    result.graph.merge_from(std::move(*outcome.graph));
  }
  return true;
}

}  // namespace swift_grapher
