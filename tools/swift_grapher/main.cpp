// swift-grapher - Swift dependency graph extractor
//
// Usage:
//   swift-grapher <project-root> [options]
//
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>

#ifdef _WIN32
#include <io.h>
#define isatty _isatty
#define fileno _fileno
#else
#include <unistd.h>
#endif

#include "swift_grapher/basic/diagnostic_printer.hpp"
#include "swift_grapher/driver/grapher.hpp"
#include "swift_grapher/project/project_config.hpp"

namespace fs = std::filesystem;

namespace
{

// ============================================================================
// Output Formatting
// ============================================================================

void print_usage(const char * program_name)
{
  std::cerr
    << "swift-grapher v0.1.0\n\n"
    << "Usage: " << program_name << " <project-root> [options]\n\n"
    << "Scans <project-root> for .swift files and writes the type dependency graph\n"
    << "as JSON (codegraph.json in the current directory by default).\n\n"
    << "Options:\n"
    << "  -o, --output <file>         Output file (overrides swift-grapher.yaml)\n"
    << "  --output-location <where>   Resolve a relative output file against 'cwd' or 'project'\n"
    << "  --config <file>             Configuration file (default: nearest swift-grapher.yaml)\n"
    << "  --merge-duplicates          Merge same-named declarations instead of keeping the last\n"
    << "  --strict-syntax             Skip files that needed syntax error recovery\n"
    << "  --fail-fast                 Stop at the first file that cannot be read or parsed\n"
    << "  -j, --jobs <n>              Parse files on <n> threads\n"
    << "  -v, --verbose               Verbose output\n"
    << "  -h, --help                  Show this help message\n\n"
    << "Note: the first entry of an inheritance clause is reported in 'inheritedTypes'\n"
    << "and the rest in 'conformedProtocols'. This split is positional and approximate.\n";
}

void print_diagnostics(
  const swift_grapher::DiagnosticBag & diagnostics, const swift_grapher::SourceRegistry & sources)
{
  const bool use_color = isatty(fileno(stderr)) != 0;
  swift_grapher::DiagnosticPrinter printer(std::cerr, use_color);
  printer.print_all(diagnostics, sources);
}

// ============================================================================
// Argument Parsing
// ============================================================================

struct CommandArgs
{
  std::string project_root;
  std::string output_path;
  std::string output_location;
  std::string config_path;
  std::optional<int> jobs;
  bool merge_duplicates = false;
  bool strict_syntax = false;
  bool fail_fast = false;
  bool verbose = false;
  bool show_help = false;
  std::string error;
};

CommandArgs parse_args(int argc, char * argv[])
{
  CommandArgs args;

  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];

    auto take_value = [&](std::string & out) {
      if (i + 1 < argc) {
        out = argv[++i];
      } else {
        args.error = "missing value for " + arg;
      }
    };

    if (arg == "-o" || arg == "--output") {
      take_value(args.output_path);
    } else if (arg == "--output-location") {
      take_value(args.output_location);
    } else if (arg == "--config") {
      take_value(args.config_path);
    } else if (arg == "-j" || arg == "--jobs") {
      std::string value;
      take_value(value);
      if (!value.empty()) {
        char * end = nullptr;
        const long n = std::strtol(value.c_str(), &end, 10);
        if (end == value.c_str() || *end != '\0' || n < 1) {
          args.error = "invalid job count: " + value;
        } else {
          args.jobs = static_cast<int>(n);
        }
      }
    } else if (arg == "--merge-duplicates") {
      args.merge_duplicates = true;
    } else if (arg == "--strict-syntax") {
      args.strict_syntax = true;
    } else if (arg == "--fail-fast") {
      args.fail_fast = true;
    } else if (arg == "-v" || arg == "--verbose") {
      args.verbose = true;
    } else if (arg == "-h" || arg == "--help") {
      args.show_help = true;
    } else if (!arg.empty() && arg[0] != '-' && args.project_root.empty()) {
      args.project_root = arg;
    } else {
      args.error = "unexpected argument: " + arg;
    }

    if (!args.error.empty()) {
      break;
    }
  }

  return args;
}

// ============================================================================
// Configuration
// ============================================================================

std::optional<swift_grapher::ProjectConfig> load_config(
  const CommandArgs & args, const fs::path & project_root)
{
  swift_grapher::ProjectConfig config;

  std::optional<fs::path> config_path;
  if (!args.config_path.empty()) {
    config_path = fs::path(args.config_path);
  } else {
    config_path = swift_grapher::find_project_config(project_root);
  }

  if (config_path) {
    auto loaded = swift_grapher::load_project_config(*config_path);
    if (!loaded.success) {
      std::cerr << "error[" << swift_grapher::diag_code::k_config << "]: " << loaded.error
                << "\n";
      return std::nullopt;
    }
    config = std::move(loaded.config);
    if (args.verbose) {
      std::cerr << "Using configuration: " << config.config_path.string() << "\n";
    }
  }

  // Command-line flags win over the file.
  if (!args.output_location.empty()) {
    if (args.output_location == "cwd") {
      config.output.location = swift_grapher::OutputLocation::WorkingDirectory;
    } else if (args.output_location == "project") {
      config.output.location = swift_grapher::OutputLocation::ProjectRoot;
    } else {
      std::cerr << "error[" << swift_grapher::diag_code::k_usage
                << "]: invalid output location: " << args.output_location
                << " (must be 'cwd' or 'project')\n";
      return std::nullopt;
    }
  }
  if (args.merge_duplicates) {
    config.extraction.duplicates = swift_grapher::DuplicatePolicy::Merge;
  }
  if (args.strict_syntax) {
    config.extraction.strict_syntax = true;
  }
  if (args.fail_fast) {
    config.errors.fail_fast = true;
  }
  if (args.jobs) {
    config.scan.jobs = static_cast<unsigned>(*args.jobs);
  }

  return config;
}

// ============================================================================
// Command
// ============================================================================

int run(const CommandArgs & args)
{
  swift_grapher::GraphOptions options;
  options.project_root = fs::absolute(args.project_root);
  options.verbose = args.verbose;
  if (!args.output_path.empty()) {
    options.output_path = fs::absolute(args.output_path);
  }

  auto config = load_config(args, options.project_root);
  if (!config) {
    return 1;
  }
  options.config = std::move(*config);

  if (args.verbose) {
    std::cerr << "Scanning directory: " << options.project_root.string() << "\n";
  }

  const swift_grapher::GraphResult result = swift_grapher::Grapher::run(options);

  if (!result.diagnostics.empty()) {
    print_diagnostics(result.diagnostics, *result.sources);
  }

  if (result.files.empty() && !result.diagnostics.has_errors()) {
    std::cerr << "No .swift files found in " << options.project_root.string() << ".\n";
    return 0;
  }

  if (!result.skipped_files.empty()) {
    std::cerr << "Skipped " << result.skipped_files.size() << " of " << result.files.size()
              << " file(s)\n";
  }

  if (result.output_path) {
    std::cerr << "Wrote " << result.output_path->filename().string() << " to: "
              << result.output_path->string() << "\n";
  }

  return result.success ? 0 : 1;
}

}  // namespace

int main(int argc, char * argv[])
{
  const CommandArgs args = parse_args(argc, argv);

  if (args.show_help) {
    print_usage(argv[0]);
    return 0;
  }

  if (!args.error.empty()) {
    std::cerr << "error[" << swift_grapher::diag_code::k_usage << "]: " << args.error << "\n\n";
    print_usage(argv[0]);
    return 1;
  }

  if (args.project_root.empty()) {
    std::cerr << "error[" << swift_grapher::diag_code::k_usage
              << "]: missing <project-root> argument\n\n";
    print_usage(argv[0]);
    return 1;
  }

  return run(args);
}
