// swift_grapher/syntax/frontend.cpp - Parse a registered file and report recovery points
#include "swift_grapher/syntax/frontend.hpp"

namespace swift_grapher
{

namespace
{

constexpr size_t k_max_syntax_diagnostics_per_file = 64;

void report_recovery_point(
  const ts_ll::Node node, FileId file, Severity severity, DiagnosticBag & diags)
{
  Diagnostic d;
  d.severity = severity;
  d.code = diag_code::k_syntax;
  d.message =
    node.is_error() ? "syntax error" : "missing token '" + std::string(node.kind()) + "'";
  d.range = node.range(file);
  d.label = "parser recovered here";
  d.help = "declarations inside the recovered region may be missing from the graph";
  diags.add(std::move(d));
}

// Preorder walk over the tree. The subtree of an ERROR node is not entered:
// anything nested in it belongs to the same recovery point.
void report_recovery_points(
  const ts_ll::Node root, FileId file, Severity severity, DiagnosticBag & diags)
{
  size_t reported = 0;
  ts_ll::Cursor cursor(root);
  while (reported < k_max_syntax_diagnostics_per_file) {
    const ts_ll::Node node = cursor.current_node();
    const bool is_recovery = node.is_error() || node.is_missing();
    if (is_recovery) {
      report_recovery_point(node, file, severity, diags);
      ++reported;
    }

    if (!node.is_error() && node.has_error() && cursor.goto_first_child()) {
      continue;
    }
    while (!cursor.goto_next_sibling()) {
      if (!cursor.goto_parent()) {
        return;
      }
    }
  }
}

}  // namespace

std::unique_ptr<ParsedUnit> parse_source(
  const SourceRegistry & sources, FileId file_id, const ParseOptions & options)
{
  auto unit = std::make_unique<ParsedUnit>();
  unit->file_id = file_id;
  unit->source = sources.get_file(file_id);
  if (unit->source == nullptr) {
    unit->diags.report_error(SourceRange{}, "source file is not registered")
      .with_code(diag_code::k_parse_failure);
    return unit;
  }

  ts_ll::Parser parser;
  if (!parser.is_ready()) {
    unit->diags.report_error(SourceRange{}, "cannot load the Swift grammar into tree-sitter")
      .with_code(diag_code::k_parse_failure)
      .with_path(unit->source->path())
      .with_help("the tree-sitter-swift library was built for an incompatible tree-sitter ABI");
    return unit;
  }

  unit->tree = parser.parse(unit->source->content());
  if (unit->tree.is_null()) {
    unit->diags.report_error(SourceRange{}, "tree-sitter returned no syntax tree")
      .with_code(diag_code::k_parse_failure)
      .with_path(unit->source->path());
    return unit;
  }

  // tree-sitter always recovers, so a tree with ERROR or MISSING nodes is
  // still extracted. Those nodes are reported so a partial graph is visible.
  const ts_ll::Node root = unit->root();
  if (root.has_error()) {
    report_recovery_points(
      root, file_id, options.strict_syntax ? Severity::Error : Severity::Warning, unit->diags);
  }
  return unit;
}

std::unique_ptr<ParsedUnit> parse_source(
  SourceRegistry & sources, const std::filesystem::path & path, std::string source_text,
  const ParseOptions & options)
{
  const FileId id = sources.register_file(path, std::move(source_text));
  if (id.is_valid()) {
    return parse_source(sources, id, options);
  }

  auto unit = std::make_unique<ParsedUnit>();
  unit->diags.report_error(SourceRange{}, "too many source files in one run")
    .with_code(diag_code::k_read_failure)
    .with_path(path);
  return unit;
}

}  // namespace swift_grapher
