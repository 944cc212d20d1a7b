// swift_grapher/basic/diagnostic_printer.hpp - Terminal rendering of diagnostics
//
// Output shape:
//
//   warning[W001]: syntax error
//     --> Sources/App/Player.swift:5:15
//      |
//    5 |     func play( {
//      |               ^ parser recovered here
//      = help: declarations inside the recovered region may be missing from the graph
//
#pragma once

#include <cstddef>
#include <iosfwd>
#include <string>
#include <string_view>

#include "swift_grapher/basic/diagnostic.hpp"
#include "swift_grapher/basic/source_manager.hpp"

namespace swift_grapher
{

class DiagnosticPrinter
{
public:
  /// With use_color, severities and gutters are colored through rang.
  explicit DiagnosticPrinter(std::ostream & os, bool use_color = true);

  void print(const Diagnostic & diag, const SourceRegistry & sources);

  /// Run-level and file-level diagnostics first, in reporting order; then
  /// located ones by file and offset.
  void print_all(const DiagnosticBag & diags, const SourceRegistry & sources);

private:
  void print_header(const Diagnostic & diag);
  void print_snippet(const SourceFile & file, const Diagnostic & diag, size_t gutter_width);
  void print_gutter(size_t gutter_width, std::string_view mark);

  std::ostream & os_;
  bool use_color_;
};

}  // namespace swift_grapher
