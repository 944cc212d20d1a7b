// swift_grapher/basic/diagnostic_printer.cpp - Diagnostic rendering with fmt and rang
#include "swift_grapher/basic/diagnostic_printer.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <filesystem>
#include <ostream>
#include <rang.hpp>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace swift_grapher
{

namespace
{

constexpr size_t k_tab_width = 4;

std::string_view severity_name(Severity severity)
{
  switch (severity) {
    case Severity::Error:
      return "error";
    case Severity::Warning:
      return "warning";
    case Severity::Note:
      return "note";
  }
  return "error";
}

rang::fg severity_color(Severity severity)
{
  switch (severity) {
    case Severity::Error:
      return rang::fg::red;
    case Severity::Warning:
      return rang::fg::yellow;
    case Severity::Note:
      return rang::fg::cyan;
  }
  return rang::fg::reset;
}

void write_styled(std::ostream & os, bool color, rang::fg fg, std::string_view text)
{
  if (color) {
    os << fg << rang::style::bold;
  }
  os << text;
  if (color) {
    os << rang::style::reset << rang::fg::reset;
  }
}

// Terminal width of the first `scalars` Unicode scalars of a line.
size_t display_width(std::string_view line, size_t scalars)
{
  size_t width = 0;
  for (const char c : line) {
    if ((static_cast<unsigned char>(c) & 0xC0U) == 0x80U) {
      continue;
    }
    if (scalars == 0) {
      break;
    }
    --scalars;
    width += c == '\t' ? k_tab_width : 1;
  }
  return width;
}

std::string expand_tabs(std::string_view line)
{
  std::string out;
  out.reserve(line.size());
  for (const char c : line) {
    if (c == '\t') {
      out.append(k_tab_width, ' ');
    } else {
      out.push_back(c);
    }
  }
  return out;
}

// Paths below the working directory are shown relative to it.
std::string display_path(const std::filesystem::path & path)
{
  std::error_code ec;
  const auto cwd = std::filesystem::current_path(ec);
  if (ec) {
    return path.string();
  }
  const auto relative = std::filesystem::relative(path, cwd, ec);
  if (ec || relative.empty() || *relative.begin() == "..") {
    return path.string();
  }
  return relative.string();
}

}  // namespace

DiagnosticPrinter::DiagnosticPrinter(std::ostream & os, bool use_color)
: os_(os), use_color_(use_color)
{
}

void DiagnosticPrinter::print(const Diagnostic & diag, const SourceRegistry & sources)
{
  const SourceFile * file = diag.is_located() ? sources.get_file(diag.range.file_id()) : nullptr;
  const LineColumn where =
    file != nullptr ? file->locate(diag.range.get_begin().offset()) : LineColumn{};
  const size_t gutter_width = where.is_valid() ? std::to_string(where.line).size() : 1;

  print_header(diag);

  if (file != nullptr && where.is_valid()) {
    print_gutter(gutter_width, "-->");
    os_ << fmt::format(" {}:{}:{}\n", display_path(file->path()), where.line, where.column);
    print_snippet(*file, diag, gutter_width);
  } else {
    if (diag.path) {
      print_gutter(gutter_width, "-->");
      os_ << ' ' << display_path(*diag.path) << '\n';
    }
    if (!diag.label.empty()) {
      print_gutter(gutter_width, "=");
      os_ << " note: " << diag.label << '\n';
    }
  }

  if (diag.help) {
    print_gutter(gutter_width, "=");
    os_ << " help: " << *diag.help << '\n';
  }
  os_ << '\n';
}

void DiagnosticPrinter::print_all(const DiagnosticBag & diags, const SourceRegistry & sources)
{
  std::vector<const Diagnostic *> ordered;
  ordered.reserve(diags.size());
  for (const Diagnostic & d : diags) {
    ordered.push_back(&d);
  }

  std::stable_sort(ordered.begin(), ordered.end(), [](const Diagnostic * a, const Diagnostic * b) {
    if (a->is_located() != b->is_located()) {
      return !a->is_located();
    }
    return a->is_located() && a->range.get_begin() < b->range.get_begin();
  });

  for (const Diagnostic * d : ordered) {
    print(*d, sources);
  }
}

void DiagnosticPrinter::print_header(const Diagnostic & diag)
{
  const std::string title = diag.code.empty()
                              ? std::string(severity_name(diag.severity))
                              : fmt::format("{}[{}]", severity_name(diag.severity), diag.code);
  write_styled(os_, use_color_, severity_color(diag.severity), title);
  if (use_color_) {
    os_ << rang::style::bold << ": " << diag.message << rang::style::reset << '\n';
  } else {
    os_ << ": " << diag.message << '\n';
  }
}

void DiagnosticPrinter::print_snippet(
  const SourceFile & file, const Diagnostic & diag, size_t gutter_width)
{
  const LineColumn begin = file.locate(diag.range.get_begin().offset());
  const LineColumn end = file.locate(diag.range.get_end().offset());
  const std::string_view line = file.line_text(begin.line);

  print_gutter(gutter_width, "|");
  os_ << '\n';

  write_styled(os_, use_color_, rang::fg::blue, fmt::format(" {:>{}} |", begin.line, gutter_width));
  os_ << ' ' << expand_tabs(line) << '\n';

  // Multi-line ranges only mark their first character.
  const size_t marked =
    end.line == begin.line && end.column > begin.column ? end.column - begin.column : 1;
  const size_t indent = display_width(line, begin.column - 1);
  const size_t width = std::max<size_t>(1, display_width(line, begin.column - 1 + marked) - indent);

  std::string marker(width, '^');
  if (!diag.label.empty()) {
    marker += ' ';
    marker += diag.label;
  }
  print_gutter(gutter_width, "|");
  os_ << ' ' << std::string(indent, ' ');
  write_styled(os_, use_color_, severity_color(diag.severity), marker);
  os_ << '\n';
}

void DiagnosticPrinter::print_gutter(size_t gutter_width, std::string_view mark)
{
  // Single-character marks line up with the '|' after the line number.
  const size_t pad = mark.size() == 1 ? gutter_width + 1 : gutter_width;
  os_ << std::string(pad, ' ');
  write_styled(os_, use_color_, rang::fg::blue, mark);
}

}  // namespace swift_grapher
