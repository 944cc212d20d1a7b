// swift_grapher/basic/diagnostic.cpp - Diagnostic bag and builder
#include "swift_grapher/basic/diagnostic.hpp"

#include <algorithm>
#include <iterator>

namespace swift_grapher
{

DiagnosticBuilder::DiagnosticBuilder(DiagnosticBag & bag, Diagnostic diag)
: bag_(&bag), diag_(std::move(diag))
{
}

DiagnosticBuilder::DiagnosticBuilder(DiagnosticBuilder && other) noexcept
: bag_(other.bag_), diag_(std::move(other.diag_))
{
  other.bag_ = nullptr;
}

DiagnosticBuilder::~DiagnosticBuilder()
{
  if (bag_ != nullptr) {
    bag_->add(std::move(diag_));
  }
}

DiagnosticBuilder & DiagnosticBuilder::with_code(std::string code)
{
  diag_.code = std::move(code);
  return *this;
}

DiagnosticBuilder & DiagnosticBuilder::with_label(SourceRange range, std::string text)
{
  diag_.range = range;
  diag_.label = std::move(text);
  return *this;
}

DiagnosticBuilder & DiagnosticBuilder::with_help(std::string text)
{
  diag_.help = std::move(text);
  return *this;
}

DiagnosticBuilder & DiagnosticBuilder::with_path(std::filesystem::path path)
{
  diag_.path = std::move(path);
  return *this;
}

DiagnosticBuilder DiagnosticBag::report(
  Severity severity, SourceRange range, std::string message, std::string label)
{
  Diagnostic diag;
  diag.severity = severity;
  diag.message = std::move(message);
  diag.range = range;
  diag.label = std::move(label);
  return DiagnosticBuilder(*this, std::move(diag));
}

void DiagnosticBag::merge(DiagnosticBag && other)
{
  if (diagnostics_.empty()) {
    diagnostics_ = std::move(other.diagnostics_);
  } else {
    std::move(
      other.diagnostics_.begin(), other.diagnostics_.end(), std::back_inserter(diagnostics_));
  }
  other.diagnostics_.clear();
}

void DiagnosticBag::merge(const DiagnosticBag & other)
{
  diagnostics_.insert(diagnostics_.end(), other.diagnostics_.begin(), other.diagnostics_.end());
}

size_t DiagnosticBag::count(Severity severity) const
{
  return static_cast<size_t>(std::count_if(
    diagnostics_.begin(), diagnostics_.end(),
    [severity](const Diagnostic & d) { return d.severity == severity; }));
}

bool DiagnosticBag::has_code(std::string_view code) const
{
  return std::any_of(
    diagnostics_.begin(), diagnostics_.end(), [code](const Diagnostic & d) { return d.code == code; });
}

}  // namespace swift_grapher
