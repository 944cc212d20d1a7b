// swift_grapher/basic/diagnostic.hpp - Problems found while scanning, parsing and writing
//
// Nothing in the pipeline throws across module boundaries. Each stage
// records what went wrong in a DiagnosticBag and keeps going where it can;
// the driver decides from the collected severities whether the run failed.
//
#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "swift_grapher/basic/source_manager.hpp"

namespace swift_grapher
{

enum class Severity : uint8_t {
  Error,
  Warning,
  Note,
};

/// Stable diagnostic codes reported by the tool.
namespace diag_code
{
inline constexpr const char * k_usage = "E001";
inline constexpr const char * k_bad_root = "E002";
inline constexpr const char * k_read_failure = "E003";
inline constexpr const char * k_parse_failure = "E004";
inline constexpr const char * k_encode_failure = "E005";
inline constexpr const char * k_write_failure = "E006";
inline constexpr const char * k_config = "E007";
inline constexpr const char * k_syntax = "W001";
}  // namespace diag_code

struct Diagnostic
{
  Severity severity = Severity::Error;
  std::string code;
  std::string message;

  /// Where in a registered file the problem is; invalid for file-level or
  /// run-level problems.
  SourceRange range;
  /// Short text printed under the marked source.
  std::string label;
  std::optional<std::string> help;
  /// File the problem concerns when it has no registered source (unreadable
  /// file, output path).
  std::optional<std::filesystem::path> path;

  [[nodiscard]] bool is_located() const noexcept { return range.is_valid(); }
};

class DiagnosticBag;

/// Fills in the optional parts of a diagnostic. The diagnostic is added to
/// its bag when the builder is destroyed, normally at the end of the
/// statement that created it.
class DiagnosticBuilder
{
public:
  DiagnosticBuilder(DiagnosticBag & bag, Diagnostic diag);
  DiagnosticBuilder(const DiagnosticBuilder &) = delete;
  DiagnosticBuilder & operator=(const DiagnosticBuilder &) = delete;
  DiagnosticBuilder(DiagnosticBuilder && other) noexcept;
  ~DiagnosticBuilder();

  DiagnosticBuilder & with_code(std::string code);
  DiagnosticBuilder & with_label(SourceRange range, std::string text);
  DiagnosticBuilder & with_help(std::string text);
  DiagnosticBuilder & with_path(std::filesystem::path path);

private:
  DiagnosticBag * bag_;
  Diagnostic diag_;
};

class DiagnosticBag
{
public:
  DiagnosticBuilder report_error(SourceRange range, std::string message, std::string label = {})
  {
    return report(Severity::Error, range, std::move(message), std::move(label));
  }
  DiagnosticBuilder report_warning(SourceRange range, std::string message, std::string label = {})
  {
    return report(Severity::Warning, range, std::move(message), std::move(label));
  }
  DiagnosticBuilder report_note(SourceRange range, std::string message, std::string label = {})
  {
    return report(Severity::Note, range, std::move(message), std::move(label));
  }

  void add(Diagnostic diag) { diagnostics_.push_back(std::move(diag)); }

  /// Appends other's diagnostics after this bag's, preserving their order.
  void merge(DiagnosticBag && other);
  void merge(const DiagnosticBag & other);

  [[nodiscard]] const std::vector<Diagnostic> & all() const noexcept { return diagnostics_; }
  [[nodiscard]] bool empty() const noexcept { return diagnostics_.empty(); }
  [[nodiscard]] size_t size() const noexcept { return diagnostics_.size(); }
  [[nodiscard]] auto begin() const noexcept { return diagnostics_.begin(); }
  [[nodiscard]] auto end() const noexcept { return diagnostics_.end(); }

  [[nodiscard]] size_t count(Severity severity) const;
  [[nodiscard]] bool has_errors() const { return count(Severity::Error) != 0; }
  [[nodiscard]] bool has_warnings() const { return count(Severity::Warning) != 0; }
  [[nodiscard]] bool has_code(std::string_view code) const;

private:
  DiagnosticBuilder report(
    Severity severity, SourceRange range, std::string message, std::string label);

  std::vector<Diagnostic> diagnostics_;
};

}  // namespace swift_grapher
