// swift_grapher/driver/source_finder.cpp - Swift source discovery
//
#include "swift_grapher/driver/source_finder.hpp"

#include <algorithm>

namespace fs = std::filesystem;

namespace swift_grapher
{

const std::vector<std::string> & default_excluded_directories()
{
  static const std::vector<std::string> k_excluded = {
    ".build", ".git", "Pods", "Carthage", "DerivedData",
  };
  return k_excluded;
}

std::vector<fs::path> find_source_files(
  const fs::path & root, const SourceFinderOptions & options, DiagnosticBag & diags)
{
  std::vector<fs::path> files;

  std::error_code ec;
  if (!fs::is_directory(root, ec)) {
    diags.report_error(SourceRange{}, "not a directory: " + root.string())
      .with_code(diag_code::k_bad_root)
      .with_path(root);
    return files;
  }

  fs::recursive_directory_iterator it(root, fs::directory_options::skip_permission_denied, ec);
  if (ec) {
    diags.report_error(SourceRange{}, "cannot read directory: " + ec.message())
      .with_code(diag_code::k_bad_root)
      .with_path(root);
    return files;
  }

  const auto is_excluded = [&options](const fs::path & dir) {
    const std::string name = dir.filename().string();
    return std::find(
             options.excluded_directories.begin(), options.excluded_directories.end(), name) !=
           options.excluded_directories.end();
  };

  for (const fs::recursive_directory_iterator end; it != end; it.increment(ec)) {
    if (ec) {
      // The iterator cannot be resumed after a failed increment.
      diags.report_warning(SourceRange{}, "directory scan stopped early: " + ec.message())
        .with_path(root);
      break;
    }

    const fs::directory_entry & entry = *it;
    std::error_code entry_ec;
    if (entry.is_directory(entry_ec)) {
      if (is_excluded(entry.path())) {
        it.disable_recursion_pending();
      }
      continue;
    }
    if (!entry.is_regular_file(entry_ec)) {
      continue;
    }

    if (options.on_file_found) {
      options.on_file_found(entry.path());
    }
    if (entry.path().extension() == options.extension) {
      files.push_back(entry.path());
    }
  }

  std::sort(files.begin(), files.end());
  return files;
}

}  // namespace swift_grapher
