#include <gtest/gtest.h>

#include <algorithm>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

#include "swift_grapher/driver/source_finder.hpp"

using namespace swift_grapher;
namespace fs = std::filesystem;

namespace
{

fs::path make_temp_dir(std::string_view prefix)
{
  const auto now = std::chrono::steady_clock::now().time_since_epoch().count();
  const fs::path dir = fs::temp_directory_path() / (std::string(prefix) + "_" + std::to_string(now));
  fs::create_directories(dir);
  return dir;
}

void touch(const fs::path & p)
{
  fs::create_directories(p.parent_path());
  std::ofstream out(p);
  out << "// " << p.filename().string() << "\n";
}

}  // namespace

TEST(DriverSourceFinder, CollectsSwiftFilesRecursivelySorted)
{
  const fs::path dir = make_temp_dir("sg_finder_sorted");
  touch(dir / "b.swift");
  touch(dir / "a.swift");
  touch(dir / "Sources" / "Core" / "c.swift");
  touch(dir / "README.md");
  touch(dir / "notes.swift.txt");

  DiagnosticBag diags;
  const auto files = find_source_files(dir, SourceFinderOptions{}, diags);

  EXPECT_TRUE(diags.empty());
  ASSERT_EQ(files.size(), 3u);
  EXPECT_TRUE(std::is_sorted(files.begin(), files.end()));
  EXPECT_EQ(files[0], dir / "Sources" / "Core" / "c.swift");
  EXPECT_EQ(files[1], dir / "a.swift");
  EXPECT_EQ(files[2], dir / "b.swift");

  fs::remove_all(dir);
}

TEST(DriverSourceFinder, SkipsExcludedDirectories)
{
  const fs::path dir = make_temp_dir("sg_finder_excluded");
  touch(dir / "App.swift");
  touch(dir / ".build" / "checkouts" / "Dep.swift");
  touch(dir / "Pods" / "Lib" / "Pod.swift");
  touch(dir / "DerivedData" / "Gen.swift");

  DiagnosticBag diags;
  const auto files = find_source_files(dir, SourceFinderOptions{}, diags);

  ASSERT_EQ(files.size(), 1u);
  EXPECT_EQ(files[0], dir / "App.swift");

  SourceFinderOptions keep_all;
  keep_all.excluded_directories.clear();
  EXPECT_EQ(find_source_files(dir, keep_all, diags).size(), 4u);

  fs::remove_all(dir);
}

TEST(DriverSourceFinder, ReportsEveryRegularFile)
{
  const fs::path dir = make_temp_dir("sg_finder_callback");
  touch(dir / "a.swift");
  touch(dir / "b.json");

  std::vector<fs::path> seen;
  SourceFinderOptions opts;
  opts.on_file_found = [&seen](const fs::path & p) { seen.push_back(p); };

  DiagnosticBag diags;
  const auto files = find_source_files(dir, opts, diags);
  EXPECT_EQ(files.size(), 1u);
  EXPECT_EQ(seen.size(), 2u);

  fs::remove_all(dir);
}

TEST(DriverSourceFinder, MissingRootIsBadRoot)
{
  const fs::path dir = make_temp_dir("sg_finder_missing");
  DiagnosticBag diags;
  const auto files = find_source_files(dir / "does_not_exist", SourceFinderOptions{}, diags);

  EXPECT_TRUE(files.empty());
  EXPECT_TRUE(diags.has_code(diag_code::k_bad_root));

  touch(dir / "file.swift");
  DiagnosticBag file_diags;
  EXPECT_TRUE(find_source_files(dir / "file.swift", SourceFinderOptions{}, file_diags).empty());
  EXPECT_TRUE(file_diags.has_code(diag_code::k_bad_root));

  fs::remove_all(dir);
}

TEST(DriverSourceFinder, EmptyDirectoryYieldsNoFiles)
{
  const fs::path dir = make_temp_dir("sg_finder_empty");
  DiagnosticBag diags;
  EXPECT_TRUE(find_source_files(dir, SourceFinderOptions{}, diags).empty());
  EXPECT_TRUE(diags.empty());
  fs::remove_all(dir);
}
