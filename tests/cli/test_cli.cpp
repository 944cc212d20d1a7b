// test_cli.cpp - CLI integration tests for swift-grapher

#include <gtest/gtest.h>

#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>

#if defined(__unix__) || defined(__APPLE__)
#include <sys/wait.h>
#endif

namespace fs = std::filesystem;

namespace
{

std::string read_all(const fs::path & p)
{
  std::ifstream in(p);
  std::stringstream ss;
  ss << in.rdbuf();
  return ss.str();
}

void write_all(const fs::path & p, const std::string & s)
{
  fs::create_directories(p.parent_path());
  std::ofstream out(p);
  ASSERT_TRUE(out.is_open()) << "Failed to open file for writing: " << p.string();
  out << s;
}

fs::path make_temp_dir(std::string_view prefix)
{
  const auto base = fs::temp_directory_path();
  const auto now = std::chrono::steady_clock::now().time_since_epoch().count();
  const fs::path dir = base / (std::string(prefix) + "_" + std::to_string(now));
  fs::create_directories(dir);
  return dir;
}

std::string shell_quote(const std::string & s)
{
  // POSIX shell single-quote escaping.
  std::string out;
  out.reserve(s.size() + 2);
  out.push_back('\'');
  for (char c : s) {
    if (c == '\'') {
      out += "'\\''";
    } else {
      out.push_back(c);
    }
  }
  out.push_back('\'');
  return out;
}

struct CliRun
{
  int exit_code = 0;
  std::string output;
};

// Runs the CLI from `cwd` and captures stderr+stdout.
CliRun run_cli(const fs::path & cwd, const std::string & args)
{
  CliRun run;
#ifndef SWIFT_GRAPHER_CLI_PATH
  (void)cwd;
  (void)args;
#else
  const fs::path log = cwd / "cli_output.log";
  const std::string cmd = "cd " + shell_quote(cwd.string()) + " && " +
                          shell_quote(SWIFT_GRAPHER_CLI_PATH) + " " + args + " > " +
                          shell_quote(log.string()) + " 2>&1";

  const int rc = std::system(cmd.c_str());
  run.output = read_all(log);
  fs::remove(log);

#if defined(__unix__) || defined(__APPLE__)
  if (rc == -1) {
    run.exit_code = 127;
  } else if (WIFEXITED(rc)) {
    run.exit_code = WEXITSTATUS(rc);
  } else {
    run.exit_code = 128;
  }
#else
  // Best-effort fallback.
  run.exit_code = rc;
#endif
#endif
  return run;
}

}  // namespace

TEST(CliTest, MissingArgumentPrintsUsage)
{
#ifndef SWIFT_GRAPHER_CLI_PATH
  GTEST_SKIP() << "SWIFT_GRAPHER_CLI_PATH is not configured (swift-grapher target missing?)";
#endif
  const fs::path dir = make_temp_dir("sg_cli_noargs");

  const CliRun run = run_cli(dir, "");
  EXPECT_EQ(run.exit_code, 1);
  EXPECT_NE(run.output.find("Usage:"), std::string::npos) << run.output;
  EXPECT_FALSE(fs::exists(dir / "codegraph.json"));

  fs::remove_all(dir);
}

TEST(CliTest, HelpExitsZero)
{
#ifndef SWIFT_GRAPHER_CLI_PATH
  GTEST_SKIP() << "SWIFT_GRAPHER_CLI_PATH is not configured (swift-grapher target missing?)";
#endif
  const fs::path dir = make_temp_dir("sg_cli_help");
  const CliRun run = run_cli(dir, "--help");
  EXPECT_EQ(run.exit_code, 0);
  EXPECT_NE(run.output.find("--merge-duplicates"), std::string::npos) << run.output;
  fs::remove_all(dir);
}

TEST(CliTest, WritesGraphToWorkingDirectory)
{
#ifndef SWIFT_GRAPHER_CLI_PATH
  GTEST_SKIP() << "SWIFT_GRAPHER_CLI_PATH is not configured (swift-grapher target missing?)";
#endif
  const fs::path cwd = make_temp_dir("sg_cli_cwd");
  const fs::path project = make_temp_dir("sg_cli_project");
  write_all(project / "Player.swift", R"(
class Player: NSObject, Playable {
  var volume: Float = 1.0
  func play(at time: Double) -> Bool {
    return engine.start(time)
  }
}
)");

  const CliRun run = run_cli(cwd, shell_quote(project.string()));
  EXPECT_EQ(run.exit_code, 0) << run.output;
  EXPECT_NE(run.output.find("Wrote codegraph.json to:"), std::string::npos) << run.output;

  const std::string json = read_all(cwd / "codegraph.json");
  EXPECT_NE(json.find("\"Player\""), std::string::npos) << json;
  EXPECT_NE(json.find("\"inheritedTypes\""), std::string::npos);
  EXPECT_NE(json.find("\"engine.start\""), std::string::npos);
  EXPECT_FALSE(fs::exists(project / "codegraph.json"));

  fs::remove_all(cwd);
  fs::remove_all(project);
}

TEST(CliTest, OutputOptionOverridesLocation)
{
#ifndef SWIFT_GRAPHER_CLI_PATH
  GTEST_SKIP() << "SWIFT_GRAPHER_CLI_PATH is not configured (swift-grapher target missing?)";
#endif
  const fs::path dir = make_temp_dir("sg_cli_output");
  write_all(dir / "src" / "A.swift", "struct A {}\n");

  const fs::path out = dir / "graph.json";
  const CliRun run =
    run_cli(dir, shell_quote((dir / "src").string()) + " -o " + shell_quote(out.string()));
  EXPECT_EQ(run.exit_code, 0) << run.output;
  EXPECT_TRUE(fs::exists(out));
  EXPECT_FALSE(fs::exists(dir / "codegraph.json"));

  fs::remove_all(dir);
}

TEST(CliTest, NoSwiftFilesExitsZeroWithoutOutput)
{
#ifndef SWIFT_GRAPHER_CLI_PATH
  GTEST_SKIP() << "SWIFT_GRAPHER_CLI_PATH is not configured (swift-grapher target missing?)";
#endif
  const fs::path cwd = make_temp_dir("sg_cli_none_cwd");
  const fs::path project = make_temp_dir("sg_cli_none");
  write_all(project / "README.md", "nothing\n");

  const CliRun run = run_cli(cwd, shell_quote(project.string()));
  EXPECT_EQ(run.exit_code, 0) << run.output;
  EXPECT_NE(run.output.find("No .swift files found"), std::string::npos) << run.output;
  EXPECT_FALSE(fs::exists(cwd / "codegraph.json"));

  fs::remove_all(cwd);
  fs::remove_all(project);
}

TEST(CliTest, MissingProjectDirectoryFails)
{
#ifndef SWIFT_GRAPHER_CLI_PATH
  GTEST_SKIP() << "SWIFT_GRAPHER_CLI_PATH is not configured (swift-grapher target missing?)";
#endif
  const fs::path dir = make_temp_dir("sg_cli_badroot");

  const CliRun run = run_cli(dir, shell_quote((dir / "missing").string()));
  EXPECT_EQ(run.exit_code, 1);
  EXPECT_NE(run.output.find("E002"), std::string::npos) << run.output;

  fs::remove_all(dir);
}

TEST(CliTest, InvalidConfigFails)
{
#ifndef SWIFT_GRAPHER_CLI_PATH
  GTEST_SKIP() << "SWIFT_GRAPHER_CLI_PATH is not configured (swift-grapher target missing?)";
#endif
  const fs::path dir = make_temp_dir("sg_cli_config");
  write_all(dir / "A.swift", "class A {}\n");
  write_all(dir / "swift-grapher.yaml", "extraction:\n  duplicates: sometimes\n");

  const CliRun run = run_cli(dir, shell_quote(dir.string()));
  EXPECT_EQ(run.exit_code, 1);
  EXPECT_NE(run.output.find("E007"), std::string::npos) << run.output;

  fs::remove_all(dir);
}

TEST(CliTest, ProjectConfigSelectsProjectRootOutput)
{
#ifndef SWIFT_GRAPHER_CLI_PATH
  GTEST_SKIP() << "SWIFT_GRAPHER_CLI_PATH is not configured (swift-grapher target missing?)";
#endif
  const fs::path cwd = make_temp_dir("sg_cli_cfg_cwd");
  const fs::path project = make_temp_dir("sg_cli_cfg_project");
  write_all(project / "A.swift", "class A {}\n");
  write_all(project / "swift-grapher.yaml", "output:\n  location: project\n  indent: -1\n");

  const CliRun run = run_cli(cwd, shell_quote(project.string()));
  EXPECT_EQ(run.exit_code, 0) << run.output;
  ASSERT_TRUE(fs::exists(project / "codegraph.json"));
  // indent -1 writes one line plus the trailing newline.
  const std::string json = read_all(project / "codegraph.json");
  EXPECT_EQ(json.find('\n'), json.size() - 1);
  EXPECT_FALSE(fs::exists(cwd / "codegraph.json"));

  fs::remove_all(cwd);
  fs::remove_all(project);
}

TEST(CliTest, StrictSyntaxSkipsBrokenFileButWritesGraph)
{
#ifndef SWIFT_GRAPHER_CLI_PATH
  GTEST_SKIP() << "SWIFT_GRAPHER_CLI_PATH is not configured (swift-grapher target missing?)";
#endif
  const fs::path dir = make_temp_dir("sg_cli_strict");
  write_all(dir / "src" / "Good.swift", "class Good {}\n");
  write_all(dir / "src" / "Bad.swift", "class Bad {\n  func f( {\n}\n");

  const CliRun run = run_cli(dir, shell_quote((dir / "src").string()) + " --strict-syntax");
  EXPECT_EQ(run.exit_code, 1);
  EXPECT_NE(run.output.find("W001"), std::string::npos) << run.output;
  ASSERT_TRUE(fs::exists(dir / "codegraph.json"));
  EXPECT_NE(read_all(dir / "codegraph.json").find("\"Good\""), std::string::npos);

  const CliRun fail_fast =
    run_cli(dir, shell_quote((dir / "src").string()) + " --strict-syntax --fail-fast -o out.json");
  EXPECT_EQ(fail_fast.exit_code, 1);
  EXPECT_FALSE(fs::exists(dir / "out.json"));

  fs::remove_all(dir);
}
