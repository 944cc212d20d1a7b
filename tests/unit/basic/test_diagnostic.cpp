#include <gtest/gtest.h>

#include <sstream>
#include <string>

#include "swift_grapher/basic/diagnostic.hpp"
#include "swift_grapher/basic/diagnostic_printer.hpp"
#include "swift_grapher/basic/source_manager.hpp"

using namespace swift_grapher;

TEST(BasicDiagnostic, BuilderRegistersOnScopeExit)
{
  DiagnosticBag bag;
  {
    auto builder = bag.report_error({}, "cannot read file");
    builder.with_code(diag_code::k_read_failure).with_path("a.swift").with_help("check permissions");
    EXPECT_TRUE(bag.empty());
  }
  ASSERT_EQ(bag.size(), 1u);

  const Diagnostic & d = bag.all().front();
  EXPECT_EQ(d.severity, Severity::Error);
  EXPECT_EQ(d.code, "E003");
  EXPECT_EQ(d.message, "cannot read file");
  ASSERT_TRUE(d.path.has_value());
  EXPECT_EQ(d.path->string(), "a.swift");
  ASSERT_TRUE(d.help.has_value());
  EXPECT_EQ(*d.help, "check permissions");
  EXPECT_FALSE(d.is_located());
  EXPECT_TRUE(d.label.empty());
}

TEST(BasicDiagnostic, SeverityQueries)
{
  DiagnosticBag bag;
  bag.report_warning({}, "recovered").with_code(diag_code::k_syntax);
  EXPECT_FALSE(bag.has_errors());
  EXPECT_TRUE(bag.has_warnings());
  EXPECT_TRUE(bag.has_code("W001"));
  EXPECT_FALSE(bag.has_code("E004"));

  bag.report_error({}, "failed").with_code(diag_code::k_parse_failure);
  bag.report_note({}, "note");
  EXPECT_TRUE(bag.has_errors());
  EXPECT_EQ(bag.count(Severity::Error), 1u);
  EXPECT_EQ(bag.count(Severity::Warning), 1u);
  EXPECT_EQ(bag.count(Severity::Note), 1u);
  EXPECT_EQ(bag.size(), 3u);
}

TEST(BasicDiagnostic, MergeAppendsInOrder)
{
  DiagnosticBag a;
  DiagnosticBag b;
  a.report_warning({}, "first");
  b.report_error({}, "second");
  b.report_error({}, "third");

  a.merge(std::move(b));
  ASSERT_EQ(a.size(), 3u);
  EXPECT_EQ(a.all()[0].message, "first");
  EXPECT_EQ(a.all()[1].message, "second");
  EXPECT_EQ(a.all()[2].message, "third");
}

TEST(BasicDiagnostic, WithLabelLocatesTheDiagnostic)
{
  DiagnosticBag bag;
  bag.report_error({}, "msg").with_label(SourceRange(FileId{0}, 5, 9), "there");

  const Diagnostic & d = bag.all().front();
  EXPECT_TRUE(d.is_located());
  EXPECT_EQ(d.range.get_begin().offset(), 5u);
  EXPECT_EQ(d.label, "there");
}

TEST(BasicDiagnosticPrinter, PrintsHeaderLocationAndSourceLine)
{
  SourceRegistry sources;
  const FileId id = sources.register_file("/tmp/sg_printer/a.swift", "class A {\n  func f( {\n}\n");

  DiagnosticBag bag;
  bag.report_warning(SourceRange(id, 20, 21), "syntax error recovered", "unexpected token")
    .with_code(diag_code::k_syntax);

  std::ostringstream os;
  DiagnosticPrinter printer(os, /*use_color*/ false);
  printer.print_all(bag, sources);

  const std::string out = os.str();
  EXPECT_NE(out.find("warning[W001]: syntax error recovered"), std::string::npos) << out;
  EXPECT_NE(out.find("a.swift:2:11"), std::string::npos) << out;
  EXPECT_NE(out.find("func f( {"), std::string::npos) << out;
  EXPECT_NE(out.find("          ^ unexpected token"), std::string::npos) << out;
}

TEST(BasicDiagnosticPrinter, UnlocatedDiagnosticsComeFirst)
{
  SourceRegistry sources;
  const FileId id = sources.register_file("/tmp/sg_printer/b.swift", "struct S {\n  let = \n}\n");

  DiagnosticBag bag;
  bag.report_warning(SourceRange(id, 17, 18), "syntax error").with_code(diag_code::k_syntax);
  bag.report_error({}, "failed to write output file").with_code(diag_code::k_write_failure);

  std::ostringstream os;
  DiagnosticPrinter printer(os, /*use_color*/ false);
  printer.print_all(bag, sources);

  const std::string out = os.str();
  const auto write_pos = out.find("error[E006]");
  const auto syntax_pos = out.find("warning[W001]");
  ASSERT_NE(write_pos, std::string::npos) << out;
  ASSERT_NE(syntax_pos, std::string::npos) << out;
  EXPECT_LT(write_pos, syntax_pos);
  EXPECT_NE(out.find("b.swift:2:7"), std::string::npos) << out;
}

TEST(BasicDiagnosticPrinter, FallsBackToDiagnosticPath)
{
  SourceRegistry sources;
  DiagnosticBag bag;
  bag.report_error({}, "cannot read file").with_code(diag_code::k_read_failure).with_path(
    "/tmp/sg_printer/missing.swift");

  std::ostringstream os;
  DiagnosticPrinter printer(os, /*use_color*/ false);
  printer.print_all(bag, sources);

  const std::string out = os.str();
  EXPECT_NE(out.find("error[E003]: cannot read file"), std::string::npos) << out;
  EXPECT_NE(out.find("missing.swift"), std::string::npos) << out;
}
