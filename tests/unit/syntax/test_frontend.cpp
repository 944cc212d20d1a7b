#include <gtest/gtest.h>

#include <string>
#include <string_view>
#include <type_traits>

#include "swift_grapher/basic/source_manager.hpp"
#include "swift_grapher/syntax/frontend.hpp"
#include "swift_grapher/syntax/swift_node_kinds.hpp"

using namespace swift_grapher;

TEST(SyntaxFrontend, ParsesValidSourceWithoutDiagnostics)
{
  SourceRegistry sources;
  const auto unit = parse_source(sources, "ok.swift", "class A: B {\n  var x: Int = 1\n}\n");

  ASSERT_TRUE(unit);
  EXPECT_TRUE(unit->ok());
  EXPECT_TRUE(unit->diags.empty());
  ASSERT_FALSE(unit->root().is_null());
  EXPECT_EQ(unit->root().kind(), "source_file");
  ASSERT_GT(unit->root().named_child_count(), 0u);
  EXPECT_EQ(unit->root().named_child(0).kind(), node_kind::k_class_declaration);
  ASSERT_NE(unit->source, nullptr);
  EXPECT_EQ(unit->source->path().string(), "ok.swift");
}

TEST(SyntaxFrontend, RecoveredSyntaxErrorIsWarning)
{
  SourceRegistry sources;
  const auto unit = parse_source(sources, "broken.swift", "class A {\n  func f( {\n}\n");

  ASSERT_TRUE(unit);
  EXPECT_FALSE(unit->tree.is_null());
  EXPECT_TRUE(unit->diags.has_code(diag_code::k_syntax));
  EXPECT_FALSE(unit->diags.has_errors());
  EXPECT_TRUE(unit->ok());
}

TEST(SyntaxFrontend, StrictSyntaxTurnsRecoveryIntoError)
{
  SourceRegistry sources;
  ParseOptions opts;
  opts.strict_syntax = true;
  const auto unit = parse_source(sources, "broken.swift", "class A {\n  func f( {\n}\n", opts);

  ASSERT_TRUE(unit);
  EXPECT_TRUE(unit->diags.has_code(diag_code::k_syntax));
  EXPECT_TRUE(unit->diags.has_errors());
  EXPECT_FALSE(unit->ok());
}

TEST(SyntaxFrontend, SyntaxDiagnosticsPointIntoTheFile)
{
  SourceRegistry sources;
  const auto unit = parse_source(sources, "broken.swift", "struct S {\n  let = \n}\n");

  ASSERT_TRUE(unit);
  ASSERT_FALSE(unit->diags.empty());
  for (const auto & d : unit->diags) {
    EXPECT_EQ(d.code, diag_code::k_syntax);
    EXPECT_EQ(d.range.file_id(), unit->file_id);
  }
}

TEST(SyntaxFrontend, UnregisteredFileIsParseFailure)
{
  const SourceRegistry sources;
  const auto unit = parse_source(sources, FileId{7});

  ASSERT_TRUE(unit);
  EXPECT_TRUE(unit->tree.is_null());
  EXPECT_TRUE(unit->diags.has_code(diag_code::k_parse_failure));
  EXPECT_FALSE(unit->ok());
}

TEST(SyntaxFrontend, EmptySourceParses)
{
  SourceRegistry sources;
  const auto unit = parse_source(sources, "empty.swift", "");

  ASSERT_TRUE(unit);
  EXPECT_TRUE(unit->ok());
  EXPECT_EQ(unit->root().named_child_count(), 0u);
}

// Parsing advances the TSParser, so it needs a mutable parser.
static_assert(
  !std::is_invocable_v<decltype(&ts_ll::Parser::parse), const ts_ll::Parser &, std::string_view>);

TEST(SyntaxFrontend, ParserCanBeReusedForSeveralSources)
{
  ts_ll::Parser parser;
  ASSERT_TRUE(parser.is_ready());

  const ts_ll::Tree first = parser.parse("struct A {}\n");
  const ts_ll::Tree second = parser.parse("class B: A {}\n");
  ASSERT_FALSE(first.is_null());
  ASSERT_FALSE(second.is_null());
  EXPECT_FALSE(first.root_node().has_error());
  EXPECT_FALSE(second.root_node().has_error());
  EXPECT_EQ(second.root_node().named_child(0).kind(), node_kind::k_class_declaration);
}
