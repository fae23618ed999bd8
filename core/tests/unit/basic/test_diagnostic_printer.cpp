// test_diagnostic_printer.cpp - Unit tests for DiagnosticBag and DiagnosticPrinter
#include <gtest/gtest.h>

#include <sstream>
#include <string>

#include "rs_outline/basic/diagnostic.hpp"
#include "rs_outline/basic/diagnostic_printer.hpp"
#include "rs_outline/basic/source_manager.hpp"

namespace rs_outline
{

namespace
{

std::string render(const DiagnosticBag & diags, const SourceManager & sm)
{
  std::ostringstream os;
  DiagnosticPrinter printer(os, false);
  printer.print_all(diags, sm);
  return os.str();
}

}  // namespace

TEST(DiagnosticBag, BuilderCommitsOnDestruction)
{
  DiagnosticBag diags;
  diags.report_error({3, 4}, "syntax error", "unexpected input").with_code("S001");

  ASSERT_EQ(diags.size(), 1U);
  const Diagnostic & d = diags.all().front();
  EXPECT_EQ(d.code, "S001");
  EXPECT_EQ(d.message, "syntax error");
  EXPECT_EQ(d.label.message, "unexpected input");
  EXPECT_EQ(d.range().get_begin().get_offset(), 3U);
  EXPECT_EQ(d.range().get_end().get_offset(), 4U);
}

TEST(DiagnosticPrinter, PlainSyntaxError)
{
  const SourceManager sm("src/lib.rs", "fn main( {\n");
  DiagnosticBag diags;
  diags.report_error({8, 9}, "syntax error", "unexpected input").with_code("S001");

  EXPECT_EQ(
    render(diags, sm),
    "error[S001]: syntax error\n"
    "  --> src/lib.rs:1:9\n"
    "      |\n"
    "    1 | fn main( {\n"
    "      |         ^ unexpected input\n"
    "\n");
}

TEST(DiagnosticPrinter, MarkerCoversSingleLineRange)
{
  const SourceManager sm("a.rs", "let value = ;\n");
  DiagnosticBag diags;
  diags.report_error({4, 9}, "missing token").with_code("S002");

  const std::string out = render(diags, sm);
  EXPECT_NE(out.find("error[S002]: missing token\n"), std::string::npos);
  EXPECT_NE(out.find("      |     ^^^^^\n"), std::string::npos);
}

TEST(DiagnosticPrinter, TabsAreExpandedInSnippetAndMarker)
{
  const SourceManager sm("a.rs", "\tfoo(\n");
  DiagnosticBag diags;
  diags.report_error({4, 5}, "syntax error").with_code("S001");

  const std::string out = render(diags, sm);
  EXPECT_NE(out.find("    1 |     foo(\n"), std::string::npos);
  EXPECT_NE(out.find("      |        ^\n"), std::string::npos);
}

TEST(DiagnosticPrinter, SortsByStartOffset)
{
  const SourceManager sm("a.rs", "fn a( {\nfn b( {\n");
  DiagnosticBag diags;
  diags.report_error({12, 13}, "second").with_code("S001");
  diags.report_error({4, 5}, "first").with_code("S001");

  const std::string out = render(diags, sm);
  const auto first = out.find("error[S001]: first");
  const auto second = out.find("error[S001]: second");
  ASSERT_NE(first, std::string::npos);
  ASSERT_NE(second, std::string::npos);
  EXPECT_LT(first, second);
  EXPECT_NE(out.find("  --> a.rs:2:5\n"), std::string::npos);
}

TEST(DiagnosticPrinter, UnnamedSourceUsesPlaceholderName)
{
  const SourceManager sm("x(");
  DiagnosticBag diags;
  diags.report_error({1, 2}, "syntax error").with_code("S001");

  EXPECT_NE(render(diags, sm).find("  --> <input>:1:2\n"), std::string::npos);
}

}  // namespace rs_outline
