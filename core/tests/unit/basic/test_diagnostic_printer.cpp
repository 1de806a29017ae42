// test_diagnostic_printer.cpp - Plain-text rendering of diagnostics
//
#include <gtest/gtest.h>

#include <sstream>
#include <string>

#include "authzgen/basic/diagnostic_printer.hpp"

namespace authzgen
{

TEST(DiagnosticPrinterTest, PrintsHeaderSourceLineAndHelp)
{
  SourceRegistry sources;
  const FileId id = sources.register_file("<printer>.zed", "definition doc {\n  relation owner user\n}\n");

  DiagnosticBag diags;
  // "user" on line 2
  diags.report_error(SourceRange{id, 34, 38}, "expected ':' after relation name 'owner'", "here")
    .with_code("E1001")
    .with_help("relations are declared as `relation <name>: <type>`");

  std::ostringstream out;
  DiagnosticPrinter printer(out, false);
  printer.print_all(diags, sources);

  const std::string text = out.str();
  EXPECT_NE(text.find("error[E1001]: expected ':' after relation name 'owner'"), std::string::npos);
  EXPECT_NE(text.find(":2:18"), std::string::npos);
  EXPECT_NE(text.find("    2 |   relation owner user"), std::string::npos);
  EXPECT_NE(text.find("^^^^ here"), std::string::npos);
  EXPECT_NE(text.find("= help: relations are declared"), std::string::npos);
}

TEST(DiagnosticPrinterTest, DiagnosticWithoutLocationPrintsNoteForLabel)
{
  SourceRegistry sources;
  DiagnosticBag diags;
  diags.report_warning(SourceRange{}, "generated source could not be formatted", "unbalanced")
    .with_code("W3002");

  std::ostringstream out;
  DiagnosticPrinter printer(out, false);
  printer.print_all(diags, sources);

  const std::string text = out.str();
  EXPECT_NE(text.find("warning[W3002]: generated source could not be formatted"), std::string::npos);
  EXPECT_NE(text.find("= note: unbalanced"), std::string::npos);
  EXPECT_EQ(text.find("-->"), std::string::npos);
}

TEST(DiagnosticPrinterTest, SortsByLocation)
{
  SourceRegistry sources;
  const FileId id = sources.register_file("<order>.zed", "aaa\nbbb\n");

  DiagnosticBag diags;
  diags.report_error(SourceRange{id, 4, 7}, "second");
  diags.report_error(SourceRange{id, 0, 3}, "first");

  std::ostringstream out;
  DiagnosticPrinter printer(out, false);
  printer.print_all(diags, sources);

  const std::string text = out.str();
  EXPECT_LT(text.find("first"), text.find("second"));
}

TEST(DiagnosticPrinterTest, LabelsPointIntoTheirOwnFiles)
{
  SourceRegistry sources;
  const FileId a = sources.register_file("a.zed", "definition user {}\n");
  const FileId b = sources.register_file("b.zed", "\ndefinition user {}\n");

  DiagnosticBag diags;
  diags.report_error(SourceRange{b, 12, 16}, "duplicate definition 'user'", "redefined here")
    .with_code("E2001")
    .with_secondary_label(SourceRange{a, 11, 15}, "first defined here");
  diags.report_error(SourceRange{a, 0, 10}, "earlier file");

  std::ostringstream out;
  DiagnosticPrinter printer(out, false);
  printer.print_all(diags, sources);

  const std::string text = out.str();
  EXPECT_LT(text.find("earlier file"), text.find("duplicate definition"));
  EXPECT_NE(text.find("b.zed:2:12"), std::string::npos);
  EXPECT_NE(text.find("first defined here"), std::string::npos);
  EXPECT_EQ(text.find("b.zed:1:"), std::string::npos);
}

}  // namespace authzgen
