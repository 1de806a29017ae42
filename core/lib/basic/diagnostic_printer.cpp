// authzgen/basic/diagnostic_printer.cpp - Rust-style diagnostic output
//
// Uses fmt for formatting and rang for terminal colors.
//
#include "authzgen/basic/diagnostic_printer.hpp"

#include <fmt/core.h>
#include <fmt/ostream.h>

#include <algorithm>
#include <filesystem>
#include <ostream>
#include <rang.hpp>
#include <string>
#include <vector>

namespace authzgen
{

namespace
{

std::string_view severity_name(Severity s)
{
  switch (s) {
    case Severity::Error:
      return "error";
    case Severity::Warning:
      return "warning";
  }
  return "error";
}

std::string expand_tabs(std::string_view line)
{
  std::string out;
  out.reserve(line.size());
  for (const char c : line) {
    if (c == '\t') {
      out += "    ";
    } else if (c != '\r' && c != '\n') {
      out += c;
    }
  }
  return out;
}

}  // namespace

DiagnosticPrinter::DiagnosticPrinter(std::ostream & os, bool use_color)
: os_(os), use_color_(use_color)
{
  if (!use_color_) {
    rang::setControlMode(rang::control::Off);
  }
}

void DiagnosticPrinter::print(const Diagnostic & diag, const SourceRegistry & sources)
{
  const SourceRange primary_range = diag.primary_range();
  const FullSourceRange primary_fr = sources.get_full_range(primary_range);

  print_severity_header(diag);

  if (primary_fr.is_valid()) {
    fmt::print(
      os_, "{} {}:{}:{}\n", gutter_arrow(), display_path(sources, primary_range.file_id()),
      primary_fr.start_line, primary_fr.start_column);
    fmt::print(os_, "{}\n", gutter_pipe());
  }

  for (const auto & label : diag.labels) {
    print_label_context(label, sources);
  }
  if (diag.help_message) {
    print_trailer("help", *diag.help_message);
  }

  fmt::print(os_, "\n");
}

void DiagnosticPrinter::print_all(const DiagnosticBag & diags, const SourceRegistry & sources)
{
  std::vector<Diagnostic> sorted_diags(diags.begin(), diags.end());
  std::stable_sort(
    sorted_diags.begin(), sorted_diags.end(), [](const Diagnostic & a, const Diagnostic & b) {
      return a.primary_range().get_begin() < b.primary_range().get_begin();
    });

  for (const auto & d : sorted_diags) {
    print(d, sources);
  }
}

// =============================================================================
// Private helpers
// =============================================================================

void DiagnosticPrinter::print_severity_header(const Diagnostic & diag)
{
  const std::string_view name = severity_name(diag.severity);
  const std::string code = diag.code.empty() ? std::string() : fmt::format("[{}]", diag.code);

  if (!use_color_) {
    fmt::print(os_, "{}{}: {}\n", name, code, diag.message);
    return;
  }

  os_ << rang::style::bold;
  switch (diag.severity) {
    case Severity::Error:
      os_ << rang::fg::red;
      break;
    case Severity::Warning:
      os_ << rang::fg::yellow;
      break;
  }
  os_ << name << code << rang::fg::reset << ": " << diag.message << rang::style::reset << "\n";
}

void DiagnosticPrinter::print_label_context(const Label & label, const SourceRegistry & sources)
{
  const SourceFile * source = sources.get_file(label.range.file_id());
  const FullSourceRange fr = sources.get_full_range(label.range);
  if (source == nullptr || !fr.is_valid()) {
    if (!label.message.empty()) {
      print_trailer("note", label.message);
    }
    return;
  }

  // Multi-line spans are underlined on their first line only.
  const uint32_t end_col = (fr.end_line == fr.start_line && fr.end_column > fr.start_column)
                             ? fr.end_column
                             : (fr.start_column + 1);

  print_source_line(
    *source, fr.start_line - 1, fr.start_column, end_col, label.style, label.message);
}

void DiagnosticPrinter::print_source_line(
  const SourceFile & source, uint32_t line_index, uint32_t start_col, uint32_t end_col,
  LabelStyle style, std::string_view label_message)
{
  const std::string_view line = source.get_line(line_index);
  const std::string cleaned_line = expand_tabs(line);

  if (use_color_) {
    os_ << rang::fg::cyan;
    fmt::print(os_, " {:>4} ", line_index + 1);
    os_ << rang::fg::reset << rang::style::bold << "| " << rang::style::reset;
  } else {
    fmt::print(os_, " {:>4} | ", line_index + 1);
  }
  fmt::print(os_, "{}\n", cleaned_line);

  std::string marker_prefix;
  for (size_t i = 0; i + 1 < start_col && i < line.size(); ++i) {
    marker_prefix += (line[i] == '\t') ? "    " : " ";
  }
  const size_t marker_len = std::max<uint32_t>(end_col - start_col, 1);
  const char marker_char = (style == LabelStyle::Primary) ? '^' : '-';

  fmt::print(os_, "{} {}", gutter_pipe(), marker_prefix);
  if (use_color_) {
    os_ << (style == LabelStyle::Primary ? rang::fg::red : rang::fg::cyan) << rang::style::bold;
  }
  fmt::print(os_, "{}", std::string(marker_len, marker_char));
  if (!label_message.empty()) {
    fmt::print(os_, " {}", label_message);
  }
  if (use_color_) {
    os_ << rang::style::reset << rang::fg::reset;
  }
  fmt::print(os_, "\n");
}

void DiagnosticPrinter::print_trailer(std::string_view kind, std::string_view message)
{
  fmt::print(os_, "{}\n", gutter_pipe());
  if (use_color_) {
    os_ << rang::fg::cyan << rang::style::bold << "      = " << rang::style::reset
        << rang::fg::reset;
    fmt::print(os_, "{}: {}\n", kind, message);
  } else {
    fmt::print(os_, "      = {}: {}\n", kind, message);
  }
}

std::string DiagnosticPrinter::display_path(const SourceRegistry & sources, FileId id) const
{
  if (!id.is_valid()) {
    return "<unknown>";
  }
  const fs::path & abs_path = sources.get_path(id);
  std::error_code ec;
  const fs::path rel_path = fs::relative(abs_path, fs::current_path(ec), ec);
  return (ec || rel_path.empty()) ? abs_path.string() : rel_path.string();
}

std::string DiagnosticPrinter::gutter_arrow() const
{
  return use_color_ ? std::string("\033[1;36m  -->\033[0m") : std::string("  -->");
}

std::string DiagnosticPrinter::gutter_pipe() const
{
  return use_color_ ? std::string("\033[1;36m      |\033[0m") : std::string("      |");
}

}  // namespace authzgen
