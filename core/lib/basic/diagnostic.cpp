// authzgen/basic/diagnostic.cpp - Diagnostic implementation
#include "authzgen/basic/diagnostic.hpp"

#include <algorithm>
#include <iterator>
#include <utility>

namespace authzgen
{

const Label * Diagnostic::primary_label() const noexcept
{
  const auto it = std::find_if(labels.begin(), labels.end(), [](const Label & l) {
    return l.style == LabelStyle::Primary;
  });
  if (it != labels.end()) {
    return &*it;
  }
  return labels.empty() ? nullptr : &labels.front();
}

SourceRange Diagnostic::primary_range() const noexcept
{
  const Label * l = primary_label();
  return l != nullptr ? l->range : SourceRange{};
}

// ============================================================================
// DiagnosticBuilder
// ============================================================================

DiagnosticBuilder::DiagnosticBuilder(DiagnosticBag & bag, Diagnostic diag)
: bag_(bag), diagnostic_(std::move(diag))
{
}

DiagnosticBuilder::DiagnosticBuilder(DiagnosticBuilder && other) noexcept
: bag_(other.bag_), diagnostic_(std::move(other.diagnostic_)), active_(other.active_)
{
  other.active_ = false;
}

DiagnosticBuilder::~DiagnosticBuilder()
{
  if (active_) {
    bag_.add(std::move(diagnostic_));
  }
}

DiagnosticBuilder & DiagnosticBuilder::with_code(std::string_view code)
{
  diagnostic_.code = std::string(code);
  return *this;
}

DiagnosticBuilder & DiagnosticBuilder::with_label(
  SourceRange range, std::string msg, LabelStyle style)
{
  diagnostic_.labels.push_back(Label{range, std::move(msg), style});
  return *this;
}

DiagnosticBuilder & DiagnosticBuilder::with_secondary_label(SourceRange range, std::string msg)
{
  return with_label(range, std::move(msg), LabelStyle::Secondary);
}

DiagnosticBuilder & DiagnosticBuilder::with_help(std::string help_msg)
{
  diagnostic_.help_message = std::move(help_msg);
  return *this;
}

// ============================================================================
// DiagnosticBag
// ============================================================================

DiagnosticBuilder DiagnosticBag::report(
  Severity severity, SourceRange range, std::string message, std::string label_message)
{
  Diagnostic d;
  d.severity = severity;
  d.message = std::move(message);
  d.labels.push_back(Label{range, std::move(label_message), LabelStyle::Primary});
  return {*this, std::move(d)};
}

DiagnosticBuilder DiagnosticBag::report_error(
  SourceRange range, std::string message, std::string label_message)
{
  return report(Severity::Error, range, std::move(message), std::move(label_message));
}

DiagnosticBuilder DiagnosticBag::report_warning(
  SourceRange range, std::string message, std::string label_message)
{
  return report(Severity::Warning, range, std::move(message), std::move(label_message));
}

void DiagnosticBag::add(Diagnostic && diag) { diagnostics_.push_back(std::move(diag)); }

void DiagnosticBag::add(const Diagnostic & diag) { diagnostics_.push_back(diag); }

std::vector<Diagnostic> DiagnosticBag::errors() const
{
  std::vector<Diagnostic> result;
  std::copy_if(
    diagnostics_.begin(), diagnostics_.end(), std::back_inserter(result),
    [](const Diagnostic & d) { return d.severity == Severity::Error; });
  return result;
}

bool DiagnosticBag::has_errors() const
{
  return std::any_of(diagnostics_.begin(), diagnostics_.end(), [](const Diagnostic & d) {
    return d.severity == Severity::Error;
  });
}

const Diagnostic * DiagnosticBag::find_code(std::string_view code) const
{
  const auto it = std::find_if(diagnostics_.begin(), diagnostics_.end(), [&](const Diagnostic & d) {
    return d.code == code;
  });
  return it != diagnostics_.end() ? &*it : nullptr;
}

}  // namespace authzgen
