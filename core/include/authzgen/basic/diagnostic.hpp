// authzgen/basic/diagnostic.hpp - Diagnostic records collected during a compile
#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "authzgen/basic/source_manager.hpp"

namespace authzgen
{

// ============================================================================
// Diagnostic codes
// ============================================================================

namespace diag_code
{
inline constexpr std::string_view k_syntax = "E1001";
inline constexpr std::string_view k_duplicate_definition = "E2001";
inline constexpr std::string_view k_duplicate_member = "E2002";
inline constexpr std::string_view k_generation = "E3001";
inline constexpr std::string_view k_format_fallback = "W3002";
inline constexpr std::string_view k_io = "E4001";
inline constexpr std::string_view k_cancelled = "E5001";
inline constexpr std::string_view k_invalid_option = "E6001";
}  // namespace diag_code

// ============================================================================
// Core Structures
// ============================================================================

enum class Severity : uint8_t {
  Error,
  Warning,
};

enum class LabelStyle : uint8_t {
  Primary,    // where the problem is
  Secondary,  // related location
};

struct Label
{
  SourceRange range;
  std::string message;
  LabelStyle style = LabelStyle::Primary;
};

struct Diagnostic
{
  Severity severity = Severity::Error;
  std::string code;
  std::string message;

  std::vector<Label> labels;
  std::optional<std::string> help_message;

  [[nodiscard]] const Label * primary_label() const noexcept;
  [[nodiscard]] SourceRange primary_range() const noexcept;
};

class DiagnosticBag;

// ============================================================================
// DiagnosticBuilder
// ============================================================================

/**
 * Fluent builder that adds its diagnostic to the owning bag on destruction.
 */
class DiagnosticBuilder
{
public:
  DiagnosticBuilder(DiagnosticBag & bag, Diagnostic diag);

  DiagnosticBuilder(const DiagnosticBuilder &) = delete;
  DiagnosticBuilder & operator=(const DiagnosticBuilder &) = delete;

  DiagnosticBuilder(DiagnosticBuilder && other) noexcept;

  ~DiagnosticBuilder();

  DiagnosticBuilder & with_code(std::string_view code);

  DiagnosticBuilder & with_label(
    SourceRange range, std::string msg, LabelStyle style = LabelStyle::Primary);

  DiagnosticBuilder & with_secondary_label(SourceRange range, std::string msg);

  DiagnosticBuilder & with_help(std::string help_msg);

private:
  DiagnosticBag & bag_;
  Diagnostic diagnostic_;
  bool active_ = true;
};

// ============================================================================
// DiagnosticBag
// ============================================================================

class DiagnosticBag
{
public:
  DiagnosticBag() = default;

  DiagnosticBuilder report_error(
    SourceRange range, std::string message, std::string label_message = "");
  DiagnosticBuilder report_warning(
    SourceRange range, std::string message, std::string label_message = "");

  void add(Diagnostic && diag);
  void add(const Diagnostic & diag);

  [[nodiscard]] const std::vector<Diagnostic> & all() const { return diagnostics_; }
  [[nodiscard]] bool empty() const { return diagnostics_.empty(); }
  [[nodiscard]] size_t size() const { return diagnostics_.size(); }

  [[nodiscard]] std::vector<Diagnostic> errors() const;
  [[nodiscard]] bool has_errors() const;

  /// First diagnostic carrying the given code, or nullptr.
  [[nodiscard]] const Diagnostic * find_code(std::string_view code) const;

  [[nodiscard]] auto begin() const { return diagnostics_.begin(); }
  [[nodiscard]] auto end() const { return diagnostics_.end(); }

private:
  DiagnosticBuilder report(
    Severity severity, SourceRange range, std::string message, std::string label_message);

  std::vector<Diagnostic> diagnostics_;
};

}  // namespace authzgen
