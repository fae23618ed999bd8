// rs_outline/basic/diagnostic.hpp - Diagnostic types for parse problems
#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "rs_outline/basic/source_manager.hpp"

namespace rs_outline
{

// ============================================================================
// Core Structures
// ============================================================================

/**
 * Source snippet a diagnostic points at.
 */
struct Label
{
  SourceRange range;
  std::string message;
};

/**
 * One syntax problem. Every diagnostic is an error; none of them is fatal to
 * the conversion.
 */
struct Diagnostic
{
  std::string code;  // e.g., "S001"
  std::string message;
  Label label;

  [[nodiscard]] SourceRange range() const noexcept { return label.range; }
};

class DiagnosticBag;

// ============================================================================
// DiagnosticBuilder
// ============================================================================

/**
 * Builds a diagnostic fluently and commits it to the bag on destruction (RAII).
 */
class DiagnosticBuilder
{
public:
  DiagnosticBuilder(DiagnosticBag & bag, Diagnostic diag);

  DiagnosticBuilder(const DiagnosticBuilder &) = delete;
  DiagnosticBuilder & operator=(const DiagnosticBuilder &) = delete;

  DiagnosticBuilder(DiagnosticBuilder && other) noexcept;

  ~DiagnosticBuilder();

  DiagnosticBuilder & with_code(std::string code);

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

  void add(Diagnostic && diag);

  [[nodiscard]] const std::vector<Diagnostic> & all() const { return diagnostics_; }
  [[nodiscard]] bool empty() const { return diagnostics_.empty(); }
  [[nodiscard]] size_t size() const { return diagnostics_.size(); }

  [[nodiscard]] auto begin() const { return diagnostics_.begin(); }
  [[nodiscard]] auto end() const { return diagnostics_.end(); }

private:
  std::vector<Diagnostic> diagnostics_;
};

}  // namespace rs_outline
