// rs_outline/driver/converter.hpp - Source file to outline document
//
// Single entry point for the conversion pipeline:
//   read -> tree-sitter parse -> normalize -> serialize -> write
// Used by the control session and the one-shot CLI mode.
//
#pragma once

#include <filesystem>
#include <memory>
#include <optional>
#include <string>

#include "rs_outline/basic/diagnostic.hpp"
#include "rs_outline/basic/source_manager.hpp"
#include "rs_outline/outline/name_extractor.hpp"
#include "rs_outline/outline/outline.hpp"
#include "rs_outline/project/outline_config.hpp"
#include "rs_outline/syntax/ts_ll.hpp"

namespace rs_outline
{

// ============================================================================
// Conversion Errors
// ============================================================================

/**
 * Whole-file failures. Node-local failures never reach this level.
 */
enum class ConversionErrorKind {
  InputUnavailable,      ///< Missing, unreadable or not UTF-8
  ParseFailed,           ///< tree-sitter returned no tree
  RootExtractionFailed,  ///< The root anchor could not be normalized
  OutputWriteFailed,     ///< The document could not be written
};

[[nodiscard]] const char * to_string(ConversionErrorKind kind) noexcept;

struct ConversionError
{
  ConversionErrorKind kind = ConversionErrorKind::InputUnavailable;
  std::string message;
};

// ============================================================================
// Conversion Options / Result
// ============================================================================

struct ConvertOptions
{
  /// Report tree-sitter error nodes through parsingErrorsDetected
  bool detect_parse_errors = true;

  /// JSON indentation
  int indent = 2;

  /// Output content written for a failed conversion
  std::string failure_placeholder = "{}";

  [[nodiscard]] static ConvertOptions from_config(const OutlineConfig & config);
};

struct ConversionResult
{
  /// Present on success
  std::optional<OutlineFile> outline;

  /// Present on failure
  std::optional<ConversionError> error;

  /// Syntax problems found while parsing (never fatal)
  DiagnosticBag diagnostics;

  /// The parsed text, kept for printing diagnostics; null if the read failed
  std::unique_ptr<SourceManager> source;

  [[nodiscard]] bool success() const noexcept { return outline.has_value(); }
};

// ============================================================================
// Converter
// ============================================================================

/**
 * Converts Rust source files to outline documents.
 *
 * Each call is independent: the parser is reused, but no tree or text
 * outlives the call that produced it.
 */
class Converter
{
public:
  /// Throws std::runtime_error if the tree-sitter parser cannot be set up.
  explicit Converter(ConvertOptions options = {});

  Converter(const Converter &) = delete;
  Converter & operator=(const Converter &) = delete;

  /**
   * Convert in-memory text.
   *
   * @param display_path Stored verbatim as the outline's name
   */
  [[nodiscard]] ConversionResult convert_source(std::string display_path, std::string text) const;

  /// Read `input` and convert it. The outline is named by `input` as given.
  [[nodiscard]] ConversionResult convert_file(const std::filesystem::path & input) const;

  /**
   * Convert `input` and write the document to `output`.
   *
   * Any previous content of `output` is replaced. When the conversion fails,
   * the failure placeholder is written instead.
   */
  [[nodiscard]] ConversionResult convert_to(
    const std::filesystem::path & input, const std::filesystem::path & output) const;

  [[nodiscard]] const ConvertOptions & options() const noexcept { return options_; }

private:
  ConvertOptions options_;
  ts_ll::Parser parser_;
  HeuristicNameExtractor names_;
};

/**
 * Whole-file HumanSpan: (1, 0) to (last line, length of last line).
 * An empty file spans (1, 0) to (1, 0).
 */
[[nodiscard]] HumanSpan whole_file_span(const SourceManager & source) noexcept;

}  // namespace rs_outline
