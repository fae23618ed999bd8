// rs_outline/project/outline_config.hpp - Tool configuration (outline.yaml)
//
// Parses and validates outline.yaml. Every key is optional; a missing file
// section keeps the defaults below.
//
#pragma once

#include <filesystem>
#include <optional>
#include <string>

namespace rs_outline
{

// ============================================================================
// Configuration Structures
// ============================================================================

/**
 * Control-session section.
 */
struct SessionConfig
{
  /// Session log file; empty logs to stderr
  std::filesystem::path log_file;

  /// Written to the flag file once the tool accepts requests
  std::string ready_marker = "READY";

  /// A source-path line equal to this text (after trimming) ends the session
  std::string end_sentinel = "end";
};

/**
 * Output document section.
 */
struct OutputConfig
{
  /// Pretty-print indentation (spaces per level)
  int indent = 2;

  /// Written to the output path when a conversion fails
  std::string failure_placeholder = "{}";
};

/**
 * Parser section.
 */
struct ParserConfig
{
  /// Set parsingErrorsDetected from tree-sitter error nodes. When false the
  /// flag is always written as false.
  bool detect_parse_errors = true;
};

/**
 * Complete tool configuration (outline.yaml).
 */
struct OutlineConfig
{
  SessionConfig session;
  OutputConfig output;
  ParserConfig parser;

  /// Directory containing outline.yaml (for resolving relative paths)
  std::filesystem::path config_root;
};

// ============================================================================
// Configuration Loading Result
// ============================================================================

/**
 * Result of loading a configuration file.
 */
struct ConfigLoadResult
{
  /// Loaded configuration (only valid if success == true)
  OutlineConfig config;

  bool success = false;

  /// Error message if loading failed
  std::string error;

  static ConfigLoadResult ok(OutlineConfig cfg)
  {
    ConfigLoadResult r;
    r.config = std::move(cfg);
    r.success = true;
    return r;
  }

  static ConfigLoadResult fail(std::string msg)
  {
    ConfigLoadResult r;
    r.error = std::move(msg);
    r.success = false;
    return r;
  }
};

// ============================================================================
// Configuration Loading API
// ============================================================================

/**
 * Load configuration from an outline.yaml file.
 *
 * A relative session.log_file is resolved against the file's directory.
 */
[[nodiscard]] ConfigLoadResult load_outline_config(const std::filesystem::path & config_path);

/**
 * Load configuration from YAML text (no file; relative paths are kept as is).
 */
[[nodiscard]] ConfigLoadResult parse_outline_config(const std::string & yaml_text);

/**
 * Find outline.yaml by searching upward from a directory.
 *
 * @return Path to outline.yaml if found, std::nullopt otherwise
 */
[[nodiscard]] std::optional<std::filesystem::path> find_outline_config(
  const std::filesystem::path & start_dir);

inline constexpr const char * k_outline_config_file_name = "outline.yaml";

}  // namespace rs_outline
