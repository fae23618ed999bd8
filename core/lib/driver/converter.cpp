// rs_outline/driver/converter.cpp - Conversion pipeline implementation
//
#include "rs_outline/driver/converter.hpp"

#include <algorithm>
#include <utility>

#include "rs_outline/driver/file_io.hpp"
#include "rs_outline/outline/json_serializer.hpp"
#include "rs_outline/outline/tree_normalizer.hpp"

namespace rs_outline
{

namespace
{

constexpr size_t k_max_syntax_diags = 64;

void collect_syntax_diagnostics(const ts_ll::Node n, DiagnosticBag & diags, size_t & count)
{
  if (count >= k_max_syntax_diags) return;
  if (n.is_null()) return;

  if (n.is_error()) {
    diags.report_error(n.range(), "syntax error", "unexpected input").with_code("S001");
    ++count;
  } else if (n.is_missing()) {
    diags.report_error(n.range(), "missing token", "expected '" + std::string(n.kind()) + "'")
      .with_code("S002");
    ++count;
  }

  if (count >= k_max_syntax_diags) return;

  for (uint32_t i = 0; i < n.child_count(); ++i) {
    const ts_ll::Node child = n.child(i);
    if (!child.has_error()) continue;
    collect_syntax_diagnostics(child, diags, count);
    if (count >= k_max_syntax_diags) return;
  }
}

ConversionResult failure(ConversionErrorKind kind, std::string message)
{
  ConversionResult r;
  r.error = ConversionError{kind, std::move(message)};
  return r;
}

}  // namespace

const char * to_string(ConversionErrorKind kind) noexcept
{
  switch (kind) {
    case ConversionErrorKind::InputUnavailable:
      return "InputUnavailable";
    case ConversionErrorKind::ParseFailed:
      return "ParseFailed";
    case ConversionErrorKind::RootExtractionFailed:
      return "RootExtractionFailed";
    case ConversionErrorKind::OutputWriteFailed:
      return "OutputWriteFailed";
  }
  return "InputUnavailable";
}

ConvertOptions ConvertOptions::from_config(const OutlineConfig & config)
{
  ConvertOptions options;
  options.detect_parse_errors = config.parser.detect_parse_errors;
  options.indent = config.output.indent;
  options.failure_placeholder = config.output.failure_placeholder;
  return options;
}

HumanSpan whole_file_span(const SourceManager & source) noexcept
{
  const auto lines = static_cast<int32_t>(std::max<uint32_t>(source.count_text_lines(), 1));
  const auto last = static_cast<int32_t>(source.last_text_line_length());
  return {{1, 0}, {lines, last}};
}

Converter::Converter(ConvertOptions options) : options_(std::move(options)) {}

ConversionResult Converter::convert_source(std::string display_path, std::string text) const
{
  ConversionResult result;
  result.source = std::make_unique<SourceManager>(display_path, std::move(text));
  const SourceManager & source = *result.source;

  const ts_ll::Tree tree(parser_.parse_string(source.get_source()));
  if (tree.is_null()) {
    result.error =
      ConversionError{ConversionErrorKind::ParseFailed, "tree-sitter returned no tree"};
    return result;
  }

  const ts_ll::Node root = tree.root_node();
  const bool has_error = root.has_error();
  if (has_error) {
    size_t count = 0;
    collect_syntax_diagnostics(root, result.diagnostics, count);
  }

  const TreeNormalizer<ts_ll::Node> normalizer(source, names_);
  RootResult normalized = normalizer.normalize_root(root);
  if (!normalized.success) {
    result.error =
      ConversionError{ConversionErrorKind::RootExtractionFailed, std::move(normalized.message)};
    return result;
  }

  OutlineFile file;
  file.name = std::move(display_path);
  file.location_span = whole_file_span(source);
  file.parsing_errors_detected = options_.detect_parse_errors && has_error;
  file.children = std::move(normalized.children);
  result.outline = std::move(file);
  return result;
}

ConversionResult Converter::convert_file(const std::filesystem::path & input) const
{
  std::string error;
  auto text = read_text_file(input, error);
  if (!text) {
    return failure(ConversionErrorKind::InputUnavailable, std::move(error));
  }
  if (!is_valid_utf8(*text)) {
    return failure(
      ConversionErrorKind::InputUnavailable, "input is not valid UTF-8: " + input.string());
  }
  return convert_source(input.string(), std::move(*text));
}

ConversionResult Converter::convert_to(
  const std::filesystem::path & input, const std::filesystem::path & output) const
{
  ConversionResult result = convert_file(input);

  std::string error;
  if (result.success()) {
    const std::string document = serialize_outline(*result.outline, options_.indent);
    if (write_text_file(output, document, error)) {
      return result;
    }
    result.outline.reset();
    result.error = ConversionError{ConversionErrorKind::OutputWriteFailed, std::move(error)};
    return result;
  }

  if (!write_text_file(output, options_.failure_placeholder, error)) {
    result.error->message += "; placeholder not written: " + error;
  }
  return result;
}

}  // namespace rs_outline
