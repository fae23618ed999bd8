// rs_outline/outline/json_serializer.hpp - JSON form of outline documents
//
// Field names and order are a wire contract with the consuming driver:
//
//   file:      type, name, locationSpan, footerSpan, parsingErrorsDetected,
//              children, parsingError
//   container: type, name, locationSpan, headerSpan, footerSpan, children
//   terminal:  type, name, locationSpan, span
//
// locationSpan is {"start": [line, column], "end": [line, column]}; byte spans
// are bare [start, end] pairs.
//
#pragma once

#include <nlohmann/json.hpp>
#include <stdexcept>
#include <string>
#include <string_view>

#include "rs_outline/outline/outline.hpp"

namespace rs_outline
{

/// Thrown when a document does not have the outline shape.
class OutlineFormatError : public std::runtime_error
{
public:
  using std::runtime_error::runtime_error;
};

/// Default pretty-print indentation.
inline constexpr int k_default_indent = 2;

[[nodiscard]] nlohmann::ordered_json to_json(const OutlineNode & node);
[[nodiscard]] nlohmann::ordered_json to_json(const OutlineFile & file);

/**
 * Serialize a file outline to pretty-printed JSON text.
 *
 * Bytes that are not valid UTF-8 (possible only in the file path) are replaced
 * with U+FFFD so the output is always readable back.
 *
 * @param indent Spaces per nesting level (0 keeps newlines, no indentation)
 */
[[nodiscard]] std::string serialize_outline(
  const OutlineFile & file, int indent = k_default_indent);

/**
 * Rebuild an outline from its JSON form.
 *
 * A node object with a "children" field is read as a Container, any other as
 * a Terminal.
 *
 * @throws OutlineFormatError on a missing or mistyped field
 */
[[nodiscard]] OutlineNode outline_node_from_json(const nlohmann::ordered_json & j);
[[nodiscard]] OutlineFile outline_file_from_json(const nlohmann::ordered_json & j);

/// Parse JSON text and rebuild the outline. Throws OutlineFormatError.
[[nodiscard]] OutlineFile parse_outline(std::string_view text);

}  // namespace rs_outline
