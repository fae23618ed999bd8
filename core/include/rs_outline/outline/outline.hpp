// rs_outline/outline/outline.hpp - Normalized outline tree
//
// An outline is built bottom-up once per source file and never mutated
// afterwards. Each vertex is either a Container (has children) or a
// Terminal (leaf).
//
#pragma once

#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "rs_outline/outline/span_converter.hpp"

namespace rs_outline
{

struct OutlineNode;

/**
 * Node with at least one surviving child.
 *
 * `header_span` covers the node's own bytes. `footer_span` is reserved for
 * nodes split into several regions and is always ByteSpan::unset() today.
 */
struct Container
{
  std::string kind;
  std::string name;
  HumanSpan location_span;
  ByteSpan header_span;
  ByteSpan footer_span = ByteSpan::unset();
  std::vector<OutlineNode> children;
};

struct Terminal
{
  std::string kind;
  std::string name;
  HumanSpan location_span;
  ByteSpan span;
};

/**
 * Tagged union of the two vertex shapes.
 *
 * The JSON form carries no discriminant: a Container is recognised by its
 * "children" field. Adding an optional "children" field to Terminal would
 * break reading.
 */
struct OutlineNode
{
  std::variant<Container, Terminal> value;

  OutlineNode(Container c) : value(std::move(c)) {}  // NOLINT(google-explicit-constructor)
  OutlineNode(Terminal t) : value(std::move(t)) {}   // NOLINT(google-explicit-constructor)

  [[nodiscard]] bool is_container() const noexcept
  {
    return std::holds_alternative<Container>(value);
  }
  [[nodiscard]] bool is_terminal() const noexcept
  {
    return std::holds_alternative<Terminal>(value);
  }

  [[nodiscard]] const Container * as_container() const noexcept
  {
    return std::get_if<Container>(&value);
  }
  [[nodiscard]] const Terminal * as_terminal() const noexcept
  {
    return std::get_if<Terminal>(&value);
  }

  [[nodiscard]] const std::string & kind() const noexcept
  {
    return std::visit([](const auto & n) -> const std::string & { return n.kind; }, value);
  }
  [[nodiscard]] const std::string & name() const noexcept
  {
    return std::visit([](const auto & n) -> const std::string & { return n.name; }, value);
  }
  [[nodiscard]] const HumanSpan & location_span() const noexcept
  {
    return std::visit(
      [](const auto & n) -> const HumanSpan & { return n.location_span; }, value);
  }
};

/// Whole-file parse failure detail (location + message).
struct ParsingError
{
  HumanSpan location;
  std::string message;
};

/**
 * Root record for one converted source file.
 *
 * `children` are the top-level named children of the parser's root node;
 * the root itself is never emitted.
 */
struct OutlineFile
{
  std::string kind = "file";
  std::string name;  ///< file path as supplied by the driver
  HumanSpan location_span;
  ByteSpan footer_span = ByteSpan::unset();
  bool parsing_errors_detected = false;
  std::vector<OutlineNode> children;
  std::optional<ParsingError> parsing_error;
};

}  // namespace rs_outline
