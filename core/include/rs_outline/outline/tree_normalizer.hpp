// rs_outline/outline/tree_normalizer.hpp - Raw parse tree to outline tree
//
// The normalizer is written against the node interface shared by
// ts_ll::Node and the in-memory test tree:
//
//   std::string_view kind() const;
//   uint32_t named_child_count() const;
//   Node named_child(uint32_t i) const;
//   uint32_t start_byte() const;  uint32_t end_byte() const;
//   TextPoint start_point() const;  TextPoint end_point() const;
//
#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "rs_outline/basic/source_manager.hpp"
#include "rs_outline/outline/name_extractor.hpp"
#include "rs_outline/outline/outline.hpp"
#include "rs_outline/outline/span_converter.hpp"

namespace rs_outline
{

enum class NormalizeError {
  NodeExtractionFailed,  ///< Node-local; the parent drops the subtree
  RootExtractionFailed,  ///< The root anchor itself failed; fatal for the file
};

[[nodiscard]] const char * to_string(NormalizeError e) noexcept;

/**
 * Result of normalizing one raw node.
 */
struct NodeResult
{
  std::optional<OutlineNode> node;
  NormalizeError error = NormalizeError::NodeExtractionFailed;
  std::string message;

  [[nodiscard]] bool success() const noexcept { return node.has_value(); }

  static NodeResult ok(OutlineNode n)
  {
    NodeResult r;
    r.node = std::move(n);
    return r;
  }

  static NodeResult fail(NormalizeError e, std::string msg)
  {
    NodeResult r;
    r.error = e;
    r.message = std::move(msg);
    return r;
  }
};

/**
 * Children of the root anchor, or RootExtractionFailed.
 */
struct RootResult
{
  std::vector<OutlineNode> children;
  bool success = false;
  std::string message;
};

/**
 * Keep the successful results in order and discard the failures.
 *
 * @param dropped If non-null, receives the number of discarded results
 */
[[nodiscard]] std::vector<OutlineNode> collect_children(
  std::vector<NodeResult> && results, size_t * dropped = nullptr);

/**
 * Node text for name extraction: the byte-range slice, or an empty string when
 * the range falls outside the text or the bytes are not valid UTF-8.
 */
[[nodiscard]] std::string_view node_text(const SourceManager & source, SourceRange range) noexcept;

/**
 * Recursive walk from a raw parse tree to OutlineNodes.
 *
 * Classification: a node with no named children becomes a Terminal; any other
 * node becomes a Container of its normalized named children. A Container whose
 * children all fail is itself reported as failed, so the parent drops it.
 */
template <typename NodeT>
class TreeNormalizer
{
public:
  TreeNormalizer(const SourceManager & source, const NameExtractor & names)
  : source_(source), names_(names)
  {
  }

  [[nodiscard]] NodeResult normalize(const NodeT & node) const
  {
    const std::string_view kind = node.kind();
    const SourceRange range(node.start_byte(), node.end_byte());

    NameResult name = names_.extract(kind, node_text(source_, range));
    if (!name.success) {
      return NodeResult::fail(NormalizeError::NodeExtractionFailed, std::move(name.error));
    }

    const HumanSpan location = to_human_span(node.start_point(), node.end_point());
    const ByteSpan bytes = to_byte_span(node.start_byte(), node.end_byte());

    const uint32_t count = node.named_child_count();
    if (count == 0) {
      return NodeResult::ok(Terminal{std::string(kind), std::move(name.name), location, bytes});
    }

    std::vector<OutlineNode> children = collect_children(normalize_children(node));
    if (children.empty()) {
      return NodeResult::fail(
        NormalizeError::NodeExtractionFailed,
        "every child of '" + std::string(kind) + "' failed extraction");
    }

    return NodeResult::ok(Container{
      std::string(kind), std::move(name.name), location, bytes, ByteSpan::unset(),
      std::move(children)});
  }

  /**
   * Normalize the root anchor and return its children.
   *
   * The root is never emitted. An empty root (no named children) or a root
   * whose children all failed yields an empty child list; only a failure to
   * name the root itself is fatal.
   */
  [[nodiscard]] RootResult normalize_root(const NodeT & root) const
  {
    RootResult out;
    const SourceRange range(root.start_byte(), root.end_byte());
    const NameResult name = names_.extract(root.kind(), node_text(source_, range));
    if (!name.success) {
      out.message =
        std::string(to_string(NormalizeError::RootExtractionFailed)) + ": " + name.error;
      return out;
    }

    out.children = collect_children(normalize_children(root));
    out.success = true;
    return out;
  }

private:
  [[nodiscard]] std::vector<NodeResult> normalize_children(const NodeT & node) const
  {
    const uint32_t count = node.named_child_count();
    std::vector<NodeResult> results;
    results.reserve(count);
    for (uint32_t i = 0; i < count; ++i) {
      results.push_back(normalize(node.named_child(i)));
    }
    return results;
  }

  const SourceManager & source_;
  const NameExtractor & names_;
};

}  // namespace rs_outline
