// rs_outline/test_support/fake_tree.hpp - In-memory raw tree for tests
//
// FakeNode offers the same accessors the normalizer uses on ts_ll::Node, so
// normalization can be exercised on hand-built trees (including shapes the
// Rust grammar never produces, such as a root that fails name extraction).
//
#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "rs_outline/basic/source_manager.hpp"
#include "rs_outline/outline/span_converter.hpp"

namespace rs_outline::test_support
{

class FakeNode
{
public:
  FakeNode(
    std::string kind, uint32_t start_byte, uint32_t end_byte, TextPoint start, TextPoint end,
    std::vector<FakeNode> children = {})
  : data_(std::make_shared<Data>(Data{
      std::move(kind), start_byte, end_byte, start, end, std::move(children)}))
  {
  }

  [[nodiscard]] std::string_view kind() const noexcept { return data_->kind; }
  [[nodiscard]] uint32_t start_byte() const noexcept { return data_->start_byte; }
  [[nodiscard]] uint32_t end_byte() const noexcept { return data_->end_byte; }
  [[nodiscard]] TextPoint start_point() const noexcept { return data_->start; }
  [[nodiscard]] TextPoint end_point() const noexcept { return data_->end; }

  [[nodiscard]] uint32_t named_child_count() const noexcept
  {
    return static_cast<uint32_t>(data_->children.size());
  }
  [[nodiscard]] FakeNode named_child(uint32_t i) const { return data_->children.at(i); }

private:
  struct Data
  {
    std::string kind;
    uint32_t start_byte;
    uint32_t end_byte;
    TextPoint start;
    TextPoint end;
    std::vector<FakeNode> children;
  };

  std::shared_ptr<const Data> data_;
};

/**
 * Builds FakeNodes over one source text, deriving row/column from offsets.
 */
class FakeTree
{
public:
  explicit FakeTree(const SourceManager & source) : source_(source) {}

  [[nodiscard]] TextPoint point_at(uint32_t offset) const
  {
    const LineColumn lc = source_.get_line_column(offset);
    return {lc.line - 1, lc.column - 1};
  }

  [[nodiscard]] FakeNode node(
    std::string kind, uint32_t start, uint32_t end, std::vector<FakeNode> children = {}) const
  {
    return {std::move(kind), start, end, point_at(start), point_at(end), std::move(children)};
  }

  /// Node spanning the first occurrence of `needle` in the source.
  [[nodiscard]] FakeNode node_for(
    std::string kind, std::string_view needle, std::vector<FakeNode> children = {}) const
  {
    const size_t pos = source_.get_source().find(needle);
    const auto start = static_cast<uint32_t>(pos == std::string_view::npos ? 0 : pos);
    const auto end = static_cast<uint32_t>(start + needle.size());
    return node(std::move(kind), start, end, std::move(children));
  }

  /// Node spanning the whole source text.
  [[nodiscard]] FakeNode root(std::string kind, std::vector<FakeNode> children = {}) const
  {
    return node(std::move(kind), 0, static_cast<uint32_t>(source_.size()), std::move(children));
  }

private:
  const SourceManager & source_;
};

}  // namespace rs_outline::test_support
