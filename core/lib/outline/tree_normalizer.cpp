// rs_outline/outline/tree_normalizer.cpp - Non-template normalizer helpers
#include "rs_outline/outline/tree_normalizer.hpp"

namespace rs_outline
{

const char * to_string(NormalizeError e) noexcept
{
  switch (e) {
    case NormalizeError::NodeExtractionFailed:
      return "NodeExtractionFailed";
    case NormalizeError::RootExtractionFailed:
      return "RootExtractionFailed";
  }
  return "NodeExtractionFailed";
}

std::vector<OutlineNode> collect_children(std::vector<NodeResult> && results, size_t * dropped)
{
  std::vector<OutlineNode> kept;
  kept.reserve(results.size());
  size_t failures = 0;
  for (auto & r : results) {
    if (r.success()) {
      kept.push_back(std::move(*r.node));
    } else {
      ++failures;
    }
  }
  if (dropped != nullptr) {
    *dropped = failures;
  }
  return kept;
}

std::string_view node_text(const SourceManager & source, SourceRange range) noexcept
{
  const std::string_view text = source.get_source_slice(range);
  if (!is_valid_utf8(text)) {
    return {};
  }
  return text;
}

}  // namespace rs_outline
