// rs_outline/outline/name_extractor.hpp - Display names for syntax nodes
//
// Name extraction is a pluggable strategy so that a grammar-aware extractor
// can replace the text heuristic without touching the normalizer.
//
#pragma once

#include <string>
#include <string_view>

namespace rs_outline
{

/**
 * Result of extracting a display name.
 */
struct NameResult
{
  /// Extracted name (only valid if success == true)
  std::string name;

  bool success = false;

  /// Reason for failure (NameExtractionFailed)
  std::string error;

  static NameResult ok(std::string n)
  {
    NameResult r;
    r.name = std::move(n);
    r.success = true;
    return r;
  }

  static NameResult fail(std::string msg)
  {
    NameResult r;
    r.error = std::move(msg);
    return r;
  }
};

/**
 * Strategy interface: derive a short display name from a node's kind label and
 * its exact source text.
 */
class NameExtractor
{
public:
  NameExtractor() = default;
  NameExtractor(const NameExtractor &) = delete;
  NameExtractor & operator=(const NameExtractor &) = delete;
  virtual ~NameExtractor() = default;

  [[nodiscard]] virtual NameResult extract(std::string_view kind, std::string_view text) const = 0;
};

/**
 * Text heuristic for Rust declarations.
 *
 * Kinds containing "identifier" or "item" are named after the first word left
 * once the characters `{ } ( ) : # [ ]` and the substrings `fn`, `struct`,
 * `enum`, `pub` are blanked out. This is plain substring replacement, so an
 * identifier containing one of the keywords is cut (`pubkey` becomes `key`).
 * Every other node is named after its kind.
 */
class HeuristicNameExtractor final : public NameExtractor
{
public:
  [[nodiscard]] NameResult extract(std::string_view kind, std::string_view text) const override;

  /// True when names for this kind are taken from the node text.
  [[nodiscard]] static bool names_declaration(std::string_view kind) noexcept;

  /// Blank out the stripped punctuation and keywords (exposed for tests).
  [[nodiscard]] static std::string strip_tokens(std::string_view text);
};

}  // namespace rs_outline
