// rs_outline/outline/name_extractor.cpp - Heuristic name extraction
#include "rs_outline/outline/name_extractor.hpp"

#include <array>

namespace rs_outline
{

namespace
{

// Replaced in this order; order matters for overlapping keywords.
constexpr std::array<std::string_view, 12> k_stripped_tokens = {
  "{", "}", "(", ")", ":", "#", "[", "]", "fn", "struct", "enum", "pub",
};

bool is_space(char c)
{
  return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\v' || c == '\f';
}

void replace_all(std::string & s, std::string_view from, std::string_view to)
{
  size_t pos = 0;
  while ((pos = s.find(from, pos)) != std::string::npos) {
    s.replace(pos, from.size(), to);
    pos += to.size();
  }
}

std::string_view first_word(std::string_view s)
{
  size_t begin = 0;
  while (begin < s.size() && is_space(s[begin])) ++begin;
  size_t end = begin;
  while (end < s.size() && !is_space(s[end])) ++end;
  return s.substr(begin, end - begin);
}

}  // namespace

bool HeuristicNameExtractor::names_declaration(std::string_view kind) noexcept
{
  return kind.find("identifier") != std::string_view::npos ||
         kind.find("item") != std::string_view::npos;
}

std::string HeuristicNameExtractor::strip_tokens(std::string_view text)
{
  std::string out(text);
  for (const auto token : k_stripped_tokens) {
    replace_all(out, token, " ");
  }
  return out;
}

NameResult HeuristicNameExtractor::extract(std::string_view kind, std::string_view text) const
{
  if (!names_declaration(kind)) {
    return NameResult::ok(std::string(kind));
  }

  const std::string stripped = strip_tokens(text);
  const std::string_view word = first_word(stripped);
  if (word.empty()) {
    return NameResult::fail("no name left in '" + std::string(kind) + "' node text");
  }
  return NameResult::ok(std::string(word));
}

}  // namespace rs_outline
