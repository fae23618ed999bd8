// rs_outline/driver/file_io.hpp - Whole-file read/write helpers
#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace rs_outline
{

/**
 * Read a regular file into memory.
 *
 * @param error Receives a message when std::nullopt is returned
 */
[[nodiscard]] std::optional<std::string> read_text_file(
  const std::filesystem::path & path, std::string & error);

/**
 * Replace the content of `path` with `content` (truncating first).
 *
 * @param error Receives a message when false is returned
 */
[[nodiscard]] bool write_text_file(
  const std::filesystem::path & path, std::string_view content, std::string & error);

}  // namespace rs_outline
