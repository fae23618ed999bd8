// rs_outline/driver/file_io.cpp - Whole-file read/write helpers
#include "rs_outline/driver/file_io.hpp"

#include <cerrno>
#include <cstring>
#include <fstream>
#include <sstream>

namespace rs_outline
{

std::optional<std::string> read_text_file(const std::filesystem::path & path, std::string & error)
{
  namespace fs = std::filesystem;

  std::error_code ec;
  if (!fs::is_regular_file(path, ec)) {
    error = "not a readable file: " + path.string();
    return std::nullopt;
  }

  std::ifstream in(path, std::ios::in | std::ios::binary);
  if (!in.is_open()) {
    error = "cannot open " + path.string() + ": " + std::strerror(errno);
    return std::nullopt;
  }

  std::ostringstream ss;
  ss << in.rdbuf();
  if (in.bad()) {
    error = "read error on " + path.string();
    return std::nullopt;
  }
  return ss.str();
}

bool write_text_file(
  const std::filesystem::path & path, std::string_view content, std::string & error)
{
  std::ofstream out(path, std::ios::out | std::ios::trunc | std::ios::binary);
  if (!out.is_open()) {
    error = "cannot open " + path.string() + " for writing: " + std::strerror(errno);
    return false;
  }

  out.write(content.data(), static_cast<std::streamsize>(content.size()));
  out.flush();
  if (!out) {
    error = "write error on " + path.string();
    return false;
  }
  return true;
}

}  // namespace rs_outline
