// rs_outline/driver/session.hpp - Line-oriented control session
//
// Protocol (one request = three lines on the input stream):
//
//   <source path>     a line equal to the end sentinel closes the session
//   <encoding>        recorded only; sources are read as UTF-8
//   <output path>
//
// For every request one line is answered, in request order: "OK" when the
// outline was written, "KO" otherwise.
//
#pragma once

#include <cstddef>
#include <iosfwd>
#include <optional>
#include <string>
#include <string_view>

#include "rs_outline/driver/converter.hpp"

namespace rs_outline
{

inline constexpr std::string_view k_reply_ok = "OK";
inline constexpr std::string_view k_reply_failed = "KO";

struct ConversionRequest
{
  std::string input_path;
  std::string encoding;
  std::string output_path;
};

/**
 * First whitespace-delimited token of a protocol line ("" for a blank line).
 */
[[nodiscard]] std::string first_token(std::string_view line);

/**
 * Runs requests against a Converter until the end sentinel or end of input.
 */
class Session
{
public:
  /**
   * @param converter Conversion pipeline shared by all requests
   * @param log Session log stream (progress lines and syntax diagnostics)
   * @param end_sentinel Source-path line that ends the session
   * @param log_colors Colorize diagnostics written to the log
   */
  Session(
    const Converter & converter, std::ostream & log, std::string end_sentinel = "end",
    bool log_colors = false);

  /**
   * Read the next request.
   *
   * @return std::nullopt at the end sentinel or end of input
   */
  [[nodiscard]] std::optional<ConversionRequest> read_request(std::istream & in) const;

  /// Convert one request and write its reply line.
  void handle(const ConversionRequest & request, std::ostream & out);

  /// Serve requests until the session ends. Returns the number of requests.
  size_t run(std::istream & in, std::ostream & out);

  [[nodiscard]] size_t succeeded() const noexcept { return succeeded_; }
  [[nodiscard]] size_t failed() const noexcept { return failed_; }

private:
  [[nodiscard]] bool is_end_sentinel(std::string_view line) const;

  const Converter & converter_;
  std::ostream & log_;
  std::string end_sentinel_;
  bool log_colors_;
  size_t succeeded_ = 0;
  size_t failed_ = 0;
};

}  // namespace rs_outline
