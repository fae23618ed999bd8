// rs_outline/driver/session.cpp - Control session implementation
#include "rs_outline/driver/session.hpp"

#include <fmt/core.h>
#include <fmt/ostream.h>

#include <istream>
#include <ostream>
#include <utility>

#include "rs_outline/basic/diagnostic_printer.hpp"

namespace rs_outline
{

namespace
{

bool is_space(char c)
{
  return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\v' || c == '\f';
}

std::string_view trim(std::string_view s)
{
  while (!s.empty() && is_space(s.front())) s.remove_prefix(1);
  while (!s.empty() && is_space(s.back())) s.remove_suffix(1);
  return s;
}

}  // namespace

std::string first_token(std::string_view line)
{
  const std::string_view t = trim(line);
  size_t end = 0;
  while (end < t.size() && !is_space(t[end])) ++end;
  return std::string(t.substr(0, end));
}

Session::Session(
  const Converter & converter, std::ostream & log, std::string end_sentinel, bool log_colors)
: converter_(converter), log_(log), end_sentinel_(std::move(end_sentinel)), log_colors_(log_colors)
{
}

bool Session::is_end_sentinel(std::string_view line) const { return trim(line) == end_sentinel_; }

std::optional<ConversionRequest> Session::read_request(std::istream & in) const
{
  std::string line;
  if (!std::getline(in, line) || is_end_sentinel(line)) {
    return std::nullopt;
  }

  ConversionRequest request;
  request.input_path = first_token(line);

  // A truncated request still gets an answer; missing lines stay empty.
  if (std::getline(in, line)) {
    request.encoding = first_token(line);
    if (std::getline(in, line)) {
      request.output_path = first_token(line);
    }
  }
  return request;
}

void Session::handle(const ConversionRequest & request, std::ostream & out)
{
  fmt::print(log_, ":: {} -> {}\n", request.input_path, request.output_path);

  bool ok = false;
  if (request.output_path.empty()) {
    fmt::print(
      log_, "KO {}: no output path given\n", to_string(ConversionErrorKind::OutputWriteFailed));
  } else {
    const ConversionResult result = converter_.convert_to(request.input_path, request.output_path);

    if (!result.diagnostics.empty() && result.source) {
      DiagnosticPrinter printer(log_, log_colors_);
      printer.print_all(result.diagnostics, *result.source);
    }

    if (result.success()) {
      ok = true;
    } else {
      fmt::print(log_, "KO {}: {}\n", to_string(result.error->kind), result.error->message);
    }
  }

  if (ok) {
    ++succeeded_;
  } else {
    ++failed_;
  }
  out << (ok ? k_reply_ok : k_reply_failed) << '\n';
  out.flush();
}

size_t Session::run(std::istream & in, std::ostream & out)
{
  size_t handled = 0;
  while (auto request = read_request(in)) {
    handle(*request, out);
    ++handled;
  }
  fmt::print(log_, "Done...\n");
  log_.flush();
  return handled;
}

}  // namespace rs_outline
