// rs-outline - Rust source outline generator
//
// Usage:
//   rs-outline shell <flag-file> [--config outline.yaml] [--log path]
//   rs-outline parse <file.rs> [-o output.json] [--config outline.yaml]
//
#include <fmt/core.h>
#include <fmt/format.h>
#include <fmt/ostream.h>
#include <fmt/ranges.h>

#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include <unistd.h>

#include "rs_outline/basic/diagnostic_printer.hpp"
#include "rs_outline/driver/converter.hpp"
#include "rs_outline/driver/file_io.hpp"
#include "rs_outline/driver/session.hpp"
#include "rs_outline/outline/json_serializer.hpp"
#include "rs_outline/project/outline_config.hpp"

namespace fs = std::filesystem;

namespace
{

// ============================================================================
// Output Formatting
// ============================================================================

void print_usage(const char * program_name)
{
  std::cerr << "rs-outline v0.1.0\n\n"
            << "Usage: " << program_name << " <command> [options]\n\n"
            << "Commands:\n"
            << "  shell <flag-file>        Serve conversion requests on stdin\n"
            << "  parse <file.rs>          Convert one file\n\n"
            << "Options:\n"
            << "  -o, --output <path>      Output file for 'parse' (default: stdout)\n"
            << "  --config <path>          Configuration file (default: nearest outline.yaml)\n"
            << "  --log <path>             Session log file (overrides configuration)\n"
            << "  -h, --help               Show this help message\n";
}

// ============================================================================
// Argument Parsing
// ============================================================================

struct CommandArgs
{
  std::string command;
  std::string target;  // flag file (shell) or source file (parse)
  std::string output_path;
  std::string config_path;
  std::string log_path;
  bool show_help = false;
  std::vector<std::string> raw;
};

CommandArgs parse_args(int argc, char * argv[])
{
  CommandArgs args;
  for (int i = 0; i < argc; ++i) {
    args.raw.emplace_back(argv[i]);
  }

  if (argc < 2) {
    args.show_help = true;
    return args;
  }

  args.command = argv[1];

  if (args.command == "-h" || args.command == "--help") {
    args.show_help = true;
    return args;
  }

  for (int i = 2; i < argc; ++i) {
    const std::string arg = argv[i];

    if (arg == "-o" || arg == "--output") {
      if (i + 1 < argc) {
        args.output_path = argv[++i];
      }
    } else if (arg == "--config") {
      if (i + 1 < argc) {
        args.config_path = argv[++i];
      }
    } else if (arg == "--log") {
      if (i + 1 < argc) {
        args.log_path = argv[++i];
      }
    } else if (arg == "-h" || arg == "--help") {
      args.show_help = true;
    } else if (arg[0] != '-' && args.target.empty()) {
      args.target = arg;
    }
  }

  return args;
}

bool load_config(const CommandArgs & args, rs_outline::OutlineConfig & config)
{
  std::optional<fs::path> config_path;
  if (!args.config_path.empty()) {
    config_path = args.config_path;
  } else {
    config_path = rs_outline::find_outline_config(fs::current_path());
  }

  if (config_path) {
    auto loaded = rs_outline::load_outline_config(*config_path);
    if (!loaded.success) {
      std::cerr << "error: " << loaded.error << "\n";
      return false;
    }
    config = std::move(loaded.config);
  }

  if (!args.log_path.empty()) {
    config.session.log_file = args.log_path;
  }
  return true;
}

// ============================================================================
// Commands
// ============================================================================

int cmd_shell(const CommandArgs & args, const rs_outline::OutlineConfig & config)
{
  if (args.target.empty()) {
    std::cerr << "error: shell requires a flag file\n";
    return 1;
  }

  std::unique_ptr<std::ofstream> log_file;
  std::ostream * log = &std::cerr;
  if (!config.session.log_file.empty()) {
    log_file = std::make_unique<std::ofstream>(config.session.log_file, std::ios::trunc);
    if (!log_file->is_open()) {
      std::cerr << "error: cannot open log file: " << config.session.log_file.string() << "\n";
      return 1;
    }
    log = log_file.get();
  }

  fmt::print(*log, "{}\n", fmt::join(args.raw, " "));

  const rs_outline::Converter converter(rs_outline::ConvertOptions::from_config(config));

  std::string error;
  if (!rs_outline::write_text_file(args.target, config.session.ready_marker, error)) {
    std::cerr << "error: " << error << "\n";
    return 1;
  }

  const bool colors = log_file == nullptr && isatty(fileno(stderr)) != 0;
  rs_outline::Session session(converter, *log, config.session.end_sentinel, colors);
  session.run(std::cin, std::cout);
  return 0;
}

int cmd_parse(const CommandArgs & args, const rs_outline::OutlineConfig & config)
{
  if (args.target.empty()) {
    std::cerr << "error: parse requires a source file\n";
    return 1;
  }

  const rs_outline::Converter converter(rs_outline::ConvertOptions::from_config(config));
  const rs_outline::ConversionResult result = converter.convert_file(args.target);

  if (!result.diagnostics.empty() && result.source) {
    rs_outline::DiagnosticPrinter printer(std::cerr, isatty(fileno(stderr)) != 0);
    printer.print_all(result.diagnostics, *result.source);
  }

  if (!result.success()) {
    std::cerr << "error: " << rs_outline::to_string(result.error->kind) << ": "
              << result.error->message << "\n";
    return 1;
  }

  const std::string document =
    rs_outline::serialize_outline(*result.outline, converter.options().indent);
  if (args.output_path.empty()) {
    std::cout << document << "\n";
    return 0;
  }

  std::string error;
  if (!rs_outline::write_text_file(args.output_path, document, error)) {
    std::cerr << "error: "
              << rs_outline::to_string(rs_outline::ConversionErrorKind::OutputWriteFailed) << ": "
              << error << "\n";
    return 1;
  }
  return 0;
}

}  // namespace

int main(int argc, char * argv[])
{
  const CommandArgs args = parse_args(argc, argv);

  if (args.show_help) {
    print_usage(argv[0]);
    return 0;
  }

  rs_outline::OutlineConfig config;
  if (!load_config(args, config)) {
    return 1;
  }

  try {
    if (args.command == "shell") {
      return cmd_shell(args, config);
    }
    if (args.command == "parse") {
      return cmd_parse(args, config);
    }
  } catch (const std::runtime_error & e) {
    std::cerr << "error: " << e.what() << "\n";
    return 1;
  }

  std::cerr << "error: unknown command '" << args.command << "'\n\n";
  print_usage(argv[0]);
  return 1;
}
