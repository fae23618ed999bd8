// rs_outline/project/outline_config.cpp - Tool configuration implementation
//
#include "rs_outline/project/outline_config.hpp"

#include <yaml-cpp/yaml.h>

namespace rs_outline
{

namespace
{

std::optional<std::string> apply_config(const YAML::Node & root, OutlineConfig & config)
{
  if (!root || root.IsNull()) {
    return std::nullopt;
  }
  if (!root.IsMap()) {
    return "top level must be a map";
  }

  // 'session' section
  if (const auto session = root["session"]) {
    if (!session.IsMap()) return "session must be a map";
    if (session["log_file"]) {
      config.session.log_file = session["log_file"].as<std::string>();
    }
    if (session["ready_marker"]) {
      config.session.ready_marker = session["ready_marker"].as<std::string>();
    }
    if (session["end_sentinel"]) {
      config.session.end_sentinel = session["end_sentinel"].as<std::string>();
      if (config.session.end_sentinel.empty()) {
        return "session.end_sentinel must not be empty";
      }
    }
  }

  // 'output' section
  if (const auto output = root["output"]) {
    if (!output.IsMap()) return "output must be a map";
    if (output["indent"]) {
      config.output.indent = output["indent"].as<int>();
      if (config.output.indent < 0 || config.output.indent > 16) {
        return "output.indent must be between 0 and 16";
      }
    }
    if (output["failure_placeholder"]) {
      config.output.failure_placeholder = output["failure_placeholder"].as<std::string>();
    }
  }

  // 'parser' section
  if (const auto parser = root["parser"]) {
    if (!parser.IsMap()) return "parser must be a map";
    if (parser["detect_parse_errors"]) {
      config.parser.detect_parse_errors = parser["detect_parse_errors"].as<bool>();
    }
  }

  return std::nullopt;
}

ConfigLoadResult load_from_node(const YAML::Node & root, OutlineConfig config)
{
  try {
    if (auto error = apply_config(root, config)) {
      return ConfigLoadResult::fail("invalid configuration: " + *error);
    }
  } catch (const YAML::Exception & e) {
    return ConfigLoadResult::fail("invalid configuration value: " + std::string(e.what()));
  }
  return ConfigLoadResult::ok(std::move(config));
}

}  // namespace

ConfigLoadResult parse_outline_config(const std::string & yaml_text)
{
  YAML::Node root;
  try {
    root = YAML::Load(yaml_text);
  } catch (const YAML::Exception & e) {
    return ConfigLoadResult::fail("failed to parse YAML: " + std::string(e.what()));
  }
  return load_from_node(root, OutlineConfig{});
}

ConfigLoadResult load_outline_config(const std::filesystem::path & config_path)
{
  namespace fs = std::filesystem;

  if (!fs::exists(config_path)) {
    return ConfigLoadResult::fail("configuration file not found: " + config_path.string());
  }

  YAML::Node root;
  try {
    root = YAML::LoadFile(config_path.string());
  } catch (const YAML::Exception & e) {
    return ConfigLoadResult::fail("failed to parse YAML: " + std::string(e.what()));
  }

  OutlineConfig config;
  config.config_root = fs::absolute(config_path).parent_path();

  auto result = load_from_node(root, std::move(config));
  if (result.success && !result.config.session.log_file.empty() &&
      result.config.session.log_file.is_relative()) {
    result.config.session.log_file = result.config.config_root / result.config.session.log_file;
  }
  return result;
}

std::optional<std::filesystem::path> find_outline_config(const std::filesystem::path & start_dir)
{
  namespace fs = std::filesystem;

  fs::path current = fs::absolute(start_dir);

  if (fs::is_regular_file(current)) {
    current = current.parent_path();
  }

  while (true) {
    fs::path candidate = current / k_outline_config_file_name;
    if (fs::exists(candidate)) {
      return candidate;
    }

    const fs::path parent = current.parent_path();
    if (parent == current) {
      break;
    }
    current = parent;
  }

  return std::nullopt;
}

}  // namespace rs_outline
