// test_outline_config.cpp - Unit tests for outline.yaml loading
#include <gtest/gtest.h>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <string>

#include "rs_outline/project/outline_config.hpp"

namespace fs = std::filesystem;

namespace rs_outline
{

namespace
{

fs::path make_temp_dir(std::string_view prefix)
{
  const auto base = fs::temp_directory_path();
  const auto now = std::chrono::steady_clock::now().time_since_epoch().count();
  const fs::path dir = base / (std::string(prefix) + "_" + std::to_string(now));
  fs::create_directories(dir);
  return dir;
}

void write_all(const fs::path & p, const std::string & s)
{
  std::ofstream out(p);
  ASSERT_TRUE(out.is_open()) << "Failed to open file for writing: " << p.string();
  out << s;
}

}  // namespace

TEST(OutlineConfig, EmptyDocumentKeepsDefaults)
{
  const auto r = parse_outline_config("");
  ASSERT_TRUE(r.success) << r.error;
  EXPECT_EQ(r.config.session.ready_marker, "READY");
  EXPECT_EQ(r.config.session.end_sentinel, "end");
  EXPECT_TRUE(r.config.session.log_file.empty());
  EXPECT_EQ(r.config.output.indent, 2);
  EXPECT_EQ(r.config.output.failure_placeholder, "{}");
  EXPECT_TRUE(r.config.parser.detect_parse_errors);
}

TEST(OutlineConfig, AllSections)
{
  const auto r = parse_outline_config(R"(
session:
  log_file: outline.log
  ready_marker: hello
  end_sentinel: quit
output:
  indent: 4
  failure_placeholder: dum
parser:
  detect_parse_errors: false
)");
  ASSERT_TRUE(r.success) << r.error;
  EXPECT_EQ(r.config.session.log_file, fs::path("outline.log"));
  EXPECT_EQ(r.config.session.ready_marker, "hello");
  EXPECT_EQ(r.config.session.end_sentinel, "quit");
  EXPECT_EQ(r.config.output.indent, 4);
  EXPECT_EQ(r.config.output.failure_placeholder, "dum");
  EXPECT_FALSE(r.config.parser.detect_parse_errors);
}

TEST(OutlineConfig, RejectsInvalidValues)
{
  EXPECT_FALSE(parse_outline_config("output:\n  indent: -1\n").success);
  EXPECT_FALSE(parse_outline_config("output:\n  indent: wide\n").success);
  EXPECT_FALSE(parse_outline_config("session: [1, 2]\n").success);
  EXPECT_FALSE(parse_outline_config("session:\n  end_sentinel: ''\n").success);
  EXPECT_FALSE(parse_outline_config("parser:\n  detect_parse_errors: maybe\n").success);
  EXPECT_FALSE(parse_outline_config("- just\n- a list\n").success);
  EXPECT_FALSE(parse_outline_config("key: [unclosed\n").success);
}

TEST(OutlineConfig, LoadFileResolvesLogRelativeToConfig)
{
  const fs::path dir = make_temp_dir("rs_outline_cfg");
  write_all(dir / "outline.yaml", "session:\n  log_file: logs/session.log\n");

  const auto r = load_outline_config(dir / "outline.yaml");
  ASSERT_TRUE(r.success) << r.error;
  EXPECT_EQ(r.config.config_root, fs::absolute(dir));
  EXPECT_EQ(r.config.session.log_file, fs::absolute(dir) / "logs/session.log");

  fs::remove_all(dir);
}

TEST(OutlineConfig, MissingFileFails)
{
  const auto r = load_outline_config("/nonexistent/dir/outline.yaml");
  EXPECT_FALSE(r.success);
  EXPECT_NE(r.error.find("not found"), std::string::npos);
}

TEST(OutlineConfig, FindSearchesParents)
{
  const fs::path dir = make_temp_dir("rs_outline_find");
  fs::create_directories(dir / "a" / "b");
  write_all(dir / "outline.yaml", "");

  const auto found = find_outline_config(dir / "a" / "b");
  ASSERT_TRUE(found.has_value());
  EXPECT_EQ(fs::canonical(*found), fs::canonical(dir / "outline.yaml"));

  fs::remove_all(dir);
}

}  // namespace rs_outline
