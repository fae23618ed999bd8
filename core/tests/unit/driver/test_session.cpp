// test_session.cpp - Control protocol tests (stdin/stdout request loop)

#include <gtest/gtest.h>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>

#include "rs_outline/driver/converter.hpp"
#include "rs_outline/driver/session.hpp"
#include "rs_outline/outline/json_serializer.hpp"

namespace fs = std::filesystem;

namespace rs_outline
{

namespace
{

std::string read_all(const fs::path & p)
{
  std::ifstream in(p);
  std::stringstream ss;
  ss << in.rdbuf();
  return ss.str();
}

void write_all(const fs::path & p, const std::string & s)
{
  std::ofstream out(p);
  ASSERT_TRUE(out.is_open()) << "Failed to open file for writing: " << p.string();
  out << s;
}

fs::path make_temp_dir(std::string_view prefix)
{
  const auto base = fs::temp_directory_path();
  const auto now = std::chrono::steady_clock::now().time_since_epoch().count();
  const fs::path dir = base / (std::string(prefix) + "_" + std::to_string(now));
  fs::create_directories(dir);
  return dir;
}

}  // namespace

class SessionTest : public ::testing::Test
{
protected:
  void SetUp() override { dir_ = make_temp_dir("rs_outline_session"); }
  void TearDown() override { fs::remove_all(dir_); }

  [[nodiscard]] std::string path(const std::string & name) const { return (dir_ / name).string(); }

  fs::path dir_;
  Converter converter_;
  std::ostringstream log_;
};

TEST(FirstToken, TakesFirstWhitespaceDelimitedWord)
{
  EXPECT_EQ(first_token("  /tmp/a.rs  trailing\r"), "/tmp/a.rs");
  EXPECT_EQ(first_token("utf-8"), "utf-8");
  EXPECT_EQ(first_token("   "), "");
  EXPECT_EQ(first_token(""), "");
}

TEST_F(SessionTest, ConvertsRequestsUntilSentinel)
{
  write_all(path("a.rs"), "fn alpha() {}\n");
  write_all(path("b.rs"), "struct Beta { x: i32 }\n");

  std::istringstream in(
    path("a.rs") + "\nutf-8\n" + path("a.json") + "\n" +  //
    path("b.rs") + "\nutf-8\n" + path("b.json") + "\n" +  //
    "end\n" +                                             //
    path("never.rs") + "\nutf-8\n" + path("never.json") + "\n");
  std::ostringstream out;

  Session session(converter_, log_);
  EXPECT_EQ(session.run(in, out), 2U);
  EXPECT_EQ(out.str(), "OK\nOK\n");
  EXPECT_EQ(session.succeeded(), 2U);
  EXPECT_EQ(session.failed(), 0U);
  EXPECT_FALSE(fs::exists(path("never.json")));

  const OutlineFile a = parse_outline(read_all(path("a.json")));
  EXPECT_EQ(a.name, path("a.rs"));
  ASSERT_EQ(a.children.size(), 1U);
  EXPECT_EQ(a.children[0].kind(), "function_item");
  EXPECT_EQ(a.children[0].name(), "alpha");

  const OutlineFile b = parse_outline(read_all(path("b.json")));
  ASSERT_EQ(b.children.size(), 1U);
  EXPECT_EQ(b.children[0].name(), "Beta");

  const std::string log = log_.str();
  EXPECT_NE(log.find(":: " + path("a.rs") + " -> " + path("a.json")), std::string::npos);
  EXPECT_NE(log.find("Done..."), std::string::npos);
}

TEST_F(SessionTest, FailedRequestDoesNotAffectNextOne)
{
  write_all(path("ok.rs"), "fn ok() {}\n");
  write_all(path("missing.json"), "stale content from an earlier run");

  std::istringstream in(
    path("missing.rs") + "\nutf-8\n" + path("missing.json") + "\n" +  //
    path("ok.rs") + "\nutf-8\n" + path("ok.json") + "\n" +            //
    "end\n");
  std::ostringstream out;

  Session session(converter_, log_);
  EXPECT_EQ(session.run(in, out), 2U);
  EXPECT_EQ(out.str(), "KO\nOK\n");
  EXPECT_EQ(session.failed(), 1U);

  EXPECT_EQ(read_all(path("missing.json")), "{}");
  EXPECT_NE(log_.str().find("KO InputUnavailable"), std::string::npos);
  EXPECT_EQ(parse_outline(read_all(path("ok.json"))).children.size(), 1U);
}

TEST_F(SessionTest, SentinelMustBeTheWholeLine)
{
  write_all(path("backend.rs"), "fn serve() {}\n");

  std::istringstream in(path("backend.rs") + "\nutf-8\n" + path("backend.json") + "\n  end  \n");
  std::ostringstream out;

  Session session(converter_, log_);
  EXPECT_EQ(session.run(in, out), 1U);
  EXPECT_EQ(out.str(), "OK\n");
}

TEST_F(SessionTest, EndOfInputEndsSession)
{
  std::istringstream in("");
  std::ostringstream out;

  Session session(converter_, log_);
  EXPECT_EQ(session.run(in, out), 0U);
  EXPECT_EQ(out.str(), "");
  EXPECT_NE(log_.str().find("Done..."), std::string::npos);
}

TEST_F(SessionTest, TruncatedRequestIsAnsweredWithFailure)
{
  write_all(path("a.rs"), "fn a() {}\n");

  std::istringstream in(path("a.rs") + "\nutf-8\n");
  std::ostringstream out;

  Session session(converter_, log_);
  EXPECT_EQ(session.run(in, out), 1U);
  EXPECT_EQ(out.str(), "KO\n");
}

TEST_F(SessionTest, CustomSentinel)
{
  std::istringstream in("quit\n");
  std::ostringstream out;

  Session session(converter_, log_, "quit");
  EXPECT_EQ(session.run(in, out), 0U);
}

TEST_F(SessionTest, UnwritableOutputIsReported)
{
  write_all(path("a.rs"), "fn a() {}\n");

  const ConversionResult r = converter_.convert_to(path("a.rs"), path("no/such/dir/a.json"));
  EXPECT_FALSE(r.success());
  ASSERT_TRUE(r.error.has_value());
  EXPECT_EQ(r.error->kind, ConversionErrorKind::OutputWriteFailed);
}

TEST_F(SessionTest, NonUtf8InputIsUnavailable)
{
  write_all(path("latin1.rs"), "fn caf\xE9() {}\n");

  const ConversionResult r = converter_.convert_file(path("latin1.rs"));
  ASSERT_TRUE(r.error.has_value());
  EXPECT_EQ(r.error->kind, ConversionErrorKind::InputUnavailable);
}

TEST_F(SessionTest, DirectoryInputIsUnavailable)
{
  const ConversionResult r = converter_.convert_file(dir_);
  ASSERT_TRUE(r.error.has_value());
  EXPECT_EQ(r.error->kind, ConversionErrorKind::InputUnavailable);
}

TEST_F(SessionTest, OutputIsTruncatedBeforeWriting)
{
  write_all(path("a.rs"), "fn a() {}\n");
  write_all(path("a.json"), std::string(10000, 'x'));

  const ConversionResult r = converter_.convert_to(path("a.rs"), path("a.json"));
  ASSERT_TRUE(r.success());
  const std::string written = read_all(path("a.json"));
  EXPECT_EQ(written.find('x'), std::string::npos);
  EXPECT_EQ(parse_outline(written).children.size(), 1U);
}

TEST(ConversionErrorKind, Names)
{
  EXPECT_STREQ(to_string(ConversionErrorKind::InputUnavailable), "InputUnavailable");
  EXPECT_STREQ(to_string(ConversionErrorKind::ParseFailed), "ParseFailed");
  EXPECT_STREQ(to_string(ConversionErrorKind::RootExtractionFailed), "RootExtractionFailed");
  EXPECT_STREQ(to_string(ConversionErrorKind::OutputWriteFailed), "OutputWriteFailed");
}

}  // namespace rs_outline
