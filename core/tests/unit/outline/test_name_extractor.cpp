// test_name_extractor.cpp - Unit tests for heuristic name extraction
#include <gtest/gtest.h>

#include "rs_outline/outline/name_extractor.hpp"

namespace rs_outline
{

class NameExtractorTest : public ::testing::Test
{
protected:
  HeuristicNameExtractor names;
};

TEST_F(NameExtractorTest, FunctionSignature)
{
  const NameResult r = names.extract("identifier", "fn foo(x: i32)");
  ASSERT_TRUE(r.success) << r.error;
  EXPECT_EQ(r.name, "foo");
}

TEST_F(NameExtractorTest, PunctuationOnlyFails)
{
  const NameResult r = names.extract("identifier", "##");
  EXPECT_FALSE(r.success);
  EXPECT_FALSE(r.error.empty());
}

TEST_F(NameExtractorTest, EmptyTextFails)
{
  EXPECT_FALSE(names.extract("function_item", "").success);
  EXPECT_FALSE(names.extract("identifier", " \t\n").success);
}

TEST_F(NameExtractorTest, KeywordOnlyIdentifierFails)
{
  EXPECT_FALSE(names.extract("identifier", "fnstruct").success);
}

TEST_F(NameExtractorTest, ItemKinds)
{
  EXPECT_EQ(names.extract("struct_item", "pub struct Point { x: i32 }").name, "Point");
  EXPECT_EQ(names.extract("enum_item", "enum Color { Red, Green }").name, "Color");
  EXPECT_EQ(names.extract("function_item", "pub fn run() {}").name, "run");
  EXPECT_EQ(names.extract("attribute_item", "#[derive(Debug)]").name, "derive");
  EXPECT_EQ(names.extract("type_identifier", "Point").name, "Point");
}

TEST_F(NameExtractorTest, OtherKindsAreNamedByKind)
{
  const NameResult r = names.extract("block", "{ let x = 1; }");
  ASSERT_TRUE(r.success);
  EXPECT_EQ(r.name, "block");

  // Text is not consulted, so even empty text succeeds.
  EXPECT_EQ(names.extract("source_file", "").name, "source_file");
}

TEST_F(NameExtractorTest, SubstringStrippingCutsIdentifiers)
{
  // Known limitation of literal replacement.
  EXPECT_EQ(names.extract("identifier", "pubkey").name, "key");
  EXPECT_EQ(names.extract("function_item", "fn pub_fn() {}").name, "_");
}

TEST(HeuristicNameExtractor, StripTokensBlanksEverySet)
{
  EXPECT_EQ(HeuristicNameExtractor::strip_tokens("{}():#[]"), "        ");
  EXPECT_EQ(HeuristicNameExtractor::strip_tokens("enum E"), "  E");
  EXPECT_TRUE(HeuristicNameExtractor::names_declaration("let_item"));
  EXPECT_TRUE(HeuristicNameExtractor::names_declaration("field_identifier"));
  EXPECT_FALSE(HeuristicNameExtractor::names_declaration("parameters"));
}

}  // namespace rs_outline
