// test_span_converter.cpp - Unit tests for parser position conversion
#include <gtest/gtest.h>

#include "rs_outline/outline/span_converter.hpp"

namespace rs_outline
{

TEST(SpanConverter, RowBecomesOneBasedColumnUnchanged)
{
  const HumanPoint p = to_human_point(TextPoint{0, 0});
  EXPECT_EQ(p.line, 1);
  EXPECT_EQ(p.column, 0);

  const HumanPoint q = to_human_point(TextPoint{41, 7});
  EXPECT_EQ(q.line, 42);
  EXPECT_EQ(q.column, 7);
}

TEST(SpanConverter, ByteOffsetsPassThrough)
{
  const ByteSpan s = to_byte_span(12, 30);
  EXPECT_EQ(s.start, 12);
  EXPECT_EQ(s.end, 30);
  EXPECT_FALSE(s.is_unset());
  EXPECT_TRUE(ByteSpan::unset().is_unset());
  EXPECT_EQ(ByteSpan::unset().end, -1);
}

TEST(SpanConverter, HumanSpanContainment)
{
  const HumanSpan outer = to_human_span({0, 0}, {4, 1});
  EXPECT_TRUE(outer.contains(to_human_span({1, 4}, {2, 0})));
  EXPECT_TRUE(outer.contains(outer));
  EXPECT_FALSE(outer.contains(to_human_span({3, 0}, {4, 2})));
  EXPECT_TRUE(to_human_span({2, 3}, {2, 3}).start <= to_human_span({2, 3}, {2, 3}).end);
}

}  // namespace rs_outline
