#include "expression_reader.hxx"
#include <gtest/gtest.h>
#include <limits>

using namespace reltime;

TEST(ExpressionReader, ReadsOccurrencesInOrder)
{
  const UnitVocabulary units;
  ExpressionReader reader("2 days ago +3 hours -weeks", "test", units);

  const auto tokens = reader.read();

  ASSERT_EQ(tokens.size(), 3u);
  EXPECT_EQ(to_string(tokens), "[Days:-2][Hours:3][Weeks:-1]");
  EXPECT_EQ(tokens[0].raw(), "2 days ago");
  EXPECT_EQ(tokens[1].raw(), "+3 hours");
  EXPECT_EQ(tokens[2].raw(), "-weeks");
  EXPECT_EQ(tokens[2].source(), "test");
}

TEST(ExpressionReader, ReportsRejectedOffset)
{
  const UnitVocabulary units;

  ExpressionReader unknown("15 eggs ago", "test", units);
  EXPECT_TRUE(unknown.read().empty());
  EXPECT_EQ(unknown.failed_at(), 0u);

  ExpressionReader trailing("15 days 4 eggs", "test", units);
  EXPECT_TRUE(trailing.read().empty());
  EXPECT_EQ(trailing.failed_at(), 8u);
}

TEST(ExpressionReader, AgoKeywordIsCaseInsensitive)
{
  const UnitVocabulary units;
  ExpressionReader reader("1 day AgO", "test", units);

  EXPECT_EQ(to_string(reader.read()), "[Days:-1]");
}

TEST(ExpressionReader, SignedMagnitude)
{
  EXPECT_EQ(signed_magnitude("", 0, false), 1);
  EXPECT_EQ(signed_magnitude("", -1, false), -1);
  EXPECT_EQ(signed_magnitude("", 0, true), -1);
  EXPECT_EQ(signed_magnitude("", -1, true), 1);
  EXPECT_EQ(signed_magnitude("15", 1, true), -15);
  EXPECT_EQ(signed_magnitude("15", -1, true), 15);
  EXPECT_EQ(signed_magnitude("9223372036854775807", -1, false),
            -std::numeric_limits<int64_t>::max());
  EXPECT_FALSE(signed_magnitude("9223372036854775808", 1, false).has_value());
}

TEST(ExpressionReader, SignedMagnitudeReachesInt64Min)
{
  const auto min = std::numeric_limits<int64_t>::min();

  EXPECT_EQ(signed_magnitude("9223372036854775808", -1, false), min);
  EXPECT_EQ(signed_magnitude("9223372036854775808", 1, true), min);
  EXPECT_EQ(signed_magnitude("0", -1, false), 0);
  EXPECT_FALSE(signed_magnitude("9223372036854775808", -1, true).has_value());
  EXPECT_FALSE(signed_magnitude("9223372036854775809", -1, false).has_value());
}
