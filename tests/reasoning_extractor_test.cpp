// =============================================================================
// reasoning_extractor_test.cpp
// =============================================================================
// Unit tests for the prose heuristics in arena::forecast.
//
// Validates:
//   - Direction: explicit buy/sell wins; otherwise sideways, bullish and
//     bearish vocabulary are checked in that order
//   - Magnitude: "N% gain"-style phrases are positive fractions, "N% loss"
//     phrases negative; gains are checked first
//   - Horizon: the first matching bucket in order wins
// =============================================================================

#include "arena/forecast/reasoning_extractor.hpp"

#include <gtest/gtest.h>

#include <string>

using arena::domain::Direction;
using arena::forecast::extractHorizon;
using arena::forecast::extractMagnitude;
using arena::forecast::inferDirection;

// -----------------------------------------------------------------------------
// 1. The trade action decides the direction regardless of wording.
// -----------------------------------------------------------------------------
TEST(ReasoningExtractorTest, ActionOverridesText) {
  EXPECT_EQ(inferDirection("very bearish setup", "buy"), Direction::Up);
  EXPECT_EQ(inferDirection("bullish breakout", "sell"), Direction::Down);
}

// -----------------------------------------------------------------------------
// 2. Hold decisions fall back to vocabulary, sideways first.
// -----------------------------------------------------------------------------
TEST(ReasoningExtractorTest, HoldUsesVocabulary) {
  EXPECT_EQ(inferDirection("Price is Range-Bound near support", "hold"),
            Direction::Flat);
  EXPECT_EQ(inferDirection("Consolidating before a bullish move", "hold"),
            Direction::Flat);
  EXPECT_EQ(inferDirection("Strong earnings GROWTH ahead", "hold"),
            Direction::Up);
  EXPECT_EQ(inferDirection("Expect a correction soon", "hold"),
            Direction::Down);
  EXPECT_EQ(inferDirection("Waiting for more data", "hold"),
            Direction::Unknown);
}

// -----------------------------------------------------------------------------
// 3. Magnitudes are fractions with the sign of the phrase.
// -----------------------------------------------------------------------------
TEST(ReasoningExtractorTest, Magnitude) {
  auto gain = extractMagnitude("Targeting a 5% gain on the breakout");
  ASSERT_TRUE(gain.has_value());
  EXPECT_DOUBLE_EQ(*gain, 0.05);

  auto loss = extractMagnitude("Risk of 2.5% downside if support breaks");
  ASSERT_TRUE(loss.has_value());
  EXPECT_DOUBLE_EQ(*loss, -0.025);

  // Gain phrasing is checked before loss phrasing.
  auto both = extractMagnitude("3% drop first, then 8% rally? no: 8% upside");
  ASSERT_TRUE(both.has_value());
  EXPECT_DOUBLE_EQ(*both, 0.08);

  EXPECT_FALSE(extractMagnitude("Price up 5 percent").has_value());
  EXPECT_FALSE(extractMagnitude("5%gain").has_value());
}

// -----------------------------------------------------------------------------
// 4. Horizon buckets.
// -----------------------------------------------------------------------------
TEST(ReasoningExtractorTest, HorizonBuckets) {
  EXPECT_EQ(extractHorizon("a short-term scalp"), "intraday");
  EXPECT_EQ(extractHorizon("should move by tomorrow"), "1-2 days");
  EXPECT_EQ(extractHorizon("resolves within a week"), "1 week");
  EXPECT_EQ(extractHorizon("over the next two weeks"), "2 weeks");
  EXPECT_EQ(extractHorizon("catalyst next month"), "1 month");
  EXPECT_EQ(extractHorizon("a Long-Term compounder"), "3+ months");
  EXPECT_FALSE(extractHorizon("no timing given").has_value());
}

// -----------------------------------------------------------------------------
// 5. The earliest bucket wins when several phrases appear.
// -----------------------------------------------------------------------------
TEST(ReasoningExtractorTest, HorizonPrecedence) {
  EXPECT_EQ(extractHorizon("long-term thesis but intraday entry"), "intraday");
  EXPECT_EQ(extractHorizon("this quarter, maybe next week"), "1 week");
}

// -----------------------------------------------------------------------------
// 6. An overlong digit run is not a magnitude.
// Why: strtod overflows to HUGE_VAL; the value must not leak out as inf.
// -----------------------------------------------------------------------------
TEST(ReasoningExtractorTest, OverlongMagnitudeIsIgnored) {
  EXPECT_FALSE(
      extractMagnitude(std::string(400, '9') + "% gain expected").has_value());
  EXPECT_FALSE(
      extractMagnitude(std::string(400, '9') + "% drop expected").has_value());
}
