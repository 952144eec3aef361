// tests/unit/model/test_qualitative_space.cpp - LevelSet and QualitativeSpace
//
#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "qualsim/model/qualitative_space.hpp"

using namespace qualsim;

namespace
{

QualitativeSpace battery_space()
{
  return QualitativeSpace{"battery_level", "Battery level", {"empty", "low", "medium", "high", "full"}};
}

LevelSet levels(const QualitativeSpace & space, const std::vector<std::string> & names)
{
  return *space.resolve(names);
}

}  // namespace

// ============================================================================
// LevelSet
// ============================================================================

TEST(ModelLevelSet, RangeAndAll)
{
  EXPECT_EQ(LevelSet::range(1, 3).bits(), 0b01110U);
  EXPECT_EQ(LevelSet::all(5).size(), 5U);
  EXPECT_TRUE(LevelSet::range(3, 1).empty());
  EXPECT_EQ(LevelSet::all(64).size(), 64U);
}

TEST(ModelLevelSet, SetAlgebra)
{
  const LevelSet a = LevelSet::range(0, 2);
  const LevelSet b = LevelSet::range(2, 4);
  EXPECT_EQ((a & b), LevelSet::single(2));
  EXPECT_EQ((a | b), LevelSet::range(0, 4));
  EXPECT_EQ((a - b), LevelSet::range(0, 1));
  EXPECT_TRUE(LevelSet::single(1).is_subset_of(a));
  EXPECT_FALSE(a.is_subset_of(b));
  EXPECT_TRUE(a.intersects(b));
  EXPECT_EQ(b.first(), 2U);
  EXPECT_EQ(b.last(), 4U);
  EXPECT_EQ(b.indices(), (std::vector<size_t>{2, 3, 4}));
}

// ============================================================================
// Operators
// ============================================================================

TEST(ModelQualitativeSpace, ParseCompareOpAcceptsAliases)
{
  EXPECT_EQ(parse_compare_op("equals"), CompareOp::Equals);
  EXPECT_EQ(parse_compare_op("=="), CompareOp::Equals);
  EXPECT_EQ(parse_compare_op("!="), CompareOp::NotEquals);
  EXPECT_EQ(parse_compare_op("gte"), CompareOp::Gte);
  EXPECT_EQ(parse_compare_op("not_in"), CompareOp::NotIn);
  EXPECT_FALSE(parse_compare_op("approximately").has_value());
}

TEST(ModelQualitativeSpace, ExpandEqualityOperators)
{
  const auto space = battery_space();
  const LevelSet high = levels(space, {"high"});
  EXPECT_EQ(space.expand(CompareOp::Equals, high), high);
  EXPECT_EQ(space.expand(CompareOp::NotEquals, high), levels(space, {"empty", "low", "medium", "full"}));
  const LevelSet some = levels(space, {"low", "full"});
  EXPECT_EQ(space.expand(CompareOp::In, some), some);
  EXPECT_EQ(space.expand(CompareOp::NotIn, some), levels(space, {"empty", "medium", "high"}));
}

TEST(ModelQualitativeSpace, ExpandOrderedOperators)
{
  const auto space = battery_space();
  const LevelSet medium = levels(space, {"medium"});
  EXPECT_EQ(space.expand(CompareOp::Lt, medium), levels(space, {"empty", "low"}));
  EXPECT_EQ(space.expand(CompareOp::Lte, medium), levels(space, {"empty", "low", "medium"}));
  EXPECT_EQ(space.expand(CompareOp::Gt, medium), levels(space, {"high", "full"}));
  EXPECT_EQ(space.expand(CompareOp::Gte, medium), levels(space, {"medium", "high", "full"}));
}

TEST(ModelQualitativeSpace, StrictOrderIsSubsetOfNonStrict)
{
  const auto space = battery_space();
  for (size_t i = 0; i < space.size(); ++i) {
    const LevelSet pivot = LevelSet::single(i);
    EXPECT_TRUE(space.expand(CompareOp::Gt, pivot).is_subset_of(space.expand(CompareOp::Gte, pivot)));
    EXPECT_TRUE(space.expand(CompareOp::Lt, pivot).is_subset_of(space.expand(CompareOp::Lte, pivot)));
    EXPECT_FALSE(space.expand(CompareOp::Gt, pivot).contains(i));
    EXPECT_TRUE(space.expand(CompareOp::Gte, pivot).contains(i));
  }
}

TEST(ModelQualitativeSpace, ExpandAtTheEnds)
{
  const auto space = battery_space();
  EXPECT_TRUE(space.expand(CompareOp::Lt, levels(space, {"empty"})).empty());
  EXPECT_TRUE(space.expand(CompareOp::Gt, levels(space, {"full"})).empty());
}

// ============================================================================
// Trends
// ============================================================================

TEST(ModelQualitativeSpace, StepIsClamped)
{
  const auto space = battery_space();
  EXPECT_EQ(space.step(0, Trend::Down), 0U);
  EXPECT_EQ(space.step(4, Trend::Up), 4U);
  EXPECT_EQ(space.step(2, Trend::Up), 3U);
  EXPECT_EQ(space.step(2, Trend::None), 2U);
}

TEST(ModelQualitativeSpace, ValueSetFromTrend)
{
  const auto space = battery_space();
  const LevelSet medium = levels(space, {"medium"});
  EXPECT_EQ(space.value_set_from_trend(medium, Trend::Down), levels(space, {"empty", "low", "medium"}));
  EXPECT_EQ(space.value_set_from_trend(medium, Trend::Up), levels(space, {"medium", "high", "full"}));
  EXPECT_EQ(space.value_set_from_trend(medium, Trend::None), medium);

  // a value set trending down keeps everything below its highest member
  EXPECT_EQ(
    space.value_set_from_trend(levels(space, {"low", "high"}), Trend::Down),
    levels(space, {"empty", "low", "medium", "high"}));
}

TEST(ModelQualitativeSpace, ResolveAndDescribe)
{
  const auto space = battery_space();
  EXPECT_FALSE(space.resolve({"low", "bogus"}).has_value());
  EXPECT_EQ(space.describe(levels(space, {"medium"})), "medium");
  EXPECT_EQ(space.describe(levels(space, {"full", "low"})), "{low, full}");
  EXPECT_EQ(space.names(space.all()).size(), 5U);
}
