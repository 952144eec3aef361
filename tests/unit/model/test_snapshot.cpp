// tests/unit/model/test_snapshot.cpp - WorldSnapshot behaviour
//
#include <gtest/gtest.h>

#include "qualsim/model/attribute_path.hpp"
#include "qualsim/model/snapshot.hpp"
#include "qualsim/test_support/flashlight_kb.hpp"

using namespace qualsim;

namespace
{

const AttributePath k_level{"battery", "level"};

}  // namespace

TEST(ModelAttributePath, Parse)
{
  const auto p = AttributePath::parse("bulb.state");
  ASSERT_TRUE(p.has_value());
  EXPECT_EQ(p->part(), "bulb");
  EXPECT_EQ(p->attribute(), "state");
  EXPECT_EQ(p->str(), "bulb.state");

  const auto g = AttributePath::parse("model");
  ASSERT_TRUE(g.has_value());
  EXPECT_TRUE(g->is_global());

  EXPECT_FALSE(AttributePath::parse("").has_value());
  EXPECT_FALSE(AttributePath::parse(".state").has_value());
  EXPECT_FALSE(AttributePath::parse("a.b.c").has_value());
}

TEST(ModelSnapshot, DefaultSnapshotUsesDefaults)
{
  const auto kb = test_support::make_flashlight_kb();
  const WorldSnapshot s = kb.find_object_type("flashlight")->default_snapshot();

  EXPECT_EQ(s.size(), 5U);
  const AttributeValue * level = s.find(k_level);
  ASSERT_NE(level, nullptr);
  EXPECT_EQ(level->levels.size(), 5U);  // "unknown" default
  EXPECT_TRUE(level->is_value_set());

  const AttributeValue * state = s.find(AttributePath{"bulb", "state"});
  ASSERT_NE(state, nullptr);
  EXPECT_TRUE(state->is_fully_resolved());
  EXPECT_EQ(state->describe(), "off");
}

TEST(ModelSnapshot, WithReturnsModifiedCopy)
{
  const auto kb = test_support::make_flashlight_kb();
  const WorldSnapshot s = kb.find_object_type("flashlight")->default_snapshot();

  const WorldSnapshot t = s.with_levels(k_level, LevelSet::single(4));
  EXPECT_EQ(s.find(k_level)->levels.size(), 5U);
  EXPECT_EQ(t.find(k_level)->levels, LevelSet::single(4));
  EXPECT_FALSE(s == t);
  EXPECT_NE(s.fingerprint(), t.fingerprint());
}

TEST(ModelSnapshot, SequenceTakesNoPartInIdentity)
{
  const auto kb = test_support::make_flashlight_kb();
  const WorldSnapshot s = kb.find_object_type("flashlight")->default_snapshot();
  const WorldSnapshot t = s.with_sequence(7);
  EXPECT_EQ(t.sequence(), 7U);
  EXPECT_TRUE(s == t);
  EXPECT_EQ(s.fingerprint(), t.fingerprint());
}

TEST(ModelSnapshot, MaterializeTrendsIsIdempotent)
{
  const auto kb = test_support::make_flashlight_kb();
  const WorldSnapshot s = kb.find_object_type("flashlight")
                            ->default_snapshot()
                            .with_levels(k_level, LevelSet::single(2))
                            .with_trend(k_level, Trend::Down);

  const WorldSnapshot once = s.materialize_trends();
  EXPECT_EQ(once.find(k_level)->levels, LevelSet::range(0, 2));
  EXPECT_EQ(once.find(k_level)->trend, Trend::Down);
  EXPECT_TRUE(once.materialize_trends() == once);
}

TEST(ModelSnapshot, FingerprintDistinguishesTrend)
{
  const auto kb = test_support::make_flashlight_kb();
  const WorldSnapshot s = kb.find_object_type("flashlight")->default_snapshot();
  EXPECT_NE(s.fingerprint(), s.with_trend(k_level, Trend::Up).fingerprint());
}
