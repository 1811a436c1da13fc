#include <gtest/gtest.h>

#include <RingGeometry.h>
#include <SymbolMap.h>

using namespace gate_dial;

TEST(RingGeometry, NormalizeWrapsIntoOneRevolution) {
  EXPECT_FLOAT_EQ(normalizeAngle(370.0f, 360.0f), 10.0f);
  EXPECT_FLOAT_EQ(normalizeAngle(-20.0f, 360.0f), 340.0f);
  EXPECT_FLOAT_EQ(normalizeAngle(360.0f, 360.0f), 0.0f);
  EXPECT_FLOAT_EQ(normalizeAngle(0.0f, 360.0f), 0.0f);
}

TEST(RingGeometry, ShortestRotationCrossesZero) {
  EXPECT_FLOAT_EQ(shortestRotation(10.0f, 350.0f, 360.0f, Rotation::Clockwise), -20.0f);
  EXPECT_FLOAT_EQ(shortestRotation(350.0f, 10.0f, 360.0f, Rotation::Clockwise), 20.0f);
}

TEST(RingGeometry, HalfTurnUsesTieBreak) {
  EXPECT_FLOAT_EQ(shortestRotation(0.0f, 180.0f, 360.0f, Rotation::Clockwise), 180.0f);
  EXPECT_FLOAT_EQ(shortestRotation(0.0f, 180.0f, 360.0f, Rotation::CounterClockwise), -180.0f);
  EXPECT_FLOAT_EQ(shortestRotation(90.0f, 270.0f, 360.0f, Rotation::CounterClockwise), -180.0f);
}

TEST(RingGeometry, NoRotationWhenAlreadyThere) {
  EXPECT_FLOAT_EQ(shortestRotation(42.0f, 42.0f, 360.0f, Rotation::CounterClockwise), 0.0f);
  EXPECT_FLOAT_EQ(shortestRotation(0.0f, 360.0f, 360.0f, Rotation::Clockwise), 0.0f);
}

TEST(RingGeometry, TravelFollowsRequestedDirection) {
  EXPECT_FLOAT_EQ(travelInDirection(10.0f, 350.0f, 360.0f, Rotation::Clockwise), 340.0f);
  EXPECT_FLOAT_EQ(travelInDirection(10.0f, 350.0f, 360.0f, Rotation::CounterClockwise), 20.0f);
}

TEST(RingGeometry, AngularDistanceIsSymmetric) {
  EXPECT_FLOAT_EQ(angularDistance(359.5f, 0.25f, 360.0f), 0.75f);
  EXPECT_FLOAT_EQ(angularDistance(0.25f, 359.5f, 360.0f), 0.75f);
  EXPECT_FLOAT_EQ(angularDistance(0.0f, 180.0f, 360.0f), 180.0f);
}

TEST(SymbolMap, SymbolsAreEvenlySpaced) {
  GateConfig cfg;
  SymbolMap map(cfg);
  const float spacing = 360.0f / 39.0f;

  float deg = -1.0f;
  ASSERT_TRUE(map.positionOf(1, deg));
  EXPECT_FLOAT_EQ(deg, 0.0f);
  ASSERT_TRUE(map.positionOf(2, deg));
  EXPECT_FLOAT_EQ(deg, spacing);
  ASSERT_TRUE(map.positionOf(39, deg));
  EXPECT_NEAR(deg, 38.0f * spacing, 1e-3f);
}

TEST(SymbolMap, OffsetShiftsEveryGlyph) {
  GateConfig cfg;
  cfg.symbolOffsetDeg = -5.0f;
  SymbolMap map(cfg);

  float deg = 0.0f;
  ASSERT_TRUE(map.positionOf(1, deg));
  EXPECT_FLOAT_EQ(deg, 355.0f);
}

TEST(SymbolMap, UnknownSymbolHasNoPosition) {
  GateConfig cfg;
  SymbolMap map(cfg);
  float deg = 123.0f;
  EXPECT_FALSE(map.positionOf(0, deg));
  EXPECT_FALSE(map.positionOf(40, deg));
  EXPECT_FALSE(map.positionOf(-3, deg));
  EXPECT_FLOAT_EQ(deg, 123.0f);
}

TEST(SymbolMap, SymbolAtFindsNearestWithinTolerance) {
  GateConfig cfg;
  SymbolMap map(cfg);
  float deg = 0.0f;
  ASSERT_TRUE(map.positionOf(30, deg));

  EXPECT_EQ(map.symbolAt(deg + 0.2f, 0.5f), 30);
  EXPECT_EQ(map.symbolAt(deg + 2.0f, 0.5f), kNoSymbol);
  EXPECT_EQ(map.symbolAt(359.9f, 0.5f), 1);
}

TEST(SymbolMap, MasterChevronSitsAtZero) {
  GateConfig cfg;
  SymbolMap map(cfg);

  float deg = -1.0f;
  ASSERT_TRUE(map.chevronAngle(7, deg));
  EXPECT_FLOAT_EQ(deg, 0.0f);
  ASSERT_TRUE(map.chevronAngle(8, deg));
  EXPECT_FLOAT_EQ(deg, 40.0f);
  ASSERT_TRUE(map.chevronAngle(1, deg));
  EXPECT_FLOAT_EQ(deg, 120.0f);
  EXPECT_FALSE(map.chevronAngle(10, deg));
  EXPECT_FALSE(map.chevronAngle(0, deg));
}

TEST(SymbolMap, SevenSymbolAddressEngagesChevronsInHardwareOrder) {
  GateConfig cfg;
  SymbolMap map(cfg);
  const uint8_t expected[] = {1, 2, 3, 4, 5, 6, 7};
  for (uint8_t step = 0; step < 7; step++) EXPECT_EQ(map.chevronForStep(step, 7), expected[step]) << "step " << (int)step;
}

TEST(SymbolMap, NineSymbolAddressSkipsMasterUntilLast) {
  GateConfig cfg;
  SymbolMap map(cfg);
  const uint8_t expected[] = {1, 2, 3, 4, 5, 6, 8, 9, 7};
  for (uint8_t step = 0; step < 9; step++) EXPECT_EQ(map.chevronForStep(step, 9), expected[step]) << "step " << (int)step;
}

TEST(SymbolMap, MilkyWayNames) {
  GateConfig cfg;
  SymbolMap map(cfg);
  EXPECT_STREQ(map.nameOf(1), "Earth");
  EXPECT_STREQ(map.nameOf(30), "Orion");
  EXPECT_STREQ(map.nameOf(39), "Leo");
  EXPECT_EQ(map.nameOf(40), nullptr);

  EXPECT_EQ(map.findByName("Serpens Caput"), 7);
  EXPECT_EQ(map.findByName("Abydos"), kNoSymbol);
  EXPECT_EQ(map.findByName(""), kNoSymbol);
}

TEST(SymbolMap, CustomAlphabetHasNoNames) {
  GateConfig cfg;
  cfg.symbolCount = 36;
  SymbolMap map(cfg);
  EXPECT_STREQ(map.nameOf(5), "");
  EXPECT_EQ(map.findByName("Earth"), kNoSymbol);
}
