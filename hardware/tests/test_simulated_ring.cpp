#include <gtest/gtest.h>

#include <SimulatedRing.h>

using namespace gate_dial;

static SimulatedRingConfig homed_at(float deg) {
  SimulatedRingConfig cfg;
  cfg.initialPositionDeg = deg;
  cfg.initiallyHomed = true;
  return cfg;
}

TEST(SimulatedRing, MovesAtConfiguredSpeed) {
  SimulatedRing ring(homed_at(0.0f));
  ASSERT_TRUE(ring.begin());

  ring.moveTo(90.0f, Rotation::Clockwise);
  EXPECT_TRUE(ring.isMoving());
  EXPECT_EQ(ring.poll(5000), MotionEvent::None);
  EXPECT_EQ(ring.poll(5500), MotionEvent::None);
  EXPECT_FLOAT_EQ(ring.currentPosition(), 45.0f);
  EXPECT_EQ(ring.poll(6000), MotionEvent::Arrived);
  EXPECT_FLOAT_EQ(ring.currentPosition(), 90.0f);
  EXPECT_FALSE(ring.isMoving());
}

TEST(SimulatedRing, FollowsRequestedDirectionTheLongWay) {
  SimulatedRing ring(homed_at(10.0f));
  ASSERT_TRUE(ring.begin());

  ring.moveTo(350.0f, Rotation::Clockwise);
  ring.poll(0);
  ring.poll(1000);
  EXPECT_FLOAT_EQ(ring.currentPosition(), 100.0f);
  EXPECT_EQ(ring.lastDirection(), Rotation::Clockwise);
}

TEST(SimulatedRing, StopDeceleratesOverStopDistance) {
  SimulatedRing ring(homed_at(0.0f));
  ASSERT_TRUE(ring.begin());

  ring.moveTo(180.0f, Rotation::Clockwise);
  ring.poll(0);
  ring.poll(1000);
  ring.stop();
  EXPECT_TRUE(ring.isMoving());
  EXPECT_EQ(ring.poll(1100), MotionEvent::Stopped);
  EXPECT_FLOAT_EQ(ring.currentPosition(), 93.0f);
}

TEST(SimulatedRing, HomingFindsReference) {
  SimulatedRingConfig cfg;
  cfg.initialPositionDeg = 200.0f;
  cfg.homeReferenceDeg = 0.0f;
  SimulatedRing ring(cfg);
  ASSERT_TRUE(ring.begin());
  EXPECT_FALSE(ring.isHomed());

  ring.home();
  EXPECT_EQ(ring.poll(100), MotionEvent::None);
  EXPECT_EQ(ring.poll(1000), MotionEvent::None);
  EXPECT_EQ(ring.poll(2100), MotionEvent::Homed);
  EXPECT_TRUE(ring.isHomed());
  EXPECT_FLOAT_EQ(ring.currentPosition(), 0.0f);
}

TEST(SimulatedRing, HomingCanFail) {
  SimulatedRing ring(SimulatedRingConfig{});
  ASSERT_TRUE(ring.begin());
  ring.setHomingFails(true);

  ring.home();
  ring.poll(0);
  EXPECT_EQ(ring.poll(5000), MotionEvent::Timeout);
  EXPECT_FALSE(ring.isHomed());
  EXPECT_STREQ(ring.faultDetail(), "home reference not found");
}

TEST(SimulatedRing, InjectedStallDropsReference) {
  SimulatedRing ring(homed_at(0.0f));
  ASSERT_TRUE(ring.begin());

  ring.moveTo(90.0f, Rotation::Clockwise);
  ring.injectStall();
  EXPECT_EQ(ring.poll(0), MotionEvent::Stalled);
  EXPECT_FALSE(ring.isHomed());
  EXPECT_FALSE(ring.isMoving());
  EXPECT_STREQ(ring.faultDetail(), "ring stalled");
}

TEST(SimulatedRing, InjectedSensorFaultCarriesDetail) {
  SimulatedRing ring(homed_at(0.0f));
  ASSERT_TRUE(ring.begin());

  ring.moveTo(90.0f, Rotation::CounterClockwise);
  ring.injectSensorFault("home sensor open circuit");
  EXPECT_EQ(ring.poll(0), MotionEvent::Fault);
  EXPECT_STREQ(ring.faultDetail(), "home sensor open circuit");
}

TEST(SimulatedRing, IdleRingReportsNothing) {
  SimulatedRing ring(homed_at(0.0f));
  ASSERT_TRUE(ring.begin());
  ring.injectStall();
  EXPECT_EQ(ring.poll(0), MotionEvent::None);
  EXPECT_EQ(ring.poll(1000), MotionEvent::None);
}

TEST(SimulatedRing, RejectsNonsenseKinematics) {
  SimulatedRingConfig cfg;
  cfg.speedDegPerSec = 0.0f;
  SimulatedRing ring(cfg);
  EXPECT_FALSE(ring.begin());
}
