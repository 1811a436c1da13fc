#include <atomic>
#include <thread>

#include <gtest/gtest.h>

#include <CommandGate.h>

#include "test_support.h"

using namespace gate_dial;
using namespace gate_dial::test;

class CommandGateTest : public ::testing::Test {
protected:
  CommandGateTest() : map(cfg), validator(map, cfg), gate(validator, cfg.fullRevolutionDeg) {}

  GateConfig cfg;
  SymbolMap map;
  AddressValidator validator;
  CommandGate gate;
};

TEST_F(CommandGateTest, AdmittedDialWaitsInMailbox) {
  const Ack ack = gate.submitDial(kAbydos, 7);
  ASSERT_TRUE(ack.accepted);
  EXPECT_EQ(ack.runId, 1u);

  PendingCommand cmd;
  ASSERT_TRUE(gate.takeCommand(cmd));
  EXPECT_EQ(cmd.kind, CommandKind::Dial);
  EXPECT_EQ(cmd.runId, 1u);
  EXPECT_EQ(cmd.address.length, 7);
  EXPECT_FALSE(gate.takeCommand(cmd));
}

TEST_F(CommandGateTest, TakenCommandKeepsGateBusyUntilPublishedIdle) {
  ASSERT_TRUE(gate.home().accepted);
  PendingCommand cmd;
  ASSERT_TRUE(gate.takeCommand(cmd));

  EXPECT_EQ(gate.submitDial(kAbydos, 7).reason, RejectReason::Busy);

  GateStatus st;
  st.state = GateState::Idle;
  gate.publish(st);
  EXPECT_TRUE(gate.submitDial(kAbydos, 7).accepted);
}

TEST_F(CommandGateTest, AbortSignalsOnlyInFlightWork) {
  EXPECT_TRUE(gate.abort().accepted);
  EXPECT_FALSE(gate.takeAbort());

  GateStatus st;
  st.state = GateState::StepMoving;
  gate.publish(st);
  EXPECT_TRUE(gate.abort().accepted);
  EXPECT_TRUE(gate.takeAbort());
  EXPECT_FALSE(gate.takeAbort());

  st.state = GateState::Aborting;
  gate.publish(st);
  gate.abort();
  EXPECT_FALSE(gate.takeAbort());
}

TEST_F(CommandGateTest, CloseOnlyWhileOpen) {
  EXPECT_EQ(gate.closeWormhole().reason, RejectReason::NotOpen);
  EXPECT_FALSE(gate.takeClose());

  GateStatus st;
  st.state = GateState::WormholeOpen;
  gate.publish(st);
  EXPECT_TRUE(gate.closeWormhole().accepted);
  EXPECT_TRUE(gate.takeClose());
}

TEST_F(CommandGateTest, FaultedGateOnlyTakesHome) {
  GateStatus st;
  st.state = GateState::Faulted;
  gate.publish(st);

  EXPECT_EQ(gate.submitDial(kAbydos, 7).reason, RejectReason::NeedsHome);
  EXPECT_EQ(gate.manualMove(15.0f).reason, RejectReason::AdapterFault);
  EXPECT_TRUE(gate.home().accepted);
}

TEST_F(CommandGateTest, ConcurrentDialsAdmitExactlyOne) {
  for (int round = 0; round < 200; round++) {
    CommandGate contested(validator, cfg.fullRevolutionDeg);
    std::atomic<bool> go(false);
    Ack acks[2];

    std::thread a([&]() {
      while (!go.load()) {
      }
      acks[0] = contested.submitDial(kAbydos, 7);
    });
    std::thread b([&]() {
      while (!go.load()) {
      }
      acks[1] = contested.submitDial(kAbydos, 7);
    });
    go.store(true);
    a.join();
    b.join();

    const int accepted = (acks[0].accepted ? 1 : 0) + (acks[1].accepted ? 1 : 0);
    ASSERT_EQ(accepted, 1) << "round " << round;
    const Ack &loser = acks[0].accepted ? acks[1] : acks[0];
    EXPECT_EQ(loser.reason, RejectReason::Busy);
  }
}

TEST(CommandGateLive, ConcurrentDialsWhileControlLoopRuns) {
  GateConfig cfg;
  cfg.holdUntilClose = true;
  GateHarness h(cfg);
  ASSERT_TRUE(h.begin());

  std::atomic<bool> stop(false);
  std::atomic<uint32_t> clock(0);
  std::thread control([&]() {
    while (!stop.load()) {
      h.gate.loop(clock.fetch_add(10));
      std::this_thread::yield();
    }
  });

  Ack acks[2];
  std::thread a([&]() { acks[0] = h.gate.submitDial(kAbydos, 7); });
  std::thread b([&]() { acks[1] = h.gate.submitDial(kAbydos, 7); });
  a.join();
  b.join();

  stop.store(true);
  control.join();

  EXPECT_EQ((acks[0].accepted ? 1 : 0) + (acks[1].accepted ? 1 : 0), 1);
  EXPECT_TRUE(acks[0].reason == RejectReason::Busy || acks[1].reason == RejectReason::Busy);
}

TEST(GateTelemetry, StatusDocumentShape) {
  GateHarness h;
  ASSERT_TRUE(h.begin());
  ASSERT_TRUE(h.gate.submitDial(kAbydos, 7).accepted);
  ASSERT_TRUE(h.runUntil(GateState::StepLocking));

  const GateStatus st = h.gate.status();
  DynamicJsonDocument doc(2048);
  writeStatusJson(st, doc);

  EXPECT_STREQ(doc["state"].as<const char *>(), "STEP_LOCKING");
  EXPECT_TRUE(doc["homed"].as<bool>());
  EXPECT_FALSE(doc["needs_home"].as<bool>());
  ASSERT_EQ(doc["chevrons"].size(), 9u);
  EXPECT_STREQ(doc["chevrons"][0].as<const char *>(), "LOCKED");
  EXPECT_STREQ(doc["chevrons"][1].as<const char *>(), "UNLIT");
  EXPECT_EQ(doc["current_run"]["run_id"].as<uint32_t>(), 1u);
  EXPECT_EQ(doc["current_run"]["address"].size(), 7u);
  EXPECT_STREQ(doc["current_run"]["steps"][0].as<const char *>(), "LOCKED");
  EXPECT_TRUE(doc["last_run"].isNull());
  EXPECT_TRUE(doc["last_fault"].isNull());
}
