#ifndef GATE_DIAL_STATUS_H
#define GATE_DIAL_STATUS_H

#include "GateTypes.h"

namespace gate_dial {

// One sequencing attempt. The sequencer owns the live record; everybody else
// gets copies through GateStatus.
struct DialRun {
  uint32_t runId = 0;
  Address address;
  uint8_t stepIndex = 0;
  StepStatus steps[kMaxAddressLength];
  uint32_t startedAtMs = 0;
  uint32_t endedAtMs = 0;
  Termination termination = Termination::None;
  FaultKind fault = FaultKind::None;
  char faultDetail[kFaultDetailMax];

  DialRun() {
    for (uint8_t i = 0; i < kMaxAddressLength; i++) {
      address.symbols[i] = kNoSymbol;
      steps[i] = StepStatus::Pending;
    }
    faultDetail[0] = '\0';
  }
};

struct GateStatus {
  GateState state = GateState::Idle;

  bool hasRun = false;
  DialRun run;
  bool hasLastRun = false;
  DialRun lastRun;

  uint8_t chevronCount = 0;
  ChevronState chevrons[kMaxChevrons];

  float positionDeg = 0.0f;
  bool homed = false;
  // Latched by a fault; only a completed home clears it.
  bool needsHome = false;
  bool moving = false;

  FaultKind lastFault = FaultKind::None;
  char lastFaultDetail[kFaultDetailMax];

  uint32_t updatedAtMs = 0;

  GateStatus() {
    for (uint8_t i = 0; i < kMaxChevrons; i++) chevrons[i] = ChevronState::Unlit;
    lastFaultDetail[0] = '\0';
  }
};

} // namespace gate_dial

#endif
