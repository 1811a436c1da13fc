#ifndef GATE_DIAL_EFFECT_COORDINATOR_H
#define GATE_DIAL_EFFECT_COORDINATOR_H

#include "GateTypes.h"

namespace gate_dial {

// Light/sound cues. Called from the control loop at most once per transition,
// in transition order. Implementations must return without waiting on the effect.
class EffectCoordinator {
public:
  virtual ~EffectCoordinator() {}

  virtual void onChevronLock(uint8_t chevron, uint8_t symbol) = 0;
  virtual void onFinalLock() = 0;
  virtual void onWormholeOpen() = 0;
  virtual void onWormholeClose() = 0;
  virtual void onAbort() = 0;
};

} // namespace gate_dial

#endif
