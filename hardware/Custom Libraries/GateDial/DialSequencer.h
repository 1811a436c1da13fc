#ifndef GATE_DIAL_DIAL_SEQUENCER_H
#define GATE_DIAL_DIAL_SEQUENCER_H

#include "CommandGate.h"
#include "EffectCoordinator.h"
#include "GateTelemetry.h"
#include "RingDriver.h"

namespace gate_dial {

// The control loop. Owns the ring driver and the live DialRun; takes work
// from the CommandGate and publishes a snapshot back after every tick.
// Every wait is a non-blocking tick, so an abort lands on the next tick.
class DialSequencer {
public:
  DialSequencer(const GateConfig &cfg, const SymbolMap &map, RingDriver &driver, EffectCoordinator &effects,
                CommandGate &gate);

  void setEventSink(EventSink sink, void *ctx);

  void tick(uint32_t nowMs);
  // Stops the ring and abandons any run. Used on teardown.
  void shutdown(uint32_t nowMs);

  GateState state() const { return _state; }

private:
  void startCommand(const PendingCommand &cmd, uint32_t nowMs);
  void beginStep(uint8_t step, uint32_t nowMs);
  void beginMotion(float targetDeg, uint32_t nowMs);
  void enterLocking(bool final, uint32_t nowMs);
  void enterWormhole(uint32_t nowMs);
  void enterClosing(uint32_t nowMs);
  void enterAborting(uint32_t nowMs);
  void enterFaulted(FaultKind kind, const char *detail, uint32_t nowMs);
  void finishRun(Termination termination, uint32_t nowMs);
  void transition(GateState next, uint32_t nowMs);

  bool motionTimedOut(uint32_t nowMs) const { return nowMs - _motionStartMs > _cfg.motionTimeoutMs; }
  bool homingTimedOut(uint32_t nowMs) const { return nowMs - _motionStartMs > _cfg.homingTimeoutMs; }
  bool anyChevronLit() const;
  void resetChevrons();
  void publishStatus(uint32_t nowMs);

  void emitMotion(float targetDeg, float deltaDeg, Rotation dir, uint32_t nowMs);
  void emitChevronLocked(uint8_t chevron, uint8_t symbol, uint32_t nowMs);
  void emitRun(const char *event, uint32_t nowMs);
  void emitFault(FaultKind kind, const char *detail, uint32_t nowMs);

  const GateConfig &_cfg;
  const SymbolMap &_map;
  RingDriver &_driver;
  EffectCoordinator &_effects;
  CommandGate &_gate;

  EventSink _sink = nullptr;
  void *_sinkCtx = nullptr;

  GateState _state = GateState::Idle;
  uint32_t _stateSinceMs = 0;

  DialRun _run;
  bool _runActive = false;
  DialRun _lastRun;
  bool _hasLastRun = false;

  ChevronState _chevrons[kMaxChevrons];

  bool _motionPending = false;
  float _targetDeg = 0.0f;
  uint32_t _motionStartMs = 0;

  bool _needsHome = false;
  FaultKind _lastFault = FaultKind::None;
  char _lastFaultDetail[kFaultDetailMax];
};

} // namespace gate_dial

#endif
