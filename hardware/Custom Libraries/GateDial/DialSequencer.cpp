#include "DialSequencer.h"

#include "RingGeometry.h"

namespace gate_dial {

static bool is_fault_event(MotionEvent e) {
  return e == MotionEvent::Stalled || e == MotionEvent::Fault || e == MotionEvent::Timeout;
}

static FaultKind fault_for_event(MotionEvent e) {
  switch (e) {
  case MotionEvent::Stalled:
    return FaultKind::Stalled;
  case MotionEvent::Fault:
    return FaultKind::SensorFault;
  case MotionEvent::Timeout:
    return FaultKind::Timeout;
  default:
    return FaultKind::None;
  }
}

DialSequencer::DialSequencer(const GateConfig &cfg, const SymbolMap &map, RingDriver &driver,
                             EffectCoordinator &effects, CommandGate &gate)
    : _cfg(cfg), _map(map), _driver(driver), _effects(effects), _gate(gate) {
  for (uint8_t i = 0; i < kMaxChevrons; i++) _chevrons[i] = ChevronState::Unlit;
  _lastFaultDetail[0] = '\0';
}

void DialSequencer::setEventSink(EventSink sink, void *ctx) {
  _sink = sink;
  _sinkCtx = ctx;
}

void DialSequencer::tick(uint32_t nowMs) {
  MotionEvent ev = _driver.poll(nowMs);

  if (_gate.takeAbort() && gate_state_in_flight(_state) && _state != GateState::Aborting) {
    enterAborting(nowMs);
  }

  if (_state == GateState::Idle || _state == GateState::Faulted) {
    PendingCommand cmd;
    if (_gate.takeCommand(cmd)) {
      startCommand(cmd, nowMs);
      ev = MotionEvent::None;
    }
  }

  if (is_fault_event(ev) && _state != GateState::Faulted) {
    enterFaulted(fault_for_event(ev), _driver.faultDetail(), nowMs);
    publishStatus(nowMs);
    return;
  }

  switch (_state) {
  case GateState::Idle:
  case GateState::Faulted:
    break;

  case GateState::Homing:
    if (ev == MotionEvent::Homed) {
      _motionPending = false;
      _needsHome = false;
      if (_runActive) {
        beginStep(0, nowMs);
      } else {
        transition(GateState::Idle, nowMs);
      }
    } else if (homingTimedOut(nowMs)) {
      enterFaulted(FaultKind::Timeout, "homing timed out", nowMs);
    }
    break;

  case GateState::ManualMoving:
    if (ev == MotionEvent::Arrived) {
      _motionPending = false;
      transition(GateState::Idle, nowMs);
    } else if (motionTimedOut(nowMs)) {
      enterFaulted(FaultKind::Timeout, "manual move timed out", nowMs);
    }
    break;

  case GateState::StepMoving:
    if (ev == MotionEvent::Arrived) {
      _motionPending = false;
      const float error = angularDistance(_driver.currentPosition(), _targetDeg, _map.revolution());
      if (error > _cfg.arrivalToleranceDeg) {
        enterFaulted(FaultKind::Stalled, "arrived off target", nowMs);
      } else {
        enterLocking(_run.stepIndex + 1 >= _run.address.length, nowMs);
      }
    } else if (motionTimedOut(nowMs)) {
      enterFaulted(FaultKind::Timeout, "symbol move timed out", nowMs);
    }
    break;

  case GateState::StepLocking:
    if (nowMs - _stateSinceMs >= _cfg.settleDelayMs) beginStep(_run.stepIndex + 1, nowMs);
    break;

  case GateState::FinalLocking:
    if (nowMs - _stateSinceMs >= _cfg.settleDelayMs) enterWormhole(nowMs);
    break;

  case GateState::WormholeOpen: {
    const bool closeRequested = _gate.takeClose();
    const bool holdExpired = !_cfg.holdUntilClose && nowMs - _stateSinceMs >= _cfg.wormholeHoldMs;
    if (closeRequested || holdExpired) enterClosing(nowMs);
    break;
  }

  case GateState::Closing:
    if (_motionPending && ev == MotionEvent::Arrived &&
        angularDistance(_driver.currentPosition(), _targetDeg, _map.revolution()) > _cfg.arrivalToleranceDeg) {
      enterFaulted(FaultKind::Stalled, "arrived off idle position", nowMs);
    } else if (!_motionPending || ev == MotionEvent::Arrived) {
      _motionPending = false;
      finishRun(Termination::Completed, nowMs);
      transition(GateState::Idle, nowMs);
    } else if (motionTimedOut(nowMs)) {
      enterFaulted(FaultKind::Timeout, "idle return timed out", nowMs);
    }
    break;

  case GateState::Aborting:
    if (ev == MotionEvent::Stopped || !_driver.isMoving()) {
      if (_runActive) finishRun(Termination::Aborted, nowMs);
      transition(GateState::Idle, nowMs);
    } else if (nowMs - _stateSinceMs > _cfg.motionTimeoutMs) {
      enterFaulted(FaultKind::Timeout, "ring did not stop", nowMs);
    }
    break;
  }

  publishStatus(nowMs);
}

void DialSequencer::shutdown(uint32_t nowMs) {
  if (gate_state_in_flight(_state)) {
    _driver.stop();
    if (_state != GateState::Aborting) _effects.onAbort();
    resetChevrons();
    _motionPending = false;
    if (_runActive) finishRun(Termination::Aborted, nowMs);
    transition(GateState::Idle, nowMs);
  }
  _gate.takeAbort();
  _gate.takeClose();
  publishStatus(nowMs);
}

void DialSequencer::startCommand(const PendingCommand &cmd, uint32_t nowMs) {
  switch (cmd.kind) {
  case CommandKind::Dial:
    _run = DialRun();
    _run.runId = cmd.runId;
    _run.address = cmd.address;
    _run.startedAtMs = nowMs;
    _runActive = true;
    resetChevrons();
    emitRun("run_started", nowMs);
    if (!_driver.isHomed()) {
      _driver.home();
      _motionPending = true;
      _motionStartMs = nowMs;
      transition(GateState::Homing, nowMs);
    } else {
      beginStep(0, nowMs);
    }
    break;

  case CommandKind::Home:
    _driver.home();
    _motionPending = true;
    _motionStartMs = nowMs;
    transition(GateState::Homing, nowMs);
    break;

  case CommandKind::ManualMove: {
    const float target = normalizeAngle(_driver.currentPosition() + cmd.deltaDeg, _map.revolution());
    const Rotation dir = cmd.deltaDeg < 0.0f ? Rotation::CounterClockwise : Rotation::Clockwise;
    _driver.moveTo(target, dir);
    _motionPending = true;
    _motionStartMs = nowMs;
    _targetDeg = target;
    emitMotion(target, cmd.deltaDeg, dir, nowMs);
    transition(GateState::ManualMoving, nowMs);
    break;
  }

  case CommandKind::None:
    break;
  }
}

void DialSequencer::beginStep(uint8_t step, uint32_t nowMs) {
  _run.stepIndex = step;
  _run.steps[step] = StepStatus::Moving;

  const uint8_t symbol = _run.address.symbols[step];
  const uint8_t engaged = _map.chevronForStep(step, _run.address.length);
  const uint8_t chevron = _cfg.lockAtEngagedChevron ? engaged : _map.masterChevron();
  _chevrons[engaged - 1] = ChevronState::LitUnlocked;

  float symbolDeg = 0.0f;
  float chevronDeg = 0.0f;
  _map.positionOf(symbol, symbolDeg);
  _map.chevronAngle(chevron, chevronDeg);

  // The ring angle that puts `symbol` under `chevron`.
  beginMotion(normalizeAngle(symbolDeg - chevronDeg, _map.revolution()), nowMs);
  transition(GateState::StepMoving, nowMs);
}

void DialSequencer::beginMotion(float targetDeg, uint32_t nowMs) {
  const float delta = shortestRotation(_driver.currentPosition(), targetDeg, _map.revolution(), _cfg.tieBreak);
  Rotation dir = _cfg.tieBreak;
  if (delta > 0.0f) dir = Rotation::Clockwise;
  if (delta < 0.0f) dir = Rotation::CounterClockwise;

  _driver.moveTo(targetDeg, dir);
  _motionPending = true;
  _motionStartMs = nowMs;
  _targetDeg = targetDeg;
  emitMotion(targetDeg, delta, dir, nowMs);
}

void DialSequencer::enterLocking(bool final, uint32_t nowMs) {
  const uint8_t step = _run.stepIndex;
  const uint8_t symbol = _run.address.symbols[step];
  const uint8_t chevron = _map.chevronForStep(step, _run.address.length);

  _chevrons[chevron - 1] = ChevronState::Locked;
  _run.steps[step] = StepStatus::Locked;

  _effects.onChevronLock(chevron, symbol);
  if (final) _effects.onFinalLock();
  emitChevronLocked(chevron, symbol, nowMs);

  transition(final ? GateState::FinalLocking : GateState::StepLocking, nowMs);
}

void DialSequencer::enterWormhole(uint32_t nowMs) {
  _effects.onWormholeOpen();
  transition(GateState::WormholeOpen, nowMs);
}

void DialSequencer::enterClosing(uint32_t nowMs) {
  _effects.onWormholeClose();
  resetChevrons();
  _gate.takeClose();
  transition(GateState::Closing, nowMs);

  const float idle = normalizeAngle(_cfg.idlePositionDeg, _map.revolution());
  if (_cfg.returnToIdlePosition &&
      angularDistance(_driver.currentPosition(), idle, _map.revolution()) > _cfg.arrivalToleranceDeg) {
    beginMotion(idle, nowMs);
  }
}

void DialSequencer::enterAborting(uint32_t nowMs) {
  _driver.stop();
  _effects.onAbort();
  resetChevrons();
  _motionPending = false;
  transition(GateState::Aborting, nowMs);
}

void DialSequencer::enterFaulted(FaultKind kind, const char *detail, uint32_t nowMs) {
  _driver.stop();
  if (anyChevronLit()) _effects.onAbort();
  resetChevrons();
  _motionPending = false;

  _lastFault = kind;
  _needsHome = true;
  cstr_copy(_lastFaultDetail, sizeof(_lastFaultDetail), detail && detail[0] ? detail : fault_kind_str(kind));
  emitFault(kind, _lastFaultDetail, nowMs);

  if (_runActive) {
    _run.fault = kind;
    cstr_copy(_run.faultDetail, sizeof(_run.faultDetail), _lastFaultDetail);
    finishRun(Termination::Faulted, nowMs);
  }
  _gate.takeClose();
  transition(GateState::Faulted, nowMs);
}

void DialSequencer::finishRun(Termination termination, uint32_t nowMs) {
  _run.termination = termination;
  _run.endedAtMs = nowMs;
  _lastRun = _run;
  _hasLastRun = true;
  _runActive = false;
  emitRun("run_finished", nowMs);
}

void DialSequencer::transition(GateState next, uint32_t nowMs) {
  const GateState prev = _state;
  _state = next;
  _stateSinceMs = nowMs;

  if (!_sink) return;
  StaticJsonDocument<256> ev;
  ev["event"] = "state";
  ev["from"] = gate_state_str(prev);
  ev["to"] = gate_state_str(next);
  if (_runActive) {
    ev["run_id"] = _run.runId;
    ev["step"] = _run.stepIndex;
  }
  ev["at_ms"] = nowMs;
  _sink(ev, _sinkCtx);
}

bool DialSequencer::anyChevronLit() const {
  for (uint8_t i = 0; i < kMaxChevrons; i++) {
    if (_chevrons[i] != ChevronState::Unlit) return true;
  }
  return false;
}

void DialSequencer::resetChevrons() {
  for (uint8_t i = 0; i < kMaxChevrons; i++) _chevrons[i] = ChevronState::Unlit;
}

void DialSequencer::publishStatus(uint32_t nowMs) {
  GateStatus st;
  st.state = _state;
  st.hasRun = _runActive;
  if (_runActive) st.run = _run;
  st.hasLastRun = _hasLastRun;
  if (_hasLastRun) st.lastRun = _lastRun;

  st.chevronCount = _map.chevronCount();
  for (uint8_t i = 0; i < kMaxChevrons; i++) st.chevrons[i] = _chevrons[i];

  st.positionDeg = _driver.currentPosition();
  st.homed = _driver.isHomed();
  st.needsHome = _needsHome;
  st.moving = _driver.isMoving();
  st.lastFault = _lastFault;
  cstr_copy(st.lastFaultDetail, sizeof(st.lastFaultDetail), _lastFaultDetail);
  st.updatedAtMs = nowMs;

  _gate.publish(st);
}

void DialSequencer::emitMotion(float targetDeg, float deltaDeg, Rotation dir, uint32_t nowMs) {
  if (!_sink) return;
  StaticJsonDocument<256> ev;
  ev["event"] = "motion";
  ev["target_deg"] = targetDeg;
  ev["delta_deg"] = deltaDeg;
  ev["direction"] = rotation_str(dir);
  ev["at_ms"] = nowMs;
  _sink(ev, _sinkCtx);
}

void DialSequencer::emitChevronLocked(uint8_t chevron, uint8_t symbol, uint32_t nowMs) {
  if (!_sink) return;
  StaticJsonDocument<256> ev;
  ev["event"] = "chevron_locked";
  ev["run_id"] = _run.runId;
  ev["step"] = _run.stepIndex;
  ev["chevron"] = chevron;
  ev["symbol"] = symbol;
  const char *name = _map.nameOf(symbol);
  if (name && name[0]) ev["symbol_name"] = name;
  ev["at_ms"] = nowMs;
  _sink(ev, _sinkCtx);
}

void DialSequencer::emitRun(const char *event, uint32_t nowMs) {
  if (!_sink) return;
  StaticJsonDocument<768> ev;
  ev["event"] = event;
  writeRunJson(_run, ev.createNestedObject("run"));
  ev["at_ms"] = nowMs;
  _sink(ev, _sinkCtx);
}

void DialSequencer::emitFault(FaultKind kind, const char *detail, uint32_t nowMs) {
  if (!_sink) return;
  StaticJsonDocument<256> ev;
  ev["event"] = "fault";
  ev["kind"] = fault_kind_str(kind);
  ev["detail"] = detail;
  if (_runActive) ev["run_id"] = _run.runId;
  ev["at_ms"] = nowMs;
  _sink(ev, _sinkCtx);
}

} // namespace gate_dial
