#include "CommandGate.h"

#include <math.h>

namespace gate_dial {

CommandGate::CommandGate(const AddressValidator &validator, float revolutionDeg)
    : _validator(validator), _revolution(revolutionDeg) {}

RejectReason CommandGate::admissionBlocker(CommandKind kind) const {
  if (_hasPending || _inFlight) return RejectReason::Busy;
  if (kind == CommandKind::Dial && _status.needsHome) return RejectReason::NeedsHome;
  if (kind == CommandKind::ManualMove && _status.state == GateState::Faulted) return RejectReason::AdapterFault;
  return RejectReason::None;
}

Ack CommandGate::admit(const PendingCommand &cmd) {
  Ack ack;
  GateLockGuard guard(_lock);
  ack.reason = admissionBlocker(cmd.kind);
  if (ack.reason != RejectReason::None) return ack;

  _pending = cmd;
  if (cmd.kind == CommandKind::Dial) _pending.runId = _nextRunId++;
  _hasPending = true;

  ack.accepted = true;
  ack.runId = _pending.runId;
  return ack;
}

Ack CommandGate::submitDial(const int *symbols, size_t count) {
  PendingCommand cmd;
  cmd.kind = CommandKind::Dial;
  const ValidationError err = _validator.validate(symbols, count, cmd.address);
  if (err != ValidationError::None) {
    Ack ack;
    ack.reason = RejectReason::InvalidAddress;
    ack.validation = err;
    return ack;
  }
  return admit(cmd);
}

Ack CommandGate::abort() {
  Ack ack;
  ack.accepted = true;

  GateLockGuard guard(_lock);
  if (_hasPending) {
    ack.runId = _pending.runId;
    _hasPending = false;
    _pending = PendingCommand();
  }
  if (_inFlight && _status.state != GateState::Aborting) {
    _abortRequested = true;
    if (_status.hasRun) ack.runId = _status.run.runId;
  }
  return ack;
}

Ack CommandGate::manualMove(float deltaDeg) {
  if (!(fabsf(deltaDeg) < _revolution) || deltaDeg == 0.0f) {
    Ack ack;
    ack.reason = RejectReason::InvalidMove;
    return ack;
  }
  PendingCommand cmd;
  cmd.kind = CommandKind::ManualMove;
  cmd.deltaDeg = deltaDeg;
  return admit(cmd);
}

Ack CommandGate::home() {
  PendingCommand cmd;
  cmd.kind = CommandKind::Home;
  return admit(cmd);
}

Ack CommandGate::closeWormhole() {
  Ack ack;
  GateLockGuard guard(_lock);
  if (_status.state != GateState::WormholeOpen) {
    ack.reason = RejectReason::NotOpen;
    return ack;
  }
  _closeRequested = true;
  ack.accepted = true;
  if (_status.hasRun) ack.runId = _status.run.runId;
  return ack;
}

GateStatus CommandGate::status() const {
  GateLockGuard guard(_lock);
  return _status;
}

bool CommandGate::takeCommand(PendingCommand &out) {
  GateLockGuard guard(_lock);
  if (!_hasPending) return false;
  out = _pending;
  _hasPending = false;
  _inFlight = true;
  return true;
}

bool CommandGate::takeAbort() {
  GateLockGuard guard(_lock);
  const bool requested = _abortRequested;
  _abortRequested = false;
  return requested;
}

bool CommandGate::takeClose() {
  GateLockGuard guard(_lock);
  const bool requested = _closeRequested;
  _closeRequested = false;
  return requested;
}

void CommandGate::publish(const GateStatus &status) {
  GateLockGuard guard(_lock);
  _status = status;
  _inFlight = gate_state_in_flight(status.state);
}

} // namespace gate_dial
