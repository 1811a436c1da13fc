#ifndef GATE_DIAL_COMMAND_GATE_H
#define GATE_DIAL_COMMAND_GATE_H

#include "AddressValidator.h"
#include "GateLock.h"
#include "GateStatus.h"

namespace gate_dial {

enum class CommandKind : uint8_t { None, Dial, ManualMove, Home };

struct PendingCommand {
  CommandKind kind = CommandKind::None;
  uint32_t runId = 0;
  Address address;
  float deltaDeg = 0.0f;
};

// Single-writer arbiter between any number of callers and the control loop.
// Callers get an immediate admission decision; admitted work waits in a
// one-slot mailbox until the control loop takes it. Nothing here touches the
// ring driver.
class CommandGate {
public:
  CommandGate(const AddressValidator &validator, float revolutionDeg);

  Ack submitDial(const int *symbols, size_t count);
  // Always accepted. Drops an unstarted command, signals an in-flight one,
  // and does nothing when idle.
  Ack abort();
  Ack manualMove(float deltaDeg);
  Ack home();
  Ack closeWormhole();

  GateStatus status() const;

  // Control loop side.
  bool takeCommand(PendingCommand &out);
  bool takeAbort();
  bool takeClose();
  void publish(const GateStatus &status);

private:
  RejectReason admissionBlocker(CommandKind kind) const;
  Ack admit(const PendingCommand &cmd);

  const AddressValidator &_validator;
  float _revolution;

  mutable GateLock _lock;
  GateStatus _status;
  PendingCommand _pending;
  bool _hasPending = false;
  bool _inFlight = false;
  bool _abortRequested = false;
  bool _closeRequested = false;
  uint32_t _nextRunId = 1;
};

} // namespace gate_dial

#endif
