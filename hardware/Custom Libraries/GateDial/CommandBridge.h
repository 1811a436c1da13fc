#ifndef GATE_DIAL_COMMAND_BRIDGE_H
#define GATE_DIAL_COMMAND_BRIDGE_H

#include "GateDial.h"

namespace gate_dial {

enum class AckStatus { Accepted, Rejected, Completed };

const char *ack_status_str(AckStatus s);

struct CommandResult {
  AckStatus status = AckStatus::Rejected;
  const char *reasonCode = nullptr;
  // Replayed from the command-id cache; nothing was executed.
  bool duplicate = false;
  bool statusRequested = false;
  uint32_t runId = 0;
};

// Maps remote command documents onto a Stargate.
//
//   { "command_id": "...", "action": "SET",
//     "parameters": { "op": "dial", "address": [27, 7, 15, 32, 12, 30, 1] } }
//
// Supported ops: dial, abort, manual_move, home, close, request_status, noop.
// Dial addresses may mix symbol ids and symbol names.
class CommandBridge {
public:
  explicit CommandBridge(Stargate &gate);

  CommandResult handle(const JsonDocument &cmd);

  // Status snapshot as a device state document. `doc` references strings held
  // by the bridge until the next writeState() call.
  void writeState(JsonDocument &doc);

private:
  CommandResult execute(JsonVariantConst parameters);
  CommandResult executeDial(JsonVariantConst parameters);
  CommandResult fromAck(const Ack &ack, AckStatus okStatus) const;

  bool checkDuplicateCommandId(const char *commandId, CommandResult &out) const;
  void rememberCommandId(const char *commandId, const CommandResult &result);

  Stargate &_gate;
  GateStatus _snapshot;

  static const uint8_t kIdempotencyEntries = 16;
  static const uint8_t kCommandIdMax = 40;    // UUID string (36) + slack + NUL
  static const uint8_t kReasonCodeMax = 32;   // "ADDRESS_DUPLICATE_SYMBOL", etc.
  char _idemCommandId[kIdempotencyEntries][kCommandIdMax];
  AckStatus _idemStatus[kIdempotencyEntries];
  char _idemReason[kIdempotencyEntries][kReasonCodeMax];
  uint32_t _idemRunId[kIdempotencyEntries];
  uint8_t _idemNext = 0;
};

} // namespace gate_dial

#endif
