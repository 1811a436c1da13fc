#include "CommandBridge.h"

#include <string.h>

namespace gate_dial {

const char *ack_status_str(AckStatus s) {
  switch (s) {
  case AckStatus::Accepted:
    return "ACCEPTED";
  case AckStatus::Rejected:
    return "REJECTED";
  case AckStatus::Completed:
    return "COMPLETED";
  }
  return "REJECTED";
}

static CommandResult rejected(const char *reasonCode) {
  CommandResult r;
  r.status = AckStatus::Rejected;
  r.reasonCode = reasonCode;
  return r;
}

static CommandResult completed() {
  CommandResult r;
  r.status = AckStatus::Completed;
  return r;
}

CommandBridge::CommandBridge(Stargate &gate) : _gate(gate) {
  for (uint8_t i = 0; i < kIdempotencyEntries; i++) {
    _idemCommandId[i][0] = '\0';
    _idemStatus[i] = AckStatus::Rejected;
    _idemReason[i][0] = '\0';
    _idemRunId[i] = 0;
  }
}

CommandResult CommandBridge::handle(const JsonDocument &cmd) {
  const char *commandId = cmd["command_id"] | "";

  CommandResult result;
  if (checkDuplicateCommandId(commandId, result)) return result;

  if (strcmp(cmd["action"] | "", "SET") != 0) {
    result = rejected("UNSUPPORTED_ACTION");
  } else {
    result = execute(cmd["parameters"]);
  }

  rememberCommandId(commandId, result);
  return result;
}

CommandResult CommandBridge::execute(JsonVariantConst parameters) {
  const char *op = parameters["op"] | "";
  if (!op[0]) return rejected("INVALID_PARAMS");

  if (strcmp(op, "dial") == 0) return executeDial(parameters);
  if (strcmp(op, "abort") == 0) return fromAck(_gate.abort(), AckStatus::Completed);
  if (strcmp(op, "home") == 0) return fromAck(_gate.home(), AckStatus::Accepted);
  if (strcmp(op, "close") == 0) return fromAck(_gate.closeWormhole(), AckStatus::Completed);

  if (strcmp(op, "manual_move") == 0) {
    JsonVariantConst delta = parameters["delta_deg"];
    if (!delta.is<float>()) return rejected("INVALID_PARAMS");
    return fromAck(_gate.manualMove(delta.as<float>()), AckStatus::Accepted);
  }

  if (strcmp(op, "request_status") == 0) {
    CommandResult r = completed();
    r.statusRequested = true;
    return r;
  }
  if (strcmp(op, "noop") == 0) return completed();

  return rejected("UNSUPPORTED_ACTION");
}

CommandResult CommandBridge::executeDial(JsonVariantConst parameters) {
  JsonArrayConst address = parameters["address"].as<JsonArrayConst>();
  if (address.isNull()) return rejected("INVALID_PARAMS");
  if (address.size() > kMaxAddressLength) return rejected(validation_error_str(ValidationError::TooLong));

  int symbols[kMaxAddressLength];
  size_t count = 0;
  for (JsonVariantConst item : address) {
    if (item.is<int>()) {
      symbols[count++] = item.as<int>();
    } else if (item.is<const char *>()) {
      // An unresolved name becomes kNoSymbol, which the validator reports in rule order.
      symbols[count++] = _gate.symbols().findByName(item.as<const char *>());
    } else {
      return rejected("INVALID_PARAMS");
    }
  }

  return fromAck(_gate.submitDial(symbols, count), AckStatus::Accepted);
}

CommandResult CommandBridge::fromAck(const Ack &ack, AckStatus okStatus) const {
  if (!ack.accepted) return rejected(reject_reason_code(ack));
  CommandResult r;
  r.status = okStatus;
  r.runId = ack.runId;
  return r;
}

void CommandBridge::writeState(JsonDocument &doc) {
  _snapshot = _gate.status();
  writeStatusJson(_snapshot, doc);
}

bool CommandBridge::checkDuplicateCommandId(const char *commandId, CommandResult &out) const {
  if (!commandId || !commandId[0]) return false;

  for (uint8_t i = 0; i < kIdempotencyEntries; i++) {
    if (_idemCommandId[i][0] == '\0') continue;
    if (strcmp(_idemCommandId[i], commandId) == 0) {
      out = CommandResult();
      out.status = _idemStatus[i];
      out.reasonCode = (_idemStatus[i] == AckStatus::Rejected && _idemReason[i][0]) ? _idemReason[i] : nullptr;
      out.runId = _idemRunId[i];
      out.duplicate = true;
      return true;
    }
  }
  return false;
}

void CommandBridge::rememberCommandId(const char *commandId, const CommandResult &result) {
  if (!commandId || !commandId[0]) return;

  uint8_t idx = _idemNext;
  _idemNext = (uint8_t)((_idemNext + 1) % kIdempotencyEntries);

  cstr_copy(_idemCommandId[idx], sizeof(_idemCommandId[idx]), commandId);
  _idemStatus[idx] = result.status;
  _idemRunId[idx] = result.runId;
  if (result.status == AckStatus::Rejected) {
    cstr_copy(_idemReason[idx], sizeof(_idemReason[idx]), result.reasonCode ? result.reasonCode : "REJECTED");
  } else {
    _idemReason[idx][0] = '\0';
  }
}

} // namespace gate_dial
