#include "GateTypes.h"

namespace gate_dial {

const char *gate_state_str(GateState s) {
  switch (s) {
  case GateState::Idle:
    return "IDLE";
  case GateState::Homing:
    return "HOMING";
  case GateState::ManualMoving:
    return "MANUAL_MOVING";
  case GateState::StepMoving:
    return "STEP_MOVING";
  case GateState::StepLocking:
    return "STEP_LOCKING";
  case GateState::FinalLocking:
    return "FINAL_LOCKING";
  case GateState::WormholeOpen:
    return "WORMHOLE_OPEN";
  case GateState::Closing:
    return "CLOSING";
  case GateState::Aborting:
    return "ABORTING";
  case GateState::Faulted:
    return "FAULTED";
  }
  return "IDLE";
}

const char *validation_error_str(ValidationError e) {
  switch (e) {
  case ValidationError::None:
    return "NONE";
  case ValidationError::TooShort:
    return "ADDRESS_TOO_SHORT";
  case ValidationError::TooLong:
    return "ADDRESS_TOO_LONG";
  case ValidationError::UnknownSymbol:
    return "ADDRESS_UNKNOWN_SYMBOL";
  case ValidationError::DuplicateSymbol:
    return "ADDRESS_DUPLICATE_SYMBOL";
  case ValidationError::MissingOrigin:
    return "ADDRESS_MISSING_ORIGIN";
  case ValidationError::MisplacedOrigin:
    return "ADDRESS_MISPLACED_ORIGIN";
  }
  return "NONE";
}

const char *fault_kind_str(FaultKind f) {
  switch (f) {
  case FaultKind::None:
    return "NONE";
  case FaultKind::Stalled:
    return "STALLED";
  case FaultKind::SensorFault:
    return "SENSOR_FAULT";
  case FaultKind::Timeout:
    return "TIMEOUT";
  }
  return "NONE";
}

const char *reject_reason_code(const Ack &ack) {
  switch (ack.reason) {
  case RejectReason::None:
    return nullptr;
  case RejectReason::Busy:
    return "BUSY";
  case RejectReason::InvalidAddress:
    return validation_error_str(ack.validation);
  case RejectReason::NeedsHome:
    return "NEEDS_HOME";
  case RejectReason::AdapterFault:
    return "ADAPTER_FAULT";
  case RejectReason::InvalidMove:
    return "INVALID_PARAMS";
  case RejectReason::NotOpen:
    return "NOT_OPEN";
  }
  return "REJECTED";
}

const char *chevron_state_str(ChevronState s) {
  switch (s) {
  case ChevronState::Unlit:
    return "UNLIT";
  case ChevronState::LitUnlocked:
    return "LIT";
  case ChevronState::Locked:
    return "LOCKED";
  }
  return "UNLIT";
}

const char *step_status_str(StepStatus s) {
  switch (s) {
  case StepStatus::Pending:
    return "PENDING";
  case StepStatus::Moving:
    return "MOVING";
  case StepStatus::Locked:
    return "LOCKED";
  }
  return "PENDING";
}

const char *termination_str(Termination t) {
  switch (t) {
  case Termination::None:
    return "NONE";
  case Termination::Completed:
    return "COMPLETED";
  case Termination::Aborted:
    return "ABORTED";
  case Termination::Faulted:
    return "FAULTED";
  }
  return "NONE";
}

const char *rotation_str(Rotation r) { return r == Rotation::Clockwise ? "CW" : "CCW"; }

bool gate_state_in_flight(GateState s) { return s != GateState::Idle && s != GateState::Faulted; }

void cstr_copy(char *dst, size_t dstSize, const char *src) {
  if (!dst || dstSize == 0) return;
  if (!src) {
    dst[0] = '\0';
    return;
  }
  size_t i = 0;
  for (; i + 1 < dstSize && src[i]; i++) dst[i] = src[i];
  dst[i] = '\0';
}

} // namespace gate_dial
