#ifndef GATE_DIAL_TYPES_H
#define GATE_DIAL_TYPES_H

#include <stddef.h>
#include <stdint.h>

namespace gate_dial {

static const uint8_t kMaxAddressLength = 9;
static const uint8_t kMinAddressLength = 6;
static const uint8_t kMaxChevrons = 9;
static const uint8_t kMaxSymbols = 64;
static const uint8_t kNoSymbol = 0;
static const size_t kFaultDetailMax = 48;

enum class Rotation : uint8_t { Clockwise, CounterClockwise };

// Where the point-of-origin symbol sits in a valid address.
enum class OriginPlacement : uint8_t { Leading, Trailing };

enum class ChevronState : uint8_t { Unlit, LitUnlocked, Locked };

enum class GateState : uint8_t {
  Idle,
  Homing,
  ManualMoving,
  StepMoving,
  StepLocking,
  FinalLocking,
  WormholeOpen,
  Closing,
  Aborting,
  Faulted,
};

enum class ValidationError : uint8_t {
  None,
  TooShort,
  TooLong,
  UnknownSymbol,
  DuplicateSymbol,
  MissingOrigin,
  MisplacedOrigin,
};

enum class FaultKind : uint8_t { None, Stalled, SensorFault, Timeout };

enum class RejectReason : uint8_t {
  None,
  Busy,
  InvalidAddress,
  NeedsHome,
  AdapterFault,
  InvalidMove,
  NotOpen,
};

enum class StepStatus : uint8_t { Pending, Moving, Locked };

enum class Termination : uint8_t { None, Completed, Aborted, Faulted };

struct Address {
  uint8_t symbols[kMaxAddressLength];
  uint8_t length = 0;
};

// Result of a Command Gate submission.
struct Ack {
  bool accepted = false;
  RejectReason reason = RejectReason::None;
  ValidationError validation = ValidationError::None;
  uint32_t runId = 0;
};

const char *gate_state_str(GateState s);
const char *validation_error_str(ValidationError e);
const char *fault_kind_str(FaultKind f);
const char *reject_reason_code(const Ack &ack);
const char *chevron_state_str(ChevronState s);
const char *step_status_str(StepStatus s);
const char *termination_str(Termination t);
const char *rotation_str(Rotation r);

// States in which a dial, home or manual move owns the ring.
bool gate_state_in_flight(GateState s);

void cstr_copy(char *dst, size_t dstSize, const char *src);

} // namespace gate_dial

#endif
