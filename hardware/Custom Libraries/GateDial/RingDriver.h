#ifndef GATE_DIAL_RING_DRIVER_H
#define GATE_DIAL_RING_DRIVER_H

#include "GateTypes.h"

namespace gate_dial {

// Completion signals reported by RingDriver::poll(). At most one per call.
enum class MotionEvent : uint8_t {
  None,
  Arrived,  // moveTo() reached its target
  Stopped,  // stop() finished decelerating
  Homed,    // home() found the reference
  Stalled,  // ring did not follow the commanded motion
  Timeout,  // home() gave up looking for the reference
  Fault,    // sensor or driver fault, see faultDetail()
};

const char *motion_event_str(MotionEvent e);

// Control contract for the ring drive. Only the control loop calls these.
// Commands return immediately; progress and completion come from poll().
class RingDriver {
public:
  virtual ~RingDriver() {}

  virtual bool begin() = 0;
  virtual void end() = 0;

  // Rotate to `angleDeg` going the `dir` way round.
  virtual void moveTo(float angleDeg, Rotation dir) = 0;
  virtual void home() = 0;
  // Decelerating stop. Never an instantaneous reversal.
  virtual void stop() = 0;

  virtual MotionEvent poll(uint32_t nowMs) = 0;

  virtual float currentPosition() const = 0;
  virtual bool isHomed() const = 0;
  virtual bool isMoving() const = 0;
  virtual const char *faultDetail() const = 0;
};

} // namespace gate_dial

#endif
