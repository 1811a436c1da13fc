#include "RingDriver.h"

namespace gate_dial {

const char *motion_event_str(MotionEvent e) {
  switch (e) {
  case MotionEvent::None:
    return "NONE";
  case MotionEvent::Arrived:
    return "ARRIVED";
  case MotionEvent::Stopped:
    return "STOPPED";
  case MotionEvent::Homed:
    return "HOMED";
  case MotionEvent::Stalled:
    return "STALLED";
  case MotionEvent::Timeout:
    return "TIMEOUT";
  case MotionEvent::Fault:
    return "FAULT";
  }
  return "NONE";
}

} // namespace gate_dial
