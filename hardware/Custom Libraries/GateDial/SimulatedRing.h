#ifndef GATE_DIAL_SIMULATED_RING_H
#define GATE_DIAL_SIMULATED_RING_H

#include "RingDriver.h"

namespace gate_dial {

struct SimulatedRingConfig {
  float revolutionDeg = 360.0f;
  float speedDegPerSec = 90.0f;
  float stopDistanceDeg = 3.0f;
  uint32_t homeDurationMs = 2000;
  float homeReferenceDeg = 0.0f;

  float initialPositionDeg = 0.0f;
  bool initiallyHomed = false;
};

// Kinematic stand-in for the ring motor: constant speed, fixed stop distance.
// Used when the motor is disabled and by the host tools.
class SimulatedRing : public RingDriver {
public:
  explicit SimulatedRing(const SimulatedRingConfig &cfg);

  bool begin() override;
  void end() override;

  void moveTo(float angleDeg, Rotation dir) override;
  void home() override;
  void stop() override;

  MotionEvent poll(uint32_t nowMs) override;

  float currentPosition() const override { return _position; }
  bool isHomed() const override { return _homed; }
  bool isMoving() const override { return _activity != Activity::Idle; }
  const char *faultDetail() const override { return _faultDetail; }

  Rotation lastDirection() const { return _lastDirection; }

  // Fault injection, reported on the next poll() while in motion.
  void injectStall();
  void injectSensorFault(const char *detail);
  void setHomingFails(bool fails) { _homingFails = fails; }

private:
  enum class Activity : uint8_t { Idle, Moving, Stopping, Homing };

  void rearmClock() { _clockArmed = false; }

  SimulatedRingConfig _cfg;
  Activity _activity = Activity::Idle;
  float _position;
  float _remaining = 0.0f;
  bool _homed;
  Rotation _lastDirection = Rotation::Clockwise;

  bool _clockArmed = false;
  uint32_t _lastPollMs = 0;
  uint32_t _homeElapsedMs = 0;

  bool _stallPending = false;
  bool _sensorFaultPending = false;
  bool _homingFails = false;
  char _faultDetail[kFaultDetailMax];
};

} // namespace gate_dial

#endif
