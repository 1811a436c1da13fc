#include "SimulatedRing.h"

#include <math.h>

#include "RingGeometry.h"

namespace gate_dial {

SimulatedRing::SimulatedRing(const SimulatedRingConfig &cfg)
    : _cfg(cfg), _position(normalizeAngle(cfg.initialPositionDeg, cfg.revolutionDeg)), _homed(cfg.initiallyHomed) {
  _faultDetail[0] = '\0';
}

bool SimulatedRing::begin() {
  if (!(_cfg.revolutionDeg > 0.0f) || !(_cfg.speedDegPerSec > 0.0f)) return false;
  _activity = Activity::Idle;
  _remaining = 0.0f;
  rearmClock();
  return true;
}

void SimulatedRing::end() {
  _activity = Activity::Idle;
  _remaining = 0.0f;
}

void SimulatedRing::moveTo(float angleDeg, Rotation dir) {
  const float target = normalizeAngle(angleDeg, _cfg.revolutionDeg);
  const float travel = travelInDirection(_position, target, _cfg.revolutionDeg, dir);
  _remaining = dir == Rotation::Clockwise ? travel : -travel;
  _lastDirection = dir;
  _activity = Activity::Moving;
  _faultDetail[0] = '\0';
  rearmClock();
}

void SimulatedRing::home() {
  _homed = false;
  _homeElapsedMs = 0;
  _remaining = 0.0f;
  _activity = Activity::Homing;
  _faultDetail[0] = '\0';
  rearmClock();
}

void SimulatedRing::stop() {
  if (_activity == Activity::Idle || _activity == Activity::Stopping) return;
  if (_activity == Activity::Moving) {
    const float mag = fabsf(_remaining) < _cfg.stopDistanceDeg ? fabsf(_remaining) : _cfg.stopDistanceDeg;
    _remaining = _remaining < 0.0f ? -mag : mag;
  } else {
    _remaining = 0.0f;
  }
  _activity = Activity::Stopping;
}

void SimulatedRing::injectStall() { _stallPending = true; }

void SimulatedRing::injectSensorFault(const char *detail) {
  _sensorFaultPending = true;
  cstr_copy(_faultDetail, sizeof(_faultDetail), detail ? detail : "sensor fault");
}

MotionEvent SimulatedRing::poll(uint32_t nowMs) {
  uint32_t dt = 0;
  if (_clockArmed) {
    dt = nowMs - _lastPollMs;
  } else {
    _clockArmed = true;
  }
  _lastPollMs = nowMs;

  if (_activity == Activity::Idle) return MotionEvent::None;

  if (_sensorFaultPending) {
    _sensorFaultPending = false;
    _activity = Activity::Idle;
    _remaining = 0.0f;
    _homed = false;
    return MotionEvent::Fault;
  }
  if (_stallPending) {
    _stallPending = false;
    _activity = Activity::Idle;
    _remaining = 0.0f;
    _homed = false;
    cstr_copy(_faultDetail, sizeof(_faultDetail), "ring stalled");
    return MotionEvent::Stalled;
  }

  if (_activity == Activity::Homing) {
    _homeElapsedMs += dt;
    if (_homeElapsedMs < _cfg.homeDurationMs) return MotionEvent::None;
    _activity = Activity::Idle;
    if (_homingFails) {
      cstr_copy(_faultDetail, sizeof(_faultDetail), "home reference not found");
      return MotionEvent::Timeout;
    }
    _position = normalizeAngle(_cfg.homeReferenceDeg, _cfg.revolutionDeg);
    _homed = true;
    return MotionEvent::Homed;
  }

  const float step = _cfg.speedDegPerSec * (float)dt / 1000.0f;
  if (fabsf(_remaining) <= step) {
    _position = normalizeAngle(_position + _remaining, _cfg.revolutionDeg);
    _remaining = 0.0f;
    const bool stopping = _activity == Activity::Stopping;
    _activity = Activity::Idle;
    return stopping ? MotionEvent::Stopped : MotionEvent::Arrived;
  }

  const float signedStep = _remaining < 0.0f ? -step : step;
  _position = normalizeAngle(_position + signedStep, _cfg.revolutionDeg);
  _remaining -= signedStep;
  return MotionEvent::None;
}

} // namespace gate_dial
