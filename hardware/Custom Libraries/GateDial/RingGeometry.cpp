#include "RingGeometry.h"

#include <math.h>

namespace gate_dial {

float normalizeAngle(float deg, float revolution) {
  float r = fmodf(deg, revolution);
  if (r < 0.0f) r += revolution;
  if (r >= revolution) r = 0.0f;
  return r;
}

float shortestRotation(float from, float to, float revolution, Rotation tieBreak) {
  const float cw = normalizeAngle(to - from, revolution);
  const float ccw = normalizeAngle(from - to, revolution);
  if (cw < ccw) return cw;
  if (ccw < cw) return -ccw;
  if (cw == 0.0f) return 0.0f;
  return tieBreak == Rotation::Clockwise ? cw : -ccw;
}

float travelInDirection(float from, float to, float revolution, Rotation dir) {
  if (dir == Rotation::Clockwise) return normalizeAngle(to - from, revolution);
  return normalizeAngle(from - to, revolution);
}

float angularDistance(float a, float b, float revolution) {
  const float d = normalizeAngle(a - b, revolution);
  return d > revolution - d ? revolution - d : d;
}

} // namespace gate_dial
