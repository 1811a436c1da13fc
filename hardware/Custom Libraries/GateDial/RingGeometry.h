#ifndef GATE_DIAL_RING_GEOMETRY_H
#define GATE_DIAL_RING_GEOMETRY_H

#include "GateTypes.h"

namespace gate_dial {

// Wraps `deg` into [0, revolution).
float normalizeAngle(float deg, float revolution);

// Signed travel from `from` to `to` along the shorter arc. Positive is clockwise.
// An exact half-revolution goes the `tieBreak` way.
float shortestRotation(float from, float to, float revolution, Rotation tieBreak);

// Distance travelled going from `from` to `to` in direction `dir`, in [0, revolution).
float travelInDirection(float from, float to, float revolution, Rotation dir);

// Unsigned distance between two angles along the shorter arc.
float angularDistance(float a, float b, float revolution);

} // namespace gate_dial

#endif
