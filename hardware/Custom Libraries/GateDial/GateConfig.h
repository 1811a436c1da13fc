#ifndef GATE_DIAL_CONFIG_H
#define GATE_DIAL_CONFIG_H

#include <ArduinoJson.h>

#include "GateTypes.h"

namespace gate_dial {

struct GateConfig {
  float fullRevolutionDeg = 360.0f;

  uint8_t symbolCount = 39;
  uint8_t pointOfOrigin = 1;
  float symbolOffsetDeg = 0.0f;

  uint8_t chevronCount = 9;
  uint8_t masterChevron = 7;
  bool lockAtEngagedChevron = false;

  uint8_t minAddressLength = 6;
  uint8_t maxAddressLength = 9;
  OriginPlacement originPlacement = OriginPlacement::Trailing;

  Rotation tieBreak = Rotation::Clockwise;
  float arrivalToleranceDeg = 0.5f;

  uint32_t settleDelayMs = 1500;
  uint32_t wormholeHoldMs = 30000;
  bool holdUntilClose = false;
  uint32_t motionTimeoutMs = 20000;
  // A homing sweep may cover more than a full turn.
  uint32_t homingTimeoutMs = 60000;

  bool returnToIdlePosition = true;
  float idlePositionDeg = 0.0f;
};

bool validateConfig(const GateConfig &cfg, const char *&outError);

// Overlays keys present in `doc` onto `cfg`. Unknown keys are ignored.
bool applyConfigJson(const JsonDocument &doc, GateConfig &cfg, const char *&outError);
bool loadConfigJson(const char *json, size_t length, GateConfig &cfg, const char *&outError);

void writeConfigJson(const GateConfig &cfg, JsonDocument &doc);

} // namespace gate_dial

#endif
