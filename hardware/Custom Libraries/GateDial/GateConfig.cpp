#include "GateConfig.h"

#include <string.h>

namespace gate_dial {

static bool read_float(const JsonDocument &doc, const char *key, float &out, const char *&outError) {
  JsonVariantConst v = doc[key];
  if (v.isNull()) return true;
  if (!v.is<float>() && !v.is<long>()) {
    outError = key;
    return false;
  }
  out = v.as<float>();
  return true;
}

static bool read_u32(const JsonDocument &doc, const char *key, uint32_t &out, const char *&outError) {
  JsonVariantConst v = doc[key];
  if (v.isNull()) return true;
  if (!v.is<unsigned long>()) {
    outError = key;
    return false;
  }
  out = (uint32_t)v.as<unsigned long>();
  return true;
}

static bool read_u8(const JsonDocument &doc, const char *key, uint8_t &out, const char *&outError) {
  JsonVariantConst v = doc[key];
  if (v.isNull()) return true;
  if (!v.is<unsigned int>() || v.as<unsigned int>() > 255) {
    outError = key;
    return false;
  }
  out = (uint8_t)v.as<unsigned int>();
  return true;
}

static bool read_bool(const JsonDocument &doc, const char *key, bool &out, const char *&outError) {
  JsonVariantConst v = doc[key];
  if (v.isNull()) return true;
  if (!v.is<bool>()) {
    outError = key;
    return false;
  }
  out = v.as<bool>();
  return true;
}

bool validateConfig(const GateConfig &cfg, const char *&outError) {
  outError = nullptr;
  if (!(cfg.fullRevolutionDeg > 0.0f)) {
    outError = "full_revolution_deg";
    return false;
  }
  if (cfg.symbolCount < 7 || cfg.symbolCount > kMaxSymbols) {
    outError = "symbol_count";
    return false;
  }
  if (cfg.pointOfOrigin < 1 || cfg.pointOfOrigin > cfg.symbolCount) {
    outError = "point_of_origin";
    return false;
  }
  if (cfg.chevronCount < 7 || cfg.chevronCount > kMaxChevrons) {
    outError = "chevron_count";
    return false;
  }
  if (cfg.masterChevron < 1 || cfg.masterChevron > cfg.chevronCount) {
    outError = "master_chevron";
    return false;
  }
  const uint8_t lengthCap = cfg.chevronCount < kMaxAddressLength ? cfg.chevronCount : kMaxAddressLength;
  if (cfg.minAddressLength < kMinAddressLength || cfg.minAddressLength > cfg.maxAddressLength) {
    outError = "min_address_length";
    return false;
  }
  if (cfg.maxAddressLength > lengthCap) {
    outError = "max_address_length";
    return false;
  }
  if (cfg.motionTimeoutMs == 0) {
    outError = "motion_timeout_ms";
    return false;
  }
  if (cfg.homingTimeoutMs == 0) {
    outError = "homing_timeout_ms";
    return false;
  }
  const float spacing = cfg.fullRevolutionDeg / (float)cfg.symbolCount;
  if (!(cfg.arrivalToleranceDeg > 0.0f) || cfg.arrivalToleranceDeg >= spacing / 2.0f) {
    outError = "arrival_tolerance_deg";
    return false;
  }
  if (cfg.idlePositionDeg < 0.0f || cfg.idlePositionDeg >= cfg.fullRevolutionDeg) {
    outError = "idle_position_deg";
    return false;
  }
  return true;
}

bool applyConfigJson(const JsonDocument &doc, GateConfig &cfg, const char *&outError) {
  outError = nullptr;
  if (!doc.is<JsonObjectConst>()) {
    outError = "root";
    return false;
  }

  if (!read_float(doc, "full_revolution_deg", cfg.fullRevolutionDeg, outError)) return false;
  if (!read_u8(doc, "symbol_count", cfg.symbolCount, outError)) return false;
  if (!read_u8(doc, "point_of_origin", cfg.pointOfOrigin, outError)) return false;
  if (!read_float(doc, "symbol_offset_deg", cfg.symbolOffsetDeg, outError)) return false;
  if (!read_u8(doc, "chevron_count", cfg.chevronCount, outError)) return false;
  if (!read_u8(doc, "master_chevron", cfg.masterChevron, outError)) return false;
  if (!read_bool(doc, "lock_at_engaged_chevron", cfg.lockAtEngagedChevron, outError)) return false;
  if (!read_u8(doc, "min_address_length", cfg.minAddressLength, outError)) return false;
  if (!read_u8(doc, "max_address_length", cfg.maxAddressLength, outError)) return false;
  if (!read_float(doc, "arrival_tolerance_deg", cfg.arrivalToleranceDeg, outError)) return false;
  if (!read_u32(doc, "settle_delay_ms", cfg.settleDelayMs, outError)) return false;
  if (!read_u32(doc, "wormhole_hold_ms", cfg.wormholeHoldMs, outError)) return false;
  if (!read_bool(doc, "hold_until_close", cfg.holdUntilClose, outError)) return false;
  if (!read_u32(doc, "motion_timeout_ms", cfg.motionTimeoutMs, outError)) return false;
  if (!read_u32(doc, "homing_timeout_ms", cfg.homingTimeoutMs, outError)) return false;
  if (!read_bool(doc, "return_to_idle_position", cfg.returnToIdlePosition, outError)) return false;
  if (!read_float(doc, "idle_position_deg", cfg.idlePositionDeg, outError)) return false;

  JsonVariantConst origin = doc["origin_placement"];
  if (!origin.isNull()) {
    const char *s = origin | "";
    if (strcmp(s, "leading") == 0) {
      cfg.originPlacement = OriginPlacement::Leading;
    } else if (strcmp(s, "trailing") == 0) {
      cfg.originPlacement = OriginPlacement::Trailing;
    } else {
      outError = "origin_placement";
      return false;
    }
  }

  JsonVariantConst tie = doc["tie_break"];
  if (!tie.isNull()) {
    const char *s = tie | "";
    if (strcmp(s, "cw") == 0) {
      cfg.tieBreak = Rotation::Clockwise;
    } else if (strcmp(s, "ccw") == 0) {
      cfg.tieBreak = Rotation::CounterClockwise;
    } else {
      outError = "tie_break";
      return false;
    }
  }

  return true;
}

bool loadConfigJson(const char *json, size_t length, GateConfig &cfg, const char *&outError) {
  DynamicJsonDocument doc(2048);
  DeserializationError err = deserializeJson(doc, json, length);
  if (err) {
    outError = "invalid_json";
    return false;
  }
  return applyConfigJson(doc, cfg, outError);
}

void writeConfigJson(const GateConfig &cfg, JsonDocument &doc) {
  doc["full_revolution_deg"] = cfg.fullRevolutionDeg;
  doc["symbol_count"] = cfg.symbolCount;
  doc["point_of_origin"] = cfg.pointOfOrigin;
  doc["symbol_offset_deg"] = cfg.symbolOffsetDeg;
  doc["chevron_count"] = cfg.chevronCount;
  doc["master_chevron"] = cfg.masterChevron;
  doc["lock_at_engaged_chevron"] = cfg.lockAtEngagedChevron;
  doc["min_address_length"] = cfg.minAddressLength;
  doc["max_address_length"] = cfg.maxAddressLength;
  doc["origin_placement"] = cfg.originPlacement == OriginPlacement::Leading ? "leading" : "trailing";
  doc["tie_break"] = cfg.tieBreak == Rotation::Clockwise ? "cw" : "ccw";
  doc["arrival_tolerance_deg"] = cfg.arrivalToleranceDeg;
  doc["settle_delay_ms"] = cfg.settleDelayMs;
  doc["wormhole_hold_ms"] = cfg.wormholeHoldMs;
  doc["hold_until_close"] = cfg.holdUntilClose;
  doc["motion_timeout_ms"] = cfg.motionTimeoutMs;
  doc["homing_timeout_ms"] = cfg.homingTimeoutMs;
  doc["return_to_idle_position"] = cfg.returnToIdlePosition;
  doc["idle_position_deg"] = cfg.idlePositionDeg;
}

} // namespace gate_dial
