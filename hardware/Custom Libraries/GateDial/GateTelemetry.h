#ifndef GATE_DIAL_TELEMETRY_H
#define GATE_DIAL_TELEMETRY_H

#include <ArduinoJson.h>

#include "GateStatus.h"

namespace gate_dial {

// Receives one telemetry document per sequencer event ("state", "motion",
// "chevron_locked", "run_started", "run_finished", "fault").
typedef void (*EventSink)(const JsonDocument &event, void *ctx);

// Fills `doc` with the status snapshot in the shape published as device state.
void writeStatusJson(const GateStatus &status, JsonDocument &doc);
void writeRunJson(const DialRun &run, JsonObject obj);

} // namespace gate_dial

#endif
