#include "GateTelemetry.h"

namespace gate_dial {

void writeRunJson(const DialRun &run, JsonObject obj) {
  obj["run_id"] = run.runId;
  JsonArray address = obj.createNestedArray("address");
  for (uint8_t i = 0; i < run.address.length; i++) address.add(run.address.symbols[i]);
  obj["step_index"] = run.stepIndex;
  JsonArray steps = obj.createNestedArray("steps");
  for (uint8_t i = 0; i < run.address.length; i++) steps.add(step_status_str(run.steps[i]));
  obj["started_at_ms"] = run.startedAtMs;
  if (run.termination != Termination::None) {
    obj["ended_at_ms"] = run.endedAtMs;
    obj["termination"] = termination_str(run.termination);
  }
  if (run.fault != FaultKind::None) {
    obj["fault"] = fault_kind_str(run.fault);
    obj["fault_detail"] = run.faultDetail;
  }
}

void writeStatusJson(const GateStatus &status, JsonDocument &doc) {
  doc["state"] = gate_state_str(status.state);
  doc["position_deg"] = status.positionDeg;
  doc["homed"] = status.homed;
  doc["needs_home"] = status.needsHome;
  doc["moving"] = status.moving;

  JsonArray chevrons = doc.createNestedArray("chevrons");
  for (uint8_t i = 0; i < status.chevronCount; i++) chevrons.add(chevron_state_str(status.chevrons[i]));

  if (status.hasRun) writeRunJson(status.run, doc.createNestedObject("current_run"));
  if (status.hasLastRun) writeRunJson(status.lastRun, doc.createNestedObject("last_run"));

  if (status.lastFault != FaultKind::None) {
    JsonObject fault = doc.createNestedObject("last_fault");
    fault["kind"] = fault_kind_str(status.lastFault);
    fault["detail"] = status.lastFaultDetail;
  }
  doc["updated_at_ms"] = status.updatedAtMs;
}

} // namespace gate_dial
