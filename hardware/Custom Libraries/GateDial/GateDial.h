#ifndef GATE_DIAL_H
#define GATE_DIAL_H

#include "AddressValidator.h"
#include "CommandGate.h"
#include "DialSequencer.h"
#include "EffectCoordinator.h"
#include "GateConfig.h"
#include "GateTelemetry.h"
#include "RingDriver.h"
#include "RingGeometry.h"
#include "SymbolMap.h"

namespace gate_dial {

// Process-wide gate context. Owns the symbol map, validator, command gate and
// sequencer; the ring driver and effects are supplied by the caller and must
// outlive it.
class Stargate {
public:
  Stargate(const GateConfig &cfg, RingDriver &driver, EffectCoordinator &effects);

  // Validates the configuration and starts the driver. On failure nothing has
  // moved and `outError` names the offending setting.
  bool begin(const char *&outError);
  void loop(uint32_t nowMs);
  // Aborts any active run and releases the driver.
  void end(uint32_t nowMs);

  void setEventSink(EventSink sink, void *ctx = nullptr) { _sequencer.setEventSink(sink, ctx); }

  Ack submitDial(const int *symbols, size_t count) { return _gate.submitDial(symbols, count); }
  Ack abort() { return _gate.abort(); }
  Ack manualMove(float deltaDeg) { return _gate.manualMove(deltaDeg); }
  Ack home() { return _gate.home(); }
  Ack closeWormhole() { return _gate.closeWormhole(); }
  GateStatus status() const { return _gate.status(); }

  const GateConfig &config() const { return _cfg; }
  const SymbolMap &symbols() const { return _map; }
  bool running() const { return _running; }

private:
  GateConfig _cfg;
  RingDriver &_driver;
  SymbolMap _map;
  AddressValidator _validator;
  CommandGate _gate;
  DialSequencer _sequencer;
  bool _running = false;
};

} // namespace gate_dial

#endif
