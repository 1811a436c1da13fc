#include "GateDial.h"

namespace gate_dial {

Stargate::Stargate(const GateConfig &cfg, RingDriver &driver, EffectCoordinator &effects)
    : _cfg(cfg), _driver(driver), _map(_cfg), _validator(_map, _cfg), _gate(_validator, _cfg.fullRevolutionDeg),
      _sequencer(_cfg, _map, driver, effects, _gate) {}

bool Stargate::begin(const char *&outError) {
  outError = nullptr;
  if (!validateConfig(_cfg, outError)) return false;
  if (!_driver.begin()) {
    outError = "ring_driver";
    return false;
  }
  _running = true;
  return true;
}

void Stargate::loop(uint32_t nowMs) {
  if (!_running) return;
  _sequencer.tick(nowMs);
}

void Stargate::end(uint32_t nowMs) {
  if (!_running) return;
  _sequencer.shutdown(nowMs);
  _driver.end();
  _running = false;
}

} // namespace gate_dial
