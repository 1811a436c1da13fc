#ifndef GATE_DIAL_SYMBOL_MAP_H
#define GATE_DIAL_SYMBOL_MAP_H

#include "GateConfig.h"

namespace gate_dial {

// Glyph <-> ring angle and chevron <-> engagement angle lookup.
// Built once from the configuration and never mutated afterwards.
class SymbolMap {
public:
  explicit SymbolMap(const GateConfig &cfg);

  uint8_t symbolCount() const { return _symbolCount; }
  uint8_t chevronCount() const { return _chevronCount; }
  uint8_t pointOfOrigin() const { return _pointOfOrigin; }
  uint8_t masterChevron() const { return _masterChevron; }
  float revolution() const { return _revolution; }

  bool contains(int symbol) const { return symbol >= 1 && symbol <= _symbolCount; }

  // false (UnknownSymbol) when `symbol` is outside the alphabet.
  bool positionOf(int symbol, float &outDeg) const;
  // kNoSymbol when no glyph lies within `toleranceDeg` of `deg`.
  uint8_t symbolAt(float deg, float toleranceDeg) const;
  bool chevronAngle(int chevron, float &outDeg) const;

  const char *nameOf(int symbol) const;
  uint8_t findByName(const char *name) const;

  // Chevron lit by step `step` (0-based) of an address of `length` symbols.
  uint8_t chevronForStep(uint8_t step, uint8_t length) const;

private:
  float _revolution;
  uint8_t _symbolCount;
  uint8_t _chevronCount;
  uint8_t _pointOfOrigin;
  uint8_t _masterChevron;
  float _positions[kMaxSymbols];
  float _chevronAngles[kMaxChevrons];
};

} // namespace gate_dial

#endif
