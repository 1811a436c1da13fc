#ifndef GATE_DIAL_ADDRESS_VALIDATOR_H
#define GATE_DIAL_ADDRESS_VALIDATOR_H

#include "SymbolMap.h"

namespace gate_dial {

class AddressValidator {
public:
  AddressValidator(const SymbolMap &map, const GateConfig &cfg);

  // Checks length, membership, distinctness, then origin presence and
  // placement; the first rule broken is reported. `out` is only written on success.
  ValidationError validate(const int *symbols, size_t count, Address &out) const;

private:
  const SymbolMap &_map;
  uint8_t _minLength;
  uint8_t _maxLength;
  OriginPlacement _placement;
};

} // namespace gate_dial

#endif
