#include "AddressValidator.h"

namespace gate_dial {

AddressValidator::AddressValidator(const SymbolMap &map, const GateConfig &cfg)
    : _map(map), _minLength(cfg.minAddressLength), _maxLength(cfg.maxAddressLength), _placement(cfg.originPlacement) {}

ValidationError AddressValidator::validate(const int *symbols, size_t count, Address &out) const {
  if (count < _minLength) return ValidationError::TooShort;
  if (count > _maxLength || count > kMaxAddressLength) return ValidationError::TooLong;
  if (!symbols) return ValidationError::TooShort;

  for (size_t i = 0; i < count; i++) {
    if (!_map.contains(symbols[i])) return ValidationError::UnknownSymbol;
  }

  for (size_t i = 0; i < count; i++) {
    for (size_t j = i + 1; j < count; j++) {
      if (symbols[i] == symbols[j]) return ValidationError::DuplicateSymbol;
    }
  }

  const int origin = _map.pointOfOrigin();
  size_t originAt = count;
  for (size_t i = 0; i < count; i++) {
    if (symbols[i] == origin) originAt = i;
  }
  if (originAt == count) return ValidationError::MissingOrigin;

  const size_t expected = _placement == OriginPlacement::Leading ? 0 : count - 1;
  if (originAt != expected) return ValidationError::MisplacedOrigin;

  for (size_t i = 0; i < count; i++) out.symbols[i] = (uint8_t)symbols[i];
  out.length = (uint8_t)count;
  return ValidationError::None;
}

} // namespace gate_dial
