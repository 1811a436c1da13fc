#include "SymbolMap.h"

#include <string.h>

#include "RingGeometry.h"

namespace gate_dial {

// Milky Way glyphs in ring order; glyph 1 is the point of origin.
static const uint8_t kMilkyWayGlyphCount = 39;
static const char *const kMilkyWayGlyphs[kMilkyWayGlyphCount] = {
    "Earth",          "Crater",     "Virgo",     "Bootes",     "Centaurus",        "Libra",       "Serpens Caput",
    "Norma",          "Scorpio",    "Corona Australis", "Scutum", "Sagittarius",   "Aquila",      "Microscopium",
    "Capricornus",    "Piscis Austrinus", "Equuleus", "Aquarius", "Pegasus",       "Sculptor",    "Pisces",
    "Andromeda",      "Triangulum", "Aries",     "Perseus",    "Cetus",            "Taurus",      "Auriga",
    "Eridanus",       "Orion",      "Canis Minor", "Monoceros", "Gemini",          "Hydra",       "Lynx",
    "Cancer",         "Sextans",    "Leo Minor", "Leo",
};

SymbolMap::SymbolMap(const GateConfig &cfg)
    : _revolution(cfg.fullRevolutionDeg), _symbolCount(cfg.symbolCount), _chevronCount(cfg.chevronCount),
      _pointOfOrigin(cfg.pointOfOrigin), _masterChevron(cfg.masterChevron) {
  if (_symbolCount > kMaxSymbols) _symbolCount = kMaxSymbols;
  if (_chevronCount > kMaxChevrons) _chevronCount = kMaxChevrons;

  const float spacing = _revolution / (float)(_symbolCount ? _symbolCount : 1);
  for (uint8_t i = 0; i < kMaxSymbols; i++) {
    _positions[i] = i < _symbolCount ? normalizeAngle(cfg.symbolOffsetDeg + spacing * (float)i, _revolution) : 0.0f;
  }

  const float chevronSpacing = _revolution / (float)(_chevronCount ? _chevronCount : 1);
  for (uint8_t i = 0; i < kMaxChevrons; i++) {
    const int offset = (int)(i + 1) - (int)_masterChevron;
    _chevronAngles[i] = i < _chevronCount ? normalizeAngle(chevronSpacing * (float)offset, _revolution) : 0.0f;
  }
}

bool SymbolMap::positionOf(int symbol, float &outDeg) const {
  if (!contains(symbol)) return false;
  outDeg = _positions[symbol - 1];
  return true;
}

uint8_t SymbolMap::symbolAt(float deg, float toleranceDeg) const {
  uint8_t best = kNoSymbol;
  float bestDistance = toleranceDeg;
  for (uint8_t i = 0; i < _symbolCount; i++) {
    const float d = angularDistance(deg, _positions[i], _revolution);
    if (d <= bestDistance) {
      bestDistance = d;
      best = (uint8_t)(i + 1);
    }
  }
  return best;
}

bool SymbolMap::chevronAngle(int chevron, float &outDeg) const {
  if (chevron < 1 || chevron > _chevronCount) return false;
  outDeg = _chevronAngles[chevron - 1];
  return true;
}

const char *SymbolMap::nameOf(int symbol) const {
  if (!contains(symbol)) return nullptr;
  if (_symbolCount != kMilkyWayGlyphCount) return "";
  return kMilkyWayGlyphs[symbol - 1];
}

uint8_t SymbolMap::findByName(const char *name) const {
  if (!name || !name[0] || _symbolCount != kMilkyWayGlyphCount) return kNoSymbol;
  for (uint8_t i = 0; i < kMilkyWayGlyphCount; i++) {
    if (strcmp(kMilkyWayGlyphs[i], name) == 0) return (uint8_t)(i + 1);
  }
  return kNoSymbol;
}

uint8_t SymbolMap::chevronForStep(uint8_t step, uint8_t length) const {
  if (length == 0 || step + 1 >= length) return _masterChevron;

  // Non-master chevrons engage in index order: 1..6 then 8, 9.
  uint8_t seen = 0;
  for (uint8_t c = 1; c <= _chevronCount; c++) {
    if (c == _masterChevron) continue;
    if (seen == step) return c;
    seen++;
  }
  return _masterChevron;
}

} // namespace gate_dial
