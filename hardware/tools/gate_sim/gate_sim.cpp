// Host-side dial simulation.
//
//   gate_sim [--config gate.json] [--stall-at-step N] [--abort-after-ms N] <symbol>...
//
// Symbols are ids (1..symbol_count) or Milky Way glyph names. Prints one JSON
// document per line (effective config, sequencer events, effect cues, final
// status) and exits 0 only if the dial completes.

#include <stdio.h>
#include <stdlib.h>
#include <string.h>

#include <string>

#include <ArduinoJson.h>

#include <GateDial.h>
#include <SimulatedRing.h>

using namespace gate_dial;

static const uint32_t kTickMs = 10;
static const uint32_t kMaxSimulatedMs = 15UL * 60UL * 1000UL;

static void print_json(const JsonDocument &doc) {
  std::string line;
  serializeJson(doc, line);
  puts(line.c_str());
}

static void print_event(const JsonDocument &event, void *ctx) {
  (void)ctx;
  print_json(event);
}

class PrintingEffects : public EffectCoordinator {
public:
  void onChevronLock(uint8_t chevron, uint8_t symbol) override {
    StaticJsonDocument<128> cue;
    cue["event"] = "cue";
    cue["cue"] = "chevron_lock";
    cue["chevron"] = chevron;
    cue["symbol"] = symbol;
    print_json(cue);
  }
  void onFinalLock() override { printCue("final_lock"); }
  void onWormholeOpen() override { printCue("wormhole_open"); }
  void onWormholeClose() override { printCue("wormhole_close"); }
  void onAbort() override { printCue("abort"); }

private:
  static void printCue(const char *name) {
    StaticJsonDocument<96> cue;
    cue["event"] = "cue";
    cue["cue"] = name;
    print_json(cue);
  }
};

static void usage() {
  fprintf(stderr, "usage: gate_sim [--config FILE] [--stall-at-step N] [--abort-after-ms N] SYMBOL...\n");
}

static bool read_file(const char *path, std::string &out) {
  FILE *f = fopen(path, "rb");
  if (!f) return false;
  char buf[512];
  size_t n = 0;
  while ((n = fread(buf, 1, sizeof(buf), f)) > 0) out.append(buf, n);
  const bool ok = ferror(f) == 0;
  fclose(f);
  return ok;
}

static bool parse_u32(const char *s, uint32_t &out) {
  if (!s || !s[0]) return false;
  char *end = nullptr;
  const unsigned long v = strtoul(s, &end, 10);
  if (*end != '\0') return false;
  out = (uint32_t)v;
  return true;
}

int main(int argc, char **argv) {
  const char *configPath = nullptr;
  bool stallRequested = false;
  uint32_t stallStep = 0;
  bool abortRequested = false;
  uint32_t abortAfterMs = 0;
  const char *symbolArgs[kMaxSymbols];
  size_t symbolArgCount = 0;

  for (int i = 1; i < argc; i++) {
    const char *arg = argv[i];
    if (strcmp(arg, "--config") == 0 && i + 1 < argc) {
      configPath = argv[++i];
    } else if (strcmp(arg, "--stall-at-step") == 0 && i + 1 < argc) {
      if (!parse_u32(argv[++i], stallStep)) {
        usage();
        return 2;
      }
      stallRequested = true;
    } else if (strcmp(arg, "--abort-after-ms") == 0 && i + 1 < argc) {
      if (!parse_u32(argv[++i], abortAfterMs)) {
        usage();
        return 2;
      }
      abortRequested = true;
    } else if (arg[0] == '-' && arg[1] == '-') {
      usage();
      return 2;
    } else if (symbolArgCount < kMaxSymbols) {
      symbolArgs[symbolArgCount++] = arg;
    }
  }
  if (symbolArgCount == 0) {
    usage();
    return 2;
  }

  GateConfig cfg;
  const char *err = nullptr;
  if (configPath) {
    std::string json;
    if (!read_file(configPath, json)) {
      fprintf(stderr, "gate_sim: cannot read %s\n", configPath);
      return 2;
    }
    if (!loadConfigJson(json.data(), json.size(), cfg, err)) {
      fprintf(stderr, "gate_sim: config rejected: %s\n", err);
      return 2;
    }
  }

  SimulatedRingConfig ringCfg;
  ringCfg.revolutionDeg = cfg.fullRevolutionDeg;
  SimulatedRing ring(ringCfg);
  PrintingEffects effects;
  Stargate gate(cfg, ring, effects);

  if (!gate.begin(err)) {
    fprintf(stderr, "gate_sim: config rejected: %s\n", err);
    return 2;
  }
  gate.setEventSink(print_event);

  DynamicJsonDocument cfgDoc(1024);
  cfgDoc["event"] = "config";
  writeConfigJson(cfg, cfgDoc);
  print_json(cfgDoc);

  int symbols[kMaxSymbols];
  for (size_t i = 0; i < symbolArgCount; i++) {
    uint32_t id = 0;
    if (parse_u32(symbolArgs[i], id)) {
      symbols[i] = (int)id;
    } else {
      symbols[i] = gate.symbols().findByName(symbolArgs[i]);
    }
  }

  const Ack ack = gate.submitDial(symbols, symbolArgCount);
  if (!ack.accepted) {
    fprintf(stderr, "gate_sim: dial rejected: %s\n", reject_reason_code(ack));
    gate.end(0);
    return 1;
  }

  bool stallInjected = false;
  bool abortSent = false;
  uint32_t now = 0;
  for (; now <= kMaxSimulatedMs; now += kTickMs) {
    gate.loop(now);
    const GateStatus st = gate.status();

    if (stallRequested && !stallInjected && st.state == GateState::StepMoving && st.hasRun &&
        st.run.stepIndex == stallStep) {
      ring.injectStall();
      stallInjected = true;
    }
    if (abortRequested && !abortSent && now >= abortAfterMs) {
      gate.abort();
      abortSent = true;
    }
    if (st.hasLastRun && st.lastRun.runId == ack.runId && !gate_state_in_flight(st.state)) break;
  }

  const GateStatus result = gate.status();
  DynamicJsonDocument statusDoc(2048);
  statusDoc["event"] = "status";
  writeStatusJson(result, statusDoc);
  print_json(statusDoc);

  gate.end(now);
  const bool completed = result.hasLastRun && result.lastRun.runId == ack.runId &&
                         result.lastRun.termination == Termination::Completed;
  return completed ? 0 : 1;
}
