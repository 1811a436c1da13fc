#ifndef GATE_DIAL_REMOTE_H
#define GATE_DIAL_REMOTE_H

#include <Arduino.h>
#include <ArduinoJson.h>
#include <MQTT.h>

#if defined(ESP32)
#include <WiFi.h>
#define GATE_DIAL_NETWORK_CLIENT WiFiClient
#else
#include <NativeEthernet.h>
#define GATE_DIAL_NETWORK_CLIENT EthernetClient
#endif

#include <CommandBridge.h>

namespace gate_dial {

struct RemoteConfig {
  IPAddress brokerIp;
  const char *brokerHost = nullptr;
  uint16_t brokerPort = 1883;
  const char *username = nullptr;
  const char *password = nullptr;

  const char *roomId = nullptr;
  const char *deviceId = nullptr;
  const char *firmwareVersion = "unknown";

  uint16_t keepAliveSeconds = 10;
  uint32_t reconnectDelayMs = 1000;
  uint32_t heartbeatIntervalMs = 1000;

  size_t rxJsonCapacity = 2048;
  size_t txJsonCapacity = 3072;
};

// Returns the ack to publish; `outReasonCode` is read only for Rejected.
using CommandHandler = AckStatus (*)(const JsonDocument &cmd, const char *&outReasonCode, void *ctx);

// MQTT transport for the gate: room/<room>/device/<device>/{cmd,ack,heartbeat,presence,state,telemetry}.
class RemoteClient {
public:
  explicit RemoteClient(const RemoteConfig &cfg);

  bool begin();
  void loop();

  void setCommandHandler(CommandHandler handler, void *ctx = nullptr);
  // "SAFE" or "FAULT"; stamped on every outgoing document.
  void setSafetyState(const char *kind) { _safetyKind = kind ? kind : "SAFE"; }

  bool isConnected() const { return _mqtt.connected(); }

  bool publishPresenceOnline();
  bool publishHeartbeat();
  bool publishState(const JsonDocument &state, const char *reason);
  bool publishTelemetry(const JsonDocument &telemetry);

  bool publishAck(const JsonDocument &cmd, AckStatus status, const char *reasonCode = nullptr);

private:
  void ensureConnected();
  void handleIncoming(char topic[], char bytes[], int length);
  void stampEnvelope(JsonDocument &doc) const;

  String topic(const char *leaf) const;
  String clientId() const;

  GATE_DIAL_NETWORK_CLIENT _net;
  MQTTClient _mqtt;
  RemoteConfig _cfg;
  unsigned long _lastConnectAttempt = 0;
  unsigned long _lastHeartbeat = 0;
  const char *_safetyKind = "SAFE";

  CommandHandler _handler = nullptr;
  void *_handlerCtx = nullptr;

  static void mqttThunk(MQTTClient *client, char topic[], char bytes[], int length);
};

} // namespace gate_dial

#endif
