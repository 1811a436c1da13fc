#include "GateRemote.h"

namespace gate_dial {

static const char *schema_v8 = "v8";

RemoteClient::RemoteClient(const RemoteConfig &cfg) : _mqtt((int)cfg.rxJsonCapacity, (int)cfg.txJsonCapacity), _cfg(cfg) {}

bool RemoteClient::begin() {
  if (!_cfg.roomId || !_cfg.deviceId) {
    return false;
  }

  _mqtt.begin(_net);
  if (_cfg.brokerIp != IPAddress(0, 0, 0, 0)) {
    _mqtt.setHost(_cfg.brokerIp, _cfg.brokerPort);
  } else if (_cfg.brokerHost && _cfg.brokerHost[0]) {
    _mqtt.setHost(_cfg.brokerHost, _cfg.brokerPort);
  } else {
    return false;
  }

  _mqtt.setOptions(_cfg.keepAliveSeconds, true, 1000);
  _mqtt.onMessageAdvanced(mqttThunk);
  _mqtt.ref = this;
  return true;
}

void RemoteClient::loop() {
  ensureConnected();
  _mqtt.loop();

  if (_mqtt.connected()) {
    const unsigned long now = millis();
    if (now - _lastHeartbeat >= _cfg.heartbeatIntervalMs) {
      publishHeartbeat();
      _lastHeartbeat = now;
    }
  }
}

void RemoteClient::setCommandHandler(CommandHandler handler, void *ctx) {
  _handler = handler;
  _handlerCtx = ctx;
}

String RemoteClient::clientId() const {
  String id = "gate-dial-";
  id += _cfg.roomId;
  id += "-";
  id += _cfg.deviceId;
  return id;
}

String RemoteClient::topic(const char *leaf) const {
  return String("room/") + _cfg.roomId + "/device/" + _cfg.deviceId + "/" + leaf;
}

void RemoteClient::stampEnvelope(JsonDocument &doc) const {
  doc["schema"] = schema_v8;
  doc["room_id"] = _cfg.roomId;
  doc["device_id"] = _cfg.deviceId;
  JsonObject safety = doc.createNestedObject("safety_state");
  safety["kind"] = _safetyKind;
  safety["latched"] = false;
  doc["observed_at_unix_ms"] = 0;
}

void RemoteClient::ensureConnected() {
  if (_mqtt.connected()) return;

  unsigned long now = millis();
  if (now - _lastConnectAttempt < _cfg.reconnectDelayMs) return;
  _lastConnectAttempt = now;

  String willTopic = topic("presence");
  DynamicJsonDocument willDoc(512);
  willDoc["schema"] = schema_v8;
  willDoc["room_id"] = _cfg.roomId;
  willDoc["device_id"] = _cfg.deviceId;
  willDoc["status"] = "OFFLINE";
  willDoc["observed_at_unix_ms"] = 0;
  String willPayload;
  serializeJson(willDoc, willPayload);

  _mqtt.setWill(willTopic.c_str(), willPayload.c_str(), true, 1);

  if (!_mqtt.connect(clientId().c_str(), _cfg.username, _cfg.password)) {
    return;
  }

  _mqtt.subscribe(topic("cmd").c_str(), 1);
  publishPresenceOnline();
}

bool RemoteClient::publishPresenceOnline() {
  DynamicJsonDocument doc(512);
  doc["schema"] = schema_v8;
  doc["room_id"] = _cfg.roomId;
  doc["device_id"] = _cfg.deviceId;
  doc["status"] = "ONLINE";
  doc["observed_at_unix_ms"] = 0;
  String payload;
  serializeJson(doc, payload);
  return _mqtt.publish(topic("presence").c_str(), payload.c_str(), true, 1);
}

bool RemoteClient::publishHeartbeat() {
  DynamicJsonDocument doc(512);
  stampEnvelope(doc);
  doc["uptime_ms"] = (uint64_t)millis();
  doc["firmware_version"] = _cfg.firmwareVersion ? _cfg.firmwareVersion : "unknown";

  String payload;
  serializeJson(doc, payload);
  return _mqtt.publish(topic("heartbeat").c_str(), payload.c_str(), false, 0);
}

bool RemoteClient::publishState(const JsonDocument &state, const char *reason) {
  DynamicJsonDocument doc(_cfg.txJsonCapacity);
  stampEnvelope(doc);
  doc["reason"] = reason ? reason : "change";
  doc["state"] = state.as<JsonVariantConst>();

  String payload;
  serializeJson(doc, payload);
  return _mqtt.publish(topic("state").c_str(), payload.c_str(), true, 1);
}

bool RemoteClient::publishTelemetry(const JsonDocument &telemetry) {
  DynamicJsonDocument doc(_cfg.txJsonCapacity);
  stampEnvelope(doc);
  doc["telemetry"] = telemetry.as<JsonVariantConst>();

  String payload;
  serializeJson(doc, payload);
  return _mqtt.publish(topic("telemetry").c_str(), payload.c_str(), false, 0);
}

bool RemoteClient::publishAck(const JsonDocument &cmd, AckStatus status, const char *reasonCode) {
  DynamicJsonDocument doc(1024);
  stampEnvelope(doc);
  doc["command_id"] = cmd["command_id"] | "";
  doc["correlation_id"] = cmd["correlation_id"] | "";
  doc["status"] = ack_status_str(status);
  if (status == AckStatus::Rejected) doc["reason_code"] = reasonCode ? reasonCode : "REJECTED";

  String payload;
  serializeJson(doc, payload);
  return _mqtt.publish(topic("ack").c_str(), payload.c_str(), false, 1);
}

void RemoteClient::mqttThunk(MQTTClient *client, char topic[], char bytes[], int length) {
  RemoteClient *self = (RemoteClient *)client->ref;
  if (!self) return;
  self->handleIncoming(topic, bytes, length);
}

void RemoteClient::handleIncoming(char topicName[], char bytes[], int length) {
  if (!_handler) return;
  if (String(topicName) != topic("cmd")) return;

  DynamicJsonDocument cmdDoc(_cfg.rxJsonCapacity);
  DeserializationError err = deserializeJson(cmdDoc, bytes, length);
  if (err) return;

  if (String(cmdDoc["schema"] | "") != schema_v8) return;
  if (String(cmdDoc["room_id"] | "") != _cfg.roomId) return;
  if (String(cmdDoc["device_id"] | "") != _cfg.deviceId) return;

  const char *reasonCode = nullptr;
  const AckStatus status = _handler(cmdDoc, reasonCode, _handlerCtx);
  if (status == AckStatus::Rejected) {
    publishAck(cmdDoc, AckStatus::Rejected, reasonCode);
    return;
  }

  publishAck(cmdDoc, AckStatus::Accepted);
  if (status == AckStatus::Completed) publishAck(cmdDoc, AckStatus::Completed);
}

} // namespace gate_dial
