#include "Mqtt.hpp"

#include <Logger.h>

#include <cctype>

using mutedeck::logger;

Mqtt mqtt;

Mqtt::Mqtt() {
  client.onConnect(onConnect);
  client.onDisconnect(onDisconnect);
  client.onSubscribe(onSubscribe);
  client.onUnsubscribe(onUnsubscribe);
  client.onMessage(onMessage);
  client.onPublish(onPublish);
}

void Mqtt::setClientId(const std::string& id) {
  clientId = id;
  client.setClientId(clientId.c_str());
}

void Mqtt::setServer(const std::string& host, uint16_t port) {
  this->host.clear();
  for (char c : host)
    if (!std::isspace(static_cast<unsigned char>(c))) this->host += c;

  client.setServer(this->host.c_str(), port);
}

void Mqtt::setCredentials(const std::string& username,
                          const std::string& password) {
  this->username = username;
  this->password = password;
  client.setCredentials(this->username.c_str(),
                        this->password.empty() ? nullptr
                                               : this->password.c_str());
}

void Mqtt::setLifecycle(mutedeck::Lifecycle* lifecycle) {
  this->lifecycle = lifecycle;
}

const std::string& Mqtt::getServer() const { return host; }

void Mqtt::connect() { client.connect(); }

bool Mqtt::connected() const { return client.connected(); }

void Mqtt::disconnect() { client.disconnect(); }

std::string Mqtt::publish(const std::string& topic, uint8_t qos, bool retain,
                          const std::string& payload) {
  if (!client.connected()) {
    std::string error = "not connected to MQTT broker";
    int reason = disconnectReason;
    if (reason >= 0)
      error += std::string(" (") + disconnectReasonText(reason) + ")";
    return error;
  }

  uint16_t packetId = client.publish(topic.c_str(), qos, retain,
                                     payload.c_str(), payload.size());
  if (packetId == 0) return "MQTT client rejected publish to " + topic;

  return "";
}

uint16_t Mqtt::subscribe(const char* topic, uint8_t qos) {
  return client.subscribe(topic, qos);
}

const char* Mqtt::disconnectReasonText(int reason) {
  switch (static_cast<AsyncMqttClientDisconnectReason>(reason)) {
    case AsyncMqttClientDisconnectReason::TCP_DISCONNECTED:
      return "tcp disconnected";
    case AsyncMqttClientDisconnectReason::MQTT_UNACCEPTABLE_PROTOCOL_VERSION:
      return "unacceptable protocol version";
    case AsyncMqttClientDisconnectReason::MQTT_IDENTIFIER_REJECTED:
      return "identifier rejected";
    case AsyncMqttClientDisconnectReason::MQTT_SERVER_UNAVAILABLE:
      return "server unavailable";
    case AsyncMqttClientDisconnectReason::MQTT_MALFORMED_CREDENTIALS:
      return "malformed credentials";
    case AsyncMqttClientDisconnectReason::MQTT_NOT_AUTHORIZED:
      return "not authorized";
    default:
      return "unknown";
  }
}

void Mqtt::onConnect(bool sessionPresent) {
  logger.info("MQTT connected");
  mqtt.disconnectReason = -1;
  mqtt.subscribe(mutedeck::lifecycleTopic, 0);
}

void Mqtt::onDisconnect(AsyncMqttClientDisconnectReason reason) {
  mqtt.disconnectReason = static_cast<int>(reason);
  logger.warn(std::string("MQTT disconnected: ") +
              disconnectReasonText(static_cast<int>(reason)));
}

void Mqtt::onMessage(const char* topic, const char* payload,
                     AsyncMqttClientMessageProperties properties, size_t len,
                     size_t index, size_t total) {
  // status messages are short, fragmented payloads are not expected
  if (index != 0 || len != total) return;

  if (std::string(topic) != mutedeck::lifecycleTopic) return;

  if (mqtt.lifecycle != nullptr)
    mqtt.lifecycle->handleStatus(std::string(payload, len));
}
