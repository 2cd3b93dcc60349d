#pragma once

#include <AsyncMqttClient.h>
#include <Lifecycle.h>
#include <Publisher.h>

#include <atomic>
#include <string>

// The MQTT class acts as a wrapper for the broker connection. It publishes on
// behalf of the bridge and forwards Home Assistant status messages to the
// lifecycle listener.

class Mqtt : public mutedeck::MqttClient {
 public:
  Mqtt();

  void setClientId(const std::string& id);
  void setServer(const std::string& host, uint16_t port);
  void setCredentials(const std::string& username,
                      const std::string& password);

  void setLifecycle(mutedeck::Lifecycle* lifecycle);

  const std::string& getServer() const;

  void connect();
  bool connected() const;

  void disconnect();

  std::string publish(const std::string& topic, uint8_t qos, bool retain,
                      const std::string& payload) override;

 private:
  AsyncMqttClient client;

  // AsyncMqttClient keeps pointers to these
  std::string clientId;
  std::string host;
  std::string username;
  std::string password;

  mutedeck::Lifecycle* lifecycle = nullptr;

  std::atomic<int> disconnectReason{-1};

  uint16_t subscribe(const char* topic, uint8_t qos);

  static const char* disconnectReasonText(int reason);

  static void onConnect(bool sessionPresent);
  static void onDisconnect(AsyncMqttClientDisconnectReason reason);

  static void onSubscribe(uint16_t packetId, uint8_t qos) {}
  static void onUnsubscribe(uint16_t packetId) {}

  static void onMessage(const char* topic, const char* payload,
                        AsyncMqttClientMessageProperties properties, size_t len,
                        size_t index, size_t total);

  static void onPublish(uint16_t packetId) {}
};

extern Mqtt mqtt;
