/*
 * Copyright (C) 2024 mutedeck2mqtt contributors
 *
 * This file is part of mutedeck2mqtt.
 *
 * mutedeck2mqtt is free software: you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * mutedeck2mqtt is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with mutedeck2mqtt. If not, see http://www.gnu.org/licenses/.
 */

// Publishing of discovery documents and status records. The broker connection
// itself is provided by an MqttClient implementation (AsyncMqttClient on the
// device, a recording fake in the tests). Publishing is never retried here,
// MuteDeck posts its status periodically.

#ifndef LIB_MUTEDECK_PUBLISHER_H_
#define LIB_MUTEDECK_PUBLISHER_H_

#include <ArduinoJson.h>

#include <cstdint>
#include <string>

#include "Discovery.h"

namespace mutedeck {

class MqttClient {
 public:
  virtual ~MqttClient() = default;

  // Returns an empty string on success, otherwise the failure cause.
  virtual std::string publish(const std::string& topic, uint8_t qos,
                              bool retain, const std::string& payload) = 0;
};

class Publisher {
 public:
  explicit Publisher(MqttClient* client);

  // Neither message is retained by the broker. Status records are published
  // with their keys in sorted order, nested objects included.
  std::string publishDiscovery(const std::string& key,
                               const DiscoveryDocument& document);
  std::string publishStatus(const std::string& channel,
                            JsonObjectConst record);

 private:
  MqttClient* client = nullptr;
};

}  // namespace mutedeck

#endif  // LIB_MUTEDECK_PUBLISHER_H_
