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

// Home Assistant MQTT device discovery for a MuteDeck instance. One discovery
// document per topic describes a device with six entities (call, control,
// mute, record, share, video) that read their state from the status topic.
// The document only depends on topic and routing prefix; the embedded version
// is fixed at build time.

#ifndef LIB_MUTEDECK_DISCOVERY_H_
#define LIB_MUTEDECK_DISCOVERY_H_

#include <ArduinoJson.h>

#include <map>
#include <string>
#include <vector>

#ifndef MUTEDECK_VERSION
#define MUTEDECK_VERSION "2024.12.16"
#endif

namespace mutedeck {

extern const char* const deviceObjectId;  // "mutedeck2mqtt_device"

struct Device {
  std::vector<std::string> ids;
  std::string name;
  std::string manufacturer;
  std::string model;
  std::string swVersion;
  std::string serialNumber;
  std::string hwVersion;
};

struct Origin {
  std::string name;
  std::string swVersion;
  std::string url;
};

struct Component {
  std::string commandTopic;
  bool enabledByDefault = true;
  std::string entityCategory;
  std::string icon;
  std::string name;
  std::string objectId;
  bool optimistic = false;
  std::vector<std::string> options;
  std::string platform;  // "binary_sensor", "select"
  std::string stateTopic;
  std::string uniqueId;
  std::string valueTemplate;
};

struct DiscoveryDocument {
  Device device;
  Origin origin;
  std::map<std::string, Component> components;  // key: <topic>_<field>
  std::string stateTopic;
  int qos = 0;

  const JsonDocument toJsonDoc() const;
  const std::string toJson() const;
};

// <discoveryPrefix>/device/mutedeck2mqtt_device_<topic>/config
const std::string discoveryTopic(const std::string& discoveryPrefix,
                                 const std::string& topic);

// <prefix>/<topic>
const std::string statusTopic(const std::string& prefix,
                              const std::string& topic);

DiscoveryDocument buildDiscovery(const std::string& topic,
                                 const std::string& prefix);

}  // namespace mutedeck

#endif  // LIB_MUTEDECK_DISCOVERY_H_
