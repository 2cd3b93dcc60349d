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

#ifndef LIB_MUTEDECK_CONFIG_H_
#define LIB_MUTEDECK_CONFIG_H_

#include <cstddef>
#include <cstdint>
#include <map>
#include <string>
#include <vector>

#include "Logger.h"

namespace mutedeck {

struct Config {
  std::string mqttHost;
  uint16_t mqttPort = 1883;
  std::string mqttUser;
  std::string mqttPass;
  std::string clientId = "mutedeck2mqtt";
  std::string discoveryPrefix = "homeassistant";
  LogLevel logLevel = LogLevel::INFO;
  uint16_t httpPort = 8080;

  // Names of the required parameters that are empty.
  const std::vector<std::string> missing() const;
};

// Empty text keeps port unchanged. Returns false unless the text is a
// decimal number in 1..65535.
bool parsePort(const std::string& text, uint16_t* port);

// Longest text the portal stores in a parameter buffer.
constexpr size_t maxTextLength = 63;

// Values submitted with the configuration form. The password field is left
// empty by the browser when unchanged, storedPassword is the saved one.
struct FormValues {
  std::string mqttServer;
  std::string mqttPort;
  std::string mqttUser;
  std::string mqttPass;
  std::string storedPass;
  std::string httpPort;
};

// Rejected fields keyed by portal id. Messages are string literals and stay
// valid after the call.
std::map<std::string, const char*> validateForm(const FormValues& values);

}  // namespace mutedeck

#endif  // LIB_MUTEDECK_CONFIG_H_
