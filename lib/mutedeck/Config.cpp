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

#include "Config.h"

#include <cctype>

const std::vector<std::string> mutedeck::Config::missing() const {
  std::vector<std::string> result;
  if (mqttHost.empty()) result.push_back("mqtt_server");
  if (mqttPass.empty()) result.push_back("mqtt_pass");
  if (mqttUser.empty()) result.push_back("mqtt_user");
  return result;
}

bool mutedeck::parsePort(const std::string& text, uint16_t* port) {
  if (text.empty()) return true;
  if (text.size() > 5) return false;

  uint32_t value = 0;
  for (char c : text) {
    if (!std::isdigit(static_cast<unsigned char>(c))) return false;
    value = value * 10 + (c - '0');
  }

  if (value == 0 || value > 65535) return false;

  *port = static_cast<uint16_t>(value);
  return true;
}

std::map<std::string, const char*> mutedeck::validateForm(
    const FormValues& values) {
  std::map<std::string, const char*> errors;

  if (values.mqttServer.empty())
    errors["mqtt_server"] = "MQTT server is required!";
  else if (values.mqttServer.size() > maxTextLength)
    errors["mqtt_server"] = "max. 63 characters allowed";

  if (values.mqttUser.empty())
    errors["mqtt_user"] = "MQTT user is required!";
  else if (values.mqttUser.size() > maxTextLength)
    errors["mqtt_user"] = "max. 63 characters allowed";

  if (values.mqttPass.empty() && values.storedPass.empty())
    errors["mqtt_pass"] = "MQTT password is required!";
  else if (values.mqttPass.size() > maxTextLength)
    errors["mqtt_pass"] = "max. 63 characters allowed";

  uint16_t port = 0;
  if (!parsePort(values.mqttPort, &port))
    errors["mqtt_port"] = "Please provide a valid port!";
  if (!parsePort(values.httpPort, &port))
    errors["http_port"] = "Please provide a valid port!";

  return errors;
}
