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

#include "Publisher.h"

#include <map>

#include "Logger.h"

namespace {

void copySorted(JsonVariantConst source, JsonVariant target) {
  if (source.is<JsonObjectConst>()) {
    std::map<std::string, JsonVariantConst> sorted;
    for (JsonPairConst kv : source.as<JsonObjectConst>())
      sorted[kv.key().c_str()] = kv.value();

    JsonObject object = target.to<JsonObject>();
    for (const auto& kv : sorted)
      copySorted(kv.second, object[kv.first].to<JsonVariant>());
  } else if (source.is<JsonArrayConst>()) {
    JsonArray array = target.to<JsonArray>();
    for (JsonVariantConst item : source.as<JsonArrayConst>())
      copySorted(item, array.add<JsonVariant>());
  } else {
    target.set(source);
  }
}

}  // namespace

mutedeck::Publisher::Publisher(MqttClient* client) : client(client) {}

std::string mutedeck::Publisher::publishDiscovery(
    const std::string& key, const DiscoveryDocument& document) {
  std::string payload = document.toJson();

  std::string error = client->publish(key, 0, false, payload);
  if (!error.empty()) return error;

  logger.debug("Discovery message body: " + payload);
  return "";
}

std::string mutedeck::Publisher::publishStatus(const std::string& channel,
                                               JsonObjectConst record) {
  JsonDocument doc;
  copySorted(record, doc.to<JsonVariant>());

  std::string payload;
  serializeJson(doc, payload);

  logger.debug("Sending body: " + payload);

  std::string error = client->publish(channel, 0, false, payload);
  if (!error.empty()) return error;

  logger.info("MQT: " + channel + " = " + payload);
  return "";
}
