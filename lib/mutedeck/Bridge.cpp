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

#include "Bridge.h"

#include <ArduinoJson.h>

#include <chrono>
#include <istream>
#include <sstream>
#include <thread>

#include "Logger.h"
#include "Status.h"

const char* const mutedeck::defaultTopic = "mutedeck";
const char* const mutedeck::defaultPrefix = "mutedeck2mqtt";

mutedeck::Bridge::Bridge(DiscoveryCache* cache, Publisher* publisher,
                         const std::string& discoveryPrefix)
    : cache(cache), publisher(publisher), discoveryPrefix(discoveryPrefix) {}

void mutedeck::Bridge::setDiscoveryDelay(const uint32_t delayMs) {
  discoveryDelay = delayMs;
}

const mutedeck::Response mutedeck::Bridge::handle(const Request& request) {
  logger.debug("Request received from IP: " + request.clientAddress);
  logger.debug("Incoming body: " + request.body);

  JsonDocument doc;
  std::istringstream input(request.body);
  DeserializationError error = deserializeJson(doc, input);
  if (error) return Response{400, error.c_str()};

  // deserializeJson stops after the first value, anything but whitespace
  // behind it makes the body invalid
  input >> std::ws;
  if (input.peek() != std::char_traits<char>::eof())
    return Response{400, DeserializationError(
                             DeserializationError::InvalidInput)
                             .c_str()};

  // null reads as an empty record and fails on the first required key
  if (!doc.isNull() && !doc.is<JsonObject>())
    return Response{400, "Invalid JSON object"};

  std::string missing = findMissingKey(doc.as<JsonObjectConst>());
  if (!missing.empty()) {
    logger.error("Request from " + request.clientAddress +
                 " missing required key: " + missing);
    return Response{400, "Missing required key: " + missing};
  }

  normalizeStatus(doc.as<JsonObject>());

  std::string topic = request.topic.empty() ? defaultTopic : request.topic;
  std::string prefix = request.prefix.empty() ? defaultPrefix : request.prefix;

  std::string announceError = announce(topic, prefix);
  if (!announceError.empty()) return Response{500, announceError};

  std::string channel = statusTopic(prefix, topic);
  std::string publishError =
      publisher->publishStatus(channel, doc.as<JsonObjectConst>());
  if (!publishError.empty()) {
    logger.error("Error publishing to MQTT topic: " + publishError);
    return Response{500, publishError};
  }

  return Response{200, ""};
}

std::string mutedeck::Bridge::announce(const std::string& topic,
                                       const std::string& prefix) {
  logger.debug("Checking discovery topic");

  std::string key = discoveryTopic(discoveryPrefix, topic);

  std::unique_lock<std::mutex> lock = cache->lock();
  if (cache->isSent(key)) return "";

  logger.debug("Preparing discovery topic");
  DiscoveryDocument document = buildDiscovery(topic, prefix);

  std::string error = publisher->publishDiscovery(key, document);
  if (!error.empty()) {
    logger.error("Error publishing discovery message to MQTT topic: " + error);
    return error;
  }
  logger.info("Discovery message sent to topic: " + key);

  cache->markSent(key, document);

  if (discoveryDelay > 0)
    std::this_thread::sleep_for(std::chrono::milliseconds(discoveryDelay));

  return "";
}
