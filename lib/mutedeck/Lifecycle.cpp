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

#include "Lifecycle.h"

#include "Logger.h"

const char* const mutedeck::lifecycleTopic = "homeassistant/status";

const char* mutedeck::consumerStateText(ConsumerState state) {
  const char* values[] = {"offline", "online"};
  return values[static_cast<int>(state)];
}

mutedeck::Lifecycle::Lifecycle(DiscoveryCache* cache, Publisher* publisher)
    : cache(cache), publisher(publisher) {}

size_t mutedeck::Lifecycle::handleStatus(const std::string& payload) {
  if (payload == "online") {
    state = ConsumerState::Online;
    logger.info("Home Assistant is online, resending discovery message");
    return replay();
  }

  if (payload == "offline") state = ConsumerState::OfflineOrUnknown;
  return 0;
}

mutedeck::ConsumerState mutedeck::Lifecycle::getState() const {
  return state;
}

size_t mutedeck::Lifecycle::replay() {
  size_t count = 0;

  std::unique_lock<std::mutex> lock = cache->lock();
  for (const auto& entry : cache->snapshot()) {
    std::string error = publisher->publishDiscovery(entry.first, entry.second);
    if (!error.empty()) {
      logger.error("Error publishing discovery message to MQTT topic: " +
                   error);
      continue;
    }
    logger.info("Resent discovery message to topic: " + entry.first);
    count++;
  }

  return count;
}
