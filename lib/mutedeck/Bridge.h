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

// Handling of one MuteDeck webhook call: the posted status record is
// validated and normalized, the device is announced to Home Assistant on the
// first call for its topic, and the record is published to the status topic.
// handle() may be called from several threads at once.

#ifndef LIB_MUTEDECK_BRIDGE_H_
#define LIB_MUTEDECK_BRIDGE_H_

#include <cstdint>
#include <string>

#include "DiscoveryCache.h"
#include "Publisher.h"

namespace mutedeck {

extern const char* const defaultTopic;   // "mutedeck"
extern const char* const defaultPrefix;  // "mutedeck2mqtt"

struct Request {
  std::string body;
  std::string topic;   // empty: defaultTopic
  std::string prefix;  // empty: defaultPrefix
  std::string clientAddress;
};

struct Response {
  int code;
  std::string body;
};

class Bridge {
 public:
  Bridge(DiscoveryCache* cache, Publisher* publisher,
         const std::string& discoveryPrefix);

  // Pause after a first announcement, gives Home Assistant time to create
  // the entities before the first state arrives.
  void setDiscoveryDelay(const uint32_t delayMs);


  const Response handle(const Request& request);

 private:
  DiscoveryCache* cache = nullptr;
  Publisher* publisher = nullptr;

  std::string discoveryPrefix;
  uint32_t discoveryDelay = 2000;  // ms

  std::string announce(const std::string& topic, const std::string& prefix);
};

}  // namespace mutedeck

#endif  // LIB_MUTEDECK_BRIDGE_H_
