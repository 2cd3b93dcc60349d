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

// Follows the Home Assistant birth/last will messages. Home Assistant does not
// keep non retained discovery messages over a restart, so every announced
// document is published again whenever "online" is received. The sent flags
// of the cache are left untouched.

#ifndef LIB_MUTEDECK_LIFECYCLE_H_
#define LIB_MUTEDECK_LIFECYCLE_H_

#include <atomic>
#include <cstddef>
#include <string>

#include "DiscoveryCache.h"
#include "Publisher.h"

namespace mutedeck {

extern const char* const lifecycleTopic;  // "homeassistant/status"

enum class ConsumerState { OfflineOrUnknown, Online };

const char* consumerStateText(ConsumerState state);

class Lifecycle {
 public:
  Lifecycle(DiscoveryCache* cache, Publisher* publisher);

  // Returns the number of documents published again.
  size_t handleStatus(const std::string& payload);

  ConsumerState getState() const;

 private:
  DiscoveryCache* cache = nullptr;
  Publisher* publisher = nullptr;

  std::atomic<ConsumerState> state{ConsumerState::OfflineOrUnknown};

  size_t replay();
};

}  // namespace mutedeck

#endif  // LIB_MUTEDECK_LIFECYCLE_H_
