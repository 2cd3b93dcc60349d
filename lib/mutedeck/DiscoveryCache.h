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

// Discovery documents already announced, keyed by discovery topic. A topic is
// announced once per process lifetime; the stored documents are replayed when
// the consumer comes back online. Entries are never removed.
//
// All members expect the caller to hold the lock returned by lock(), so that
// check, publish and markSent form one step for concurrent requests.

#ifndef LIB_MUTEDECK_DISCOVERYCACHE_H_
#define LIB_MUTEDECK_DISCOVERYCACHE_H_

#include <map>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

#include "Discovery.h"

namespace mutedeck {

class DiscoveryCache {
 public:
  DiscoveryCache() = default;

  std::unique_lock<std::mutex> lock();

  bool isSent(const std::string& key) const;
  void markSent(const std::string& key, const DiscoveryDocument& document);

  // Every announced (key, document), order unspecified.
  std::vector<std::pair<std::string, DiscoveryDocument>> snapshot() const;

  size_t size() const;

 private:
  struct Entry {
    bool sent = false;
    DiscoveryDocument document;
  };

  std::map<std::string, Entry> entries;

  std::mutex mux;
};

}  // namespace mutedeck

#endif  // LIB_MUTEDECK_DISCOVERYCACHE_H_
