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

#include "DiscoveryCache.h"

std::unique_lock<std::mutex> mutedeck::DiscoveryCache::lock() {
  return std::unique_lock<std::mutex>(mux);
}

bool mutedeck::DiscoveryCache::isSent(const std::string& key) const {
  auto it = entries.find(key);
  return it != entries.end() && it->second.sent;
}

void mutedeck::DiscoveryCache::markSent(const std::string& key,
                                        const DiscoveryDocument& document) {
  Entry& entry = entries[key];
  entry.sent = true;
  entry.document = document;
}

std::vector<std::pair<std::string, mutedeck::DiscoveryDocument>>
mutedeck::DiscoveryCache::snapshot() const {
  std::vector<std::pair<std::string, DiscoveryDocument>> result;
  for (const auto& kv : entries) {
    if (kv.second.sent) result.emplace_back(kv.first, kv.second.document);
  }
  return result;
}

size_t mutedeck::DiscoveryCache::size() const { return entries.size(); }
