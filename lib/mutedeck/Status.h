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

// Validation and normalization of the status record posted by MuteDeck. A
// record must carry the six state fields, any other field passes through
// unmodified. The "control" field names the active meeting platform and is
// rewritten to a display label before the record is republished.

#ifndef LIB_MUTEDECK_STATUS_H_
#define LIB_MUTEDECK_STATUS_H_

#include <ArduinoJson.h>

#include <string>
#include <vector>

namespace mutedeck {

// call, control, mute, record, share, video (checked in this order)
extern const std::vector<std::string> requiredKeys;

// Returns the first required key missing in the record, empty if complete.
std::string findMissingKey(JsonObjectConst record);

// Rewrites "control" to its platform name when it is a string.
void normalizeStatus(JsonObject record);

const std::string platformName(const std::string& control);

// Underscores become spaces, each word starts upper case, the rest is lower.
const std::string titleCase(const std::string& text);

// First entry of X-Forwarded-For if present, else the peer address.
const std::string clientAddress(const std::string& forwardedFor,
                                const std::string& remoteAddress);

}  // namespace mutedeck

#endif  // LIB_MUTEDECK_STATUS_H_
