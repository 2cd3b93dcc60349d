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

#include "Status.h"

#include <algorithm>
#include <cctype>

const std::vector<std::string> mutedeck::requiredKeys = {
    "call", "control", "mute", "record", "share", "video"};

std::string mutedeck::findMissingKey(JsonObjectConst record) {
  // a key holding null counts as present
  for (const std::string& key : requiredKeys) {
    bool found = false;
    for (JsonPairConst kv : record) {
      if (key == kv.key().c_str()) {
        found = true;
        break;
      }
    }
    if (!found) return key;
  }
  return "";
}

void mutedeck::normalizeStatus(JsonObject record) {
  JsonVariant control = record["control"];
  if (control.is<const char*>())
    control.set(platformName(control.as<std::string>()));
}

namespace {

bool startsWith(const std::string& text, const std::string& prefix) {
  return text.compare(0, prefix.size(), prefix) == 0;
}

}  // namespace

const std::string mutedeck::platformName(const std::string& control) {
  if (startsWith(control, "zoom")) return "Zoom";
  if (startsWith(control, "teams")) return "Teams";
  if (control == "webex") return "Webex";
  if (control == "streamyard") return "StreamYard";
  if (control == "google-meet") return "Google Meet";
  return titleCase(control);
}

const std::string mutedeck::titleCase(const std::string& text) {
  std::string result = text;
  std::replace(result.begin(), result.end(), '_', ' ');

  bool wordStart = true;
  for (char& c : result) {
    unsigned char uc = static_cast<unsigned char>(c);
    if (std::isalpha(uc)) {
      c = wordStart ? std::toupper(uc) : std::tolower(uc);
      wordStart = false;
    } else if (std::isdigit(uc) || c == '\'') {
      wordStart = false;
    } else {
      wordStart = true;
    }
  }
  return result;
}

const std::string mutedeck::clientAddress(const std::string& forwardedFor,
                                          const std::string& remoteAddress) {
  if (forwardedFor.empty()) return remoteAddress;
  return forwardedFor.substr(0, forwardedFor.find(','));
}
