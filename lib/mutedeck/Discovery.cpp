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

#include "Discovery.h"

#include "Status.h"

const char* const mutedeck::deviceObjectId = "mutedeck2mqtt_device";

namespace {

const char* const noReplyTopic = "mutedeck2mqtt/no-reply";

mutedeck::Component createComponent(const std::string& topic,
                                    const std::string& prefix,
                                    const std::string& field,
                                    const std::string& platform,
                                    const std::string& name,
                                    const std::string& icon) {
  mutedeck::Component c;
  c.commandTopic = noReplyTopic;
  c.enabledByDefault = true;
  c.entityCategory = "diagnostic";
  c.icon = icon;
  c.name = name;
  c.objectId = topic + '_' + field;
  c.optimistic = false;
  c.platform = platform;
  c.stateTopic = mutedeck::statusTopic(prefix, topic);
  c.uniqueId = topic + '_' + field + "_mutedeck2mqtt";
  return c;
}

// ON while the field is "active", inverted reports OFF while "active"
mutedeck::Component createBinarySensor(const std::string& topic,
                                       const std::string& prefix,
                                       const std::string& field,
                                       const std::string& name,
                                       const std::string& icon,
                                       const bool inverted) {
  mutedeck::Component c =
      createComponent(topic, prefix, field, "binary_sensor", name, icon);
  c.valueTemplate = "{{ value_json." + field +
                    (inverted ? " == " : " != ") + "'active' and 'OFF' or 'ON' }}";
  return c;
}

mutedeck::Component createSelect(const std::string& topic,
                                 const std::string& prefix,
                                 const std::string& field,
                                 const std::string& name,
                                 const std::string& icon,
                                 const std::vector<std::string>& options) {
  mutedeck::Component c =
      createComponent(topic, prefix, field, "select", name, icon);
  c.options = options;
  c.valueTemplate = "{{ value_json." + field + " }}";
  return c;
}

}  // namespace

const std::string mutedeck::discoveryTopic(const std::string& discoveryPrefix,
                                           const std::string& topic) {
  return discoveryPrefix + "/device/" + deviceObjectId + '_' + topic +
         "/config";
}

const std::string mutedeck::statusTopic(const std::string& prefix,
                                        const std::string& topic) {
  return prefix + '/' + topic;
}

mutedeck::DiscoveryDocument mutedeck::buildDiscovery(
    const std::string& topic, const std::string& prefix) {
  DiscoveryDocument d;

  d.device.ids.push_back(std::string(deviceObjectId) + '_' + topic);
  d.device.name = titleCase(topic);
  d.device.manufacturer = "MuteDeck";

  d.origin.name = "MuteDeck2MQTT";
  d.origin.swVersion = MUTEDECK_VERSION;
  d.origin.url = "https://github.com/chelming/mutedeck2mqtt/";

  d.components[topic + "_call"] = createBinarySensor(
      topic, prefix, "call", "Call", "mdi:phone", false);
  d.components[topic + "_control"] =
      createSelect(topic, prefix, "control", "Control", "mdi:application-cog",
                   {"Zoom", "Teams", "Google Meet", "StreamYard", "Webex",
                    "System"});
  d.components[topic + "_mute"] = createBinarySensor(
      topic, prefix, "mute", "Microphone", "mdi:microphone", true);
  d.components[topic + "_record"] = createBinarySensor(
      topic, prefix, "record", "Recording", "mdi:record-rec", false);
  d.components[topic + "_share"] = createBinarySensor(
      topic, prefix, "share", "Screen sharing", "mdi:monitor-share", false);
  d.components[topic + "_video"] = createBinarySensor(
      topic, prefix, "video", "Video", "mdi:video", false);

  d.stateTopic = statusTopic(prefix, topic);
  d.qos = 0;
  return d;
}

const JsonDocument mutedeck::DiscoveryDocument::toJsonDoc() const {
  JsonDocument doc;

  JsonObject dev = doc["dev"].to<JsonObject>();
  JsonArray ids = dev["ids"].to<JsonArray>();
  for (const std::string& id : device.ids) ids.add(id);
  dev["name"] = device.name;
  dev["mf"] = device.manufacturer;
  dev["mdl"] = device.model;
  dev["sw"] = device.swVersion;
  dev["sn"] = device.serialNumber;
  dev["hw"] = device.hwVersion;

  JsonObject o = doc["o"].to<JsonObject>();
  o["name"] = origin.name;
  o["sw"] = origin.swVersion;
  o["url"] = origin.url;

  JsonObject cmps = doc["cmps"].to<JsonObject>();
  for (const auto& kv : components) {
    const Component& c = kv.second;
    JsonObject cmp = cmps[kv.first].to<JsonObject>();
    cmp["cmd_t"] = c.commandTopic;
    cmp["en"] = c.enabledByDefault;
    cmp["ent_cat"] = c.entityCategory;
    cmp["icon"] = c.icon;
    cmp["name"] = c.name;
    cmp["obj_id"] = c.objectId;
    cmp["opt"] = c.optimistic;
    JsonArray options = cmp["options"].to<JsonArray>();
    for (const std::string& opt : c.options) options.add(opt);
    cmp["p"] = c.platform;
    cmp["stat_t"] = c.stateTopic;
    cmp["uniq_id"] = c.uniqueId;
    cmp["val_tpl"] = c.valueTemplate;
  }

  doc["stat_t"] = stateTopic;
  doc["qos"] = qos;

  doc.shrinkToFit();
  return doc;
}

const std::string mutedeck::DiscoveryDocument::toJson() const {
  std::string payload;
  JsonDocument doc = toJsonDoc();
  serializeJson(doc, payload);
  return payload;
}
