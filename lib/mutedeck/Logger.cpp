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

#include "Logger.h"

#include <ArduinoJson.h>

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdio>
#include <ctime>

mutedeck::Logger mutedeck::logger;

const char* mutedeck::logLevelText(LogLevel level) {
  const char* values[] = {"DEBUG", "INFO", "WARN", "ERROR"};
  return values[static_cast<int>(level)];
}

mutedeck::LogLevel mutedeck::parseLogLevel(const std::string& text) {
  std::string upper = text;
  std::transform(upper.begin(), upper.end(), upper.begin(),
                 [](unsigned char c) { return std::toupper(c); });

  if (upper == "DEBUG") return LogLevel::DEBUG;
  if (upper == "WARN") return LogLevel::WARN;
  if (upper == "ERROR") return LogLevel::ERROR;
  return LogLevel::INFO;
}

mutedeck::Logger::Logger(size_t maxEntries)
    : buffer(maxEntries), maxEntries(maxEntries) {}

void mutedeck::Logger::setLevel(const LogLevel level) {
  std::lock_guard<std::mutex> lock(mux);
  this->level = level;
}

mutedeck::LogLevel mutedeck::Logger::getLevel() const {
  std::lock_guard<std::mutex> lock(mux);
  return level;
}

void mutedeck::Logger::setSink(
    std::function<void(const std::string& entry)> sinkFunction) {
  std::lock_guard<std::mutex> lock(mux);
  sinkCallback = std::move(sinkFunction);
}

void mutedeck::Logger::error(const std::string& message) {
  log(LogLevel::ERROR, message);
}

void mutedeck::Logger::warn(const std::string& message) {
  log(LogLevel::WARN, message);
}

void mutedeck::Logger::info(const std::string& message) {
  log(LogLevel::INFO, message);
}

void mutedeck::Logger::debug(const std::string& message) {
  log(LogLevel::DEBUG, message);
}

bool mutedeck::Logger::enabled(const LogLevel level) const {
  std::lock_guard<std::mutex> lock(mux);
  return level >= this->level;
}

const std::string mutedeck::Logger::getLogs() const {
  std::string response = "[";

  std::lock_guard<std::mutex> lock(mux);
  for (size_t i = 0; i < entries; i++) {
    size_t logIndex = (index - entries + i + maxEntries) % maxEntries;
    response += buffer[logIndex];
    if (i < entries - 1) response += ",";
  }

  response += "]";
  return response;
}

size_t mutedeck::Logger::size() const {
  std::lock_guard<std::mutex> lock(mux);
  return entries;
}

void mutedeck::Logger::clear() {
  std::lock_guard<std::mutex> lock(mux);
  index = 0;
  entries = 0;
}

const std::string mutedeck::Logger::timestamp() {
  auto now = std::chrono::system_clock::now();
  time_t seconds = std::chrono::system_clock::to_time_t(now);
  auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
                    now.time_since_epoch())
                    .count() %
                1000;

  struct tm timeinfo;
  gmtime_r(&seconds, &timeinfo);

  char timestamp[40];
  size_t len =
      strftime(timestamp, sizeof(timestamp), "%Y-%m-%dT%H:%M:%S", &timeinfo);
  snprintf(timestamp + len, sizeof(timestamp) - len, ".%03dZ",
           static_cast<int>(millis));

  return std::string(timestamp);
}

void mutedeck::Logger::log(const LogLevel level, const std::string& message) {
  if (maxEntries == 0 || !enabled(level)) return;

  std::string payload;
  JsonDocument doc;

  doc["timestamp"] = timestamp();
  doc["level"] = logLevelText(level);
  doc["message"] = message;

  doc.shrinkToFit();
  serializeJson(doc, payload);

  std::function<void(const std::string& entry)> sink;
  {
    std::lock_guard<std::mutex> lock(mux);
    buffer[index] = payload;
    index = (index + 1) % maxEntries;
    if (entries < maxEntries) entries++;
    sink = sinkCallback;
  }

  if (sink) sink(payload);
}
