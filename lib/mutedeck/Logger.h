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

// Leveled logger with a circular buffer of JSON formatted entries. Entries
// below the configured level are dropped. An optional sink receives every
// stored entry (e.g. the serial console).

#ifndef LIB_MUTEDECK_LOGGER_H_
#define LIB_MUTEDECK_LOGGER_H_

#include <cstddef>
#include <functional>
#include <mutex>
#include <string>
#include <vector>

namespace mutedeck {

enum class LogLevel { DEBUG, INFO, WARN, ERROR };

const char* logLevelText(LogLevel level);

// Case insensitive, unknown or empty text yields LogLevel::INFO.
LogLevel parseLogLevel(const std::string& text);

class Logger {
 public:
  explicit Logger(size_t maxEntries = 35);

  void setLevel(const LogLevel level);
  LogLevel getLevel() const;

  void setSink(std::function<void(const std::string& entry)> sinkFunction);

  void error(const std::string& message);
  void warn(const std::string& message);
  void info(const std::string& message);
  void debug(const std::string& message);

  bool enabled(const LogLevel level) const;

  // JSON array of the stored entries, oldest first
  const std::string getLogs() const;
  size_t size() const;
  void clear();

 private:
  std::vector<std::string> buffer;
  size_t maxEntries;
  size_t index = 0;
  size_t entries = 0;

  LogLevel level = LogLevel::INFO;

  std::function<void(const std::string& entry)> sinkCallback = nullptr;

  mutable std::mutex mux;

  static const std::string timestamp();

  void log(const LogLevel level, const std::string& message);
};

extern Logger logger;

}  // namespace mutedeck

#endif  // LIB_MUTEDECK_LOGGER_H_
