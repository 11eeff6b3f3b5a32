/* @file ConfigLoader.cpp
 * @brief reads the monitor's JSON settings file and maps it onto MonitorConfig
 *
 * © 2025 Qube Monitor — MIT-licensed.
 */

// STL headers
#include <fstream>
#include <stdexcept>
#include <string>

// nlohmann headers
#include <nlohmann/json.hpp>

// Qube headers
#include "core/ConfigLoader.hpp"
#include "core/MonitorConfig.hpp"
#include "io/SerialChannel.hpp"

using namespace qube::core;
using nlohmann::json;

ConfigLoader::ConfigLoader(std::string configPath) : path_(std::move(configPath)) {}

json ConfigLoader::load() const {
  std::ifstream in(path_);
  if (!in)
    throw std::runtime_error("[ConfigLoader] cannot open config file: " + path_);

  try {
    return json::parse(in);
  } catch (const json::parse_error& e) {
    throw std::runtime_error("[ConfigLoader] parse error in " + path_ + ": " + e.what());
  }
}

// -------------------------------------------------------------------
// MonitorConfig::fromJson
// Every key is optional. A present key of the wrong type or with an
// out-of-range value is a hard error naming "<section>.<key>".
// -------------------------------------------------------------------
namespace {

  const json* section(const json& doc, const char* name) {
    auto it = doc.find(name);
    if (it == doc.end())
      return nullptr;
    if (!it->is_object())
      throw std::runtime_error(std::string("[MonitorConfig] '") + name + "' must be an object");
    return &*it;
  }

  template <typename T>
  bool read(const json* sec, const char* secName, const char* key, T& out) {
    if (!sec)
      return false;
    auto it = sec->find(key);
    if (it == sec->end())
      return false;
    try {
      out = it->get<T>();
    } catch (const json::exception&) {
      throw std::runtime_error(std::string("[MonitorConfig] '") + secName + "." + key +
                               "' has the wrong type");
    }
    return true;
  }

  [[noreturn]] void badValue(const char* key, const std::string& why) {
    throw std::runtime_error(std::string("[MonitorConfig] '") + key + "' " + why);
  }

  std::chrono::seconds positiveSeconds(const char* key, long long value) {
    if (value <= 0)
      badValue(key, "must be positive");
    return std::chrono::seconds{ value };
  }

} // namespace

MonitorConfig MonitorConfig::fromJson(const json& doc) {
  if (!doc.is_object())
    throw std::runtime_error("[MonitorConfig] top level must be an object");

  MonitorConfig cfg;
  long long n = 0;

  if (const json* serial = section(doc, "serial")) {
    int baud = 0;
    if (read(serial, "serial", "baud", baud)) {
      if (!io::toSpeed(baud))
        badValue("serial.baud", "is not a supported baud rate");
      cfg.baud = baud;
    }
    if (read(serial, "serial", "read_timeout_ms", n)) {
      if (n <= 0)
        badValue("serial.read_timeout_ms", "must be positive");
      cfg.readTimeout = std::chrono::milliseconds{ n };
    }
    std::string probe;
    if (read(serial, "serial", "probe_line", probe)) {
      if (probe.empty())
        badValue("serial.probe_line", "must not be empty");
      cfg.probeLine = probe;
    }
  }

  if (const json* health = section(doc, "health")) {
    if (read(health, "health", "check_interval_s", n))
      cfg.healthCheckInterval = positiveSeconds("health.check_interval_s", n);
    if (read(health, "health", "forced_refresh_s", n)) {
      if (n < 0)
        badValue("health.forced_refresh_s", "must be zero (disabled) or positive");
      cfg.forcedRefreshInterval = std::chrono::seconds{ n };
    }
    if (read(health, "health", "self_test_interval_s", n))
      cfg.selfTestInterval = positiveSeconds("health.self_test_interval_s", n);
    if (read(health, "health", "heartbeat_warning_s", n))
      cfg.heartbeatWarning = positiveSeconds("health.heartbeat_warning_s", n);
    if (read(health, "health", "heartbeat_reconnect_s", n))
      cfg.heartbeatReconnect = positiveSeconds("health.heartbeat_reconnect_s", n);
    if (read(health, "health", "shutdown_timeout_ms", n)) {
      if (n <= 0)
        badValue("health.shutdown_timeout_ms", "must be positive");
      cfg.shutdownTimeout = std::chrono::milliseconds{ n };
    }
  }

  if (const json* students = section(doc, "students")) {
    if (read(students, "students", "duplicate_window_s", n))
      cfg.duplicateWindow = positiveSeconds("students.duplicate_window_s", n);
    if (read(students, "students", "duration_warning_s", n))
      cfg.durationWarning = positiveSeconds("students.duration_warning_s", n);
    if (read(students, "students", "duration_critical_s", n))
      cfg.durationCritical = positiveSeconds("students.duration_critical_s", n);
  }

  if (const json* log = section(doc, "log")) {
    if (read(log, "log", "max_entries", n)) {
      if (n <= 0)
        badValue("log.max_entries", "must be positive");
      cfg.maxLogEntries = static_cast<std::size_t>(n);
    }
    if (read(log, "log", "display_entries", n)) {
      if (n <= 0)
        badValue("log.display_entries", "must be positive");
      cfg.logDisplayEntries = static_cast<std::size_t>(n);
    }
    read(log, "log", "echo_to_console", cfg.echoLogToConsole);
  }

  // cross-field rules
  if (cfg.heartbeatReconnect <= cfg.heartbeatWarning)
    badValue("health.heartbeat_reconnect_s", "must exceed health.heartbeat_warning_s");
  if (cfg.durationCritical <= cfg.durationWarning)
    badValue("students.duration_critical_s", "must exceed students.duration_warning_s");
  if (cfg.logDisplayEntries > cfg.maxLogEntries)
    badValue("log.display_entries", "must not exceed log.max_entries");

  return cfg;
}
