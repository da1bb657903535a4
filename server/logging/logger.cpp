#include "server/logging/logger.h"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <atomic>
#include <cctype>
#include <chrono>
#include <cstdio>
#include <ctime>
#include <iostream>
#include <mutex>

using json = nlohmann::json;

namespace parley {
namespace log {

namespace {

std::atomic<bool> g_json_mode{false};
std::atomic<int> g_min_level{static_cast<int>(Level::INFO)};
std::mutex g_mutex;
std::ostream *g_sink = nullptr; // guarded by g_mutex

const char *LevelString(Level level) {
  switch (level) {
  case Level::DEBUG:
    return "DEBUG";
  case Level::INFO:
    return "INFO";
  case Level::WARN:
    return "WARN";
  case Level::ERROR:
    return "ERROR";
  }
  return "UNKNOWN";
}

// "2024-03-01T12:00:00.123Z"
std::string UtcTimestamp() {
  auto now = std::chrono::system_clock::now();
  auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                now.time_since_epoch()) %
            1000;
  std::time_t secs = std::chrono::system_clock::to_time_t(now);
  std::tm tm{};
  gmtime_r(&secs, &tm);
  char buf[32];
  std::size_t n = std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%S", &tm);
  std::snprintf(buf + n, sizeof(buf) - n, ".%03dZ", static_cast<int>(ms.count()));
  return buf;
}

bool IsKeyChar(char c) {
  return std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '.';
}

// Length of the "key" in "key=value", or 0 when `token` is not of that form.
std::size_t KeyLength(const std::string &token) {
  auto eq = token.find('=');
  if (eq == std::string::npos || eq == 0) {
    return 0;
  }
  for (std::size_t i = 0; i < eq; ++i) {
    if (!IsKeyChar(token[i])) {
      return 0;
    }
  }
  return eq;
}

} // namespace

void SetJsonMode(bool enabled) { g_json_mode.store(enabled); }
bool IsJsonMode() { return g_json_mode.load(); }

void SetMinLevel(Level level) { g_min_level.store(static_cast<int>(level)); }
Level MinLevel() { return static_cast<Level>(g_min_level.load()); }

Level ParseLevel(const std::string &name) {
  std::string lowered = name;
  std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  if (lowered == "debug") {
    return Level::DEBUG;
  }
  if (lowered == "warn" || lowered == "warning") {
    return Level::WARN;
  }
  if (lowered == "error") {
    return Level::ERROR;
  }
  return Level::INFO;
}

void SetSink(std::ostream *sink) {
  std::lock_guard<std::mutex> lock(g_mutex);
  g_sink = sink;
}

std::vector<std::pair<std::string, std::string>>
ParseExtra(const std::string &extra) {
  std::vector<std::pair<std::string, std::string>> fields;
  std::size_t pos = 0;
  while (pos < extra.size()) {
    auto space = extra.find(' ', pos);
    std::string token = extra.substr(
        pos, space == std::string::npos ? std::string::npos : space - pos);
    pos = space == std::string::npos ? extra.size() : space + 1;
    if (token.empty()) {
      continue;
    }
    std::size_t key_len = KeyLength(token);
    if (key_len > 0) {
      fields.emplace_back(token.substr(0, key_len), token.substr(key_len + 1));
    } else if (fields.empty()) {
      fields.emplace_back("detail", token);
    } else {
      fields.back().second += " " + token;
    }
  }
  return fields;
}

std::string FormatLine(Level level, const std::string &component,
                       const std::string &message, const std::string &extra,
                       bool json_mode) {
  if (!json_mode) {
    std::string line = std::string("[") + LevelString(level) + "] " +
                       component + ": " + message;
    if (!extra.empty()) {
      line += " | " + extra;
    }
    return line;
  }
  json j;
  j["ts"] = UtcTimestamp();
  j["level"] = LevelString(level);
  j["component"] = component;
  j["message"] = message;
  for (auto &field : ParseExtra(extra)) {
    // Reserved names keep their meaning; a clashing extra key gets a prefix.
    std::string key = j.contains(field.first) ? "extra_" + field.first
                                              : field.first;
    j[key] = std::move(field.second);
  }
  // Generated text may hold invalid UTF-8; replace rather than throw.
  return j.dump(-1, ' ', false, json::error_handler_t::replace);
}

void Log(Level level, const std::string &component, const std::string &message,
         const std::string &extra) {
  if (static_cast<int>(level) < g_min_level.load()) {
    return;
  }
  std::string line =
      FormatLine(level, component, message, extra, g_json_mode.load());
  std::lock_guard<std::mutex> lock(g_mutex);
  std::ostream &out = g_sink ? *g_sink : std::cerr;
  out << line << "\n";
}

} // namespace log
} // namespace parley
