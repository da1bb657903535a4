#pragma once

#include <iosfwd>
#include <string>
#include <utility>
#include <vector>

namespace parley {
namespace log {

enum class Level { DEBUG, INFO, WARN, ERROR };

// Plain text is "[LEVEL] component: message | extra". JSON mode writes one
// object per line and lifts the key=value pairs of `extra` into fields.
// Selected once in main() from logging.format / PARLEY_LOG_FORMAT.
void SetJsonMode(bool enabled);
bool IsJsonMode();

// Entries below `level` are dropped. Default is INFO.
void SetMinLevel(Level level);
Level MinLevel();

// Parses "debug" / "info" / "warn" / "error" (case-insensitive). Unknown
// names fall back to INFO.
Level ParseLevel(const std::string &name);

// Redirects output; nullptr restores stderr. The stream must outlive every
// later Log() call.
void SetSink(std::ostream *sink);

// Splits "chat_id=abc error=model not found" into ordered pairs. A token
// without '=' continues the previous value, so values may contain spaces.
// Text before the first key is returned under "detail".
std::vector<std::pair<std::string, std::string>>
ParseExtra(const std::string &extra);

// Renders one entry without the trailing newline.
std::string FormatLine(Level level, const std::string &component,
                       const std::string &message, const std::string &extra,
                       bool json_mode);

// `component` names the subsystem ("http", "registry", "orchestrator").
void Log(Level level, const std::string &component, const std::string &message,
         const std::string &extra = {});

inline void Debug(const std::string &component, const std::string &message,
                  const std::string &extra = {}) {
  Log(Level::DEBUG, component, message, extra);
}
inline void Info(const std::string &component, const std::string &message,
                 const std::string &extra = {}) {
  Log(Level::INFO, component, message, extra);
}
inline void Warn(const std::string &component, const std::string &message,
                 const std::string &extra = {}) {
  Log(Level::WARN, component, message, extra);
}
inline void Error(const std::string &component, const std::string &message,
                  const std::string &extra = {}) {
  Log(Level::ERROR, component, message, extra);
}

} // namespace log
} // namespace parley
