#pragma once

#include <fstream>
#include <mutex>
#include <string>

namespace parley {

// Append-only JSON-lines trail of security-relevant events: logins, chat
// creation and deletion, and the outcome of every generation.
class AuditLogger {
 public:
  AuditLogger() = default;

  // path: log file path; debug_mode: when true, log raw prompt/answer text
  // instead of SHA-256 hashes.
  explicit AuditLogger(const std::string& path, bool debug_mode = false);

  bool Enabled() const { return stream_.is_open(); }

  // General-purpose entry (subject, chat, action, outcome, free-form detail).
  void Log(const std::string& subject,
           const std::string& chat_id,
           const std::string& action,
           const std::string& outcome,
           const std::string& detail = {});

  // Login attempt. The username is recorded as submitted; failures never say
  // whether the user exists.
  void LogLogin(const std::string& username, bool success);

  // One generation turn. Prompt and answer are hashed unless debug_mode.
  void LogGeneration(const std::string& subject,
                     const std::string& chat_id,
                     const std::string& model,
                     const std::string& prompt,
                     const std::string& answer,
                     bool success);

  // Hash a string to its SHA-256 hex representation (64 chars).
  static std::string HashContent(const std::string& content);

 private:
  void Write(const std::string& line);

  std::ofstream stream_;
  std::mutex mutex_;
  bool debug_mode_{false};
};

}  // namespace parley
