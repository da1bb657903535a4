#include "server/logging/audit_logger.h"

#include <nlohmann/json.hpp>
#include <openssl/sha.h>

#include <chrono>
#include <iomanip>
#include <sstream>

using json = nlohmann::json;

namespace parley {

namespace {
long long NowSeconds() {
  auto now = std::chrono::system_clock::now();
  return std::chrono::duration_cast<std::chrono::seconds>(now.time_since_epoch()).count();
}
}  // namespace

AuditLogger::AuditLogger(const std::string& path, bool debug_mode)
    : debug_mode_(debug_mode) {
  if (!path.empty()) {
    stream_.open(path, std::ios::app);
  }
}

std::string AuditLogger::HashContent(const std::string& content) {
  unsigned char hash[SHA256_DIGEST_LENGTH];
  SHA256(reinterpret_cast<const unsigned char*>(content.data()), content.size(), hash);
  std::ostringstream hex;
  hex << std::hex << std::setfill('0');
  for (int i = 0; i < SHA256_DIGEST_LENGTH; ++i) {
    hex << std::setw(2) << static_cast<int>(hash[i]);
  }
  return hex.str();
}

void AuditLogger::Log(const std::string& subject,
                      const std::string& chat_id,
                      const std::string& action,
                      const std::string& outcome,
                      const std::string& detail) {
  if (!Enabled()) {
    return;
  }
  json j;
  j["timestamp"] = NowSeconds();
  j["subject"] = subject;
  j["chat_id"] = chat_id;
  j["action"] = action;
  j["outcome"] = outcome;
  if (!detail.empty()) {
    j["detail"] = detail;
  }
  Write(j.dump(-1, ' ', false, json::error_handler_t::replace));
}

void AuditLogger::LogLogin(const std::string& username, bool success) {
  Log(username, "", "login", success ? "success" : "failure");
}

void AuditLogger::LogGeneration(const std::string& subject,
                                const std::string& chat_id,
                                const std::string& model,
                                const std::string& prompt,
                                const std::string& answer,
                                bool success) {
  if (!Enabled()) {
    return;
  }
  json j;
  j["timestamp"] = NowSeconds();
  j["subject"] = subject;
  j["chat_id"] = chat_id;
  j["action"] = "generate";
  j["model"] = model;
  j["outcome"] = success ? "success" : "error";
  if (debug_mode_) {
    j["prompt"] = prompt;
    j["answer"] = answer;
  } else {
    // Never write raw conversation text to disk in production.
    j["prompt_sha256"] = HashContent(prompt);
    j["answer_sha256"] = HashContent(answer);
  }
  Write(j.dump(-1, ' ', false, json::error_handler_t::replace));
}

void AuditLogger::Write(const std::string& line) {
  std::lock_guard<std::mutex> lock(mutex_);
  stream_ << line << "\n";
  stream_.flush();
}

}  // namespace parley
