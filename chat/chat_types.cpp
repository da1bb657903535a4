#include "chat/chat_types.h"

#include <cstdio>
#include <ctime>
#include <stdexcept>

using json = nlohmann::json;

namespace parley {

const char* MessageTypeName(MessageType type) {
  switch (type) {
    case MessageType::kSystem:
      return "system";
    case MessageType::kHuman:
      return "human";
    case MessageType::kAi:
      return "ai";
  }
  return "system";
}

std::optional<MessageType> ParseMessageType(const std::string& name) {
  if (name == "system") return MessageType::kSystem;
  if (name == "human") return MessageType::kHuman;
  if (name == "ai") return MessageType::kAi;
  return std::nullopt;
}

std::string FormatTimestamp(Timestamp ts) {
  auto micros = std::chrono::duration_cast<std::chrono::microseconds>(ts.time_since_epoch()).count();
  std::time_t secs = static_cast<std::time_t>(micros / 1000000);
  long frac = static_cast<long>(micros % 1000000);
  if (frac < 0) {
    frac += 1000000;
    --secs;
  }
  std::tm tm{};
  gmtime_r(&secs, &tm);
  char buf[40];
  std::snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02d.%06ld", tm.tm_year + 1900,
                tm.tm_mon + 1, tm.tm_mday, tm.tm_hour, tm.tm_min, tm.tm_sec, frac);
  return buf;
}

std::optional<Timestamp> ParseTimestamp(const std::string& text) {
  std::tm tm{};
  int consumed = 0;
  if (std::sscanf(text.c_str(), "%4d-%2d-%2dT%2d:%2d:%2d%n", &tm.tm_year, &tm.tm_mon,
                  &tm.tm_mday, &tm.tm_hour, &tm.tm_min, &tm.tm_sec, &consumed) != 6) {
    return std::nullopt;
  }
  long micros = 0;
  std::size_t pos = static_cast<std::size_t>(consumed);
  if (pos < text.size() && text[pos] == '.') {
    ++pos;
    long scale = 100000;
    while (pos < text.size() && text[pos] >= '0' && text[pos] <= '9') {
      micros += (text[pos] - '0') * scale;
      scale /= 10;
      ++pos;
    }
  }
  tm.tm_year -= 1900;
  tm.tm_mon -= 1;
  std::time_t secs = timegm(&tm);
  if (secs == static_cast<std::time_t>(-1)) {
    return std::nullopt;
  }
  return Timestamp(std::chrono::duration_cast<Timestamp::duration>(
      std::chrono::seconds(secs) + std::chrono::microseconds(micros)));
}

json MessageToJson(const Message& message) {
  return {{"type", MessageTypeName(message.type)}, {"data", {{"content", message.content}}}};
}

Message MessageFromJson(const json& j) {
  auto type = ParseMessageType(j.at("type").get<std::string>());
  if (!type) {
    throw std::invalid_argument("unknown message type: " + j.at("type").get<std::string>());
  }
  Message message;
  message.type = *type;
  message.content = j.at("data").at("content").get<std::string>();
  return message;
}

json ParametersToJson(const ChatParameters& params) {
  json j;
  j["model_path"] = params.model_path;
  j["n_ctx"] = params.n_ctx;
  j["temperature"] = params.temperature;
  j["top_k"] = params.top_k;
  j["top_p"] = params.top_p;
  j["repeat_penalty"] = params.repeat_penalty;
  j["last_n_tokens_size"] = params.last_n_tokens_size;
  j["max_tokens"] = params.max_tokens;
  j["n_threads"] = params.n_threads;
  j["n_gpu_layers"] = params.n_gpu_layers ? json(*params.n_gpu_layers) : json(nullptr);
  j["init_prompt"] = params.init_prompt;
  return j;
}

ChatParameters ParametersFromJson(const json& j) {
  ChatParameters params;
  params.model_path = j.value("model_path", params.model_path);
  params.n_ctx = j.value("n_ctx", params.n_ctx);
  params.temperature = j.value("temperature", params.temperature);
  params.top_k = j.value("top_k", params.top_k);
  params.top_p = j.value("top_p", params.top_p);
  params.repeat_penalty = j.value("repeat_penalty", params.repeat_penalty);
  params.last_n_tokens_size = j.value("last_n_tokens_size", params.last_n_tokens_size);
  params.max_tokens = j.value("max_tokens", params.max_tokens);
  params.n_threads = j.value("n_threads", params.n_threads);
  if (j.contains("n_gpu_layers") && j["n_gpu_layers"].is_number_integer()) {
    params.n_gpu_layers = j["n_gpu_layers"].get<int>();
  }
  params.init_prompt = j.value("init_prompt", params.init_prompt);
  return params;
}

json SessionToJson(const ChatSession& session) {
  return {{"id", session.id},
          {"owner", session.owner},
          {"created", FormatTimestamp(session.created)},
          {"params", ParametersToJson(session.params)}};
}

ChatSession SessionFromJson(const json& j, const std::string& default_owner) {
  ChatSession session;
  session.id = j.at("id").get<std::string>();
  session.owner = j.value("owner", std::string());
  if (session.owner.empty()) {
    session.owner = default_owner;
  }
  auto created = ParseTimestamp(j.value("created", std::string()));
  if (!created) {
    throw std::invalid_argument("session " + session.id + " has an unreadable timestamp");
  }
  session.created = *created;
  session.params = ParametersFromJson(j.value("params", json::object()));
  return session;
}

json SummaryToJson(const ChatSummary& summary) {
  return {{"id", summary.id},
          {"created", FormatTimestamp(summary.created)},
          {"model", summary.model},
          {"subtitle", summary.subtitle}};
}

}  // namespace parley
