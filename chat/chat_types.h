#pragma once

#include <nlohmann/json.hpp>

#include <chrono>
#include <optional>
#include <string>

namespace parley {

enum class MessageType { kSystem, kHuman, kAi };

const char* MessageTypeName(MessageType type);
// Accepts "system", "human" and "ai".
std::optional<MessageType> ParseMessageType(const std::string& name);

struct Message {
  MessageType type{MessageType::kSystem};
  std::string content;

  bool operator==(const Message& other) const {
    return type == other.type && content == other.content;
  }
};

// Sampling configuration fixed at chat creation. Field names follow the
// persisted blob.
struct ChatParameters {
  // Upper bounds accepted from callers.
  static constexpr int kMaxContextWindow = 1 << 20;
  static constexpr int kMaxTokens = 1 << 20;
  static constexpr int kMaxThreads = 512;

  std::string model_path{"7B"};
  int n_ctx{2048};
  double temperature{0.1};
  int top_k{50};
  double top_p{0.95};
  double repeat_penalty{1.3};
  int last_n_tokens_size{64};
  int max_tokens{2048};
  int n_threads{4};
  std::optional<int> n_gpu_layers;
  std::string init_prompt{
      "Below is an instruction that describes a task. Write a response that "
      "appropriately completes the request."};
};

using Timestamp = std::chrono::system_clock::time_point;

struct ChatSession {
  std::string id;
  std::string owner;
  Timestamp created;
  ChatParameters params;
};

struct ChatSummary {
  std::string id;
  Timestamp created;
  std::string model;
  std::string subtitle;
};

// ISO-8601 UTC with microseconds, e.g. "2024-03-01T12:00:00.123456".
std::string FormatTimestamp(Timestamp ts);
std::optional<Timestamp> ParseTimestamp(const std::string& text);

// Transcript entry: {"type": "human", "data": {"content": "..."}}.
nlohmann::json MessageToJson(const Message& message);
// Throws nlohmann::json::exception or std::invalid_argument on malformed input.
Message MessageFromJson(const nlohmann::json& j);

nlohmann::json ParametersToJson(const ChatParameters& params);
ChatParameters ParametersFromJson(const nlohmann::json& j);

// Session blob: {"id", "owner", "created", "params"}. A blob without an
// owner is attributed to `default_owner`.
nlohmann::json SessionToJson(const ChatSession& session);
ChatSession SessionFromJson(const nlohmann::json& j, const std::string& default_owner);

nlohmann::json SummaryToJson(const ChatSummary& summary);

}  // namespace parley
