#include "runtime/prompt/prompt_assembler.h"

namespace parley {

std::string
InstructPromptAssembler::Assemble(const std::vector<Message> &transcript,
                                  const ChatParameters &params) const {
  std::vector<std::string> turns;
  for (std::size_t i = 0; i < transcript.size(); ++i) {
    const Message &message = transcript[i];
    switch (message.type) {
    case MessageType::kHuman:
      turns.push_back(std::string(kInstructionMarker) + message.content + "\n");
      break;
    case MessageType::kAi:
      turns.push_back(std::string(kResponseMarker) + message.content + "\n");
      break;
    case MessageType::kSystem:
      break;
    }
  }

  std::size_t budget =
      params.n_ctx > 0 ? static_cast<std::size_t>(params.n_ctx) : 0;
  std::size_t used = 0;
  std::size_t first_kept = turns.size();
  while (first_kept > 0) {
    std::size_t size = turns[first_kept - 1].size();
    if (first_kept < turns.size() && used + size > budget) {
      break;
    }
    used += size;
    --first_kept;
  }

  std::string prompt = params.init_prompt;
  if (!prompt.empty()) {
    prompt += "\n\n";
  }
  for (std::size_t i = first_kept; i < turns.size(); ++i) {
    prompt += turns[i];
  }
  prompt += kResponseMarker;
  return prompt;
}

} // namespace parley
