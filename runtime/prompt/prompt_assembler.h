#pragma once

#include "chat/chat_types.h"

#include <string>
#include <vector>

namespace parley {

// PromptAssembler renders a transcript into the single prompt string fed to
// the engine. It is a pure function of its inputs; the returned prompt
// always ends with the marker that opens the model's next turn.
class PromptAssembler {
public:
  virtual ~PromptAssembler() = default;

  virtual std::string Assemble(const std::vector<Message> &transcript,
                               const ChatParameters &params) const = 0;

  // Name for logging.
  virtual std::string Name() const = 0;
};

// Alpaca-style instruction template:
//
//   <init_prompt>
//
//   ### Instruction:
//   <human turn>
//   ### Response:
//   <ai turn>
//   ...
//   ### Response:
//
// Turns are kept newest-first while they fit in params.n_ctx characters; the
// newest turn is always kept. System messages after the first (error
// diagnostics) are not shown to the model.
class InstructPromptAssembler : public PromptAssembler {
public:
  static constexpr const char *kInstructionMarker = "### Instruction:\n";
  static constexpr const char *kResponseMarker = "### Response:\n";

  std::string Assemble(const std::vector<Message> &transcript,
                       const ChatParameters &params) const override;

  std::string Name() const override { return "instruct"; }
};

} // namespace parley
