#pragma once

#include "runtime/backends/model_cache.h"
#include "runtime/inference_engine.h"

#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>

struct llama_model;

namespace parley {

struct LlamaEngineConfig {
  // Model ids resolve to <weights_dir>/<id><extension>.
  std::filesystem::path weights_dir{"weights"};
  std::string extension{".bin"};
  int32_t batch_size = 512;
  // Loaded models kept resident between generations. Least recently used
  // models are released first.
  std::size_t max_cached_models = 2;
};

// InferenceEngine over llama.cpp. Model weights are loaded once and shared;
// each generation gets its own llama_context and sampler chain sized from
// the chat's parameters, so concurrent generations on different chats do
// not share decode state.
class LlamaEngine : public InferenceEngine {
public:
  explicit LlamaEngine(LlamaEngineConfig config);
  ~LlamaEngine() override;

  std::string ResolveModelPath(const std::string &model) const override;
  bool HasModel(const std::string &model) const override;

  void Generate(const std::string &prompt, const GenerationParams &params,
                const FragmentCallback &on_fragment) override;

  std::string Name() const override { return "llama.cpp"; }

private:
  static bool IsValidModelId(const std::string &model);
  std::shared_ptr<llama_model> AcquireModel(const std::string &path,
                                            int gpu_layers);

  LlamaEngineConfig config_;
  ModelCache<llama_model> cache_;
};

} // namespace parley
