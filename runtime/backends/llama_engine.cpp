#include "runtime/backends/llama_engine.h"

#include "runtime/utf8_stream.h"
#include "server/logging/logger.h"

#include <llama.h>

#include <algorithm>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <vector>

namespace parley {

namespace {

std::mutex g_llama_init_mutex;
int g_llama_init_refcount = 0;

void LlamaBackendAcquire() {
  std::lock_guard<std::mutex> lock(g_llama_init_mutex);
  if (g_llama_init_refcount++ == 0) {
    llama_backend_init();
  }
}

void LlamaBackendRelease() {
  std::lock_guard<std::mutex> lock(g_llama_init_mutex);
  if (--g_llama_init_refcount == 0) {
    llama_backend_free();
  }
}

struct ContextDeleter {
  void operator()(llama_context *ctx) const { llama_free(ctx); }
};
struct SamplerDeleter {
  void operator()(llama_sampler *sampler) const { llama_sampler_free(sampler); }
};

// Owns a llama_batch for the duration of one generation.
class ScopedBatch {
public:
  explicit ScopedBatch(int32_t capacity)
      : batch_(llama_batch_init(capacity, 0, 1)), capacity_(capacity) {}
  ~ScopedBatch() { llama_batch_free(batch_); }
  ScopedBatch(const ScopedBatch &) = delete;
  ScopedBatch &operator=(const ScopedBatch &) = delete;

  void Clear() { batch_.n_tokens = 0; }

  void Add(llama_token id, llama_pos pos, bool logits) {
    if (batch_.n_tokens >= capacity_) {
      throw std::runtime_error("llama_batch capacity exceeded");
    }
    batch_.token[batch_.n_tokens] = id;
    batch_.pos[batch_.n_tokens] = pos;
    batch_.n_seq_id[batch_.n_tokens] = 1;
    batch_.seq_id[batch_.n_tokens][0] = 0;
    batch_.logits[batch_.n_tokens] = logits ? 1 : 0;
    batch_.n_tokens++;
  }

  llama_batch &get() { return batch_; }

private:
  llama_batch batch_;
  int32_t capacity_;
};

std::vector<llama_token> Tokenize(const llama_vocab *vocab,
                                  const std::string &text) {
  std::vector<llama_token> tokens(text.size() + 8);
  int n = llama_tokenize(vocab, text.c_str(), static_cast<int32_t>(text.size()),
                         tokens.data(), static_cast<int32_t>(tokens.size()),
                         /*add_special=*/true, /*parse_special=*/true);
  if (n < 0) {
    tokens.resize(static_cast<std::size_t>(-n));
    n = llama_tokenize(vocab, text.c_str(), static_cast<int32_t>(text.size()),
                       tokens.data(), static_cast<int32_t>(tokens.size()), true,
                       true);
    if (n < 0) {
      throw std::runtime_error("failed to tokenize prompt");
    }
  }
  tokens.resize(static_cast<std::size_t>(n));
  return tokens;
}

std::string TokenToString(const llama_vocab *vocab, llama_token token) {
  std::string buf;
  buf.resize(16);
  int written = llama_token_to_piece(vocab, token, buf.data(),
                                     static_cast<int32_t>(buf.size()), 0, false);
  if (written < 0) {
    buf.resize(static_cast<std::size_t>(-written));
    if (llama_token_to_piece(vocab, token, buf.data(),
                             static_cast<int32_t>(buf.size()), 0, false) < 0) {
      return {};
    }
  } else {
    buf.resize(static_cast<std::size_t>(written));
  }
  return buf;
}

llama_sampler *BuildSampler(const GenerationParams &params) {
  auto *chain = llama_sampler_chain_init(llama_sampler_chain_default_params());

  if (params.repeat_penalty != 1.0) {
    llama_sampler_chain_add(
        chain, llama_sampler_init_penalties(
                   params.repeat_last_n,
                   static_cast<float>(params.repeat_penalty), 0.0f, 0.0f));
  }
  if (params.top_k > 0) {
    llama_sampler_chain_add(chain, llama_sampler_init_top_k(params.top_k));
  }
  if (params.top_p < 1.0) {
    llama_sampler_chain_add(
        chain, llama_sampler_init_top_p(static_cast<float>(params.top_p), 1));
  }
  // Greedy when temperature <= 0, stochastic otherwise.
  if (params.temperature <= 0.0) {
    llama_sampler_chain_add(chain, llama_sampler_init_greedy());
  } else {
    llama_sampler_chain_add(
        chain, llama_sampler_init_temp(static_cast<float>(params.temperature)));
    llama_sampler_chain_add(chain, llama_sampler_init_dist(LLAMA_DEFAULT_SEED));
  }
  return chain;
}

} // namespace

LlamaEngine::LlamaEngine(LlamaEngineConfig config)
    : config_(std::move(config)), cache_(config_.max_cached_models) {
  LlamaBackendAcquire();
}

LlamaEngine::~LlamaEngine() {
  cache_.Clear();
  LlamaBackendRelease();
}

bool LlamaEngine::IsValidModelId(const std::string &model) {
  return !model.empty() && model.find('/') == std::string::npos &&
         model.find('\\') == std::string::npos &&
         model.find("..") == std::string::npos;
}

std::string LlamaEngine::ResolveModelPath(const std::string &model) const {
  return (config_.weights_dir / (model + config_.extension)).string();
}

bool LlamaEngine::HasModel(const std::string &model) const {
  if (!IsValidModelId(model)) {
    return false;
  }
  std::error_code ec;
  return std::filesystem::is_regular_file(ResolveModelPath(model), ec);
}

std::shared_ptr<llama_model> LlamaEngine::AcquireModel(const std::string &path,
                                                       int gpu_layers) {
  std::string key = path + "#" + std::to_string(gpu_layers);
  return cache_.Acquire(key, [&]() -> std::shared_ptr<llama_model> {
    llama_model_params model_params = llama_model_default_params();
    model_params.n_gpu_layers = gpu_layers;
    llama_model *raw = llama_model_load_from_file(path.c_str(), model_params);
    if (!raw) {
      log::Error("engine", "failed to load model", "path=" + path);
      throw ModelUnavailableError("Failed to load model from file: " + path);
    }
    log::Info("engine", "model loaded",
              "path=" + path + " gpu_layers=" + std::to_string(gpu_layers));
    return std::shared_ptr<llama_model>(
        raw, [](llama_model *m) { llama_model_free(m); });
  });
}

void LlamaEngine::Generate(const std::string &prompt,
                           const GenerationParams &params,
                           const FragmentCallback &on_fragment) {
  std::string path = ResolveModelPath(params.model);
  if (!HasModel(params.model)) {
    throw ModelUnavailableError("Model can't be found: " + path);
  }
  // llama.cpp treats -1 as "offload every layer"; an unset hint keeps the
  // model on the CPU.
  int gpu_layers = params.n_gpu_layers.value_or(0);
  std::shared_ptr<llama_model> model = AcquireModel(path, gpu_layers);

  const llama_vocab *vocab = llama_model_get_vocab(model.get());
  if (!vocab) {
    throw std::runtime_error("failed to obtain vocabulary for " + path);
  }

  int32_t n_ctx = std::max(params.n_ctx, 8);
  std::vector<llama_token> prompt_tokens = Tokenize(vocab, prompt);
  if (prompt_tokens.empty()) {
    throw std::runtime_error("prompt tokenized to nothing");
  }
  if (static_cast<int32_t>(prompt_tokens.size()) >= n_ctx) {
    throw std::runtime_error(
        "Requested tokens (" + std::to_string(prompt_tokens.size()) +
        ") exceed context window of " + std::to_string(n_ctx));
  }

  int32_t n_batch = std::min<int32_t>(
      n_ctx, std::max<int32_t>(config_.batch_size,
                               static_cast<int32_t>(prompt_tokens.size())));
  llama_context_params ctx_params = llama_context_default_params();
  ctx_params.n_ctx = static_cast<uint32_t>(n_ctx);
  ctx_params.n_batch = static_cast<uint32_t>(n_batch);
  ctx_params.n_threads = std::max(params.n_threads, 1);
  ctx_params.n_threads_batch = std::max(params.n_threads, 1);
  std::unique_ptr<llama_context, ContextDeleter> context(
      llama_init_from_model(model.get(), ctx_params));
  if (!context) {
    throw std::runtime_error("failed to create llama context");
  }
  std::unique_ptr<llama_sampler, SamplerDeleter> sampler(BuildSampler(params));

  ScopedBatch batch(n_batch);
  llama_pos position = 0;
  for (std::size_t i = 0; i < prompt_tokens.size(); ++i) {
    batch.Add(prompt_tokens[i], position++, i == prompt_tokens.size() - 1);
  }
  if (llama_decode(context.get(), batch.get()) != 0) {
    throw std::runtime_error("llama_decode failed for prompt");
  }
  batch.Clear();

  Utf8StreamBuffer utf8;
  bool cancelled = false;
  int tokens_remaining = std::max(params.max_tokens, 1);
  while (tokens_remaining-- > 0 && position < n_ctx) {
    llama_token token = llama_sampler_sample(sampler.get(), context.get(), -1);
    if (llama_vocab_is_eog(vocab, token)) {
      break;
    }
    std::string piece = utf8.Push(TokenToString(vocab, token));
    if (!piece.empty() && on_fragment && !on_fragment(piece)) {
      cancelled = true;
      break;
    }
    batch.Add(token, position++, true);
    if (llama_decode(context.get(), batch.get()) != 0) {
      throw std::runtime_error("llama_decode failed while generating");
    }
    batch.Clear();
  }

  std::size_t dropped = utf8.Flush();
  if (dropped > 0 && !cancelled) {
    throw DecodeArtifactError("generation ended inside a multi-byte character (" +
                              std::to_string(dropped) + " bytes dropped)");
  }
}

} // namespace parley
