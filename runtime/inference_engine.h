#pragma once

#include <functional>
#include <optional>
#include <stdexcept>
#include <string>

namespace parley {

// Sampling and context settings for one generation. Built per call from the
// chat's ChatParameters.
struct GenerationParams {
  std::string model;
  int n_ctx{2048};
  double temperature{0.1};
  int top_k{50};
  double top_p{0.95};
  double repeat_penalty{1.3};
  int repeat_last_n{64};
  int max_tokens{2048};
  int n_threads{4};
  std::optional<int> n_gpu_layers;
};

// The requested model artifact is missing or could not be loaded.
class ModelUnavailableError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

// A fragment boundary split a multi-byte character. Callers treat this as
// benign and keep what was produced so far.
class DecodeArtifactError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

// Receives each text fragment in production order. Returning false asks the
// engine to stop at the next token (client went away).
using FragmentCallback = std::function<bool(const std::string &)>;

// InferenceEngine turns an assembled prompt into a stream of text fragments.
//
// Generate() blocks until the model stops, max_tokens is reached, or the
// callback returns false. Errors are thrown: ModelUnavailableError before
// any fragment, DecodeArtifactError or std::runtime_error afterwards.
//
// Thread safety: Generate() may be called concurrently for different chats.
class InferenceEngine {
public:
  virtual ~InferenceEngine() = default;

  // Filesystem location the artifact for `model` is expected at.
  virtual std::string ResolveModelPath(const std::string &model) const = 0;

  virtual bool HasModel(const std::string &model) const = 0;

  virtual void Generate(const std::string &prompt,
                        const GenerationParams &params,
                        const FragmentCallback &on_fragment) = 0;

  // Name for logging.
  virtual std::string Name() const = 0;
};

} // namespace parley
