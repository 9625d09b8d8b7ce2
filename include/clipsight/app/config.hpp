#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace clipsight::app {

/// Inference backend type: mock (synthetic) or onnx (real model).
enum class InferenceBackendType {
  Mock,
  Onnx,
};

/// How per-frame detection is spread across threads.
enum class ParallelBackend {
  Threads,  // std::thread worker pool
  Tbb,      // tbb::parallel_for (only when built with CLIPSIGHT_HAS_TBB)
};

/// Analysis configuration: model, sampling, thresholds, timeouts.
struct AnalyzerConfig {
  std::string model_path;
  InferenceBackendType backend_type{InferenceBackendType::Mock};
  std::uint32_t input_size{640};  // model input side when the model leaves it dynamic

  std::size_t sample_count{15};
  float min_confidence{0.3f};
  float iou_threshold{0.5f};
  double dark_threshold{20.0};
  double bright_threshold{235.0};
  std::size_t top_k{5};

  std::uint32_t model_timeout_ms{5000};   // 0 = unbounded
  std::uint32_t decode_timeout_ms{30000};

  std::size_t num_workers{0};  // 0 = hardware concurrency
  ParallelBackend parallel_backend{ParallelBackend::Threads};

  std::vector<std::string> allowed_classes;  // empty = all labels
};

/// Load config from a simple key=value file (one per line, '#' comments) on top of defaults.
/// Throws std::runtime_error if the file cannot be opened or a value does not parse.
AnalyzerConfig load_config(const std::string& path);

/// Default config when no file is provided.
AnalyzerConfig default_config();

/// Apply CLIPSIGHT_<KEY> environment variables (e.g. CLIPSIGHT_SAMPLE_COUNT) to \p cfg.
void apply_env_overrides(AnalyzerConfig& cfg);

/// Set one key=value pair. Returns false for an unknown key; throws on a bad value.
bool apply_setting(AnalyzerConfig& cfg, const std::string& key, const std::string& value);

/// Human-readable reason the config is unusable, or empty when it is valid.
[[nodiscard]] std::string validate_config(const AnalyzerConfig& cfg);

}  // namespace clipsight::app
