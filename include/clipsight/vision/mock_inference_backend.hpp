#pragma once

#include <clipsight/vision/inference_backend.hpp>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <mutex>
#include <utility>
#include <vector>

namespace clipsight::vision {

/// Mock backend that returns configurable synthetic outputs (for tests/demo). Thread-safe.
class MockInferenceBackend : public IInferenceBackend {
 public:
  using Responder =
      std::function<std::expected<InferenceResult, core::PipelineError>(const core::Frame&)>;

  /// Same output for every frame.
  void set_result(InferenceResult result);

  /// Per-frame output; takes precedence over set_result().
  void set_responder(Responder responder);

  /// Simulated model latency. Interrupted early when the stop token fires.
  void set_latency(std::chrono::milliseconds latency);

  [[nodiscard]] std::expected<InferenceResult, core::PipelineError>
  infer(const core::Frame& input, std::stop_token stop) override;

  [[nodiscard]] std::size_t call_count() const;

 private:
  mutable std::mutex mutex_;
  InferenceResult result_;
  Responder responder_;
  std::chrono::milliseconds latency_{0};
  std::size_t calls_{0};
};

/// Builds an InferenceResult from (class_id, score) pairs with unit boxes.
[[nodiscard]] InferenceResult make_inference_result(
    const std::vector<std::pair<std::int64_t, float>>& outputs);

}  // namespace clipsight::vision
