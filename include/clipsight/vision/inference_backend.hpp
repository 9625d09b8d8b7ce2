#pragma once

#include <clipsight/core/error.hpp>
#include <clipsight/core/frame.hpp>
#include <clipsight/vision/inference_result.hpp>
#include <expected>
#include <stop_token>

namespace clipsight::vision {

/// Abstract detection model: decoded Frame -> InferenceResult.
/// Loaded once at startup and shared by all requests, so infer() must be callable from
/// several threads at once. Construction failures (missing model, bad graph) throw.
class IInferenceBackend {
 public:
  virtual ~IInferenceBackend() = default;

  /// Single-frame inference. Implementations should return early with DetectionModelError
  /// once \p stop is requested.
  [[nodiscard]] virtual std::expected<InferenceResult, core::PipelineError>
  infer(const core::Frame& input, std::stop_token stop) = 0;

  /// Optional: validate frame format/dimensions before infer. Default: accept well-formed frames.
  [[nodiscard]] virtual std::expected<void, core::PipelineError>
  validate_input(const core::Frame& input) const {
    if (!input.well_formed()) {
      return std::unexpected(core::PipelineError::InvalidFrame);
    }
    return {};
  }

  /// Optional: warmup run (e.g. dummy inference). Call once after construction. Default: no-op.
  virtual void warmup() {}
};

}  // namespace clipsight::vision
