#pragma once

#include <clipsight/core/detection.hpp>
#include <clipsight/core/error.hpp>
#include <clipsight/core/frame.hpp>
#include <clipsight/vision/detection_decoder.hpp>
#include <clipsight/vision/inference_backend.hpp>
#include <chrono>
#include <expected>
#include <memory>
#include <stop_token>
#include <vector>

namespace clipsight::vision {

/// Runs the inference backend on one frame and decodes the output into Detections.
/// Safe to call from several threads when the backend is.
class ObjectDetector {
 public:
  /// \param call_timeout Bound on one model call; zero disables the bound and calls inline.
  ObjectDetector(std::shared_ptr<IInferenceBackend> backend,
                 DetectionDecoder decoder,
                 std::chrono::milliseconds call_timeout = std::chrono::milliseconds{0});

  /// Detections for one accepted frame (possibly empty).
  /// Errors: DetectionModelError (backend failure, exception, timeout, malformed output),
  /// InvalidFrame (backend rejects input), Cancelled (\p stop requested before or during
  /// a bounded call). A bounded call that overruns is abandoned, not joined.
  [[nodiscard]] std::expected<std::vector<core::Detection>, core::PipelineError> detect(
      const core::RawFrame& frame, std::stop_token stop = {}) const;

  [[nodiscard]] const DetectionDecoder& decoder() const noexcept { return decoder_; }
  [[nodiscard]] std::chrono::milliseconds call_timeout() const noexcept { return call_timeout_; }

 private:
  [[nodiscard]] std::expected<InferenceResult, core::PipelineError> infer_bounded(
      const core::Frame& image, std::stop_token stop) const;

  std::shared_ptr<IInferenceBackend> backend_;
  DetectionDecoder decoder_;
  std::chrono::milliseconds call_timeout_;
};

}  // namespace clipsight::vision
