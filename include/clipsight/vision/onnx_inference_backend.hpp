#pragma once

#include <clipsight/core/error.hpp>
#include <clipsight/core/frame.hpp>
#include <clipsight/vision/inference_backend.hpp>
#include <clipsight/vision/inference_result.hpp>
#include <cstdint>
#include <memory>
#include <string>

namespace clipsight::vision {

struct OnnxBackendOptions {
  /// Candidates below this score are dropped before NMS (raw YOLOv8 heads only).
  float score_threshold{0.25f};
  float iou_threshold{0.5f};
  int intra_op_threads{1};
  /// Used for spatial input dims the model leaves dynamic.
  std::uint32_t dynamic_input_size{640};
};

/// ONNX Runtime inference backend for YOLO-family detectors.
///
/// Expected model: one float image input, NCHW [1,3,H,W] or NHWC [1,H,W,3], and one output:
/// - **[1, N, 6] or [1, 6, N]**: post-NMS rows (xmin, ymin, xmax, ymax, score, class_id),
///   e.g. YOLOv10 exports;
/// - **[1, 4 + C, A]**: raw YOLOv8 head (cx, cy, w, h, C class scores per anchor); the backend
///   picks the best class per anchor and runs class-aware NMS.
///
/// Input: any well-formed BGR8 / RGB8 / Grayscale8 frame. It is letterboxed to the model input
/// size, converted to RGB float in [0,1], and boxes are mapped back to source-frame pixels.
/// The constructor throws (Ort::Exception / std::runtime_error) when the model cannot be loaded.
class OnnxInferenceBackend : public IInferenceBackend {
 public:
  explicit OnnxInferenceBackend(std::string model_path, OnnxBackendOptions options = {});

  ~OnnxInferenceBackend() override;

  OnnxInferenceBackend(const OnnxInferenceBackend&) = delete;
  OnnxInferenceBackend& operator=(const OnnxInferenceBackend&) = delete;

  /// Thread-safe; a stop request terminates the running session call.
  [[nodiscard]] std::expected<InferenceResult, core::PipelineError>
  infer(const core::Frame& input, std::stop_token stop) override;

  void warmup() override;

  [[nodiscard]] std::uint32_t input_width() const noexcept;
  [[nodiscard]] std::uint32_t input_height() const noexcept;

 private:
  struct Impl;
  std::unique_ptr<Impl> impl_;
};

}  // namespace clipsight::vision
