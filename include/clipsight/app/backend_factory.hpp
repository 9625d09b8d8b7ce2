#pragma once

#include <clipsight/app/config.hpp>
#include <clipsight/vision/inference_backend.hpp>
#include <clipsight/vision/onnx_inference_backend.hpp>
#include <memory>

namespace clipsight::app {

/// ONNX backend options derived from \p cfg. The pre-NMS score cut follows min_confidence,
/// so lowering the detection threshold also lets weaker raw-head candidates through.
[[nodiscard]] vision::OnnxBackendOptions onnx_backend_options(const AnalyzerConfig& cfg);

/// Build the backend named by cfg.backend_type. Onnx loads cfg.model_path and runs warmup;
/// Mock returns an empty MockInferenceBackend. Throws when the model cannot be loaded.
[[nodiscard]] std::shared_ptr<vision::IInferenceBackend> make_inference_backend(
    const AnalyzerConfig& cfg);

}  // namespace clipsight::app
