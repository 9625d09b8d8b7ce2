#include <clipsight/app/backend_factory.hpp>
#include <clipsight/vision/mock_inference_backend.hpp>

namespace clipsight::app {

vision::OnnxBackendOptions onnx_backend_options(const AnalyzerConfig& cfg) {
  vision::OnnxBackendOptions options;
  options.score_threshold = cfg.min_confidence;
  options.iou_threshold = cfg.iou_threshold;
  options.dynamic_input_size = cfg.input_size;
  return options;
}

std::shared_ptr<vision::IInferenceBackend> make_inference_backend(const AnalyzerConfig& cfg) {
  if (cfg.backend_type == InferenceBackendType::Onnx) {
    auto onnx = std::make_shared<vision::OnnxInferenceBackend>(cfg.model_path,
                                                               onnx_backend_options(cfg));
    onnx->warmup();
    return onnx;
  }
  return std::make_shared<vision::MockInferenceBackend>();
}

}  // namespace clipsight::app
