#include <clipsight/app/backend_factory.hpp>
#include <clipsight/app/config.hpp>
#include <clipsight/vision/mock_inference_backend.hpp>
#include <onnxruntime_cxx_api.h>
#include <gtest/gtest.h>
#include <memory>

namespace ca = clipsight::app;
namespace cv_ = clipsight::vision;

TEST(BackendFactory, OnnxOptionsFollowConfig) {
  ca::AnalyzerConfig cfg = ca::default_config();
  cfg.iou_threshold = 0.4f;
  cfg.input_size = 320;
  const cv_::OnnxBackendOptions options = ca::onnx_backend_options(cfg);
  EXPECT_FLOAT_EQ(options.score_threshold, cfg.min_confidence);
  EXPECT_FLOAT_EQ(options.iou_threshold, 0.4f);
  EXPECT_EQ(options.dynamic_input_size, 320u);
}

TEST(BackendFactory, LowConfidenceLowersPreNmsCut) {
  ca::AnalyzerConfig cfg = ca::default_config();
  ASSERT_TRUE(ca::apply_setting(cfg, "min_confidence", "0.1"));
  const cv_::OnnxBackendOptions options = ca::onnx_backend_options(cfg);
  EXPECT_FLOAT_EQ(options.score_threshold, 0.1f);
  EXPECT_LT(options.score_threshold, cv_::OnnxBackendOptions{}.score_threshold);
}

TEST(BackendFactory, MockBackendByDefault) {
  const auto backend = ca::make_inference_backend(ca::default_config());
  ASSERT_NE(backend, nullptr);
  EXPECT_NE(std::dynamic_pointer_cast<cv_::MockInferenceBackend>(backend), nullptr);
}

TEST(BackendFactory, OnnxWithMissingModelThrows) {
  ca::AnalyzerConfig cfg = ca::default_config();
  cfg.backend_type = ca::InferenceBackendType::Onnx;
  cfg.model_path = "nonexistent_clipsight_model_12345.onnx";
  EXPECT_THROW((void)ca::make_inference_backend(cfg), Ort::Exception);
}
