#include <clipsight/core/error.hpp>
#include <clipsight/core/frame.hpp>
#include <clipsight/vision/mock_inference_backend.hpp>
#include <gtest/gtest.h>
#include <chrono>
#include <stop_token>
#include <thread>
#include <vector>

namespace cv_ = clipsight::vision;
namespace cc = clipsight::core;

namespace {

cc::Frame make_frame() {
  std::vector<std::byte> buf(8 * 8 * 3, std::byte{100});
  return cc::Frame(8, 8, cc::PixelFormat::BGR8, std::move(buf));
}

}  // namespace

TEST(MockInferenceBackend, ReturnsSetResult) {
  cv_::MockInferenceBackend mock;
  mock.set_result(cv_::make_inference_result({{0, 0.95f}, {16, 0.8f}}));
  auto result = mock.infer(make_frame(), {});
  ASSERT_TRUE(result.has_value());
  EXPECT_EQ(result->num_detections, 2u);
  EXPECT_EQ(result->boxes.size(), 8u);
  EXPECT_FLOAT_EQ(result->scores[0], 0.95f);
  EXPECT_EQ(result->class_ids[1], 16);
  EXPECT_EQ(mock.call_count(), 1u);
}

TEST(MockInferenceBackend, DefaultIsEmptyResult) {
  cv_::MockInferenceBackend mock;
  auto result = mock.infer(make_frame(), {});
  ASSERT_TRUE(result.has_value());
  EXPECT_EQ(result->num_detections, 0u);
}

TEST(MockInferenceBackend, ResponderTakesPrecedence) {
  cv_::MockInferenceBackend mock;
  mock.set_result(cv_::make_inference_result({{0, 0.9f}}));
  mock.set_responder([](const cc::Frame&) -> std::expected<cv_::InferenceResult, cc::PipelineError> {
    return std::unexpected(cc::PipelineError::DetectionModelError);
  });
  auto result = mock.infer(make_frame(), {});
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error(), cc::PipelineError::DetectionModelError);
}

TEST(MockInferenceBackend, ValidateInputRejectsEmptyFrame) {
  cv_::MockInferenceBackend mock;
  auto valid = mock.validate_input(cc::Frame{});
  ASSERT_FALSE(valid.has_value());
  EXPECT_EQ(valid.error(), cc::PipelineError::InvalidFrame);

  auto result = mock.infer(cc::Frame{}, {});
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error(), cc::PipelineError::InvalidFrame);
}

TEST(MockInferenceBackend, LatencyInterruptedByStop) {
  cv_::MockInferenceBackend mock;
  mock.set_latency(std::chrono::seconds{10});
  std::stop_source stop;
  std::jthread stopper([&stop] {
    std::this_thread::sleep_for(std::chrono::milliseconds{20});
    stop.request_stop();
  });

  const auto t0 = std::chrono::steady_clock::now();
  auto result = mock.infer(make_frame(), stop.get_token());
  const auto elapsed = std::chrono::steady_clock::now() - t0;
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error(), cc::PipelineError::DetectionModelError);
  EXPECT_LT(elapsed, std::chrono::seconds{5});
}

TEST(MockInferenceBackend, ConcurrentCallsAreCounted) {
  cv_::MockInferenceBackend mock;
  mock.set_result(cv_::make_inference_result({{0, 0.9f}}));
  {
    std::vector<std::jthread> threads;
    for (int t = 0; t < 4; ++t) {
      threads.emplace_back([&mock] {
        for (int i = 0; i < 25; ++i) {
          auto r = mock.infer(make_frame(), {});
          EXPECT_TRUE(r.has_value());
        }
      });
    }
  }
  EXPECT_EQ(mock.call_count(), 100u);
}
