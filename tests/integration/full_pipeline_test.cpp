#include <clipsight/app/config.hpp>
#include <clipsight/app/response.hpp>
#include <clipsight/app/video_analyzer.hpp>
#include <clipsight/core/activity_rules.hpp>
#include <clipsight/core/error.hpp>
#include <clipsight/vision/frame_sampler.hpp>
#include <clipsight/vision/mock_inference_backend.hpp>
#include <support/fake_video_source.hpp>
#include <support/temp_video.hpp>
#include <gtest/gtest.h>
#include <chrono>
#include <filesystem>
#include <memory>
#include <stdexcept>
#include <stop_token>
#include <string>
#include <thread>
#include <vector>

namespace {

using namespace clipsight::core;
using namespace clipsight::vision;
using namespace clipsight::app;
using clipsight::testing::FakeSourceCounters;
using clipsight::testing::FakeVideoSource;

constexpr std::uint8_t kFailingPixel = 99;

/// Two people and a dog per frame; frames filled with kFailingPixel make the model fail.
std::shared_ptr<MockInferenceBackend> person_dog_backend() {
  auto mock = std::make_shared<MockInferenceBackend>();
  mock->set_responder([](const Frame& f) -> std::expected<InferenceResult, PipelineError> {
    if (static_cast<std::uint8_t>(f.data()[0]) == kFailingPixel) {
      return std::unexpected(PipelineError::DetectionModelError);
    }
    return make_inference_result({{0, 0.9f}, {0, 0.8f}, {16, 0.7f}});
  });
  return mock;
}

AnalyzerConfig test_config() {
  AnalyzerConfig cfg = default_config();
  cfg.num_workers = 3;
  return cfg;
}

}  // namespace

TEST(FullPipeline, PersonAndDogVideo) {
  auto mock = person_dog_backend();
  VideoAnalyzer analyzer(mock, test_config());
  auto counters = std::make_shared<FakeSourceCounters>();

  auto result = analyzer.analyze(std::make_unique<FakeVideoSource>(300, counters));
  ASSERT_TRUE(result.has_value());
  EXPECT_EQ(counters->destroyed.load(), 1);
  EXPECT_EQ(mock->call_count(), 15u);

  EXPECT_EQ(result->activity, "Person with dog");
  ASSERT_EQ(result->detections.size(), 2u);
  EXPECT_EQ(result->detections[0].label, "person");
  EXPECT_EQ(result->detections[0].count, 30u);
  EXPECT_EQ(result->detections[0].frames_appeared_in, 15u);
  EXPECT_NEAR(result->detections[0].mean_confidence, 0.85f, 1e-4);
  EXPECT_EQ(result->detections[1].label, "dog");
  EXPECT_EQ(result->detections[1].count, 15u);

  EXPECT_EQ(result->stats.frames_sampled, 15u);
  EXPECT_EQ(result->stats.frames_passed_quality, 15u);
  EXPECT_EQ(result->stats.frames_failed_detection, 0u);
  EXPECT_EQ(result->stats.total_detections, 45u);

  const AnalysisResponse resp = build_response(result);
  EXPECT_EQ(resp.status, 200);
  EXPECT_EQ(resp.body["frames_processed"], 15);
  EXPECT_EQ(resp.body["total_objects_detected"], 45);
}

TEST(FullPipeline, OneFailingFrameOnlyShowsInStatistics) {
  const auto planned = plan_sample_positions(300, 15);
  const std::int64_t bad = planned[6];
  auto source = std::make_unique<FakeVideoSource>(
      300, nullptr, [bad](std::int64_t i) -> std::uint8_t { return i == bad ? kFailingPixel : 128; });

  std::vector<std::string> warnings;
  LogCallback log = [&warnings](LogLevel level, std::string_view message) {
    if (level == LogLevel::Warning) warnings.emplace_back(message);
  };

  VideoAnalyzer analyzer(person_dog_backend(), test_config());
  auto result = analyzer.analyze(std::move(source), {}, &log);
  ASSERT_TRUE(result.has_value());
  EXPECT_EQ(result->stats.frames_failed_detection, 1u);
  EXPECT_EQ(result->stats.frames_passed_quality, 15u);
  EXPECT_EQ(result->stats.total_detections, 42u);
  ASSERT_FALSE(result->detections.empty());
  EXPECT_EQ(result->detections[0].label, "person");
  EXPECT_EQ(result->detections[0].frames_appeared_in, 14u);
  EXPECT_EQ(result->activity, "Person with dog");

  ASSERT_EQ(warnings.size(), 1u);
  EXPECT_NE(warnings[0].find("frame " + std::to_string(bad)), std::string::npos);
}

TEST(FullPipeline, AllDarkVideoHasNoActivity) {
  auto mock = person_dog_backend();
  VideoAnalyzer analyzer(mock, test_config());
  auto result = analyzer.analyze(std::make_unique<FakeVideoSource>(
      120, nullptr, [](std::int64_t) -> std::uint8_t { return 5; }));
  ASSERT_TRUE(result.has_value());
  EXPECT_TRUE(result->detections.empty());
  EXPECT_EQ(result->activity, kNoActivity);
  EXPECT_EQ(result->stats.frames_sampled, 15u);
  EXPECT_EQ(result->stats.frames_passed_quality, 0u);
  EXPECT_EQ(result->stats.frames_rejected_quality, 15u);
  EXPECT_EQ(mock->call_count(), 0u);
  EXPECT_EQ(build_response(result).status, 200);
}

TEST(FullPipeline, OverexposedFramesAreFilteredOut) {
  VideoAnalyzer analyzer(person_dog_backend(), test_config());
  auto result = analyzer.analyze(std::make_unique<FakeVideoSource>(
      100, nullptr, [](std::int64_t i) -> std::uint8_t { return i < 50 ? 250 : 128; }));
  ASSERT_TRUE(result.has_value());
  EXPECT_EQ(result->stats.frames_sampled, 15u);
  EXPECT_GT(result->stats.frames_rejected_quality, 0u);
  EXPECT_EQ(result->stats.frames_passed_quality + result->stats.frames_rejected_quality, 15u);
  EXPECT_EQ(result->detections[0].frames_appeared_in, result->stats.frames_passed_quality);
}

TEST(FullPipeline, UnreadableVideoAbortsWithoutPartialResult) {
  auto mock = person_dog_backend();
  VideoAnalyzer analyzer(mock, test_config());
  auto counters = std::make_shared<FakeSourceCounters>();
  auto source = std::make_unique<FakeVideoSource>(100, counters);
  source->fail_all(PipelineError::UnreadableVideo);

  auto result = analyzer.analyze(std::move(source));
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error(), PipelineError::UnreadableVideo);
  EXPECT_EQ(counters->destroyed.load(), 1);
  EXPECT_EQ(mock->call_count(), 0u);

  const AnalysisResponse resp = build_response(result);
  EXPECT_EQ(resp.status, 400);
  EXPECT_FALSE(resp.body.contains("detections"));
}

TEST(FullPipeline, ZeroFrameVideoIsUnreadable) {
  VideoAnalyzer analyzer(person_dog_backend(), test_config());
  auto result = analyzer.analyze(std::make_unique<FakeVideoSource>(0));
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error(), PipelineError::UnreadableVideo);
}

TEST(FullPipeline, ShortVideoUsesEveryFrame) {
  VideoAnalyzer analyzer(person_dog_backend(), test_config());
  auto result = analyzer.analyze(std::make_unique<FakeVideoSource>(6));
  ASSERT_TRUE(result.has_value());
  EXPECT_EQ(result->stats.frames_sampled, 6u);
  EXPECT_EQ(result->detections[0].count, 12u);
}

TEST(FullPipeline, DetectionsCappedAtTopK) {
  auto mock = std::make_shared<MockInferenceBackend>();
  mock->set_result(make_inference_result(
      {{0, 0.9f}, {0, 0.9f}, {2, 0.8f}, {7, 0.7f}, {5, 0.6f}, {39, 0.5f}, {41, 0.5f}, {56, 0.4f}}));
  AnalyzerConfig cfg = test_config();
  cfg.sample_count = 4;
  cfg.top_k = 5;
  VideoAnalyzer analyzer(mock, cfg);

  auto result = analyzer.analyze(std::make_unique<FakeVideoSource>(40));
  ASSERT_TRUE(result.has_value());
  EXPECT_EQ(result->detections.size(), 5u);
  EXPECT_EQ(result->stats.distinct_classes, 7u);
  EXPECT_EQ(result->stats.total_detections, 32u);
  EXPECT_EQ(result->detections[0].label, "person");
  EXPECT_EQ(result->activity, "Person near car");
}

TEST(FullPipeline, AllowListDropsOtherClasses) {
  AnalyzerConfig cfg = test_config();
  cfg.allowed_classes = {"dog"};
  VideoAnalyzer analyzer(person_dog_backend(), cfg);
  auto result = analyzer.analyze(std::make_unique<FakeVideoSource>(100));
  ASSERT_TRUE(result.has_value());
  ASSERT_EQ(result->detections.size(), 1u);
  EXPECT_EQ(result->detections[0].label, "dog");
  EXPECT_EQ(result->activity, "Multiple dogs present");
}

TEST(FullPipeline, ModelTimeoutsCountAsFailedFrames) {
  auto mock = std::make_shared<MockInferenceBackend>();
  mock->set_latency(std::chrono::seconds{10});
  AnalyzerConfig cfg = test_config();
  cfg.sample_count = 5;
  cfg.model_timeout_ms = 20;
  VideoAnalyzer analyzer(mock, cfg);

  auto result = analyzer.analyze(std::make_unique<FakeVideoSource>(100));
  ASSERT_TRUE(result.has_value());
  EXPECT_EQ(result->stats.frames_failed_detection, 5u);
  EXPECT_TRUE(result->detections.empty());
  EXPECT_EQ(result->activity, kNoActivity);
}

TEST(FullPipeline, CancelledBeforeStart) {
  auto counters = std::make_shared<FakeSourceCounters>();
  VideoAnalyzer analyzer(person_dog_backend(), test_config());
  std::stop_source stop;
  stop.request_stop();
  auto result = analyzer.analyze(std::make_unique<FakeVideoSource>(100, counters), stop.get_token());
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error(), PipelineError::Cancelled);
  EXPECT_EQ(counters->destroyed.load(), 1);
  EXPECT_EQ(build_response(result).status, 499);
}

TEST(FullPipeline, CancelledDuringDetection) {
  auto mock = std::make_shared<MockInferenceBackend>();
  mock->set_latency(std::chrono::seconds{10});
  AnalyzerConfig cfg = test_config();
  cfg.model_timeout_ms = 0;
  VideoAnalyzer analyzer(mock, cfg);

  std::stop_source stop;
  std::jthread canceller([&stop] {
    std::this_thread::sleep_for(std::chrono::milliseconds{50});
    stop.request_stop();
  });
  const auto t0 = std::chrono::steady_clock::now();
  auto result = analyzer.analyze(std::make_unique<FakeVideoSource>(100), stop.get_token());
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error(), PipelineError::Cancelled);
  EXPECT_LT(std::chrono::steady_clock::now() - t0, std::chrono::seconds{5});
}

TEST(FullPipeline, NullBackendThrows) {
  EXPECT_THROW(VideoAnalyzer(nullptr, test_config()), std::invalid_argument);
}

TEST(FullPipeline, AnalyzeMissingFile) {
  VideoAnalyzer analyzer(person_dog_backend(), test_config());
  auto result = analyzer.analyze_file("/nonexistent/clipsight/video.mp4");
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error(), PipelineError::UnreadableVideo);
}

TEST(FullPipeline, AnalyzeWrittenClip) {
  const auto path = clipsight::testing::write_temp_video(
      "clipsight_full_pipeline_test.avi", 90, [](int) { return 128; });
  if (path.empty()) {
    GTEST_SKIP() << "No OpenCV video writer backend available";
  }
  auto mock = person_dog_backend();
  VideoAnalyzer analyzer(mock, test_config());
  auto result = analyzer.analyze_file(path.string());
  std::filesystem::remove(path);

  ASSERT_TRUE(result.has_value());
  EXPECT_EQ(result->stats.frames_sampled, 15u);
  EXPECT_EQ(result->activity, "Person with dog");
}

TEST(FullPipeline, ActivitySeesClassesBeyondTopK) {
  AnalyzerConfig cfg = test_config();
  cfg.top_k = 1;
  VideoAnalyzer analyzer(person_dog_backend(), cfg);
  auto result = analyzer.analyze(std::make_unique<FakeVideoSource>(100));
  ASSERT_TRUE(result.has_value());
  ASSERT_EQ(result->detections.size(), 1u);
  EXPECT_EQ(result->detections[0].label, "person");
  EXPECT_EQ(result->stats.total_detections, 45u);
  EXPECT_EQ(result->activity, "Person with dog");
}
