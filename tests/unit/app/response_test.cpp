#include <clipsight/app/response.hpp>
#include <clipsight/core/error.hpp>
#include <clipsight/core/pipeline_result.hpp>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include <string>

namespace ca = clipsight::app;
namespace cc = clipsight::core;

namespace {

cc::PipelineResult sample_result() {
  cc::PipelineResult r;
  r.detections = {
      cc::AggregatedDetection{"person", 3, 0.8f, 3},
      cc::AggregatedDetection{"dog", 1, 0.61234f, 1},
  };
  r.activity = "Person with dog";
  r.stats.frames_sampled = 15;
  r.stats.frames_passed_quality = 12;
  r.stats.frames_rejected_quality = 3;
  r.stats.frames_failed_detection = 1;
  r.stats.total_detections = 6;
  r.stats.distinct_classes = 3;
  return r;
}

}  // namespace

TEST(Response, SuccessBody) {
  const nlohmann::json body = ca::to_json(sample_result());
  ASSERT_TRUE(body["detections"].is_array());
  ASSERT_EQ(body["detections"].size(), 2u);
  EXPECT_EQ(body["detections"][0]["class"], "person");
  EXPECT_EQ(body["detections"][0]["count"], 3);
  EXPECT_DOUBLE_EQ(body["detections"][0]["confidence"].get<double>(), 0.8);
  EXPECT_EQ(body["detections"][0]["frames"], 3);
  EXPECT_DOUBLE_EQ(body["detections"][1]["confidence"].get<double>(), 0.612);
  EXPECT_EQ(body["activity"], "Person with dog");
  EXPECT_EQ(body["frames_processed"], 12);
  EXPECT_EQ(body["total_objects_detected"], 6);
  EXPECT_EQ(body["frames_sampled"], 15);
  EXPECT_EQ(body["frames_failed"], 1);
}

TEST(Response, EmptyResultIsStillOk) {
  cc::PipelineResult r;
  r.activity = "No clear activity detected";
  const ca::AnalysisResponse resp = ca::build_response(r);
  EXPECT_EQ(resp.status, 200);
  EXPECT_TRUE(resp.body["detections"].empty());
  EXPECT_EQ(resp.body["activity"], "No clear activity detected");
  EXPECT_EQ(resp.body["frames_processed"], 0);
}

TEST(Response, ClientErrorsAreBadRequest) {
  const ca::AnalysisResponse unreadable =
      ca::build_response(std::unexpected(cc::PipelineError::UnreadableVideo));
  EXPECT_EQ(unreadable.status, 400);
  EXPECT_EQ(unreadable.body["detail"], "Could not open or decode video file");
  EXPECT_FALSE(unreadable.body.contains("detections"));

  const ca::AnalysisResponse upload =
      ca::build_response(std::unexpected(cc::PipelineError::InvalidUploadType));
  EXPECT_EQ(upload.status, 400);
  EXPECT_NE(upload.body["detail"].get<std::string>().find(".mp4"), std::string::npos);
}

TEST(Response, CancelledIs499) {
  const ca::AnalysisResponse resp = ca::build_response(std::unexpected(cc::PipelineError::Cancelled));
  EXPECT_EQ(resp.status, 499);
  EXPECT_TRUE(resp.body.contains("detail"));
}

TEST(Response, OtherErrorsAreGenericServerErrors) {
  const ca::AnalysisResponse resp =
      ca::build_response(std::unexpected(cc::PipelineError::DetectionModelError));
  EXPECT_EQ(resp.status, 500);
  EXPECT_EQ(resp.body["detail"], "Error processing video");
  EXPECT_EQ(ca::server_error_response().body, resp.body);
}
