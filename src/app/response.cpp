#include <clipsight/app/response.hpp>
#include <cmath>
#include <string>

namespace clipsight::app {

namespace {

constexpr const char* kGenericServerError = "Error processing video";

double round3(float v) {
  return std::round(static_cast<double>(v) * 1000.0) / 1000.0;
}

AnalysisResponse error_response(int status, std::string detail) {
  AnalysisResponse r;
  r.status = status;
  r.body = nlohmann::json{{"detail", std::move(detail)}};
  return r;
}

}  // namespace

nlohmann::json to_json(const core::PipelineResult& result) {
  nlohmann::json detections = nlohmann::json::array();
  for (const auto& d : result.detections) {
    detections.push_back({
        {"class", d.label},
        {"count", d.count},
        {"confidence", round3(d.mean_confidence)},
        {"frames", d.frames_appeared_in},
    });
  }

  nlohmann::json body;
  body["detections"] = std::move(detections);
  body["activity"] = result.activity;
  body["frames_processed"] = result.stats.frames_passed_quality;
  body["total_objects_detected"] = result.stats.total_detections;
  body["frames_sampled"] = result.stats.frames_sampled;
  body["frames_failed"] = result.stats.frames_failed_detection;
  return body;
}

AnalysisResponse build_response(
    const std::expected<core::PipelineResult, core::PipelineError>& outcome) {
  if (outcome) {
    AnalysisResponse r;
    r.status = kStatusOk;
    r.body = to_json(*outcome);
    return r;
  }

  const core::PipelineError e = outcome.error();
  switch (e) {
    case core::PipelineError::UnreadableVideo:
    case core::PipelineError::InvalidUploadType:
      return error_response(kStatusBadRequest, std::string(core::error_message(e)));
    case core::PipelineError::Cancelled:
      return error_response(kStatusClientClosed, std::string(core::error_message(e)));
    default:
      return error_response(kStatusServerError, kGenericServerError);
  }
}

AnalysisResponse server_error_response() {
  return error_response(kStatusServerError, kGenericServerError);
}

}  // namespace clipsight::app
