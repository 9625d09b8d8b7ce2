#pragma once

#include <clipsight/core/error.hpp>
#include <clipsight/core/pipeline_result.hpp>
#include <expected>
#include <nlohmann/json.hpp>

namespace clipsight::app {

/// Status codes used by the response builder.
inline constexpr int kStatusOk = 200;
inline constexpr int kStatusBadRequest = 400;
inline constexpr int kStatusClientClosed = 499;
inline constexpr int kStatusServerError = 500;

/// HTTP-style outcome of one analysis request.
struct AnalysisResponse {
  int status{kStatusOk};
  nlohmann::json body;
};

/// Success body:
/// {"detections": [{"class", "count", "confidence", "frames"}...], "activity",
///  "frames_processed", "total_objects_detected", "frames_sampled", "frames_failed"}.
/// "frames_processed" counts frames that passed the quality filter; "confidence" is the mean
/// confidence rounded to 3 decimals.
[[nodiscard]] nlohmann::json to_json(const core::PipelineResult& result);

/// 200 with to_json() on success; 400 for UnreadableVideo / InvalidUploadType; 499 for
/// Cancelled; 500 otherwise. Error bodies are {"detail": <message>}.
[[nodiscard]] AnalysisResponse build_response(
    const std::expected<core::PipelineResult, core::PipelineError>& outcome);

/// 500 response for an unexpected exception. Exception text is not included.
[[nodiscard]] AnalysisResponse server_error_response();

}  // namespace clipsight::app
