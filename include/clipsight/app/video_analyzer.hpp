#pragma once

#include <clipsight/app/config.hpp>
#include <clipsight/core/activity_rules.hpp>
#include <clipsight/core/error.hpp>
#include <clipsight/core/pipeline_result.hpp>
#include <clipsight/vision/inference_backend.hpp>
#include <clipsight/vision/object_detector.hpp>
#include <clipsight/vision/quality_filter.hpp>
#include <clipsight/vision/video_source.hpp>
#include <expected>
#include <functional>
#include <memory>
#include <stop_token>
#include <string>
#include <string_view>

namespace clipsight::app {

enum class LogLevel {
  Debug,
  Info,
  Warning,
};

/// Optional diagnostics sink: (level, message). Invoked only from the thread calling analyze().
using LogCallback = std::function<void(LogLevel level, std::string_view message)>;

/// One analysis request: sample -> quality filter -> detect -> aggregate -> activity.
///
/// Built once per process around a loaded backend; analyze() may be called concurrently for
/// independent videos when the backend is thread-safe. Fatal errors (UnreadableVideo,
/// Cancelled) end the request without a partial result; per-frame DetectionModelError only
/// shows up in ProcessingStats::frames_failed_detection.
class VideoAnalyzer {
 public:
  /// Throws std::invalid_argument if \p backend is null.
  VideoAnalyzer(std::shared_ptr<vision::IInferenceBackend> backend,
                AnalyzerConfig config,
                core::ActivityEngine engine = core::ActivityEngine());

  /// Analyzes an opened video. The source is released before this returns, on every path.
  [[nodiscard]] std::expected<core::PipelineResult, core::PipelineError> analyze(
      std::unique_ptr<vision::IVideoSource> source,
      std::stop_token stop = {},
      LogCallback* log = nullptr) const;

  /// Opens \p path with OpenCV and analyzes it. UnreadableVideo if it cannot be opened.
  [[nodiscard]] std::expected<core::PipelineResult, core::PipelineError> analyze_file(
      const std::string& path,
      std::stop_token stop = {},
      LogCallback* log = nullptr) const;

  [[nodiscard]] const AnalyzerConfig& config() const noexcept { return config_; }

 private:
  AnalyzerConfig config_;
  vision::ObjectDetector detector_;
  vision::QualityFilter quality_;
  core::ActivityEngine engine_;
};

}  // namespace clipsight::app
