#include <clipsight/app/video_analyzer.hpp>
#include <clipsight/app/frame_dispatch.hpp>
#include <clipsight/core/detection_aggregator.hpp>
#include <clipsight/vision/class_labels.hpp>
#include <clipsight/vision/detection_decoder.hpp>
#include <clipsight/vision/frame_sampler.hpp>
#include <clipsight/vision/opencv_video_source.hpp>
#include <chrono>
#include <sstream>
#include <utility>
#include <vector>

namespace clipsight::app {

namespace {

void emit(LogCallback* log, LogLevel level, const std::string& message) {
  if (log && *log) (*log)(level, message);
}

vision::ObjectDetector make_detector(std::shared_ptr<vision::IInferenceBackend> backend,
                                     const AnalyzerConfig& cfg) {
  vision::DetectionDecoder decoder(cfg.min_confidence, vision::coco_class_labels(),
                                   cfg.allowed_classes);
  return vision::ObjectDetector(std::move(backend), std::move(decoder),
                                std::chrono::milliseconds{cfg.model_timeout_ms});
}

std::vector<FrameOutcome> dispatch(const vision::ObjectDetector& detector,
                                   const std::vector<core::RawFrame>& frames,
                                   const AnalyzerConfig& cfg,
                                   std::stop_token stop) {
#ifdef CLIPSIGHT_HAS_TBB
  if (cfg.parallel_backend == ParallelBackend::Tbb) {
    return detect_frames_tbb(detector, frames, stop);
  }
#endif
  return detect_frames(detector, frames, cfg.num_workers, stop);
}

}  // namespace

VideoAnalyzer::VideoAnalyzer(std::shared_ptr<vision::IInferenceBackend> backend,
                             AnalyzerConfig config,
                             core::ActivityEngine engine)
    : config_(std::move(config)),
      detector_(make_detector(std::move(backend), config_)),
      quality_(vision::BrightnessBand{config_.dark_threshold, config_.bright_threshold}),
      engine_(std::move(engine)) {}

std::expected<core::PipelineResult, core::PipelineError> VideoAnalyzer::analyze(
    std::unique_ptr<vision::IVideoSource> source,
    std::stop_token stop,
    LogCallback* log) const {
  vision::SamplerOptions options;
  options.sample_count = config_.sample_count;
  options.decode_timeout = std::chrono::milliseconds{config_.decode_timeout_ms};

  auto sampler = vision::FrameSampler::create(std::move(source), options, stop);
  if (!sampler) {
    return std::unexpected(sampler.error());
  }

  core::PipelineResult result;
  core::ProcessingStats& stats = result.stats;
  std::vector<core::RawFrame> accepted;

  {
    // The sampler (and the decoder it owns) is gone before any detection runs.
    vision::FrameSampler frames = std::move(*sampler);
    while (true) {
      auto next = frames.next();
      if (!next) {
        return std::unexpected(next.error());
      }
      if (!next->has_value()) break;

      core::RawFrame frame = std::move(**next);
      ++stats.frames_sampled;
      if (quality_.accept(frame.image)) {
        accepted.push_back(std::move(frame));
      } else {
        ++stats.frames_rejected_quality;
        emit(log, LogLevel::Debug,
             "frame " + std::to_string(frame.index) + " rejected by quality filter");
      }
    }
    if (frames.frames_skipped() > 0) {
      emit(log, LogLevel::Warning,
           std::to_string(frames.frames_skipped()) + " sampled frame(s) could not be decoded");
    }
  }
  stats.frames_passed_quality = accepted.size();

  if (accepted.empty()) {
    emit(log, LogLevel::Info, "no frame passed the quality filter");
    result.activity = std::string(core::kNoActivity);
    return result;
  }

  std::vector<FrameOutcome> outcomes = dispatch(detector_, accepted, config_, stop);
  if (stop.stop_requested()) {
    return std::unexpected(core::PipelineError::Cancelled);
  }

  std::vector<core::FrameDetections> per_frame;
  per_frame.reserve(outcomes.size());
  for (std::size_t i = 0; i < outcomes.size(); ++i) {
    if (outcomes[i]) {
      per_frame.push_back(std::move(*outcomes[i]));
      continue;
    }
    if (outcomes[i].error() == core::PipelineError::Cancelled) {
      return std::unexpected(core::PipelineError::Cancelled);
    }
    ++stats.frames_failed_detection;
    emit(log, LogLevel::Warning,
         "frame " + std::to_string(accepted[i].index) + ": " +
             std::string(core::error_message(outcomes[i].error())));
  }

  core::AggregationSummary summary = core::aggregate_detections(per_frame);
  stats.total_detections = summary.total_detections;
  stats.distinct_classes = summary.ranked.size();

  result.activity = engine_.infer(summary.ranked);
  result.detections = core::top_classes(summary.ranked, config_.top_k);

  std::ostringstream msg;
  msg << "analyzed " << stats.frames_sampled << " frame(s): " << stats.frames_passed_quality
      << " passed quality, " << stats.frames_failed_detection << " failed detection, "
      << stats.total_detections << " detection(s)";
  emit(log, LogLevel::Info, msg.str());
  return result;
}

std::expected<core::PipelineResult, core::PipelineError> VideoAnalyzer::analyze_file(
    const std::string& path,
    std::stop_token stop,
    LogCallback* log) const {
  auto source = vision::OpenCvVideoSource::open(
      path, std::chrono::milliseconds{config_.decode_timeout_ms});
  if (!source) {
    emit(log, LogLevel::Warning, "cannot open video " + path);
    return std::unexpected(source.error());
  }
  return analyze(std::move(*source), stop, log);
}

}  // namespace clipsight::app
