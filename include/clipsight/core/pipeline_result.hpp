#pragma once

#include <clipsight/core/detection.hpp>
#include <cstddef>
#include <string>
#include <vector>

namespace clipsight::core {

/// Counters collected while one video is processed.
struct ProcessingStats {
  std::size_t frames_sampled{0};
  std::size_t frames_passed_quality{0};
  std::size_t frames_rejected_quality{0};
  /// Frames whose detection call failed or timed out; their detections count as empty.
  std::size_t frames_failed_detection{0};
  /// Raw detections across all classes, before the top-K cap.
  std::size_t total_detections{0};
  /// Distinct classes before the top-K cap.
  std::size_t distinct_classes{0};
};

/// Final value of one analysis request.
struct PipelineResult {
  /// Ranked (count desc, mean confidence desc, label asc) and capped at top-K.
  std::vector<AggregatedDetection> detections;
  std::string activity;
  ProcessingStats stats;
};

}  // namespace clipsight::core
