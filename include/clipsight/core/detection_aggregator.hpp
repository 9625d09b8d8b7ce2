#pragma once

#include <clipsight/core/detection.hpp>
#include <cstddef>
#include <vector>

namespace clipsight::core {

/// Detections of one frame, in the order the detector produced them.
using FrameDetections = std::vector<Detection>;

/// Aggregation output: every class, ranked, plus the raw total.
struct AggregationSummary {
  std::vector<AggregatedDetection> ranked;
  std::size_t total_detections{0};
};

/// Strict weak ordering used for the result payload:
/// count descending, then mean confidence descending, then label ascending.
[[nodiscard]] bool ranks_before(const AggregatedDetection& a,
                                const AggregatedDetection& b) noexcept;

/// Groups detections by label across frames. Each element of \p per_frame is one source
/// frame (frames_appeared_in counts distinct elements). Nothing is filtered here.
[[nodiscard]] AggregationSummary aggregate_detections(
    const std::vector<FrameDetections>& per_frame);

/// First \p limit entries of an already ranked list.
[[nodiscard]] std::vector<AggregatedDetection> top_classes(
    const std::vector<AggregatedDetection>& ranked, std::size_t limit);

}  // namespace clipsight::core
