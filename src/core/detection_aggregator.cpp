#include <clipsight/core/detection_aggregator.hpp>
#include <algorithm>
#include <cstdint>
#include <map>
#include <string>

namespace clipsight::core {

namespace {

struct ClassAccumulator {
  std::uint32_t count{0};
  double confidence_sum{0.0};
  std::uint32_t frames{0};
  std::size_t last_frame_slot{0};
  bool seen{false};
};

}  // namespace

bool ranks_before(const AggregatedDetection& a, const AggregatedDetection& b) noexcept {
  if (a.count != b.count) return a.count > b.count;
  if (a.mean_confidence != b.mean_confidence) return a.mean_confidence > b.mean_confidence;
  return a.label < b.label;
}

AggregationSummary aggregate_detections(const std::vector<FrameDetections>& per_frame) {
  std::map<std::string, ClassAccumulator> groups;
  AggregationSummary summary;

  for (std::size_t slot = 0; slot < per_frame.size(); ++slot) {
    for (const auto& d : per_frame[slot]) {
      ClassAccumulator& acc = groups[d.label];
      ++acc.count;
      acc.confidence_sum += static_cast<double>(d.confidence);
      if (!acc.seen || acc.last_frame_slot != slot) {
        ++acc.frames;
        acc.last_frame_slot = slot;
        acc.seen = true;
      }
      ++summary.total_detections;
    }
  }

  summary.ranked.reserve(groups.size());
  for (const auto& [label, acc] : groups) {
    AggregatedDetection a;
    a.label = label;
    a.count = acc.count;
    a.mean_confidence = static_cast<float>(acc.confidence_sum / acc.count);
    a.frames_appeared_in = acc.frames;
    summary.ranked.push_back(std::move(a));
  }
  std::sort(summary.ranked.begin(), summary.ranked.end(), ranks_before);
  return summary;
}

std::vector<AggregatedDetection> top_classes(const std::vector<AggregatedDetection>& ranked,
                                             std::size_t limit) {
  const std::size_t n = std::min(limit, ranked.size());
  return std::vector<AggregatedDetection>(ranked.begin(),
                                          ranked.begin() + static_cast<std::ptrdiff_t>(n));
}

}  // namespace clipsight::core
