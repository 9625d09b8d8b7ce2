#include <clipsight/vision/detection_decoder.hpp>
#include <cmath>
#include <cstddef>
#include <utility>

namespace clipsight::vision {

DetectionDecoder::DetectionDecoder(float min_confidence,
                                   ClassLabelTable labels,
                                   std::vector<std::string> allowed_labels)
    : min_confidence_(min_confidence),
      labels_(std::move(labels)),
      allowed_(allowed_labels.begin(), allowed_labels.end()) {}

std::expected<std::vector<core::Detection>, core::PipelineError> DetectionDecoder::decode(
    const InferenceResult& result, std::int64_t frame_index) const {
  const std::size_t n = static_cast<std::size_t>(result.num_detections);
  if (result.scores.size() != n || result.class_ids.size() != n ||
      (!result.boxes.empty() && result.boxes.size() != n * 4)) {
    return std::unexpected(core::PipelineError::DetectionModelError);
  }

  std::vector<core::Detection> out;
  for (std::size_t i = 0; i < n; ++i) {
    const float score = result.scores[i];
    if (!std::isfinite(score) || score > 1.f) {
      return std::unexpected(core::PipelineError::DetectionModelError);
    }
    if (score < min_confidence_) {
      continue;
    }
    const auto label = label_for(labels_, result.class_ids[i]);
    if (!label) {
      continue;
    }
    if (!allowed_.empty() && !allowed_.contains(std::string(*label))) {
      continue;
    }

    core::Detection d;
    d.label = std::string(*label);
    d.confidence = score;
    d.frame_index = frame_index;
    if (!result.boxes.empty()) {
      core::BBox box;
      box.x = result.boxes[i * 4 + 0];
      box.y = result.boxes[i * 4 + 1];
      box.w = result.boxes[i * 4 + 2] - box.x;
      box.h = result.boxes[i * 4 + 3] - box.y;
      d.bbox = box;
    }
    out.push_back(std::move(d));
  }
  return out;
}

}  // namespace clipsight::vision
