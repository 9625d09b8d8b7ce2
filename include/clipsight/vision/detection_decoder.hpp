#pragma once

#include <clipsight/core/detection.hpp>
#include <clipsight/core/error.hpp>
#include <clipsight/vision/class_labels.hpp>
#include <clipsight/vision/inference_result.hpp>
#include <cstdint>
#include <expected>
#include <string>
#include <unordered_set>
#include <vector>

namespace clipsight::vision {

/// Decodes InferenceResult -> vector<Detection>: confidence threshold, class-id lookup and an
/// optional label allow-list (empty = every label in the table).
class DetectionDecoder {
 public:
  DetectionDecoder(float min_confidence,
                   ClassLabelTable labels,
                   std::vector<std::string> allowed_labels = {});

  /// DetectionModelError when the output arrays disagree with num_detections or a score is
  /// not a finite number.
  [[nodiscard]] std::expected<std::vector<core::Detection>, core::PipelineError> decode(
      const InferenceResult& result, std::int64_t frame_index) const;

  void set_min_confidence(float t) noexcept { min_confidence_ = t; }
  [[nodiscard]] float min_confidence() const noexcept { return min_confidence_; }

 private:
  float min_confidence_;
  ClassLabelTable labels_;
  std::unordered_set<std::string> allowed_;
};

}  // namespace clipsight::vision
