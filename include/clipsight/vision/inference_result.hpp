#pragma once

#include <cstdint>
#include <vector>

namespace clipsight::vision {

/// Raw model output before label lookup and thresholding.
struct InferenceResult {
  std::vector<float> boxes;  // [x1,y1,x2,y2] per detection, source-frame pixels
  std::vector<float> scores;
  std::vector<std::int64_t> class_ids;
  std::uint32_t num_detections{0};
};

}  // namespace clipsight::vision
