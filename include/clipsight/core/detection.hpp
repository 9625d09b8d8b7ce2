#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace clipsight::core {

/// Axis-aligned bounding box in source-frame pixel coordinates.
struct BBox {
  float x{0.f};
  float y{0.f};
  float w{0.f};
  float h{0.f};
};

/// One object instance found in one frame. Built by the detector adapter; not modified after.
struct Detection {
  std::string label;
  float confidence{0.f};
  std::optional<BBox> bbox;
  std::int64_t frame_index{0};
};

/// Per-class summary across all frames of one request.
struct AggregatedDetection {
  std::string label;
  std::uint32_t count{0};               // raw detections of this class
  float mean_confidence{0.f};           // in [0, 1]
  std::uint32_t frames_appeared_in{0};  // <= count, <= frames sampled

  bool operator==(const AggregatedDetection&) const = default;
};

}  // namespace clipsight::core
