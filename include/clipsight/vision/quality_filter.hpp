#pragma once

#include <clipsight/core/frame.hpp>
#include <optional>

namespace clipsight::vision {

/// Brightness band (0-255 luma). Both bounds are exclusive: a frame is accepted only when
/// dark_threshold < mean brightness < bright_threshold.
struct BrightnessBand {
  double dark_threshold{20.0};
  double bright_threshold{235.0};
};

/// Mean grayscale brightness of a frame, or nullopt if the frame is empty, malformed, or in an
/// unsupported pixel format.
[[nodiscard]] std::optional<double> mean_brightness(const core::Frame& frame);

/// Rejects frames too dark, too bright, or degenerate to yield reliable detections.
class QualityFilter {
 public:
  QualityFilter() = default;
  explicit QualityFilter(BrightnessBand band) : band_(band) {}

  [[nodiscard]] bool accept(const core::Frame& frame) const;

  /// Decision for an already measured brightness.
  [[nodiscard]] bool accept_brightness(double brightness) const noexcept {
    return brightness > band_.dark_threshold && brightness < band_.bright_threshold;
  }

  [[nodiscard]] const BrightnessBand& band() const noexcept { return band_; }

 private:
  BrightnessBand band_{};
};

}  // namespace clipsight::vision
