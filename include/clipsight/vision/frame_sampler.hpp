#pragma once

#include <clipsight/core/error.hpp>
#include <clipsight/core/frame.hpp>
#include <clipsight/vision/video_source.hpp>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <memory>
#include <optional>
#include <stop_token>
#include <vector>

namespace clipsight::vision {

/// Half-open range of frame indices.
struct FrameRange {
  std::int64_t begin{0};
  std::int64_t end{0};

  [[nodiscard]] std::int64_t size() const noexcept { return end > begin ? end - begin : 0; }
  [[nodiscard]] bool contains(std::int64_t i) const noexcept { return i >= begin && i < end; }
};

/// Opening (~first 15%), steady state (25%..75%) and closing (~last 15%) of a timeline.
/// Zones are disjoint; the middle one may be empty for very short videos.
struct TimelineZones {
  FrameRange start;
  FrameRange middle;
  FrameRange end;
};

[[nodiscard]] TimelineZones timeline_zones(std::int64_t total_frames);

/// Frame indices to decode, ascending and distinct. Returns every index when
/// total_frames <= sample_count, otherwise exactly sample_count indices split 30/40/30 over
/// the start/middle/end zones (at least one per non-empty zone when sample_count >= 3).
[[nodiscard]] std::vector<std::int64_t> plan_sample_positions(std::int64_t total_frames,
                                                              std::size_t sample_count);

struct SamplerOptions {
  std::size_t sample_count{15};
  /// Budget for decoding all planned frames.
  std::chrono::milliseconds decode_timeout{30000};
};

/// Lazily decodes the planned frames of one video, in timeline order. Owns the video source
/// and releases it as soon as the sequence ends, fails, or the sampler is destroyed.
/// Not restartable: once next() reports the end, it keeps doing so.
class FrameSampler {
 public:
  /// UnreadableVideo if \p source is null or reports no frames.
  [[nodiscard]] static std::expected<FrameSampler, core::PipelineError> create(
      std::unique_ptr<IVideoSource> source,
      SamplerOptions options,
      std::stop_token stop = {});

  FrameSampler(FrameSampler&&) noexcept = default;
  FrameSampler& operator=(FrameSampler&&) noexcept = default;
  FrameSampler(const FrameSampler&) = delete;
  FrameSampler& operator=(const FrameSampler&) = delete;

  /// Next decoded frame, std::nullopt at the end of the sequence.
  /// Errors: UnreadableVideo (decoder failure, decode deadline exceeded, or no planned frame
  /// could be decoded), Cancelled (stop requested). Frames that individually fail to decode
  /// are skipped.
  [[nodiscard]] std::expected<std::optional<core::RawFrame>, core::PipelineError> next();

  [[nodiscard]] const std::vector<std::int64_t>& planned_positions() const noexcept {
    return positions_;
  }
  [[nodiscard]] std::size_t frames_decoded() const noexcept { return decoded_; }
  [[nodiscard]] std::size_t frames_skipped() const noexcept { return skipped_; }
  [[nodiscard]] bool source_released() const noexcept { return source_ == nullptr; }

 private:
  FrameSampler(std::unique_ptr<IVideoSource> source,
               std::vector<std::int64_t> positions,
               std::chrono::steady_clock::time_point deadline,
               std::stop_token stop);

  void release() noexcept { source_.reset(); }

  std::unique_ptr<IVideoSource> source_;
  std::vector<std::int64_t> positions_;
  std::size_t cursor_{0};
  std::size_t decoded_{0};
  std::size_t skipped_{0};
  double fps_{0.0};
  bool finished_{false};
  std::chrono::steady_clock::time_point deadline_;
  std::stop_token stop_;
};

}  // namespace clipsight::vision
