#pragma once

#include <clipsight/core/error.hpp>
#include <clipsight/core/frame.hpp>
#include <clipsight/vision/video_source.hpp>
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <functional>
#include <memory>
#include <set>
#include <vector>

namespace clipsight::testing {

/// Counters shared between a test and a FakeVideoSource it has handed away.
struct FakeSourceCounters {
  std::atomic<int> destroyed{0};
  std::atomic<int> reads{0};
  std::vector<std::int64_t> read_indices;  // single-threaded readers only
};

/// Synthetic BGR8 video: every frame is uniformly filled with brightness(index).
class FakeVideoSource : public vision::IVideoSource {
 public:
  using Brightness = std::function<std::uint8_t(std::int64_t index)>;

  FakeVideoSource(std::int64_t frame_count,
                  std::shared_ptr<FakeSourceCounters> counters = nullptr,
                  Brightness brightness = [](std::int64_t) -> std::uint8_t { return 128; })
      : frame_count_(frame_count), counters_(std::move(counters)), brightness_(std::move(brightness)) {}

  ~FakeVideoSource() override {
    if (counters_) ++counters_->destroyed;
  }

  /// Reads of these indices fail with InvalidFrame.
  void fail_frames(std::set<std::int64_t> indices) { bad_frames_ = std::move(indices); }

  /// Every read fails with \p error.
  void fail_all(core::PipelineError error) { fail_all_ = error; }

  [[nodiscard]] std::int64_t frame_count() const override { return frame_count_; }
  [[nodiscard]] double fps() const override { return 25.0; }

  [[nodiscard]] std::expected<core::Frame, core::PipelineError> read(std::int64_t index) override {
    if (counters_) {
      ++counters_->reads;
      counters_->read_indices.push_back(index);
    }
    if (fail_all_ != core::PipelineError::None) return std::unexpected(fail_all_);
    if (bad_frames_.contains(index)) return std::unexpected(core::PipelineError::InvalidFrame);
    return make_frame(brightness_(index));
  }

  static core::Frame make_frame(std::uint8_t value, std::uint32_t w = 16, std::uint32_t h = 16) {
    std::vector<std::byte> buf(static_cast<std::size_t>(w) * h * 3, std::byte{value});
    return core::Frame(w, h, core::PixelFormat::BGR8, std::move(buf));
  }

 private:
  std::int64_t frame_count_;
  std::shared_ptr<FakeSourceCounters> counters_;
  Brightness brightness_;
  std::set<std::int64_t> bad_frames_;
  core::PipelineError fail_all_{core::PipelineError::None};
};

}  // namespace clipsight::testing
