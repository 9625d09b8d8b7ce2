#pragma once

#include <clipsight/core/error.hpp>
#include <clipsight/core/frame.hpp>
#include <clipsight/vision/video_source.hpp>
#include <chrono>
#include <expected>
#include <memory>
#include <string>

namespace clipsight::vision {

/// IVideoSource backed by cv::VideoCapture. The capture is released when this object is
/// destroyed. Open and per-read waits are bounded by \p decode_timeout (FFmpeg backend).
class OpenCvVideoSource : public IVideoSource {
 public:
  /// Returns UnreadableVideo if the file is missing, empty, or no backend can open it.
  [[nodiscard]] static std::expected<std::unique_ptr<OpenCvVideoSource>, core::PipelineError>
  open(const std::string& path, std::chrono::milliseconds decode_timeout);

  /// Constructor key only OpenCvVideoSource can create; use open().
  class OpenKey {
    friend class OpenCvVideoSource;
    OpenKey() = default;
  };
  explicit OpenCvVideoSource(OpenKey);

  ~OpenCvVideoSource() override;

  OpenCvVideoSource(const OpenCvVideoSource&) = delete;
  OpenCvVideoSource& operator=(const OpenCvVideoSource&) = delete;

  [[nodiscard]] std::int64_t frame_count() const override;
  [[nodiscard]] double fps() const override;
  [[nodiscard]] std::expected<core::Frame, core::PipelineError> read(std::int64_t index) override;

 private:
  struct Impl;
  std::unique_ptr<Impl> impl_;
};

}  // namespace clipsight::vision
