#include <clipsight/vision/opencv_video_source.hpp>
#include "frame_cv_utils.hpp"
#include <opencv2/core.hpp>
#include <opencv2/videoio.hpp>
#include <filesystem>
#include <memory>
#include <system_error>
#include <vector>

namespace clipsight::vision {

struct OpenCvVideoSource::Impl {
  cv::VideoCapture capture;
  std::int64_t frame_count{0};
  double fps{0.0};
  std::int64_t next_index{-1};  // position the decoder is at; avoids seeking on sequential reads
};

OpenCvVideoSource::OpenCvVideoSource(OpenKey) : impl_(std::make_unique<Impl>()) {}

OpenCvVideoSource::~OpenCvVideoSource() {
  if (impl_ && impl_->capture.isOpened()) {
    impl_->capture.release();
  }
}

std::expected<std::unique_ptr<OpenCvVideoSource>, core::PipelineError> OpenCvVideoSource::open(
    const std::string& path, std::chrono::milliseconds decode_timeout) {
  std::error_code ec;
  const auto size = std::filesystem::file_size(path, ec);
  if (ec || size == 0) {
    return std::unexpected(core::PipelineError::UnreadableVideo);
  }

  auto source = std::make_unique<OpenCvVideoSource>(OpenKey{});
  const int timeout_ms = static_cast<int>(decode_timeout.count());
  const std::vector<int> params = {
      cv::CAP_PROP_OPEN_TIMEOUT_MSEC, timeout_ms,
      cv::CAP_PROP_READ_TIMEOUT_MSEC, timeout_ms,
  };
  try {
    if (!source->impl_->capture.open(path, cv::CAP_ANY, params)) {
      return std::unexpected(core::PipelineError::UnreadableVideo);
    }
  } catch (const cv::Exception&) {
    return std::unexpected(core::PipelineError::UnreadableVideo);
  }

  source->impl_->frame_count =
      static_cast<std::int64_t>(source->impl_->capture.get(cv::CAP_PROP_FRAME_COUNT));
  source->impl_->fps = source->impl_->capture.get(cv::CAP_PROP_FPS);
  source->impl_->next_index = 0;
  return source;
}

std::int64_t OpenCvVideoSource::frame_count() const { return impl_->frame_count; }

double OpenCvVideoSource::fps() const { return impl_->fps; }

std::expected<core::Frame, core::PipelineError> OpenCvVideoSource::read(std::int64_t index) {
  if (!impl_->capture.isOpened()) {
    return std::unexpected(core::PipelineError::UnreadableVideo);
  }
  if (index < 0 || index >= impl_->frame_count) {
    return std::unexpected(core::PipelineError::InvalidFrame);
  }

  cv::Mat mat;
  try {
    if (index != impl_->next_index) {
      impl_->capture.set(cv::CAP_PROP_POS_FRAMES, static_cast<double>(index));
    }
    if (!impl_->capture.read(mat) || mat.empty()) {
      impl_->next_index = -1;
      return std::unexpected(core::PipelineError::InvalidFrame);
    }
  } catch (const cv::Exception&) {
    impl_->next_index = -1;
    return std::unexpected(core::PipelineError::UnreadableVideo);
  }
  impl_->next_index = index + 1;

  const core::PixelFormat format =
      mat.channels() == 1 ? core::PixelFormat::Grayscale8 : core::PixelFormat::BGR8;
  if (mat.channels() != 1 && mat.channels() != 3) {
    return std::unexpected(core::PipelineError::InvalidFrame);
  }
  return detail::mat_to_frame(mat, format);
}

}  // namespace clipsight::vision
