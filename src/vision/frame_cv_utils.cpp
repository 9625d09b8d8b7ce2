#include "frame_cv_utils.hpp"
#include <clipsight/core/frame.hpp>
#include <opencv2/core.hpp>
#include <cstddef>
#include <cstring>
#include <vector>

namespace clipsight::vision::detail {

namespace cc = clipsight::core;

std::optional<cv::Mat> frame_to_mat(const cc::Frame& frame) {
  if (!frame.well_formed()) return std::nullopt;

  const int w = static_cast<int>(frame.width());
  const int h = static_cast<int>(frame.height());
  auto* ptr = const_cast<std::byte*>(frame.data().data());

  switch (frame.format()) {
    case cc::PixelFormat::Grayscale8:
      return cv::Mat(h, w, CV_8UC1, ptr);
    case cc::PixelFormat::RGB8:
    case cc::PixelFormat::BGR8:
      return cv::Mat(h, w, CV_8UC3, ptr);
    case cc::PixelFormat::Unknown:
    default:
      return std::nullopt;
  }
}

cc::Frame mat_to_frame(const cv::Mat& mat, cc::PixelFormat format) {
  if (mat.empty()) return cc::Frame();

  const cv::Mat packed = mat.isContinuous() ? mat : mat.clone();
  const std::size_t len = packed.total() * packed.elemSize();
  std::vector<std::byte> buffer(len);
  std::memcpy(buffer.data(), packed.ptr(), len);
  return cc::Frame(static_cast<std::uint32_t>(packed.cols),
                   static_cast<std::uint32_t>(packed.rows), format, std::move(buffer));
}

}  // namespace clipsight::vision::detail
