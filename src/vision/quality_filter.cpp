#include <clipsight/vision/quality_filter.hpp>
#include "frame_cv_utils.hpp"
#include <opencv2/core.hpp>
#include <opencv2/imgproc.hpp>

namespace clipsight::vision {

std::optional<double> mean_brightness(const core::Frame& frame) {
  auto mat = detail::frame_to_mat(frame);
  if (!mat) return std::nullopt;

  cv::Mat gray;
  switch (frame.format()) {
    case core::PixelFormat::Grayscale8:
      gray = *mat;
      break;
    case core::PixelFormat::BGR8:
      cv::cvtColor(*mat, gray, cv::COLOR_BGR2GRAY);
      break;
    case core::PixelFormat::RGB8:
      cv::cvtColor(*mat, gray, cv::COLOR_RGB2GRAY);
      break;
    default:
      return std::nullopt;
  }
  return cv::mean(gray)[0];
}

bool QualityFilter::accept(const core::Frame& frame) const {
  const auto brightness = mean_brightness(frame);
  return brightness.has_value() && accept_brightness(*brightness);
}

}  // namespace clipsight::vision
