#pragma once

#include <clipsight/core/frame.hpp>
#include <opencv2/core/mat.hpp>
#include <optional>

namespace clipsight::vision::detail {

/// Non-owning cv::Mat view over a Frame's buffer. Returns nullopt if the frame is empty,
/// malformed, or its format has no 8-bit OpenCV equivalent.
std::optional<cv::Mat> frame_to_mat(const clipsight::core::Frame& frame);

/// Copy a CV_8UC1 / CV_8UC3 cv::Mat into a Frame with tightly packed rows.
clipsight::core::Frame mat_to_frame(const cv::Mat& mat, clipsight::core::PixelFormat format);

}  // namespace clipsight::vision::detail
