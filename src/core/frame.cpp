#include <clipsight/core/frame.hpp>
#include <cstddef>

namespace clipsight::core {

std::size_t Frame::bytes_per_pixel(PixelFormat format) noexcept {
  switch (format) {
    case PixelFormat::Grayscale8:
      return 1;
    case PixelFormat::RGB8:
    case PixelFormat::BGR8:
      return 3;
    case PixelFormat::Unknown:
    default:
      return 0;
  }
}

std::size_t Frame::min_bytes(std::uint32_t width,
                             std::uint32_t height,
                             PixelFormat format) noexcept {
  return static_cast<std::size_t>(width) * height * bytes_per_pixel(format);
}

bool Frame::well_formed() const noexcept {
  if (width_ == 0 || height_ == 0) return false;
  const std::size_t need = min_bytes(width_, height_, format_);
  return need > 0 && buffer_.size() >= need;
}

}  // namespace clipsight::core
