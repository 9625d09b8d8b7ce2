#pragma once

#include <clipsight/core/error.hpp>
#include <clipsight/core/frame.hpp>
#include <cstdint>
#include <expected>

namespace clipsight::vision {

/// Opened, seekable decoded video. Implementations release their decoding resources in the
/// destructor; an instance is owned by exactly one request.
class IVideoSource {
 public:
  virtual ~IVideoSource() = default;

  /// Total frame count reported by the container (may be 0 when unknown or empty).
  [[nodiscard]] virtual std::int64_t frame_count() const = 0;

  /// Frames per second; 0 when the container does not report it.
  [[nodiscard]] virtual double fps() const = 0;

  /// Seek to \p index and decode one frame. InvalidFrame when that frame cannot be decoded,
  /// UnreadableVideo when the decoder itself has failed (e.g. read timeout).
  [[nodiscard]] virtual std::expected<core::Frame, core::PipelineError> read(std::int64_t index) = 0;
};

}  // namespace clipsight::vision
