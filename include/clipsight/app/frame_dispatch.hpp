#pragma once

#include <clipsight/core/detection.hpp>
#include <clipsight/core/error.hpp>
#include <clipsight/core/frame.hpp>
#include <clipsight/vision/object_detector.hpp>
#include <cstddef>
#include <expected>
#include <stop_token>
#include <vector>

namespace clipsight::app {

/// Detector outcome for one frame; slot i always belongs to frames[i].
using FrameOutcome = std::expected<std::vector<core::Detection>, core::PipelineError>;

/// Runs the detector over \p frames and returns one outcome per frame, in frame order.
/// Work is pulled from an indexed task list by a fixed pool of std::threads and written into
/// a pre-sized slot array (each slot written once). num_workers 0 = hardware concurrency.
/// Slots not processed because \p stop was requested hold PipelineError::Cancelled.
[[nodiscard]] std::vector<FrameOutcome> detect_frames(const vision::ObjectDetector& detector,
                                                      const std::vector<core::RawFrame>& frames,
                                                      std::size_t num_workers = 0,
                                                      std::stop_token stop = {});

#ifdef CLIPSIGHT_HAS_TBB
/// Same contract as detect_frames(), scheduled with tbb::parallel_for.
[[nodiscard]] std::vector<FrameOutcome> detect_frames_tbb(const vision::ObjectDetector& detector,
                                                          const std::vector<core::RawFrame>& frames,
                                                          std::stop_token stop = {});
#endif  // CLIPSIGHT_HAS_TBB

}  // namespace clipsight::app
