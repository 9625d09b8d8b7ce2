#include <clipsight/app/frame_dispatch.hpp>

#ifdef CLIPSIGHT_HAS_TBB

#include <tbb/blocked_range.h>
#include <tbb/parallel_for.h>

namespace clipsight::app {

std::vector<FrameOutcome> detect_frames_tbb(const vision::ObjectDetector& detector,
                                            const std::vector<core::RawFrame>& frames,
                                            std::stop_token stop) {
  const std::size_t n = frames.size();
  std::vector<FrameOutcome> slots(n, std::unexpected(core::PipelineError::Cancelled));
  if (n == 0) return slots;

  tbb::parallel_for(
      tbb::blocked_range<std::size_t>(0, n),
      [&detector, &frames, &slots, &stop](const tbb::blocked_range<std::size_t>& range) {
        for (std::size_t i = range.begin(); i != range.end(); ++i) {
          if (stop.stop_requested()) return;
          slots[i] = detector.detect(frames[i], stop);
        }
      });
  return slots;
}

}  // namespace clipsight::app

#endif  // CLIPSIGHT_HAS_TBB
