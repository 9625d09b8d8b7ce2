#include <clipsight/app/frame_dispatch.hpp>
#include <algorithm>
#include <atomic>
#include <thread>

namespace clipsight::app {

namespace {

std::size_t effective_workers(std::size_t num_workers) {
  if (num_workers > 0) return num_workers;
  const unsigned hw = std::thread::hardware_concurrency();
  return hw > 0 ? static_cast<std::size_t>(hw) : 1;
}

}  // namespace

std::vector<FrameOutcome> detect_frames(const vision::ObjectDetector& detector,
                                        const std::vector<core::RawFrame>& frames,
                                        std::size_t num_workers,
                                        std::stop_token stop) {
  const std::size_t n = frames.size();
  std::vector<FrameOutcome> slots(n, std::unexpected(core::PipelineError::Cancelled));
  if (n == 0) return slots;

  const std::size_t workers = std::min(effective_workers(num_workers), n);
  if (workers <= 1) {
    for (std::size_t i = 0; i < n && !stop.stop_requested(); ++i) {
      slots[i] = detector.detect(frames[i], stop);
    }
    return slots;
  }

  std::atomic<std::size_t> next_index{0};
  auto worker = [&]() {
    while (!stop.stop_requested()) {
      const std::size_t idx = next_index.fetch_add(1);
      if (idx >= n) break;
      slots[idx] = detector.detect(frames[idx], stop);
    }
  };

  std::vector<std::thread> threads;
  threads.reserve(workers);
  for (std::size_t i = 0; i < workers; ++i) {
    threads.emplace_back(worker);
  }
  for (auto& t : threads) {
    t.join();
  }
  return slots;
}

}  // namespace clipsight::app
