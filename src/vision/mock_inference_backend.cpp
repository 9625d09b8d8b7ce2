#include <clipsight/vision/mock_inference_backend.hpp>
#include <condition_variable>
#include <cstdint>
#include <utility>
#include <vector>

namespace clipsight::vision {

void MockInferenceBackend::set_result(InferenceResult result) {
  std::lock_guard lock(mutex_);
  result_ = std::move(result);
}

void MockInferenceBackend::set_responder(Responder responder) {
  std::lock_guard lock(mutex_);
  responder_ = std::move(responder);
}

void MockInferenceBackend::set_latency(std::chrono::milliseconds latency) {
  std::lock_guard lock(mutex_);
  latency_ = latency;
}

std::size_t MockInferenceBackend::call_count() const {
  std::lock_guard lock(mutex_);
  return calls_;
}

std::expected<InferenceResult, core::PipelineError>
MockInferenceBackend::infer(const core::Frame& input, std::stop_token stop) {
  auto valid = validate_input(input);
  if (!valid) {
    return std::unexpected(valid.error());
  }

  std::unique_lock lock(mutex_);
  ++calls_;
  const auto latency = latency_;
  Responder responder = responder_;
  InferenceResult fixed = result_;

  if (latency.count() > 0) {
    std::condition_variable_any cv;
    (void)cv.wait_for(lock, stop, latency, [] { return false; });
    if (stop.stop_requested()) {
      return std::unexpected(core::PipelineError::DetectionModelError);
    }
  }
  lock.unlock();

  if (responder) {
    return responder(input);
  }
  return fixed;
}

InferenceResult make_inference_result(const std::vector<std::pair<std::int64_t, float>>& outputs) {
  InferenceResult r;
  r.num_detections = static_cast<std::uint32_t>(outputs.size());
  float x = 0.f;
  for (const auto& [class_id, score] : outputs) {
    r.boxes.insert(r.boxes.end(), {x, 0.f, x + 1.f, 1.f});
    r.scores.push_back(score);
    r.class_ids.push_back(class_id);
    x += 1.f;
  }
  return r;
}

}  // namespace clipsight::vision
