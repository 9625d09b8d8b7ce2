#include <clipsight/vision/object_detector.hpp>
#include <chrono>
#include <exception>
#include <future>
#include <memory>
#include <stdexcept>
#include <thread>
#include <utility>

namespace clipsight::vision {

namespace {

constexpr std::chrono::milliseconds kWaitSlice{10};

}  // namespace

ObjectDetector::ObjectDetector(std::shared_ptr<IInferenceBackend> backend,
                               DetectionDecoder decoder,
                               std::chrono::milliseconds call_timeout)
    : backend_(std::move(backend)), decoder_(std::move(decoder)), call_timeout_(call_timeout) {
  if (!backend_) {
    throw std::invalid_argument("ObjectDetector: backend must not be null");
  }
}

std::expected<InferenceResult, core::PipelineError> ObjectDetector::infer_bounded(
    const core::Frame& image, std::stop_token stop) const {
  using Outcome = std::expected<InferenceResult, core::PipelineError>;

  if (call_timeout_.count() <= 0) {
    try {
      return backend_->infer(image, stop);
    } catch (const std::exception&) {
      return std::unexpected(core::PipelineError::DetectionModelError);
    }
  }

  // The worker owns its backend handle, frame copy and promise. A timed-out call is asked
  // to stop and left to finish detached.
  auto promise = std::make_shared<std::promise<Outcome>>();
  std::future<Outcome> outcome = promise->get_future();

  std::jthread call([promise, backend = backend_, image_copy = image](std::stop_token call_stop) {
    try {
      promise->set_value(backend->infer(image_copy, call_stop));
    } catch (...) {
      promise->set_exception(std::current_exception());
    }
  });
  std::stop_source call_control = call.get_stop_source();
  std::stop_callback forward_cancel(stop, [call_control]() mutable {
    call_control.request_stop();
  });

  const auto deadline = std::chrono::steady_clock::now() + call_timeout_;
  while (outcome.wait_for(kWaitSlice) != std::future_status::ready) {
    const bool cancelled = stop.stop_requested();
    if (cancelled || std::chrono::steady_clock::now() >= deadline) {
      call_control.request_stop();
      call.detach();
      return std::unexpected(cancelled ? core::PipelineError::Cancelled
                                       : core::PipelineError::DetectionModelError);
    }
  }
  try {
    return outcome.get();
  } catch (const std::exception&) {
    return std::unexpected(core::PipelineError::DetectionModelError);
  }
}

std::expected<std::vector<core::Detection>, core::PipelineError> ObjectDetector::detect(
    const core::RawFrame& frame, std::stop_token stop) const {
  if (stop.stop_requested()) {
    return std::unexpected(core::PipelineError::Cancelled);
  }
  auto valid = backend_->validate_input(frame.image);
  if (!valid) {
    return std::unexpected(valid.error());
  }

  auto raw = infer_bounded(frame.image, stop);
  if (!raw) {
    return std::unexpected(raw.error());
  }
  return decoder_.decode(*raw, frame.index);
}

}  // namespace clipsight::vision
