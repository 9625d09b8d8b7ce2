#include <clipsight/vision/onnx_inference_backend.hpp>
#include "frame_cv_utils.hpp"
#include <onnxruntime_cxx_api.h>
#include <opencv2/core.hpp>
#include <opencv2/dnn.hpp>
#include <opencv2/imgproc.hpp>
#include <algorithm>
#include <array>
#include <cmath>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

namespace clipsight::vision {

namespace {

constexpr int64_t kNumChannels = 3;
constexpr int64_t kPostNmsRowSize = 6;

Ort::MemoryInfo CpuMemoryInfo() {
  return Ort::MemoryInfo::CreateCpu(OrtArenaAllocator, OrtMemTypeDefault);
}

/// Copy HWC (height, width, channels) float buffer to NCHW (batch, channels, height, width).
void HwcToNchw(const float* hwc, std::uint32_t h, std::uint32_t w, float* nchw) {
  const std::size_t hw = static_cast<std::size_t>(h) * w;
  for (std::uint32_t y = 0; y < h; ++y) {
    for (std::uint32_t x = 0; x < w; ++x) {
      const std::size_t src_idx = (static_cast<std::size_t>(y) * w + x) * kNumChannels;
      nchw[0 * hw + y * w + x] = hwc[src_idx + 0];
      nchw[1 * hw + y * w + x] = hwc[src_idx + 1];
      nchw[2 * hw + y * w + x] = hwc[src_idx + 2];
    }
  }
}

/// Scale and padding applied when fitting the source frame into the model input.
struct Letterbox {
  float scale{1.f};
  int pad_left{0};
  int pad_top{0};
  int src_width{0};
  int src_height{0};
};

/// Resize keeping aspect ratio, pad with grey (114) to the target size, convert to RGB float.
cv::Mat letterbox_rgb_float(const cv::Mat& src, core::PixelFormat format, int target_w,
                            int target_h, Letterbox& lb) {
  cv::Mat rgb;
  switch (format) {
    case core::PixelFormat::BGR8:
      cv::cvtColor(src, rgb, cv::COLOR_BGR2RGB);
      break;
    case core::PixelFormat::Grayscale8:
      cv::cvtColor(src, rgb, cv::COLOR_GRAY2RGB);
      break;
    default:
      rgb = src;
      break;
  }

  lb.src_width = rgb.cols;
  lb.src_height = rgb.rows;
  lb.scale = std::min(static_cast<float>(target_w) / static_cast<float>(rgb.cols),
                      static_cast<float>(target_h) / static_cast<float>(rgb.rows));
  const int new_w = std::max(1, static_cast<int>(std::round(rgb.cols * lb.scale)));
  const int new_h = std::max(1, static_cast<int>(std::round(rgb.rows * lb.scale)));

  cv::Mat resized;
  if (new_w != rgb.cols || new_h != rgb.rows) {
    cv::resize(rgb, resized, cv::Size(new_w, new_h), 0, 0, cv::INTER_LINEAR);
  } else {
    resized = rgb;
  }

  lb.pad_left = (target_w - new_w) / 2;
  lb.pad_top = (target_h - new_h) / 2;
  cv::Mat padded;
  cv::copyMakeBorder(resized, padded, lb.pad_top, target_h - new_h - lb.pad_top, lb.pad_left,
                     target_w - new_w - lb.pad_left, cv::BORDER_CONSTANT,
                     cv::Scalar(114, 114, 114));

  cv::Mat as_float;
  padded.convertTo(as_float, CV_32FC3, 1.0 / 255.0);
  return as_float;
}

/// Model-input coordinates -> source-frame pixels, clamped to the frame.
void push_source_box(const Letterbox& lb, float x1, float y1, float x2, float y2,
                     std::vector<float>& boxes) {
  auto map_x = [&](float x) {
    return std::clamp((x - static_cast<float>(lb.pad_left)) / lb.scale, 0.f,
                      static_cast<float>(lb.src_width));
  };
  auto map_y = [&](float y) {
    return std::clamp((y - static_cast<float>(lb.pad_top)) / lb.scale, 0.f,
                      static_cast<float>(lb.src_height));
  };
  boxes.push_back(map_x(x1));
  boxes.push_back(map_y(y1));
  boxes.push_back(map_x(x2));
  boxes.push_back(map_y(y2));
}

}  // namespace

struct OnnxInferenceBackend::Impl {
  Ort::Env env{ORT_LOGGING_LEVEL_WARNING, "clipsight"};
  Ort::SessionOptions session_options;
  Ort::Session session{nullptr};
  OnnxBackendOptions options;

  std::string input_name;
  std::string output_name;

  std::uint32_t input_height{0};
  std::uint32_t input_width{0};
  bool input_is_nchw{true};

  Impl() {
    session_options.SetGraphOptimizationLevel(GraphOptimizationLevel::ORT_ENABLE_EXTENDED);
  }

  std::expected<InferenceResult, core::PipelineError> parse_post_nms(
      const float* data, const std::vector<int64_t>& shape, const Letterbox& lb) const;
  std::expected<InferenceResult, core::PipelineError> parse_raw_head(
      const float* data, const std::vector<int64_t>& shape, const Letterbox& lb) const;
};

OnnxInferenceBackend::OnnxInferenceBackend(std::string model_path, OnnxBackendOptions options)
    : impl_(std::make_unique<Impl>()) {
  impl_->options = options;
  impl_->session_options.SetIntraOpNumThreads(options.intra_op_threads);
  impl_->session = Ort::Session(impl_->env, model_path.c_str(), impl_->session_options);

  Ort::AllocatorWithDefaultOptions allocator;
  if (impl_->session.GetInputCount() == 0) {
    throw std::runtime_error("OnnxInferenceBackend: model has no inputs");
  }
  impl_->input_name = impl_->session.GetInputNameAllocated(0, allocator).get();

  Ort::TypeInfo input_type = impl_->session.GetInputTypeInfo(0);
  const auto shape_info = input_type.GetTensorTypeAndShapeInfo();
  std::vector<int64_t> dims = shape_info.GetShape();
  if (dims.size() != 4u) {
    throw std::runtime_error("OnnxInferenceBackend: expected 4D input");
  }
  // NCHW: [1, C, H, W] or NHWC: [1, H, W, C]; dynamic spatial dims use dynamic_input_size.
  const std::uint32_t fallback = options.dynamic_input_size > 0 ? options.dynamic_input_size : 640;
  auto dim_or_default = [fallback](int64_t d) {
    return d > 0 ? static_cast<std::uint32_t>(d) : fallback;
  };
  if (dims[1] == kNumChannels) {
    impl_->input_is_nchw = true;
    impl_->input_height = dim_or_default(dims[2]);
    impl_->input_width = dim_or_default(dims[3]);
  } else if (dims[3] == kNumChannels) {
    impl_->input_is_nchw = false;
    impl_->input_height = dim_or_default(dims[1]);
    impl_->input_width = dim_or_default(dims[2]);
  } else {
    throw std::runtime_error("OnnxInferenceBackend: expected input shape [1,3,H,W] or [1,H,W,3]");
  }

  if (impl_->session.GetOutputCount() == 0) {
    throw std::runtime_error("OnnxInferenceBackend: model has no outputs");
  }
  impl_->output_name = impl_->session.GetOutputNameAllocated(0, allocator).get();
}

OnnxInferenceBackend::~OnnxInferenceBackend() = default;

std::uint32_t OnnxInferenceBackend::input_width() const noexcept { return impl_->input_width; }

std::uint32_t OnnxInferenceBackend::input_height() const noexcept { return impl_->input_height; }

std::expected<InferenceResult, core::PipelineError> OnnxInferenceBackend::Impl::parse_post_nms(
    const float* data, const std::vector<int64_t>& shape, const Letterbox& lb) const {
  // [1, N, 6] rows or [1, 6, N] columns of (xmin, ymin, xmax, ymax, score, class_id)
  const bool rows_are_n6 = shape[2] == kPostNmsRowSize;
  const int64_t n = rows_are_n6 ? shape[1] : shape[2];
  if (n < 0) {
    return std::unexpected(core::PipelineError::DetectionModelError);
  }

  InferenceResult result;
  result.num_detections = static_cast<std::uint32_t>(n);
  result.boxes.reserve(static_cast<std::size_t>(n) * 4u);
  result.scores.reserve(static_cast<std::size_t>(n));
  result.class_ids.reserve(static_cast<std::size_t>(n));
  auto at = [&](int64_t i, int64_t field) {
    return rows_are_n6 ? data[i * kPostNmsRowSize + field] : data[field * n + i];
  };
  for (int64_t i = 0; i < n; ++i) {
    push_source_box(lb, at(i, 0), at(i, 1), at(i, 2), at(i, 3), result.boxes);
    result.scores.push_back(at(i, 4));
    result.class_ids.push_back(static_cast<int64_t>(at(i, 5)));
  }
  return result;
}

std::expected<InferenceResult, core::PipelineError> OnnxInferenceBackend::Impl::parse_raw_head(
    const float* data, const std::vector<int64_t>& shape, const Letterbox& lb) const {
  // [1, 4 + C, A]: anchors along the last axis
  const int64_t fields = shape[1];
  const int64_t anchors = shape[2];
  const int64_t num_classes = fields - 4;
  if (num_classes <= 0 || anchors <= 0) {
    return std::unexpected(core::PipelineError::DetectionModelError);
  }

  std::vector<cv::Rect> candidates;
  std::vector<float> scores;
  std::vector<int> class_ids;
  for (int64_t a = 0; a < anchors; ++a) {
    int64_t best_class = 0;
    float best_score = data[4 * anchors + a];
    for (int64_t c = 1; c < num_classes; ++c) {
      const float s = data[(4 + c) * anchors + a];
      if (s > best_score) {
        best_score = s;
        best_class = c;
      }
    }
    if (best_score < options.score_threshold) {
      continue;
    }
    const float cx = data[0 * anchors + a];
    const float cy = data[1 * anchors + a];
    const float w = data[2 * anchors + a];
    const float h = data[3 * anchors + a];
    candidates.emplace_back(static_cast<int>(cx - 0.5f * w), static_cast<int>(cy - 0.5f * h),
                            static_cast<int>(w), static_cast<int>(h));
    scores.push_back(best_score);
    class_ids.push_back(static_cast<int>(best_class));
  }

  std::vector<int> keep;
  cv::dnn::NMSBoxesBatched(candidates, scores, class_ids, options.score_threshold,
                           options.iou_threshold, keep);

  InferenceResult result;
  result.num_detections = static_cast<std::uint32_t>(keep.size());
  for (int idx : keep) {
    const cv::Rect& r = candidates[static_cast<std::size_t>(idx)];
    push_source_box(lb, static_cast<float>(r.x), static_cast<float>(r.y),
                    static_cast<float>(r.x + r.width), static_cast<float>(r.y + r.height),
                    result.boxes);
    result.scores.push_back(scores[static_cast<std::size_t>(idx)]);
    result.class_ids.push_back(class_ids[static_cast<std::size_t>(idx)]);
  }
  return result;
}

std::expected<InferenceResult, core::PipelineError>
OnnxInferenceBackend::infer(const core::Frame& input, std::stop_token stop) {
  auto valid = validate_input(input);
  if (!valid) {
    return std::unexpected(valid.error());
  }
  auto mat = detail::frame_to_mat(input);
  if (!mat) {
    return std::unexpected(core::PipelineError::InvalidFrame);
  }

  const std::uint32_t h = impl_->input_height;
  const std::uint32_t w = impl_->input_width;
  Letterbox lb;
  cv::Mat hwc = letterbox_rgb_float(*mat, input.format(), static_cast<int>(w),
                                    static_cast<int>(h), lb);

  const std::size_t num_floats = static_cast<std::size_t>(kNumChannels) * h * w;
  std::vector<float> tensor_data(num_floats);
  std::array<int64_t, 4> shape{};
  if (impl_->input_is_nchw) {
    HwcToNchw(hwc.ptr<float>(), h, w, tensor_data.data());
    shape = {1, kNumChannels, static_cast<int64_t>(h), static_cast<int64_t>(w)};
  } else {
    std::copy(hwc.ptr<float>(), hwc.ptr<float>() + num_floats, tensor_data.begin());
    shape = {1, static_cast<int64_t>(h), static_cast<int64_t>(w), kNumChannels};
  }

  Ort::MemoryInfo mem_info = CpuMemoryInfo();
  Ort::Value input_tensor = Ort::Value::CreateTensor<float>(
      mem_info, tensor_data.data(), num_floats, shape.data(), shape.size());

  const char* input_names_c[] = {impl_->input_name.c_str()};
  const char* output_names_c[] = {impl_->output_name.c_str()};
  Ort::RunOptions run_options;
  std::stop_callback terminate_on_stop(stop, [&run_options] { run_options.SetTerminate(); });

  std::vector<Ort::Value> outputs;
  try {
    outputs = impl_->session.Run(run_options, input_names_c, &input_tensor, 1, output_names_c, 1);
  } catch (const Ort::Exception&) {
    return std::unexpected(core::PipelineError::DetectionModelError);
  }
  if (outputs.size() != 1u || !outputs[0].IsTensor()) {
    return std::unexpected(core::PipelineError::DetectionModelError);
  }

  const auto out_shape = outputs[0].GetTensorTypeAndShapeInfo().GetShape();
  const float* data = outputs[0].GetTensorData<float>();
  if (out_shape.size() != 3u || out_shape[0] != 1) {
    return std::unexpected(core::PipelineError::DetectionModelError);
  }
  if (out_shape[1] == kPostNmsRowSize || out_shape[2] == kPostNmsRowSize) {
    return impl_->parse_post_nms(data, out_shape, lb);
  }
  return impl_->parse_raw_head(data, out_shape, lb);
}

void OnnxInferenceBackend::warmup() {
  const std::size_t num_bytes =
      core::Frame::min_bytes(impl_->input_width, impl_->input_height, core::PixelFormat::BGR8);
  std::vector<std::byte> buffer(num_bytes, std::byte{0});
  core::Frame frame(impl_->input_width, impl_->input_height, core::PixelFormat::BGR8,
                    std::move(buffer));
  (void)infer(frame, std::stop_token{});
}

}  // namespace clipsight::vision
