/**
 * clipsight-cli: analyze one video file and print the JSON response body.
 * Build: cmake -B build && cmake --build build
 * Run:   ./build/clipsight_cli --input clip.mp4 [--config path] [--backend onnx --model yolov8n.onnx]
 * Exit code 0 on status 200, 1 otherwise.
 */

#include <clipsight/app/backend_factory.hpp>
#include <clipsight/app/config.hpp>
#include <clipsight/app/response.hpp>
#include <clipsight/app/upload.hpp>
#include <clipsight/app/video_analyzer.hpp>
#include <clipsight/vision/mock_inference_backend.hpp>

#include <atomic>
#include <chrono>
#include <csignal>
#include <exception>
#include <filesystem>
#include <iostream>
#include <memory>
#include <stop_token>
#include <string>
#include <thread>

namespace {

std::atomic<bool> g_interrupted{false};

void on_sigint(int) { g_interrupted.store(true); }

const char* level_str(clipsight::app::LogLevel level) {
  switch (level) {
  case clipsight::app::LogLevel::Debug:
    return "debug";
  case clipsight::app::LogLevel::Info:
    return "info";
  case clipsight::app::LogLevel::Warning:
    return "warning";
  }
  return "log";
}

std::shared_ptr<clipsight::vision::IInferenceBackend>
build_backend(const clipsight::app::AnalyzerConfig &cfg) {
  using namespace clipsight::vision;

  if (cfg.backend_type == clipsight::app::InferenceBackendType::Onnx) {
    return clipsight::app::make_inference_backend(cfg);
  }

  // Demo output: two confident people and a dog in every frame.
  auto mock = std::make_shared<MockInferenceBackend>();
  mock->set_result(make_inference_result({{0, 0.91f}, {0, 0.84f}, {16, 0.72f}}));
  return mock;
}

} // namespace

int main(int argc, char *argv[]) {
  std::string config_path;
  std::string input_path;
  std::string backend_override;  // "mock" or "onnx"
  std::string model_override;
  std::string samples_override;
  std::string confidence_override;
  bool verbose = false;

  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    if (arg == "--config" && i + 1 < argc) {
      config_path = argv[++i];
    } else if (arg == "--input" && i + 1 < argc) {
      input_path = argv[++i];
    } else if (arg == "--backend" && i + 1 < argc) {
      backend_override = argv[++i];
    } else if (arg == "--model" && i + 1 < argc) {
      model_override = argv[++i];
    } else if (arg == "--samples" && i + 1 < argc) {
      samples_override = argv[++i];
    } else if (arg == "--min-confidence" && i + 1 < argc) {
      confidence_override = argv[++i];
    } else if (arg == "--verbose" || arg == "-v") {
      verbose = true;
    } else if (arg == "--help" || arg == "-h") {
      std::cout << "Usage: clipsight_cli --input <video> [options]\n"
                << "  --config <path>          Analyzer config (key=value file); default: built-in (mock)\n"
                << "  --backend <type>         Override backend: mock | onnx\n"
                << "  --model <path>           Override model path (required for --backend onnx)\n"
                << "  --samples <n>            Frames to sample (default 15)\n"
                << "  --min-confidence <c>     Detection confidence threshold (default 0.3)\n"
                << "  --verbose, -v            Also print debug diagnostics\n"
                << "\nEnvironment: CLIPSIGHT_<KEY> overrides config keys (e.g. CLIPSIGHT_TOP_K=3).\n";
      return 0;
    } else {
      std::cerr << "Unknown argument " << arg << " (see --help)\n";
      return 1;
    }
  }

  if (input_path.empty()) {
    std::cerr << "Missing --input <video> (see --help)\n";
    return 1;
  }

  clipsight::app::AnalyzerConfig cfg;
  try {
    cfg = config_path.empty() ? clipsight::app::default_config()
                              : clipsight::app::load_config(config_path);
    clipsight::app::apply_env_overrides(cfg);
    if (!backend_override.empty()) clipsight::app::apply_setting(cfg, "backend_type", backend_override);
    if (!model_override.empty()) cfg.model_path = model_override;
    if (!samples_override.empty()) clipsight::app::apply_setting(cfg, "sample_count", samples_override);
    if (!confidence_override.empty()) {
      clipsight::app::apply_setting(cfg, "min_confidence", confidence_override);
    }
  } catch (const std::exception &e) {
    std::cerr << e.what() << "\n";
    return 1;
  }
  if (const std::string problem = clipsight::app::validate_config(cfg); !problem.empty()) {
    std::cerr << "Invalid config: " << problem << "\n";
    return 1;
  }

  std::shared_ptr<clipsight::vision::IInferenceBackend> backend;
  try {
    backend = build_backend(cfg);
  } catch (const std::exception &e) {
    std::cerr << "Failed to load detection model: " << e.what() << "\n";
    return 1;
  }

  clipsight::app::LogCallback log = [verbose](clipsight::app::LogLevel level,
                                               std::string_view message) {
    if (level == clipsight::app::LogLevel::Debug && !verbose) return;
    std::cerr << "[" << level_str(level) << "] " << message << "\n";
  };

  std::stop_source stop;
  std::signal(SIGINT, on_sigint);
  std::jthread interrupt_watch([&stop](std::stop_token done) {
    while (!done.stop_requested()) {
      if (g_interrupted.load()) {
        stop.request_stop();
        return;
      }
      std::this_thread::sleep_for(std::chrono::milliseconds{50});
    }
  });

  clipsight::app::AnalysisResponse response;
  if (auto upload = clipsight::app::validate_upload(std::filesystem::path(input_path).filename().string());
      !upload) {
    response = clipsight::app::build_response(std::unexpected(upload.error()));
  } else {
    try {
      const clipsight::app::VideoAnalyzer analyzer(backend, cfg);
      response = clipsight::app::build_response(
          analyzer.analyze_file(input_path, stop.get_token(), &log));
    } catch (const std::exception &e) {
      std::cerr << "Analysis failed: " << e.what() << "\n";
      response = clipsight::app::server_error_response();
    }
  }
  interrupt_watch.request_stop();

  std::cout << response.body.dump(2) << "\n";
  if (response.status != clipsight::app::kStatusOk) {
    std::cerr << "status " << response.status << "\n";
  }
  return response.status == clipsight::app::kStatusOk ? 0 : 1;
}
