#include <clipsight/app/config.hpp>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string_view>

namespace clipsight::app {

namespace {

constexpr const char* kKeys[] = {
    "model_path",       "backend_type",     "sample_count",      "min_confidence",
    "iou_threshold",    "dark_threshold",   "bright_threshold",  "top_k",
    "model_timeout_ms", "decode_timeout_ms", "num_workers",      "parallel_backend",
    "allowed_classes",  "input_size",
};

void trim(std::string& s) {
  const auto start = s.find_first_not_of(" \t\r\n");
  if (start == std::string::npos) {
    s.clear();
    return;
  }
  const auto end = s.find_last_not_of(" \t\r\n");
  s = s.substr(start, end == std::string::npos ? std::string::npos : end - start + 1);
}

bool parse_line(std::string_view line, std::string& key, std::string& value) {
  const auto pos = line.find('=');
  if (pos == std::string_view::npos) return false;
  key.assign(line.substr(0, pos));
  value.assign(line.substr(pos + 1));
  trim(key);
  trim(value);
  return !key.empty();
}

std::vector<std::string> split_list(const std::string& value) {
  std::vector<std::string> out;
  std::stringstream ss(value);
  std::string item;
  while (std::getline(ss, item, ',')) {
    trim(item);
    if (!item.empty()) out.push_back(item);
  }
  return out;
}

std::size_t to_size(const std::string& key, const std::string& value) {
  if (value.empty() || value.front() == '-') {
    throw std::runtime_error("config: " + key + " must be a non-negative integer, got '" + value + "'");
  }
  try {
    return static_cast<std::size_t>(std::stoull(value));
  } catch (const std::exception&) {
    throw std::runtime_error("config: " + key + " must be a non-negative integer, got '" + value + "'");
  }
}

double to_double(const std::string& key, const std::string& value) {
  try {
    return std::stod(value);
  } catch (const std::exception&) {
    throw std::runtime_error("config: " + key + " must be a number, got '" + value + "'");
  }
}

std::string env_name(std::string_view key) {
  std::string name = "CLIPSIGHT_";
  for (char c : key) name.push_back(static_cast<char>(std::toupper(static_cast<unsigned char>(c))));
  return name;
}

}  // namespace

AnalyzerConfig default_config() {
  AnalyzerConfig c;
  c.model_path = "";
  c.backend_type = InferenceBackendType::Mock;
  c.input_size = 640;
  c.sample_count = 15;
  c.min_confidence = 0.3f;
  c.iou_threshold = 0.5f;
  c.dark_threshold = 20.0;
  c.bright_threshold = 235.0;
  c.top_k = 5;
  c.model_timeout_ms = 5000;
  c.decode_timeout_ms = 30000;
  return c;
}

bool apply_setting(AnalyzerConfig& c, const std::string& key, const std::string& value) {
  if (key == "model_path") c.model_path = value;
  else if (key == "backend_type") {
    if (value == "onnx") c.backend_type = InferenceBackendType::Onnx;
    else if (value == "mock") c.backend_type = InferenceBackendType::Mock;
    else throw std::runtime_error("config: backend_type must be mock or onnx, got '" + value + "'");
  }
  else if (key == "input_size") c.input_size = static_cast<std::uint32_t>(to_size(key, value));
  else if (key == "sample_count") c.sample_count = to_size(key, value);
  else if (key == "min_confidence") c.min_confidence = static_cast<float>(to_double(key, value));
  else if (key == "iou_threshold") c.iou_threshold = static_cast<float>(to_double(key, value));
  else if (key == "dark_threshold") c.dark_threshold = to_double(key, value);
  else if (key == "bright_threshold") c.bright_threshold = to_double(key, value);
  else if (key == "top_k") c.top_k = to_size(key, value);
  else if (key == "model_timeout_ms") c.model_timeout_ms = static_cast<std::uint32_t>(to_size(key, value));
  else if (key == "decode_timeout_ms") c.decode_timeout_ms = static_cast<std::uint32_t>(to_size(key, value));
  else if (key == "num_workers") c.num_workers = to_size(key, value);
  else if (key == "parallel_backend") {
    if (value == "threads") c.parallel_backend = ParallelBackend::Threads;
    else if (value == "tbb") c.parallel_backend = ParallelBackend::Tbb;
    else throw std::runtime_error("config: parallel_backend must be threads or tbb, got '" + value + "'");
  }
  else if (key == "allowed_classes") c.allowed_classes = split_list(value);
  else return false;
  return true;
}

AnalyzerConfig load_config(const std::string& path) {
  AnalyzerConfig c = default_config();
  std::ifstream f(path);
  if (!f) {
    throw std::runtime_error("config: cannot open " + path);
  }

  std::string line;
  std::string key;
  std::string value;
  while (std::getline(f, line)) {
    trim(line);
    if (line.empty() || line[0] == '#') continue;
    if (!parse_line(line, key, value)) continue;
    apply_setting(c, key, value);  // unknown keys are ignored
  }
  return c;
}

void apply_env_overrides(AnalyzerConfig& cfg) {
  for (const char* key : kKeys) {
    const std::string name = env_name(key);
    const char* env = std::getenv(name.c_str());
    if (env && env[0] != '\0') {
      apply_setting(cfg, key, env);
    }
  }
}

std::string validate_config(const AnalyzerConfig& cfg) {
  if (cfg.sample_count == 0) return "sample_count must be at least 1";
  if (cfg.min_confidence < 0.f || cfg.min_confidence > 1.f) return "min_confidence must be in [0, 1]";
  if (cfg.iou_threshold <= 0.f || cfg.iou_threshold > 1.f) return "iou_threshold must be in (0, 1]";
  if (cfg.dark_threshold < 0.0 || cfg.bright_threshold > 255.0 ||
      cfg.dark_threshold >= cfg.bright_threshold) {
    return "brightness band must satisfy 0 <= dark_threshold < bright_threshold <= 255";
  }
  if (cfg.top_k == 0) return "top_k must be at least 1";
  if (cfg.input_size < 32) return "input_size must be at least 32";
  if (cfg.decode_timeout_ms == 0) return "decode_timeout_ms must be positive";
  if (cfg.backend_type == InferenceBackendType::Onnx && cfg.model_path.empty()) {
    return "backend_type=onnx requires model_path";
  }
#ifndef CLIPSIGHT_HAS_TBB
  if (cfg.parallel_backend == ParallelBackend::Tbb) return "parallel_backend=tbb requires a TBB build";
#endif
  return {};
}

}  // namespace clipsight::app
