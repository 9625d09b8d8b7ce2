#include <clipsight/core/error.hpp>

namespace clipsight::core {

std::string_view error_message(PipelineError e) noexcept {
  switch (e) {
    case PipelineError::None:
      return "ok";
    case PipelineError::InvalidFrame:
      return "invalid frame";
    case PipelineError::InvalidConfig:
      return "invalid configuration";
    case PipelineError::UnreadableVideo:
      return "Could not open or decode video file";
    case PipelineError::DetectionModelError:
      return "detection model failed";
    case PipelineError::InvalidUploadType:
      return "Invalid file format. Allowed formats: .mp4, .avi, .mov, .mkv, .wmv";
    case PipelineError::Cancelled:
      return "Request cancelled";
  }
  return "unknown error";
}

}  // namespace clipsight::core
