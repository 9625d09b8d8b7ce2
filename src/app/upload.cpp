#include <clipsight/app/upload.hpp>
#include <algorithm>
#include <cctype>
#include <string>

namespace clipsight::app {

std::expected<void, core::PipelineError> validate_upload(std::string_view filename) {
  const auto dot = filename.rfind('.');
  if (filename.empty() || dot == std::string_view::npos) {
    return std::unexpected(core::PipelineError::InvalidUploadType);
  }
  // A trailing path separator after the dot means the dot belongs to a directory name.
  if (filename.find_first_of("/\\", dot) != std::string_view::npos) {
    return std::unexpected(core::PipelineError::InvalidUploadType);
  }

  std::string ext(filename.substr(dot));
  std::transform(ext.begin(), ext.end(), ext.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  const bool allowed = std::find(kAllowedVideoExtensions.begin(), kAllowedVideoExtensions.end(),
                                 ext) != kAllowedVideoExtensions.end();
  if (!allowed) {
    return std::unexpected(core::PipelineError::InvalidUploadType);
  }
  return {};
}

}  // namespace clipsight::app
