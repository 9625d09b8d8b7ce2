#pragma once

#include <string_view>

namespace clipsight::core {

/// Pipeline error codes; used with std::expected for recoverable failures.
enum class PipelineError {
  None = 0,
  InvalidFrame,
  InvalidConfig,
  /// Video cannot be opened or decoded at all (also decode timeout). Fatal to the request.
  UnreadableVideo,
  /// Model call failed, timed out, or returned malformed output. Recoverable per frame.
  DetectionModelError,
  /// Upload rejected before the pipeline runs (bad name or extension).
  InvalidUploadType,
  Cancelled,
};

/// Short, caller-safe description of an error code.
[[nodiscard]] std::string_view error_message(PipelineError e) noexcept;

}  // namespace clipsight::core
