#pragma once

#include <clipsight/core/error.hpp>
#include <array>
#include <expected>
#include <string_view>

namespace clipsight::app {

/// Video container extensions accepted for upload (lower case, with the dot).
inline constexpr std::array<std::string_view, 5> kAllowedVideoExtensions = {
    ".mp4", ".avi", ".mov", ".mkv", ".wmv"};

/// InvalidUploadType unless \p filename is non-empty and ends in an allowed extension
/// (compared case-insensitively).
[[nodiscard]] std::expected<void, core::PipelineError> validate_upload(std::string_view filename);

}  // namespace clipsight::app
