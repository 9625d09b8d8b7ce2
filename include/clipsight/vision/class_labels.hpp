#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace clipsight::vision {

/// Model class id -> label. Index is the class id.
using ClassLabelTable = std::vector<std::string>;

/// The 80 COCO labels in YOLO class-id order. Built once, never modified.
[[nodiscard]] const ClassLabelTable& coco_class_labels();

/// Label for \p class_id, or nullopt when the id is outside \p table.
[[nodiscard]] std::optional<std::string_view> label_for(const ClassLabelTable& table,
                                                        std::int64_t class_id) noexcept;

}  // namespace clipsight::vision
