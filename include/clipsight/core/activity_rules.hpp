#pragma once

#include <clipsight/core/detection.hpp>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace clipsight::core {

/// Result returned when nothing was detected (or every frame was filtered out).
inline constexpr std::string_view kNoActivity = "No clear activity detected";

/// Prefix of the fallback result that names the most frequent class.
inline constexpr std::string_view kFallbackPrefix = "Activity involving ";

/// One class a rule needs. Both thresholds are inclusive.
struct ClassRequirement {
  std::string label;
  std::uint32_t min_count{1};
  float min_mean_confidence{0.f};
};

/// All requirements must hold for the rule to fire.
struct ActivityRule {
  std::vector<ClassRequirement> required;
  std::string description;
};

/// Built-in rule table. Process-wide, built on first use, never modified.
[[nodiscard]] const std::vector<ActivityRule>& default_activity_rules();

/// Evaluates a rule table top-down; the first satisfied rule wins.
class ActivityEngine {
 public:
  /// Uses default_activity_rules().
  ActivityEngine();
  explicit ActivityEngine(std::vector<ActivityRule> rules);

  /// \p ranked must be ordered by ranks_before(); the fallback names ranked.front().
  [[nodiscard]] std::string infer(const std::vector<AggregatedDetection>& ranked) const;

  [[nodiscard]] const std::vector<ActivityRule>& rules() const noexcept { return rules_; }

 private:
  std::vector<ActivityRule> rules_;
};

/// True if every requirement of \p rule is met by \p ranked.
[[nodiscard]] bool rule_matches(const ActivityRule& rule,
                                const std::vector<AggregatedDetection>& ranked);

}  // namespace clipsight::core
