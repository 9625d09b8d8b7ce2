#include <clipsight/core/activity_rules.hpp>
#include <algorithm>
#include <utility>

namespace clipsight::core {

namespace {

// Person rules require repeated, confident person sightings before pairing with an object.
ClassRequirement person() { return {"person", 2, 0.5f}; }

std::vector<ActivityRule> build_default_rules() {
  return {
      {{person(), {"tv"}}, "Person watching TV"},
      {{person(), {"laptop"}}, "Person using laptop"},
      {{person(), {"cell phone"}}, "Person using phone"},
      {{person(), {"dog"}}, "Person with dog"},
      {{person(), {"cat"}}, "Person with cat"},
      {{person(), {"car"}}, "Person near car"},
      {{person(), {"bicycle"}}, "Person with bicycle"},
      {{person(), {"chair"}}, "Person sitting"},
      {{person(), {"dining table"}}, "Person at table"},
      {{{"car", 2}}, "Multiple cars present"},
      {{{"truck"}}, "Truck present"},
      {{{"bus"}}, "Bus present"},
      {{{"motorcycle"}}, "Motorcycle present"},
      {{{"dog", 2}}, "Multiple dogs present"},
      {{{"cat", 2}}, "Multiple cats present"},
  };
}

}  // namespace

const std::vector<ActivityRule>& default_activity_rules() {
  static const std::vector<ActivityRule> rules = build_default_rules();
  return rules;
}

bool rule_matches(const ActivityRule& rule, const std::vector<AggregatedDetection>& ranked) {
  return std::all_of(rule.required.begin(), rule.required.end(), [&](const ClassRequirement& req) {
    auto it = std::find_if(ranked.begin(), ranked.end(), [&](const AggregatedDetection& a) {
      return a.label == req.label;
    });
    return it != ranked.end() && it->count >= req.min_count &&
           it->mean_confidence >= req.min_mean_confidence;
  });
}

ActivityEngine::ActivityEngine() : rules_(default_activity_rules()) {}

ActivityEngine::ActivityEngine(std::vector<ActivityRule> rules) : rules_(std::move(rules)) {}

std::string ActivityEngine::infer(const std::vector<AggregatedDetection>& ranked) const {
  if (ranked.empty()) {
    return std::string(kNoActivity);
  }
  for (const auto& rule : rules_) {
    if (rule_matches(rule, ranked)) {
      return rule.description;
    }
  }
  return std::string(kFallbackPrefix) + ranked.front().label;
}

}  // namespace clipsight::core
