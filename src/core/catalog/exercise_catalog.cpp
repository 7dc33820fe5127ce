#include "core/catalog/exercise_catalog.hpp"

namespace lift {

ExerciseCatalog::ExerciseCatalog()
    : groups_({
          {"legs", "Legs", {"squat", "leg press", "leg extension", "leg curl", "lunge"}},
          {"core", "Core", {"crunch", "side bend", "cable crunch", "sit up", "leg raises"}},
          {"back", "Back", {"pull up", "row", "deadlift", "hyper-extension"}},
          {"arms",
           "Arms",
           {"bicep curl", "hammer curl", "pronated curl", "tricep push down", "tricep overhead extension",
            "tricep dip", "close-grip bench press"}},
          {"chest", "Chest", {"chest press", "butterfly", "cable cross-over", "incline chest press", "push up"}},
          {"shoulders",
           "Shoulders",
           {"shoulder press", "lateral raise", "front raise", "rear raise", "upright row", "shrug"}},
          {"cardiovascular", "Cardiovascular", {"running", "cycling", "swimming", "elliptical", "rowing"}},
      }) {
  build_entries();
}

std::optional<MuscleGroup> ExerciseCatalog::find(std::string_view key) const {
  const auto it = index_by_key_.find(std::string{key});
  if (it == index_by_key_.end()) {
    return std::nullopt;
  }

  return groups_[it->second];
}

bool ExerciseCatalog::supports(std::string_view key) const {
  return index_by_key_.contains(std::string{key});
}

void ExerciseCatalog::build_entries() {
  example_entries_.clear();
  index_by_key_.clear();

  for (std::size_t i = 0; i < groups_.size(); ++i) {
    const MuscleGroup& group = groups_[i];
    index_by_key_.emplace(group.key, i);
    for (const auto& name : group.exercises) {
      example_entries_.push_back({
          .key = group.key,
          .intended_intensity = 0.0,
          .count = 0,
          .exercise = {.name = name, .intensity = std::nullopt, .metadata = std::nullopt},
      });
    }
  }
}

const ExerciseCatalog& default_catalog() {
  static const ExerciseCatalog catalog;
  return catalog;
}

}  // namespace lift
