#include "core/stats/exercise_statistics.hpp"

#include <algorithm>
#include <cmath>
#include <ranges>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <utility>

#include "core/util/canonical.hpp"

namespace lift {
namespace {

struct ExampleGroup {
  std::string name;
  std::uint64_t total_count = 0;
  double intensity_sum = 0.0;
  std::size_t row_count = 0;
};

bool contains_key(const std::vector<MuscleGroupKey>& keys, const MuscleGroupKey& key) {
  return std::ranges::find(keys, key) != keys.end();
}

}  // namespace

std::int64_t intensity_bucket(double intensity) {
  return static_cast<std::int64_t>(std::llround(intensity * kIntensityBucketsPerUnit));
}

bool intensity_close(double lhs, double rhs) {
  return intensity_bucket(lhs) == intensity_bucket(rhs);
}

// Two absent intensities are close: repeated observations of an exercise
// without an intensity keep counting a single row.
bool intensity_close(const std::optional<double>& lhs, const std::optional<double>& rhs) {
  if (lhs.has_value() && rhs.has_value()) {
    return intensity_close(*lhs, *rhs);
  }
  return !lhs.has_value() && !rhs.has_value();
}

ExerciseStatistics::ExerciseStatistics(std::vector<StatEntry> rows, const ExerciseCatalog* catalog)
    : rows_(std::move(rows)), catalog_(catalog) {}

bool ExerciseStatistics::row_matches(const StatEntry& row, const SessionProperties& properties,
                                     const Exercise& exercise) {
  return contains_key(properties.muscle_group_keys, row.key) &&
         intensity_close(row.intended_intensity, properties.intended_intensity) &&
         row.exercise.name == exercise.name && intensity_close(row.exercise.intensity, exercise.intensity);
}

ExerciseStatistics ExerciseStatistics::with_observed_exercise(const SessionProperties& properties,
                                                              const Exercise& exercise) const {
  std::vector<StatEntry> next = rows_;

  const auto match = std::ranges::find_if(next, [&properties, &exercise](const StatEntry& row) {
    return row_matches(row, properties, exercise);
  });

  if (match != next.end()) {
    ++match->count;
  } else {
    for (const auto& key : util::unique_values(properties.muscle_group_keys)) {
      next.push_back({
          .key = key,
          .intended_intensity = properties.intended_intensity,
          .count = 1,
          .exercise = exercise,
      });
    }
  }

  return ExerciseStatistics{std::move(next), catalog_};
}

std::vector<Exercise> ExerciseStatistics::ranked_examples(
    const std::optional<std::vector<MuscleGroupKey>>& muscle_groups,
    const std::optional<double>& intended_intensity) const {
  const auto group_filter = [&muscle_groups](const MuscleGroupKey& key) {
    return !muscle_groups.has_value() || contains_key(*muscle_groups, key);
  };
  const auto intensity_filter = [&intended_intensity](double row_intensity) {
    return !intended_intensity.has_value() || intensity_close(row_intensity, *intended_intensity);
  };

  std::vector<ExampleGroup> groups;
  std::unordered_map<std::string, std::size_t> group_index;
  for (const auto& row : rows_) {
    if (!group_filter(row.key) || !intensity_filter(row.intended_intensity)) {
      continue;
    }

    auto [it, inserted] = group_index.try_emplace(row.exercise.name, groups.size());
    if (inserted) {
      groups.push_back({.name = row.exercise.name});
    }
    ExampleGroup& group = groups[it->second];
    group.total_count += row.count;
    group.intensity_sum += row.exercise.intensity.value_or(kDefaultExampleIntensity);
    ++group.row_count;
  }

  std::ranges::sort(groups, [](const ExampleGroup& lhs, const ExampleGroup& rhs) {
    if (lhs.total_count != rhs.total_count) {
      return lhs.total_count < rhs.total_count;
    }
    return lhs.name < rhs.name;
  });

  std::vector<Exercise> examples;
  std::unordered_set<std::string> emitted;
  examples.reserve(groups.size());
  for (const auto& group : groups) {
    examples.push_back({
        .name = group.name,
        .intensity = group.intensity_sum / static_cast<double>(group.row_count),
        .metadata = std::nullopt,
    });
    emitted.insert(group.name);
  }

  std::vector<Exercise> rest;
  for (const auto& entry : catalog().example_entries()) {
    if (!group_filter(entry.key)) {
      continue;
    }
    if (emitted.insert(entry.exercise.name).second) {
      rest.push_back(entry.exercise);
    }
  }
  std::ranges::sort(rest, [](const Exercise& lhs, const Exercise& rhs) {
    return lhs.name < rhs.name;
  });

  examples.insert(examples.end(), std::make_move_iterator(rest.begin()), std::make_move_iterator(rest.end()));
  return examples;
}

std::vector<Exercise> ExerciseStatistics::examples(const std::vector<MuscleGroupKey>& muscle_groups,
                                                   double intended_intensity) const {
  return ranked_examples(muscle_groups, intended_intensity);
}

std::vector<Exercise> ExerciseStatistics::examples(const std::vector<MuscleGroupKey>& muscle_groups) const {
  return ranked_examples(muscle_groups, std::nullopt);
}

std::vector<Exercise> ExerciseStatistics::examples() const {
  return ranked_examples(std::nullopt, std::nullopt);
}

std::uint64_t ExerciseStatistics::total_count() const {
  std::uint64_t total = 0;
  for (const auto& row : rows_) {
    total += row.count;
  }
  return total;
}

const ExerciseCatalog& ExerciseStatistics::catalog() const {
  return catalog_ != nullptr ? *catalog_ : default_catalog();
}

}  // namespace lift
