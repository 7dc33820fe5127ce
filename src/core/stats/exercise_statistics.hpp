#pragma once

#include <cstdint>
#include <optional>
#include <vector>

#include "core/catalog/exercise_catalog.hpp"
#include "core/model/types.hpp"

namespace lift {

// Two intensities are close when they round to the same tenth.
inline constexpr double kIntensityBucketsPerUnit = 10.0;
inline constexpr double kDefaultExampleIntensity = 0.5;

std::int64_t intensity_bucket(double intensity);
bool intensity_close(double lhs, double rhs);
bool intensity_close(const std::optional<double>& lhs, const std::optional<double>& rhs);

// Immutable exercise counters; every update returns a new aggregate.
class ExerciseStatistics {
public:
  ExerciseStatistics() = default;
  explicit ExerciseStatistics(std::vector<StatEntry> rows, const ExerciseCatalog* catalog = nullptr);

  [[nodiscard]] ExerciseStatistics with_observed_exercise(const SessionProperties& properties,
                                                          const Exercise& exercise) const;

  // Least counted first, then catalog filler in name order.
  [[nodiscard]] std::vector<Exercise> ranked_examples(
      const std::optional<std::vector<MuscleGroupKey>>& muscle_groups,
      const std::optional<double>& intended_intensity) const;

  [[nodiscard]] std::vector<Exercise> examples(const std::vector<MuscleGroupKey>& muscle_groups,
                                               double intended_intensity) const;
  [[nodiscard]] std::vector<Exercise> examples(const std::vector<MuscleGroupKey>& muscle_groups) const;
  [[nodiscard]] std::vector<Exercise> examples() const;

  [[nodiscard]] const std::vector<StatEntry>& rows() const { return rows_; }
  [[nodiscard]] std::size_t size() const { return rows_.size(); }
  [[nodiscard]] bool empty() const { return rows_.empty(); }
  [[nodiscard]] std::uint64_t total_count() const;

  static bool row_matches(const StatEntry& row, const SessionProperties& properties, const Exercise& exercise);

  friend bool operator==(const ExerciseStatistics& lhs, const ExerciseStatistics& rhs) {
    return lhs.rows_ == rhs.rows_;
  }

private:
  [[nodiscard]] const ExerciseCatalog& catalog() const;

  std::vector<StatEntry> rows_;
  const ExerciseCatalog* catalog_ = nullptr;
};

}  // namespace lift
