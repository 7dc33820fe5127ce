#pragma once

#include <optional>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "core/model/types.hpp"

namespace lift {

// Fixed muscle groups and their exercises. Immutable after construction and
// shared read-only by every view instance.
class ExerciseCatalog {
public:
  ExerciseCatalog();

  [[nodiscard]] const std::vector<MuscleGroup>& muscle_groups() const { return groups_; }

  // key x exercise cross product as zero-count placeholders, in catalog order.
  [[nodiscard]] const std::vector<StatEntry>& example_entries() const { return example_entries_; }

  [[nodiscard]] std::optional<MuscleGroup> find(std::string_view key) const;
  [[nodiscard]] bool supports(std::string_view key) const;

private:
  std::vector<MuscleGroup> groups_;
  std::vector<StatEntry> example_entries_;
  std::unordered_map<std::string, std::size_t> index_by_key_;

  void build_entries();
};

const ExerciseCatalog& default_catalog();

}  // namespace lift
