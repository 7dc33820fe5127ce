#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "core/catalog/exercise_catalog.hpp"
#include "core/model/events.hpp"
#include "core/model/requests.hpp"
#include "core/model/types.hpp"
#include "core/stats/exercise_statistics.hpp"
#include "core/stats/suggestion_store.hpp"

namespace lift {

struct IdleMode {
  friend bool operator==(const IdleMode&, const IdleMode&) = default;
};

struct InSessionMode {
  SessionId session_id;
  SessionProperties properties;

  friend bool operator==(const InSessionMode&, const InSessionMode&) = default;
};

using ViewMode = std::variant<IdleMode, InSessionMode>;

enum class FoldEffect {
  None,
  RecordExercise,
  ReplaceSuggestions,
  Ignored,
};

struct Transition {
  ViewMode next;
  FoldEffect effect = FoldEffect::None;
};

// Pure (mode, event) -> (next mode, side effect) table.
//   Idle      + SessionStarted   -> InSession, none
//   Idle      + SuggestionsSet   -> Idle, replace suggestions
//   InSession + ExerciseObserved -> InSession, record exercise
//   InSession + SessionEnded     -> Idle, none
//   InSession + SuggestionsSet   -> InSession, replace suggestions
//   anything else                -> unchanged, ignored
Transition transition(const ViewMode& mode, const DomainEvent& event);

// Not thread-safe; the owner serializes all calls.
class ExerciseView {
public:
  explicit ExerciseView(UserId user_id, const ExerciseCatalog* catalog = nullptr);

  // Fails without touching state on a malformed payload or a sequence gap.
  Result apply(const EventEnvelope& envelope);

  FoldEffect fold(const DomainEvent& event);

  [[nodiscard]] ExamplesReply examples_for_session(const SessionId& session_id) const;
  [[nodiscard]] ExamplesReply examples(const std::optional<std::vector<MuscleGroupKey>>& muscle_group_keys) const;
  [[nodiscard]] ExamplesReply handle(const ExamplesQuery& query) const;
  [[nodiscard]] SuggestionsReply handle(const SuggestionsQuery& query) const;
  [[nodiscard]] const SuggestionSet& suggestions() const { return suggestions_.get(); }

  [[nodiscard]] const UserId& user_id() const { return user_id_; }
  [[nodiscard]] std::string persistence_id() const;
  [[nodiscard]] std::string view_id() const;

  [[nodiscard]] const ViewMode& mode() const { return mode_; }
  [[nodiscard]] bool in_session() const { return std::holds_alternative<InSessionMode>(mode_); }
  [[nodiscard]] std::optional<SessionId> active_session() const;
  [[nodiscard]] const ExerciseStatistics& statistics() const { return statistics_; }
  [[nodiscard]] std::uint64_t last_sequence_nr() const { return last_sequence_nr_; }
  [[nodiscard]] std::uint64_t folded_event_count() const { return folded_event_count_; }
  [[nodiscard]] std::uint64_t ignored_event_count() const { return ignored_event_count_; }

  // Compares folded state only: mode, statistics, suggestions and offset.
  [[nodiscard]] bool same_state_as(const ExerciseView& other) const;

private:
  UserId user_id_;
  ViewMode mode_ = IdleMode{};
  ExerciseStatistics statistics_;
  SuggestionStore suggestions_;
  std::uint64_t last_sequence_nr_ = 0;
  std::uint64_t folded_event_count_ = 0;
  std::uint64_t ignored_event_count_ = 0;
};

std::string persistence_id_for(const UserId& user_id);
std::string view_id_for(const UserId& user_id);

}  // namespace lift
