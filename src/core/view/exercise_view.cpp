#include "core/view/exercise_view.hpp"

#include <utility>

#include "core/model/app_meta.hpp"

namespace lift {

Transition transition(const ViewMode& mode, const DomainEvent& event) {
  if (std::holds_alternative<IdleMode>(mode)) {
    if (const auto* started = std::get_if<SessionStarted>(&event)) {
      return {InSessionMode{started->session_id, started->properties}, FoldEffect::None};
    }
    if (std::holds_alternative<SuggestionsSet>(event)) {
      return {mode, FoldEffect::ReplaceSuggestions};
    }
    return {mode, FoldEffect::Ignored};
  }

  if (std::holds_alternative<ExerciseObserved>(event)) {
    return {mode, FoldEffect::RecordExercise};
  }
  if (std::holds_alternative<SessionEnded>(event)) {
    return {IdleMode{}, FoldEffect::None};
  }
  if (std::holds_alternative<SuggestionsSet>(event)) {
    return {mode, FoldEffect::ReplaceSuggestions};
  }
  return {mode, FoldEffect::Ignored};
}

ExerciseView::ExerciseView(UserId user_id, const ExerciseCatalog* catalog)
    : user_id_(std::move(user_id)), statistics_({}, catalog) {}

Result ExerciseView::apply(const EventEnvelope& envelope) {
  if (!envelope.persistent) {
    ++ignored_event_count_;
    return Result::success("Transient delivery ignored.");
  }

  if (envelope.sequence_nr != last_sequence_nr_ + 1U) {
    return Result::failure("Replay out of order for " + persistence_id() + ": expected sequence " +
                           std::to_string(last_sequence_nr_ + 1U) + ", got " +
                           std::to_string(envelope.sequence_nr) + ".");
  }

  DecodedEvent decoded = decode_event(envelope);
  if (!decoded.status.ok) {
    return Result::failure("Replay failed for " + persistence_id() + " at sequence " +
                           std::to_string(envelope.sequence_nr) + ": " + decoded.status.message);
  }

  last_sequence_nr_ = envelope.sequence_nr;
  const FoldEffect effect = fold(decoded.event);
  return Result::success(effect == FoldEffect::Ignored ? "Event ignored." : "Event folded.");
}

FoldEffect ExerciseView::fold(const DomainEvent& event) {
  Transition step = transition(mode_, event);

  switch (step.effect) {
    case FoldEffect::RecordExercise: {
      const auto& session = std::get<InSessionMode>(mode_);
      const auto& observed = std::get<ExerciseObserved>(event);
      statistics_ = statistics_.with_observed_exercise(session.properties, observed.exercise);
      break;
    }
    case FoldEffect::ReplaceSuggestions:
      suggestions_.set(std::get<SuggestionsSet>(event).suggestions);
      break;
    case FoldEffect::Ignored:
      ++ignored_event_count_;
      return step.effect;
    case FoldEffect::None:
      break;
  }

  mode_ = std::move(step.next);
  ++folded_event_count_;
  return step.effect;
}

ExamplesReply ExerciseView::examples_for_session(const SessionId& session_id) const {
  const auto* session = std::get_if<InSessionMode>(&mode_);
  if (session == nullptr || session->session_id != session_id) {
    return ExamplesReply::failure(std::string{kNoExamplesMessage});
  }

  return ExamplesReply::success(
      statistics_.examples(session->properties.muscle_group_keys, session->properties.intended_intensity));
}

ExamplesReply ExerciseView::examples(const std::optional<std::vector<MuscleGroupKey>>& muscle_group_keys) const {
  if (muscle_group_keys.has_value()) {
    return ExamplesReply::success(statistics_.examples(*muscle_group_keys));
  }
  return ExamplesReply::success(statistics_.examples());
}

ExamplesReply ExerciseView::handle(const ExamplesQuery& query) const {
  if (query.session_id.has_value()) {
    return examples_for_session(*query.session_id);
  }
  return examples(query.muscle_group_keys);
}

SuggestionsReply ExerciseView::handle(const SuggestionsQuery&) const {
  return SuggestionsReply::success(suggestions_.get());
}

std::string ExerciseView::persistence_id() const {
  return persistence_id_for(user_id_);
}

std::string ExerciseView::view_id() const {
  return view_id_for(user_id_);
}

std::optional<SessionId> ExerciseView::active_session() const {
  if (const auto* session = std::get_if<InSessionMode>(&mode_)) {
    return session->session_id;
  }
  return std::nullopt;
}

bool ExerciseView::same_state_as(const ExerciseView& other) const {
  return mode_ == other.mode_ && statistics_ == other.statistics_ && suggestions_ == other.suggestions_ &&
         last_sequence_nr_ == other.last_sequence_nr_;
}

std::string persistence_id_for(const UserId& user_id) {
  return std::string{kPersistenceIdPrefix} + user_id.value;
}

std::string view_id_for(const UserId& user_id) {
  return std::string{kViewIdPrefix} + user_id.value;
}

}  // namespace lift
