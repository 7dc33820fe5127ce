#include "core/model/events.hpp"

#include <unordered_map>
#include <utility>
#include <vector>

#include "core/util/canonical.hpp"

namespace lift {
namespace {

using PayloadMap = std::unordered_map<std::string, std::string>;

std::optional<std::string> field(const PayloadMap& payload, const std::string& key) {
  const auto it = payload.find(key);
  if (it == payload.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::string encode_payload(const SessionStarted& event) {
  return util::canonical_join({
      {"session_id", event.session_id},
      {"start_unix", std::to_string(event.properties.start_unix)},
      {"muscle_group_keys", util::join_csv(event.properties.muscle_group_keys)},
      {"intended_intensity", util::format_double(event.properties.intended_intensity)},
  });
}

std::string encode_payload(const ExerciseObserved& event) {
  std::vector<std::pair<std::string, std::string>> fields = {
      {"session_id", event.session_id},
      {"exercise_name", event.exercise.name},
  };
  if (event.exercise.intensity.has_value()) {
    fields.emplace_back("exercise_intensity", util::format_double(*event.exercise.intensity));
  }
  if (event.exercise.metadata.has_value()) {
    fields.emplace_back("exercise_metadata", *event.exercise.metadata);
  }
  if (event.metadata.has_value()) {
    fields.emplace_back("metadata", *event.metadata);
  }
  return util::canonical_join(std::move(fields));
}

std::string encode_payload(const SessionEnded& event) {
  return util::canonical_join({{"session_id", event.session_id}});
}

std::string encode_payload(const SuggestionsSet& event) {
  std::vector<std::pair<std::string, std::string>> fields = {
      {"suggestion_count", std::to_string(event.suggestions.size())},
  };
  for (std::size_t i = 0; i < event.suggestions.size(); ++i) {
    const Suggestion& suggestion = event.suggestions[i];
    const std::string prefix = "suggestion." + std::to_string(i) + ".";
    fields.emplace_back(prefix + "date_unix", std::to_string(suggestion.date_unix));
    fields.emplace_back(prefix + "source", suggestion.source);
    fields.emplace_back(prefix + "muscle_group_keys", util::join_csv(suggestion.muscle_group_keys));
    fields.emplace_back(prefix + "intended_intensity", util::format_double(suggestion.intended_intensity));
  }
  return util::canonical_join(std::move(fields));
}

std::string encode_payload(const UnrecognizedEvent&) {
  return {};
}

DecodedEvent decode_failure(std::string_view kind, std::string_view reason) {
  return {Result::failure(std::string{kind} + " payload rejected: " + std::string{reason}),
          UnrecognizedEvent{std::string{kind}}};
}

DecodedEvent decode_session_started(const PayloadMap& payload) {
  SessionStarted event;
  const auto session_id = field(payload, "session_id");
  if (!session_id.has_value() || session_id->empty()) {
    return decode_failure("SessionStarted", "missing session_id.");
  }
  event.session_id = *session_id;

  const auto keys = field(payload, "muscle_group_keys");
  if (keys.has_value()) {
    event.properties.muscle_group_keys = util::unique_values(util::split_csv(*keys));
  }

  const auto intensity_text = field(payload, "intended_intensity");
  const auto intensity = intensity_text.has_value() ? util::parse_double(*intensity_text) : std::nullopt;
  if (!intensity.has_value()) {
    return decode_failure("SessionStarted", "missing or invalid intended_intensity.");
  }
  event.properties.intended_intensity = *intensity;

  if (const auto start = field(payload, "start_unix"); start.has_value()) {
    const auto parsed = util::parse_int64(*start);
    if (!parsed.has_value()) {
      return decode_failure("SessionStarted", "invalid start_unix.");
    }
    event.properties.start_unix = *parsed;
  }

  return {Result::success(), std::move(event)};
}

DecodedEvent decode_exercise_observed(const PayloadMap& payload) {
  ExerciseObserved event;
  const auto session_id = field(payload, "session_id");
  if (!session_id.has_value() || session_id->empty()) {
    return decode_failure("ExerciseObserved", "missing session_id.");
  }
  event.session_id = *session_id;

  const auto name = field(payload, "exercise_name");
  if (!name.has_value() || name->empty()) {
    return decode_failure("ExerciseObserved", "missing exercise_name.");
  }
  event.exercise.name = *name;

  if (const auto intensity = field(payload, "exercise_intensity"); intensity.has_value()) {
    event.exercise.intensity = util::parse_double(*intensity);
    if (!event.exercise.intensity.has_value()) {
      return decode_failure("ExerciseObserved", "invalid exercise_intensity.");
    }
  }
  event.exercise.metadata = field(payload, "exercise_metadata");
  event.metadata = field(payload, "metadata");

  return {Result::success(), std::move(event)};
}

DecodedEvent decode_session_ended(const PayloadMap& payload) {
  const auto session_id = field(payload, "session_id");
  if (!session_id.has_value() || session_id->empty()) {
    return decode_failure("SessionEnded", "missing session_id.");
  }
  return {Result::success(), SessionEnded{*session_id}};
}

DecodedEvent decode_suggestions_set(const PayloadMap& payload) {
  const auto count_text = field(payload, "suggestion_count");
  const auto count = count_text.has_value() ? util::parse_uint64(*count_text) : std::nullopt;
  if (!count.has_value()) {
    return decode_failure("SuggestionsSet", "missing or invalid suggestion_count.");
  }

  SuggestionsSet event;
  event.suggestions.reserve(static_cast<std::size_t>(*count));
  for (std::uint64_t i = 0; i < *count; ++i) {
    const std::string prefix = "suggestion." + std::to_string(i) + ".";
    Suggestion suggestion;

    const auto date = field(payload, prefix + "date_unix");
    const auto parsed_date = date.has_value() ? util::parse_int64(*date) : std::nullopt;
    const auto intensity = field(payload, prefix + "intended_intensity");
    const auto parsed_intensity = intensity.has_value() ? util::parse_double(*intensity) : std::nullopt;
    if (!parsed_date.has_value() || !parsed_intensity.has_value()) {
      return decode_failure("SuggestionsSet", "suggestion " + std::to_string(i) + " is incomplete.");
    }

    suggestion.date_unix = *parsed_date;
    suggestion.intended_intensity = *parsed_intensity;
    suggestion.source = field(payload, prefix + "source").value_or("");
    const auto keys = field(payload, prefix + "muscle_group_keys");
    if (keys.has_value()) {
      suggestion.muscle_group_keys = util::unique_values(util::split_csv(*keys));
    }
    event.suggestions.push_back(std::move(suggestion));
  }

  return {Result::success(), std::move(event)};
}

}  // namespace

std::string_view event_kind_to_string(EventKind kind) {
  switch (kind) {
    case EventKind::SessionStarted:
      return "SessionStarted";
    case EventKind::ExerciseObserved:
      return "ExerciseObserved";
    case EventKind::SessionEnded:
      return "SessionEnded";
    case EventKind::SuggestionsSet:
      return "ExerciseSuggestionsSet";
    case EventKind::Unrecognized:
      return "Unrecognized";
  }
  return "Unrecognized";
}

EventKind event_kind_from_string(std::string_view text) {
  if (text == "SessionStarted") {
    return EventKind::SessionStarted;
  }
  if (text == "ExerciseObserved") {
    return EventKind::ExerciseObserved;
  }
  if (text == "SessionEnded") {
    return EventKind::SessionEnded;
  }
  if (text == "ExerciseSuggestionsSet") {
    return EventKind::SuggestionsSet;
  }
  return EventKind::Unrecognized;
}

DecodedEvent decode_event(const EventEnvelope& envelope) {
  const EventKind kind = event_kind_from_string(envelope.kind);
  if (kind == EventKind::Unrecognized) {
    return {Result::success("Unrecognized event kind."), UnrecognizedEvent{envelope.kind}};
  }

  const PayloadMap payload = util::parse_canonical_map(envelope.payload);
  switch (kind) {
    case EventKind::SessionStarted:
      return decode_session_started(payload);
    case EventKind::ExerciseObserved:
      return decode_exercise_observed(payload);
    case EventKind::SessionEnded:
      return decode_session_ended(payload);
    case EventKind::SuggestionsSet:
      return decode_suggestions_set(payload);
    case EventKind::Unrecognized:
      break;
  }
  return {Result::success("Unrecognized event kind."), UnrecognizedEvent{envelope.kind}};
}

EventEnvelope encode_event(const DomainEvent& event) {
  EventEnvelope envelope;
  if (const auto* started = std::get_if<SessionStarted>(&event)) {
    envelope.kind = event_kind_to_string(EventKind::SessionStarted);
    envelope.payload = encode_payload(*started);
  } else if (const auto* observed = std::get_if<ExerciseObserved>(&event)) {
    envelope.kind = event_kind_to_string(EventKind::ExerciseObserved);
    envelope.payload = encode_payload(*observed);
  } else if (const auto* ended = std::get_if<SessionEnded>(&event)) {
    envelope.kind = event_kind_to_string(EventKind::SessionEnded);
    envelope.payload = encode_payload(*ended);
  } else if (const auto* suggestions = std::get_if<SuggestionsSet>(&event)) {
    envelope.kind = event_kind_to_string(EventKind::SuggestionsSet);
    envelope.payload = encode_payload(*suggestions);
  } else if (const auto* unknown = std::get_if<UnrecognizedEvent>(&event)) {
    envelope.kind = unknown->kind;
    envelope.payload = encode_payload(*unknown);
  }
  return envelope;
}

}  // namespace lift
