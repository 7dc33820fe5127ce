#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

#include "core/model/types.hpp"

namespace lift {

enum class EventKind {
  SessionStarted,
  ExerciseObserved,
  SessionEnded,
  SuggestionsSet,
  Unrecognized,
};

// One persisted record of a user's stream. `kind` keeps the raw tag so that
// records written by newer producers survive a round trip unchanged.
struct EventEnvelope {
  std::uint64_t sequence_nr = 0;
  std::string kind;
  std::int64_t unix_ts = 0;
  std::string payload;
  bool persistent = true;
};

struct SessionStarted {
  SessionId session_id;
  SessionProperties properties;
};

struct ExerciseObserved {
  SessionId session_id;
  std::optional<std::string> metadata;
  Exercise exercise;
};

struct SessionEnded {
  SessionId session_id;
};

struct SuggestionsSet {
  SuggestionSet suggestions;
};

struct UnrecognizedEvent {
  std::string kind;
};

using DomainEvent = std::variant<SessionStarted, ExerciseObserved, SessionEnded, SuggestionsSet, UnrecognizedEvent>;

struct DecodedEvent {
  Result status;
  DomainEvent event;
};

std::string_view event_kind_to_string(EventKind kind);
EventKind event_kind_from_string(std::string_view text);

// A known kind with a malformed payload yields a failed status; unknown kinds
// decode successfully to UnrecognizedEvent.
DecodedEvent decode_event(const EventEnvelope& envelope);

// Fills kind and payload; sequence number and timestamp belong to the journal.
EventEnvelope encode_event(const DomainEvent& event);

}  // namespace lift
