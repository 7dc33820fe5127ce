#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace lift {

struct Result {
  bool ok = false;
  std::string message;
  std::string data;

  static Result success(std::string msg = {}, std::string payload = {}) {
    return {true, std::move(msg), std::move(payload)};
  }

  static Result failure(std::string msg) {
    return {false, std::move(msg), {}};
  }
};

using MuscleGroupKey = std::string;
using SessionId = std::string;

struct UserId {
  std::string value;

  [[nodiscard]] bool empty() const { return value.empty(); }
};

struct MuscleGroup {
  MuscleGroupKey key;
  std::string title;
  std::vector<std::string> exercises;
};

struct Exercise {
  std::string name;
  std::optional<double> intensity;
  std::optional<std::string> metadata;

  friend bool operator==(const Exercise&, const Exercise&) = default;
};

struct SessionProperties {
  std::int64_t start_unix = 0;
  std::vector<MuscleGroupKey> muscle_group_keys;
  double intended_intensity = 0.0;

  friend bool operator==(const SessionProperties&, const SessionProperties&) = default;
};

struct StatEntry {
  MuscleGroupKey key;
  double intended_intensity = 0.0;
  std::uint64_t count = 0;
  Exercise exercise;

  friend bool operator==(const StatEntry&, const StatEntry&) = default;
};

struct Suggestion {
  std::int64_t date_unix = 0;
  std::string source;
  std::vector<MuscleGroupKey> muscle_group_keys;
  double intended_intensity = 0.0;

  friend bool operator==(const Suggestion&, const Suggestion&) = default;
};

using SuggestionSet = std::vector<Suggestion>;

struct ExamplesReply {
  bool ok = false;
  std::string message;
  std::vector<Exercise> examples;

  static ExamplesReply success(std::vector<Exercise> items) {
    return {true, {}, std::move(items)};
  }

  static ExamplesReply failure(std::string msg) {
    return {false, std::move(msg), {}};
  }
};

struct SuggestionsReply {
  bool ok = false;
  std::string message;
  SuggestionSet suggestions;

  static SuggestionsReply success(SuggestionSet items) {
    return {true, {}, std::move(items)};
  }

  static SuggestionsReply failure(std::string msg) {
    return {false, std::move(msg), {}};
  }
};

inline constexpr std::string_view kNoExamplesMessage = "No examples";

struct ViewConfig {
  std::string data_dir = "lift-stats-data";
  std::string journal_dir;      // empty -> <data_dir>/journal
  std::string diagnostics_log;  // empty -> <data_dir>/diagnostics.log
  std::uint32_t shard_count = 10;
  std::uint64_t refresh_interval_ms = 1000;
  std::uint64_t idle_timeout_seconds = 360;
};

struct HostStatus {
  bool background_running = false;
  std::size_t live_entities = 0;
  std::uint64_t created_entities = 0;
  std::uint64_t refresh_ticks = 0;
  std::uint64_t evictions = 0;
  std::uint64_t replay_failures = 0;
  std::uint64_t ignored_events = 0;
  std::uint64_t folded_events = 0;
  std::uint32_t shard_count = 0;
  std::uint64_t refresh_interval_ms = 0;
  std::uint64_t idle_timeout_seconds = 0;
  std::string journal_dir;
  std::string diagnostics_log;
};

}  // namespace lift
