#include <algorithm>
#include <cassert>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <ranges>
#include <string>
#include <thread>
#include <unordered_set>
#include <vector>

#include "core/api/core_api.hpp"
#include "core/catalog/exercise_catalog.hpp"
#include "core/config/view_config.hpp"
#include "core/model/events.hpp"
#include "core/routing/shard_router.hpp"
#include "core/service/view_host.hpp"
#include "core/stats/exercise_statistics.hpp"
#include "core/storage/event_journal.hpp"
#include "core/util/canonical.hpp"
#include "core/view/exercise_view.hpp"

namespace {

std::filesystem::path temp_dir(const std::string& name) {
  const auto root = std::filesystem::temp_directory_path() / "lift-stats-tests" / name;
  std::error_code ec;
  std::filesystem::remove_all(root, ec);
  std::filesystem::create_directories(root, ec);
  return root;
}

lift::SessionProperties legs_session(double intensity) {
  return {.start_unix = 1700000000, .muscle_group_keys = {"legs"}, .intended_intensity = intensity};
}

lift::Exercise exercise(const std::string& name, double intensity) {
  return {.name = name, .intensity = intensity, .metadata = std::nullopt};
}

lift::EventEnvelope envelope(std::uint64_t sequence_nr, const lift::DomainEvent& event) {
  lift::EventEnvelope out = lift::encode_event(event);
  out.sequence_nr = sequence_nr;
  out.unix_ts = 1700000000 + static_cast<std::int64_t>(sequence_nr);
  return out;
}

std::vector<lift::EventEnvelope> squat_session_events() {
  return {
      envelope(1, lift::SessionStarted{"S1", legs_session(0.7)}),
      envelope(2, lift::ExerciseObserved{"S1", std::nullopt, exercise("squat", 0.7)}),
      envelope(3, lift::ExerciseObserved{"S1", std::nullopt, exercise("squat", 0.7)}),
      envelope(4, lift::SessionEnded{"S1"}),
  };
}

std::vector<std::string> names_of(const std::vector<lift::Exercise>& exercises) {
  std::vector<std::string> names;
  for (const auto& e : exercises) {
    names.push_back(e.name);
  }
  return names;
}

bool all_unique(const std::vector<std::string>& names) {
  std::unordered_set<std::string> seen(names.begin(), names.end());
  return seen.size() == names.size();
}

void test_catalog_entries() {
  const lift::ExerciseCatalog& catalog = lift::default_catalog();
  assert(catalog.muscle_groups().size() == 7);
  assert(catalog.example_entries().size() == 37);
  assert(catalog.supports("cardiovascular"));
  assert(!catalog.supports("neck"));

  const auto legs = catalog.find("legs");
  assert(legs.has_value());
  assert(legs->title == "Legs");
  assert(legs->exercises.front() == "squat");

  for (const auto& entry : catalog.example_entries()) {
    assert(entry.count == 0);
    assert(entry.intended_intensity == 0.0);
    assert(!entry.exercise.intensity.has_value());
    assert(catalog.supports(entry.key));
  }
}

void test_intensity_closeness() {
  assert(lift::intensity_close(0.7, 0.7));
  assert(lift::intensity_close(0.7, 0.74));
  assert(lift::intensity_close(0.66, 0.7));
  assert(!lift::intensity_close(0.7, 0.76));
  assert(!lift::intensity_close(0.3, 0.7));
  assert(lift::intensity_close(std::optional<double>{}, std::optional<double>{}));
  assert(!lift::intensity_close(std::optional<double>{0.5}, std::optional<double>{}));
}

void test_statistics_counts_every_observation() {
  const auto session = legs_session(0.7);
  lift::ExerciseStatistics stats;
  for (int i = 0; i < 5; ++i) {
    const lift::ExerciseStatistics next = stats.with_observed_exercise(session, exercise("squat", 0.7));
    assert(next.total_count() == stats.total_count() + 1);
    stats = next;
  }

  assert(stats.size() == 1);
  assert(stats.rows().front().key == "legs");
  assert(stats.rows().front().count == 5);

  // Declared intensity drift inside one bucket still hits the same row.
  stats = stats.with_observed_exercise(legs_session(0.72), exercise("squat", 0.68));
  assert(stats.size() == 1);
  assert(stats.rows().front().count == 6);

  // A different bucket opens a new row.
  stats = stats.with_observed_exercise(legs_session(0.7), exercise("squat", 0.9));
  assert(stats.size() == 2);
  assert(stats.rows().back().count == 1);
}

void test_statistics_update_leaves_receiver_untouched() {
  const lift::ExerciseStatistics empty;
  const lift::ExerciseStatistics one = empty.with_observed_exercise(legs_session(0.5), exercise("lunge", 0.5));
  assert(empty.empty());
  assert(one.size() == 1);
}

void test_statistics_multi_group_first_match_wins() {
  const lift::SessionProperties session{
      .start_unix = 0, .muscle_group_keys = {"legs", "core"}, .intended_intensity = 0.6};

  lift::ExerciseStatistics stats;
  stats = stats.with_observed_exercise(session, exercise("lunge", 0.6));
  assert(stats.size() == 2);
  assert(stats.rows()[0].key == "legs");
  assert(stats.rows()[1].key == "core");

  stats = stats.with_observed_exercise(session, exercise("lunge", 0.6));
  assert(stats.size() == 2);
  assert(stats.rows()[0].count == 2);
  assert(stats.rows()[1].count == 1);

  // Rows are matched by group membership, so a core-only session hits the core row.
  const lift::SessionProperties core_only{.start_unix = 0, .muscle_group_keys = {"core"}, .intended_intensity = 0.6};
  stats = stats.with_observed_exercise(core_only, exercise("lunge", 0.6));
  assert(stats.rows()[1].count == 2);
}

void test_ranked_examples_least_counted_first() {
  const auto session = legs_session(0.5);
  lift::ExerciseStatistics stats;
  for (int i = 0; i < 3; ++i) {
    stats = stats.with_observed_exercise(session, exercise("squat", 0.5));
  }
  stats = stats.with_observed_exercise(legs_session(0.6), exercise("lunge", 0.6));

  const auto examples = stats.examples(std::vector<std::string>{"legs"});
  const std::vector<std::string> expected = {"lunge", "squat", "leg curl", "leg extension", "leg press"};
  assert(names_of(examples) == expected);
  assert(examples[0].intensity.has_value() && *examples[0].intensity == 0.6);
  assert(examples[1].intensity.has_value() && *examples[1].intensity == 0.5);
  assert(!examples[2].intensity.has_value());
}

void test_ranked_examples_mean_intensity() {
  lift::ExerciseStatistics stats;
  stats = stats.with_observed_exercise(legs_session(0.4), exercise("squat", 0.4));
  stats = stats.with_observed_exercise(legs_session(0.8), exercise("squat", 0.8));
  stats = stats.with_observed_exercise(legs_session(0.8), lift::Exercise{.name = "squat"});

  const auto examples = stats.examples(std::vector<std::string>{"legs"});
  assert(examples.front().name == "squat");
  const double mean = *examples.front().intensity;
  assert(mean > (0.4 + 0.8 + 0.5) / 3.0 - 1e-9 && mean < (0.4 + 0.8 + 0.5) / 3.0 + 1e-9);
}

void test_ranked_examples_filters_and_uniqueness() {
  lift::ExerciseStatistics stats;
  stats = stats.with_observed_exercise(legs_session(0.7), exercise("squat", 0.7));
  stats = stats.with_observed_exercise(
      {.start_unix = 0, .muscle_group_keys = {"arms"}, .intended_intensity = 0.7}, exercise("bicep curl", 0.7));
  stats = stats.with_observed_exercise(
      {.start_unix = 0, .muscle_group_keys = {"arms"}, .intended_intensity = 0.3}, exercise("hammer curl", 0.3));

  const auto arms = stats.examples(std::vector<std::string>{"arms"});
  const auto arms_group = lift::default_catalog().find("arms");
  assert(arms_group.has_value());
  assert(arms.size() == arms_group->exercises.size());
  for (const auto& e : arms) {
    assert(std::ranges::find(arms_group->exercises, e.name) != arms_group->exercises.end());
  }
  assert(all_unique(names_of(arms)));

  // Intensity filter: the 0.3 row is excluded from the observed part and only
  // comes back as catalog filler without an intensity.
  const auto arms_hard = stats.examples(std::vector<std::string>{"arms"}, 0.7);
  assert(arms_hard.front().name == "bicep curl");
  const auto hammer = std::ranges::find_if(arms_hard, [](const lift::Exercise& e) { return e.name == "hammer curl"; });
  assert(hammer != arms_hard.end());
  assert(!hammer->intensity.has_value());

  const auto everything = stats.examples();
  assert(everything.size() == lift::default_catalog().example_entries().size());
  assert(all_unique(names_of(everything)));
  assert(everything[0].intensity.has_value());
  assert(everything[1].intensity.has_value());
  assert(everything[2].intensity.has_value());
  assert(!everything[3].intensity.has_value());
}

void test_ranked_examples_is_repeatable() {
  lift::ExerciseStatistics stats;
  stats = stats.with_observed_exercise(legs_session(0.7), exercise("squat", 0.7));
  stats = stats.with_observed_exercise(legs_session(0.7), exercise("lunge", 0.7));
  stats = stats.with_observed_exercise(legs_session(0.7), exercise("lunge", 0.7));

  assert(stats.examples() == stats.examples());
  assert(stats.examples(std::vector<std::string>{"legs"}, 0.7) ==
         stats.examples(std::vector<std::string>{"legs"}, 0.7));
  assert(lift::ExerciseStatistics{}.examples().size() == 37);
}

void test_transition_table() {
  const lift::ViewMode idle = lift::IdleMode{};
  const lift::ViewMode in_session = lift::InSessionMode{"S1", legs_session(0.7)};

  auto step = lift::transition(idle, lift::SessionStarted{"S1", legs_session(0.7)});
  assert(step.next == in_session);
  assert(step.effect == lift::FoldEffect::None);

  step = lift::transition(idle, lift::SuggestionsSet{});
  assert(step.next == idle && step.effect == lift::FoldEffect::ReplaceSuggestions);

  step = lift::transition(idle, lift::ExerciseObserved{"S1", std::nullopt, exercise("squat", 0.7)});
  assert(step.next == idle && step.effect == lift::FoldEffect::Ignored);

  step = lift::transition(idle, lift::SessionEnded{"S1"});
  assert(step.next == idle && step.effect == lift::FoldEffect::Ignored);

  step = lift::transition(in_session, lift::ExerciseObserved{"S1", std::nullopt, exercise("squat", 0.7)});
  assert(step.next == in_session && step.effect == lift::FoldEffect::RecordExercise);

  step = lift::transition(in_session, lift::SessionEnded{"S1"});
  assert(step.next == idle && step.effect == lift::FoldEffect::None);

  step = lift::transition(in_session, lift::SuggestionsSet{});
  assert(step.next == in_session && step.effect == lift::FoldEffect::ReplaceSuggestions);

  step = lift::transition(in_session, lift::SessionStarted{"S2", legs_session(0.2)});
  assert(step.next == in_session && step.effect == lift::FoldEffect::Ignored);

  step = lift::transition(in_session, lift::UnrecognizedEvent{"WorkoutShared"});
  assert(step.next == in_session && step.effect == lift::FoldEffect::Ignored);
}

void test_view_squat_scenario() {
  lift::ExerciseView view(lift::UserId{"user-1"});
  for (const auto& event : squat_session_events()) {
    assert(view.apply(event).ok);
  }

  assert(!view.in_session());
  assert(view.last_sequence_nr() == 4);
  assert(view.statistics().size() == 1);
  const lift::StatEntry& row = view.statistics().rows().front();
  assert(row.key == "legs");
  assert(row.intended_intensity == 0.7);
  assert(row.count == 2);
  assert(row.exercise.name == "squat");

  const auto reply = view.handle(lift::ExamplesQuery{std::nullopt, std::vector<std::string>{"legs"}});
  assert(reply.ok);
  const std::vector<std::string> expected = {"squat", "leg curl", "leg extension", "leg press", "lunge"};
  assert(names_of(reply.examples) == expected);

  // The session is over, so a session-scoped request no longer has examples.
  const auto ended = view.handle(lift::ExamplesQuery{"S1", std::nullopt});
  assert(!ended.ok);
  assert(ended.message == lift::kNoExamplesMessage);
  assert(ended.examples.empty());
}

void test_view_session_queries_match_strictly() {
  lift::ExerciseView view(lift::UserId{"user-2"});
  assert(!view.examples_for_session("S1").ok);
  assert(view.handle(lift::ExamplesQuery{}).ok);
  assert(view.handle(lift::ExamplesQuery{}).examples.size() == 37);

  assert(view.apply(envelope(1, lift::SessionStarted{"S1", legs_session(0.7)})).ok);
  assert(view.apply(envelope(2, lift::ExerciseObserved{"S1", std::string{"wrist"}, exercise("lunge", 0.7)})).ok);
  assert(view.active_session() == std::optional<lift::SessionId>{"S1"});

  const auto other = view.handle(lift::ExamplesQuery{"S2", std::vector<std::string>{"legs"}});
  assert(!other.ok);
  assert(other.message == lift::kNoExamplesMessage);

  const auto active = view.handle(lift::ExamplesQuery{"S1", std::nullopt});
  assert(active.ok);
  assert(active.examples.front().name == "lunge");
  assert(active.examples.size() == 5);
}

void test_view_suggestions_replace_wholesale() {
  lift::ExerciseView view(lift::UserId{"user-3"});
  assert(view.handle(lift::SuggestionsQuery{}).suggestions.empty());

  const lift::SuggestionSet first = {
      {.date_unix = 1700086400, .source = "a", .muscle_group_keys = {"legs"}, .intended_intensity = 0.6},
      {.date_unix = 1700172800, .source = "b", .muscle_group_keys = {"arms", "chest"}, .intended_intensity = 0.8},
  };
  const lift::SuggestionSet second = {
      {.date_unix = 1700259200, .source = "c", .muscle_group_keys = {"back"}, .intended_intensity = 0.5},
  };

  assert(view.apply(envelope(1, lift::SuggestionsSet{first})).ok);
  assert(view.handle(lift::SuggestionsQuery{}).suggestions == first);

  assert(view.apply(envelope(2, lift::SessionStarted{"S1", legs_session(0.7)})).ok);
  assert(view.apply(envelope(3, lift::SuggestionsSet{second})).ok);
  const auto reply = view.handle(lift::SuggestionsQuery{});
  assert(reply.ok);
  assert(reply.suggestions == second);
  assert(view.in_session());
}

void test_view_ignores_transient_and_unknown_events() {
  lift::ExerciseView view(lift::UserId{"user-4"});

  lift::EventEnvelope transient = envelope(1, lift::SessionStarted{"S1", legs_session(0.7)});
  transient.persistent = false;
  assert(view.apply(transient).ok);
  assert(!view.in_session());
  assert(view.last_sequence_nr() == 0);

  assert(view.apply(envelope(1, lift::UnrecognizedEvent{"WorkoutShared"})).ok);
  assert(view.apply(envelope(2, lift::ExerciseObserved{"S0", std::nullopt, exercise("squat", 0.7)})).ok);
  assert(view.statistics().empty());
  assert(view.last_sequence_nr() == 2);
  assert(view.ignored_event_count() == 3);

  assert(view.apply(envelope(3, lift::SessionStarted{"S1", legs_session(0.7)})).ok);
  assert(view.apply(envelope(4, lift::SessionStarted{"S2", legs_session(0.3)})).ok);
  assert(view.active_session() == std::optional<lift::SessionId>{"S1"});
}

void test_view_rejects_inconsistent_replay() {
  lift::ExerciseView view(lift::UserId{"user-5"});
  assert(view.apply(envelope(1, lift::SessionStarted{"S1", legs_session(0.7)})).ok);

  // Gap in the stream.
  const lift::Result gap = view.apply(envelope(3, lift::SessionEnded{"S1"}));
  assert(!gap.ok);
  assert(view.in_session());
  assert(view.last_sequence_nr() == 1);

  // Known kind with a malformed payload.
  lift::EventEnvelope broken = envelope(2, lift::ExerciseObserved{"S1", std::nullopt, exercise("squat", 0.7)});
  broken.payload = lift::util::canonical_join({{"session_id", "S1"}, {"exercise_name", "squat"},
                                               {"exercise_intensity", "heavy"}});
  const lift::Result malformed = view.apply(broken);
  assert(!malformed.ok);
  assert(view.statistics().empty());
  assert(view.last_sequence_nr() == 1);
}

void test_fold_is_deterministic_and_resumable() {
  std::vector<lift::EventEnvelope> events = squat_session_events();
  events.push_back(envelope(5, lift::SuggestionsSet{{{.date_unix = 1, .source = "x"}}}));
  events.push_back(envelope(6, lift::SessionStarted{"S2", legs_session(0.3)}));
  events.push_back(envelope(7, lift::ExerciseObserved{"S2", std::nullopt, exercise("lunge", 0.3)}));

  lift::ExerciseView first(lift::UserId{"user-6"});
  lift::ExerciseView second(lift::UserId{"user-6"});
  for (const auto& event : events) {
    assert(first.apply(event).ok);
    assert(second.apply(event).ok);
  }
  assert(first.same_state_as(second));

  lift::ExerciseView resumed(lift::UserId{"user-6"});
  for (std::size_t i = 0; i < 3; ++i) {
    assert(resumed.apply(events[i]).ok);
  }
  assert(!resumed.same_state_as(first));
  for (std::size_t i = 3; i < events.size(); ++i) {
    assert(resumed.apply(events[i]).ok);
  }
  assert(resumed.same_state_as(first));
  assert(resumed.examples_for_session("S2").ok);
}

void test_event_codec() {
  const lift::ExerciseObserved observed{
      "S9", std::string{"device=watch"},
      {.name = "row", .intensity = 0.45, .metadata = std::string{"set=3"}}};
  const lift::DecodedEvent decoded = lift::decode_event(envelope(1, observed));
  assert(decoded.status.ok);
  const auto* back = std::get_if<lift::ExerciseObserved>(&decoded.event);
  assert(back != nullptr);
  assert(back->session_id == "S9");
  assert(back->metadata == std::optional<std::string>{"device=watch"});
  assert(back->exercise == observed.exercise);

  lift::EventEnvelope unknown{.sequence_nr = 1, .kind = "WorkoutShared", .unix_ts = 0, .payload = "x=1\n"};
  const lift::DecodedEvent unknown_decoded = lift::decode_event(unknown);
  assert(unknown_decoded.status.ok);
  assert(std::holds_alternative<lift::UnrecognizedEvent>(unknown_decoded.event));

  lift::EventEnvelope missing{.sequence_nr = 1, .kind = "SessionEnded", .unix_ts = 0, .payload = ""};
  assert(!lift::decode_event(missing).status.ok);
}

void test_shard_router_is_pure() {
  const lift::UserId user{"8a3c1f0e-5b1d-4a4e-9d42-6f1f2b7c9e01"};
  const lift::UserRequest examples = lift::UserExamplesRequest{.user_id = user, .session_id = "S1"};
  const lift::UserRequest suggestions = lift::UserSuggestionsRequest{.user_id = user};

  const lift::RouteKey a = lift::route(examples);
  const lift::RouteKey b = lift::route(suggestions);
  assert(a == b);
  assert(a.entity_id == user.value);
  assert(a == lift::route(examples));

  for (int i = 0; i < 200; ++i) {
    const lift::UserId other{"user-" + std::to_string(i)};
    const std::uint32_t shard = lift::shard_index_for(other);
    assert(shard < lift::kDefaultShardCount);
    assert(shard == lift::shard_index_for(other));
    assert(lift::shard_id_for(lift::UserSuggestionsRequest{other}) == std::to_string(shard));
  }

  assert(lift::shard_id_for(suggestions, 1) == "0");
  assert(lift::shard_id_for(suggestions, 0) == "0");

  const lift::RoutedQuery routed = lift::extract_query(examples);
  assert(routed.entity_id == user.value);
  assert(std::get<lift::ExamplesQuery>(routed.query).session_id == std::optional<lift::SessionId>{"S1"});
  assert(std::holds_alternative<lift::SuggestionsQuery>(lift::extract_query(suggestions).query));
}

void test_journal_append_and_read() {
  const auto dir = temp_dir("journal");
  lift::util::DiagnosticsLog diagnostics;
  diagnostics.open((dir / "diagnostics.log").string());

  lift::EventJournal journal;
  assert(journal.open((dir / "journal").string(), &diagnostics).ok);

  const std::string stream = lift::persistence_id_for(lift::UserId{"user-7"});
  assert(journal.highest_sequence_nr(stream) == 0);
  const lift::JournalRead empty = journal.read_since(stream, 0);
  assert(empty.status.ok && empty.events.empty());

  for (const auto& event : squat_session_events()) {
    const lift::DecodedEvent decoded = lift::decode_event(event);
    assert(journal.append(stream, decoded.event, event.unix_ts).ok);
  }
  assert(journal.highest_sequence_nr(stream) == 4);

  const lift::JournalRead all = journal.read_since(stream, 0);
  assert(all.status.ok);
  assert(all.events.size() == 4);
  assert(all.events.front().sequence_nr == 1);
  assert(all.events.back().kind == "SessionEnded");

  const lift::JournalRead tail = journal.read_since(stream, 2);
  assert(tail.events.size() == 2);
  assert(tail.events.front().sequence_nr == 3);

  {
    std::ofstream out(journal.stream_path(stream), std::ios::out | std::ios::app);
    out << "5\tSessionEnded\t0\tdeadbeef\tnot-a-digest\n";
  }
  const lift::JournalRead corrupt = journal.read_since(stream, 0);
  assert(!corrupt.status.ok);
  assert(corrupt.events.empty());
  assert(diagnostics.record_count() == 1);
  assert(std::filesystem::exists(dir / "diagnostics.log"));
}

void test_host_rebuild_refresh_and_eviction() {
  const auto dir = temp_dir("host");
  lift::EventJournal journal;
  assert(journal.open((dir / "journal").string()).ok);

  const lift::ViewConfig config = lift::normalize_view_config({
      .data_dir = dir.string(),
      .shard_count = 10,
      .refresh_interval_ms = 1000,
      .idle_timeout_seconds = 360,
  });
  lift::ViewHost host(journal, config);

  const lift::UserId user{"user-8"};
  const std::string stream = lift::persistence_id_for(user);
  for (const auto& event : squat_session_events()) {
    assert(journal.append(stream, event).ok);
  }

  const auto t0 = lift::ViewHost::Clock::now();
  const auto first = host.get_examples({.user_id = user, .muscle_group_keys = std::vector<std::string>{"legs"}}, t0);
  assert(first.ok);
  assert(first.examples.front().name == "squat");
  assert(host.is_live(user.value));
  assert(host.last_sequence_nr(user.value) == std::optional<std::uint64_t>{4});

  // New events are invisible until the next refresh.
  assert(journal.append(stream, lift::SessionStarted{"S2", legs_session(0.7)}, 0).ok);
  assert(journal.append(stream, lift::ExerciseObserved{"S2", std::nullopt, exercise("lunge", 0.7)}, 0).ok);
  assert(!host.get_examples({.user_id = user, .session_id = "S2"}, t0).ok);

  assert(host.refresh_tick().ok);
  const auto session = host.get_examples({.user_id = user, .session_id = "S2"}, t0);
  assert(session.ok);
  assert(session.examples.front().name == "lunge");
  assert(host.last_sequence_nr(user.value) == std::optional<std::uint64_t>{6});

  assert(host.evict_idle(t0 + std::chrono::seconds(359)) == 0);
  assert(host.evict_idle(t0 + std::chrono::seconds(360)) == 1);
  assert(!host.is_live(user.value));

  // A later request recreates the view from the full stream.
  const auto t1 = t0 + std::chrono::seconds(400);
  const auto rebuilt = host.get_examples({.user_id = user, .session_id = "S2"}, t1);
  assert(rebuilt.ok);
  assert(rebuilt.examples.front().name == "lunge");

  const lift::HostStatus status = host.status();
  assert(status.live_entities == 1);
  assert(status.created_entities == 2);
  assert(status.evictions == 1);
  assert(status.refresh_ticks == 1);
  assert(status.replay_failures == 0);
}

void test_host_discards_inconsistent_views() {
  const auto dir = temp_dir("host-corrupt");
  lift::util::DiagnosticsLog diagnostics;
  diagnostics.open((dir / "diagnostics.log").string());
  lift::EventJournal journal;
  assert(journal.open((dir / "journal").string(), &diagnostics).ok);

  lift::ViewHost host(journal, lift::normalize_view_config({.data_dir = dir.string()}), &diagnostics);

  const lift::UserId user{"user-9"};
  const std::string stream = lift::persistence_id_for(user);
  assert(journal.append(stream, lift::SessionStarted{"S1", legs_session(0.5)}, 0).ok);
  assert(host.get_suggestions({.user_id = user}).ok);

  {
    std::ofstream out(journal.stream_path(stream), std::ios::out | std::ios::app);
    out << "broken line\n";
  }

  assert(!host.refresh_tick().ok);
  assert(!host.is_live(user.value));
  assert(host.status().replay_failures == 1);

  const auto retry = host.get_examples({.user_id = user});
  assert(!retry.ok);
  assert(!host.is_live(user.value));
  assert(host.status().replay_failures == 2);

  assert(!host.get_examples({.user_id = lift::UserId{}}).ok);
}

void test_host_background_refresh() {
  const auto dir = temp_dir("host-background");
  lift::EventJournal journal;
  assert(journal.open((dir / "journal").string()).ok);

  lift::ViewHost host(journal, lift::normalize_view_config({.data_dir = dir.string(), .refresh_interval_ms = 20}));
  const lift::UserId user{"user-10"};
  const std::string stream = lift::persistence_id_for(user);

  assert(host.get_suggestions({.user_id = user}).suggestions.empty());
  assert(host.start().ok);
  assert(host.status().background_running);

  const lift::SuggestionSet set = {{.date_unix = 1, .source = "planner", .muscle_group_keys = {"core"}}};
  assert(journal.append(stream, lift::SuggestionsSet{set}, 0).ok);

  bool refreshed = false;
  for (int i = 0; i < 200 && !refreshed; ++i) {
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
    refreshed = host.get_suggestions({.user_id = user}).suggestions == set;
  }
  assert(refreshed);

  host.stop();
  assert(!host.status().background_running);
  assert(host.status().refresh_ticks >= 1);
}

void test_config_loading() {
  const auto dir = temp_dir("config");
  const auto path = dir / "lift-stats.conf";
  {
    std::ofstream out(path);
    out << "# lift-stats node\n";
    out << "data_dir = " << (dir / "data").string() << "\n";
    out << "shard_count = 16\n";
    out << "refresh_interval_ms = 1\n";
    out << "idle_timeout_seconds = 120\n";
    out << "unknown_key = ignored\n";
  }

  const auto loaded = lift::load_view_config(path.string());
  assert(loaded.has_value());
  assert(loaded->shard_count == 16);
  assert(loaded->idle_timeout_seconds == 120);

  const lift::ViewConfig config = lift::normalize_view_config(*loaded);
  assert(config.refresh_interval_ms == 10);
  assert(config.journal_dir == (dir / "data" / "journal").string());
  assert(config.diagnostics_log == (dir / "data" / "diagnostics.log").string());

  assert(!lift::load_view_config((dir / "missing.conf").string()).has_value());
  assert(lift::normalize_view_config({.shard_count = 0}).shard_count == 1);
}

void test_core_api_flow() {
  const auto dir = temp_dir("core-api");
  lift::CoreApi api;
  assert(!api.get_examples({.user_id = lift::UserId{"user-11"}}).ok);

  const lift::Result init = api.init({.data_dir = dir.string(), .shard_count = 4, .refresh_interval_ms = 50});
  assert(init.ok);
  assert(api.muscle_groups().size() == 7);

  const lift::UserId user{"user-11"};
  const std::string stream = lift::persistence_id_for(user);
  assert(api.journal().append(stream, lift::SessionStarted{"S1", legs_session(0.7)}, 1).ok);
  assert(api.journal().append(stream, lift::ExerciseObserved{"S1", std::nullopt, exercise("squat", 0.7)}, 2).ok);

  const auto session = api.get_examples({.user_id = user, .session_id = "S1"});
  assert(session.ok);
  assert(session.examples.front().name == "squat");

  const lift::RouteKey key = api.route(lift::UserSuggestionsRequest{user});
  assert(key.entity_id == "user-11");
  assert(key.shard_id == lift::shard_id_for(lift::UserSuggestionsRequest{user}, 4));

  assert(api.journal().append(stream, lift::SessionEnded{"S1"}, 3).ok);
  assert(api.tick().ok);
  assert(!api.get_examples({.user_id = user, .session_id = "S1"}).ok);

  assert(api.start_background().ok);
  api.stop_background();
  assert(api.status().live_entities == 1);
  assert(api.status().shard_count == 4);
}

std::string read_file(const std::string& path) {
  std::ifstream in(path, std::ios::in | std::ios::binary);
  return std::string{std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>()};
}

void write_file(const std::string& path, const std::string& content) {
  std::ofstream out(path, std::ios::out | std::ios::binary | std::ios::trunc);
  out << content;
}

void test_duplicate_muscle_group_keys_count_once() {
  const lift::SessionProperties doubled{.start_unix = 0, .muscle_group_keys = {"legs", "legs"}, .intended_intensity = 0.7};

  lift::ExerciseStatistics stats;
  for (int i = 0; i < 3; ++i) {
    stats = stats.with_observed_exercise(doubled, exercise("squat", 0.7));
  }
  assert(stats.size() == 1);
  assert(stats.total_count() == 3);

  lift::EventEnvelope started{.sequence_nr = 1, .kind = "SessionStarted", .unix_ts = 0};
  started.payload = lift::util::canonical_join(
      {{"session_id", "S1"}, {"muscle_group_keys", "legs,core,legs"}, {"intended_intensity", "0.7"}});
  const lift::DecodedEvent decoded = lift::decode_event(started);
  assert(decoded.status.ok);
  const auto& keys = std::get<lift::SessionStarted>(decoded.event).properties.muscle_group_keys;
  assert((keys == std::vector<std::string>{"legs", "core"}));

  lift::ExerciseView view(lift::UserId{"user-12"});
  assert(view.apply(started).ok);
  for (std::uint64_t seq = 2; seq <= 4; ++seq) {
    assert(view.apply(envelope(seq, lift::ExerciseObserved{"S1", std::nullopt, exercise("squat", 0.7)})).ok);
  }
  assert(view.statistics().size() == 2);
  assert(view.statistics().rows()[0].count == 3);
  assert(view.statistics().rows()[1].count == 1);
}

void test_non_finite_intensities_fail_replay() {
  assert(!lift::util::parse_double("nan").has_value());
  assert(!lift::util::parse_double("inf").has_value());
  assert(!lift::util::parse_double("-inf").has_value());
  assert(lift::util::parse_double("1e300").has_value());
  assert(lift::util::parse_double(" 0.25 ") == std::optional<double>{0.25});

  lift::ExerciseView view(lift::UserId{"user-13"});

  lift::EventEnvelope started{.sequence_nr = 1, .kind = "SessionStarted", .unix_ts = 0};
  started.payload = lift::util::canonical_join(
      {{"session_id", "S1"}, {"muscle_group_keys", "legs"}, {"intended_intensity", "nan"}});
  assert(!lift::decode_event(started).status.ok);
  assert(!view.apply(started).ok);
  assert(!view.in_session());
  assert(view.last_sequence_nr() == 0);

  assert(view.apply(envelope(1, lift::SessionStarted{"S1", legs_session(0.7)})).ok);
  lift::EventEnvelope observed{.sequence_nr = 2, .kind = "ExerciseObserved", .unix_ts = 0};
  observed.payload = lift::util::canonical_join(
      {{"session_id", "S1"}, {"exercise_name", "squat"}, {"exercise_intensity", "inf"}});
  assert(!view.apply(observed).ok);
  assert(view.statistics().empty());
  assert(view.last_sequence_nr() == 1);
}

void test_journal_skips_record_in_progress() {
  const auto dir = temp_dir("journal-partial");
  lift::EventJournal journal;
  assert(journal.open((dir / "journal").string()).ok);
  lift::ViewHost host(journal, lift::normalize_view_config({.data_dir = dir.string()}));

  const lift::UserId user{"user-14"};
  const std::string stream = lift::persistence_id_for(user);
  assert(journal.append(stream, lift::SessionStarted{"S1", legs_session(0.7)}, 1).ok);
  assert(host.get_examples({.user_id = user, .session_id = "S1"}).ok);

  assert(journal.append(stream, lift::ExerciseObserved{"S1", std::nullopt, exercise("squat", 0.7)}, 2).ok);
  const std::string path = journal.stream_path(stream);
  const std::string complete = read_file(path);
  const std::size_t last_line = complete.rfind('\n', complete.size() - 2U) + 1U;
  const std::size_t cut = last_line + (complete.size() - last_line) / 2U;
  write_file(path, complete.substr(0, cut));

  // Half a record is still being written: nothing is read past the last newline.
  const lift::JournalRead partial = journal.read_since(stream, 0);
  assert(partial.status.ok);
  assert(partial.events.size() == 1);
  assert(partial.next.byte_offset == last_line);
  assert(journal.highest_sequence_nr(stream) == 1);

  assert(host.refresh_tick().ok);
  assert(host.is_live(user.value));
  assert(host.last_sequence_nr(user.value) == std::optional<std::uint64_t>{1});
  assert(host.status().replay_failures == 0);

  write_file(path, complete);
  assert(host.refresh_tick().ok);
  assert(host.last_sequence_nr(user.value) == std::optional<std::uint64_t>{2});
  const auto session = host.get_examples({.user_id = user, .session_id = "S1"});
  assert(session.ok);
  assert(session.examples.front().name == "squat");
}

void test_journal_resumes_from_cursor() {
  const auto dir = temp_dir("journal-cursor");
  lift::util::DiagnosticsLog diagnostics;
  diagnostics.open((dir / "diagnostics.log").string());
  lift::EventJournal journal;
  assert(journal.open((dir / "journal").string(), &diagnostics).ok);

  const std::string stream = lift::persistence_id_for(lift::UserId{"user-15"});
  for (const auto& event : squat_session_events()) {
    assert(journal.append(stream, event).ok);
  }

  const lift::JournalRead first = journal.read_since(stream, 0);
  assert(first.status.ok);
  assert(first.next.sequence_nr == 4);
  assert(first.next.byte_offset == std::filesystem::file_size(journal.stream_path(stream)));

  const lift::JournalRead nothing_new = journal.read_from(stream, first.next);
  assert(nothing_new.status.ok);
  assert(nothing_new.events.empty());
  assert(nothing_new.next == first.next);

  assert(journal.append(stream, lift::SessionStarted{"S2", legs_session(0.3)}, 5).ok);
  assert(journal.append(stream, lift::ExerciseObserved{"S2", std::nullopt, exercise("lunge", 0.3)}, 6).ok);
  const lift::JournalRead resumed = journal.read_from(stream, first.next);
  assert(resumed.status.ok);
  assert(resumed.events.size() == 2);
  assert(resumed.events.front().sequence_nr == 5);
  assert(resumed.next.sequence_nr == 6);
  assert(resumed.next.byte_offset == std::filesystem::file_size(journal.stream_path(stream)));

  const lift::JournalRead full = journal.read_since(stream, 4);
  assert(full.events.size() == resumed.events.size());
  assert(full.next == resumed.next);

  // A cursor inside a record, or one whose sequence does not line up, is rejected.
  assert(!journal.read_from(stream, {4, first.next.byte_offset - 3U}).status.ok);
  assert(!journal.read_from(stream, {3, first.next.byte_offset}).status.ok);
  assert(diagnostics.record_count() == 2);
}

void test_host_refresh_reads_only_new_records() {
  const auto dir = temp_dir("host-incremental");
  lift::EventJournal journal;
  assert(journal.open((dir / "journal").string()).ok);
  lift::ViewHost host(journal, lift::normalize_view_config({.data_dir = dir.string()}));

  const lift::UserId user{"user-16"};
  const std::string stream = lift::persistence_id_for(user);
  for (const auto& event : squat_session_events()) {
    assert(journal.append(stream, event).ok);
  }
  const auto t0 = lift::ViewHost::Clock::now();
  assert(host.get_suggestions({.user_id = user}, t0).ok);

  // Flip one digest character of the first record, keeping every offset intact.
  const std::string path = journal.stream_path(stream);
  std::string content = read_file(path);
  const std::size_t digest_end = content.find('\n', content.find('\n') + 1U) - 1U;
  content[digest_end] = content[digest_end] == '0' ? '1' : '0';
  write_file(path, content);

  assert(journal.append(stream, lift::SessionStarted{"S2", legs_session(0.7)}, 5).ok);
  assert(host.refresh_tick().ok);
  assert(host.last_sequence_nr(user.value) == std::optional<std::uint64_t>{5});
  assert(host.get_examples({.user_id = user, .session_id = "S2"}, t0).ok);

  // A rebuild after eviction reads the stream from the start and hits the damage.
  assert(host.evict_idle(t0 + std::chrono::seconds(360)) == 1);
  assert(!host.get_suggestions({.user_id = user}).ok);
  assert(host.status().replay_failures == 1);
}

void test_journal_rejects_unsafe_stream_names() {
  const auto dir = temp_dir("journal-names");
  lift::EventJournal journal;
  assert(journal.open((dir / "journal").string()).ok);

  const lift::SessionEnded ended{"S1"};
  assert(!journal.append("user-exercises-../../escape", ended, 0).ok);
  assert(!journal.append("nested/stream", ended, 0).ok);
  assert(!journal.append("..", ended, 0).ok);
  assert(!journal.append(std::string{"bad\nname"}, ended, 0).ok);
  assert(!journal.read_since("nested/stream", 0).status.ok);
  assert(journal.highest_sequence_nr("nested/stream") == 0);
  assert(journal.append("user-exercises-user.17", ended, 0).ok);

  lift::ViewHost host(journal, lift::normalize_view_config({.data_dir = dir.string()}));
  assert(!host.get_examples({.user_id = lift::UserId{"../../escape"}}).ok);
  assert(!std::filesystem::exists(dir / "escape.log"));
  assert(!std::filesystem::exists(dir / "journal" / "user-exercises-.."));
}

}  // namespace

int main() {
  test_catalog_entries();
  test_intensity_closeness();
  test_statistics_counts_every_observation();
  test_statistics_update_leaves_receiver_untouched();
  test_statistics_multi_group_first_match_wins();
  test_ranked_examples_least_counted_first();
  test_ranked_examples_mean_intensity();
  test_ranked_examples_filters_and_uniqueness();
  test_ranked_examples_is_repeatable();
  test_transition_table();
  test_view_squat_scenario();
  test_view_session_queries_match_strictly();
  test_view_suggestions_replace_wholesale();
  test_view_ignores_transient_and_unknown_events();
  test_view_rejects_inconsistent_replay();
  test_fold_is_deterministic_and_resumable();
  test_event_codec();
  test_shard_router_is_pure();
  test_journal_append_and_read();
  test_host_rebuild_refresh_and_eviction();
  test_host_discards_inconsistent_views();
  test_host_background_refresh();
  test_config_loading();
  test_core_api_flow();
  test_duplicate_muscle_group_keys_count_once();
  test_non_finite_intensities_fail_replay();
  test_journal_skips_record_in_progress();
  test_journal_resumes_from_cursor();
  test_host_refresh_reads_only_new_records();
  test_journal_rejects_unsafe_stream_names();

  std::cout << "lift_stats_unit_tests passed\n";
  return 0;
}
