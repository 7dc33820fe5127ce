#include <chrono>
#include <iostream>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

#include "core/api/core_api.hpp"
#include "core/config/view_config.hpp"
#include "core/model/app_meta.hpp"

namespace {

constexpr std::size_t kPrintedExamples = 8;

void print_usage() {
  std::cout << "usage: lift_stats_node [--config <file>] <user-id>...\n";
}

void print_user(lift::CoreApi& api, const std::string& user) {
  const lift::UserId user_id{user};
  const lift::RouteKey key = api.route(lift::UserExamplesRequest{.user_id = user_id});
  std::cout << "user " << key.entity_id << " -> shard " << key.shard_id << '\n';

  const lift::ExamplesReply examples = api.get_examples({.user_id = user_id});
  if (!examples.ok) {
    std::cerr << "  examples failed: " << examples.message << '\n';
    return;
  }
  for (std::size_t i = 0; i < examples.examples.size() && i < kPrintedExamples; ++i) {
    const lift::Exercise& exercise = examples.examples[i];
    std::cout << "  " << exercise.name;
    if (exercise.intensity.has_value()) {
      std::cout << " @" << *exercise.intensity;
    }
    std::cout << '\n';
  }

  const lift::SuggestionsReply suggestions = api.get_suggestions({.user_id = user_id});
  std::cout << "  suggestions: " << suggestions.suggestions.size() << '\n';
}

}  // namespace

int main(int argc, char** argv) {
  lift::ViewConfig config{
      .data_dir = "lift-stats-data",
      .shard_count = 10,
      .refresh_interval_ms = 1000,
      .idle_timeout_seconds = 360,
  };

  std::vector<std::string> users;
  for (int i = 1; i < argc; ++i) {
    const std::string_view arg{argv[i]};
    if (arg == "--help" || arg == "-h") {
      print_usage();
      return 0;
    }
    if (arg == "--config") {
      if (i + 1 >= argc) {
        print_usage();
        return 2;
      }
      const auto loaded = lift::load_view_config(argv[++i], config);
      if (!loaded.has_value()) {
        std::cerr << "lift_stats_node: unable to read config file " << argv[i] << '\n';
        return 1;
      }
      config = *loaded;
      continue;
    }
    users.emplace_back(arg);
  }

  lift::CoreApi api;
  const lift::Result init = api.init(config);
  if (!init.ok) {
    std::cerr << "lift_stats_node init failed: " << init.message << '\n';
    return 1;
  }

  std::cout << lift::kAppDisplayName << ' ' << lift::kAppVersion << " (" << lift::kBuildRelease << ")\n";
  std::cout << "journal: " << api.config().journal_dir << ", shards: " << api.config().shard_count << '\n';

  const lift::Result started = api.start_background();
  if (!started.ok) {
    std::cerr << "lift_stats_node: " << started.message << '\n';
    return 1;
  }

  for (const auto& user : users) {
    print_user(api, user);
  }

  std::this_thread::sleep_for(std::chrono::milliseconds(api.config().refresh_interval_ms));
  api.stop_background();

  const lift::HostStatus status = api.status();
  std::cout << "live views: " << status.live_entities << ", refresh ticks: " << status.refresh_ticks
            << ", replay failures: " << status.replay_failures << '\n';
  return 0;
}
