#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <thread>
#include <unordered_map>

#include "core/catalog/exercise_catalog.hpp"
#include "core/model/requests.hpp"
#include "core/model/types.hpp"
#include "core/routing/shard_router.hpp"
#include "core/storage/event_source.hpp"
#include "core/util/diagnostics.hpp"
#include "core/view/exercise_view.hpp"

namespace lift {

// Live ExerciseView instances of one process, serialized per user.
class ViewHost {
public:
  using Clock = std::chrono::steady_clock;

  ViewHost(const IEventSource& source, const ViewConfig& config, util::DiagnosticsLog* diagnostics = nullptr,
           const ExerciseCatalog* catalog = nullptr);
  ~ViewHost();

  ViewHost(const ViewHost&) = delete;
  ViewHost& operator=(const ViewHost&) = delete;

  ExamplesReply get_examples(const UserExamplesRequest& request, Clock::time_point now = Clock::now());
  SuggestionsReply get_suggestions(const UserSuggestionsRequest& request, Clock::time_point now = Clock::now());

  [[nodiscard]] RouteKey route(const UserRequest& request) const;

  // Folds events persisted since each live instance's last sequence number.
  Result refresh_tick();

  // Drops instances idle for at least the configured window. Returns how many.
  std::size_t evict_idle(Clock::time_point now);

  // Background scheduler running refresh_tick() and evict_idle() every
  // refresh interval until stop().
  Result start();
  void stop();

  [[nodiscard]] bool is_live(std::string_view entity_id) const;
  [[nodiscard]] std::optional<std::uint64_t> last_sequence_nr(std::string_view entity_id) const;
  [[nodiscard]] HostStatus status() const;

private:
  struct ViewInstance {
    ViewInstance(UserId user_id, const ExerciseCatalog* catalog) : view(std::move(user_id), catalog) {}

    std::mutex mutex;
    ExerciseView view;
    StreamCursor cursor;
    bool recovered = false;
    bool failed = false;
    Clock::time_point last_activity{};
  };

  using InstancePtr = std::shared_ptr<ViewInstance>;

  template <typename Reply, typename Query>
  Reply deliver(const UserId& user_id, const Query& query, Clock::time_point now);

  InstancePtr acquire(const UserId& user_id, Clock::time_point now);
  Result catch_up(ViewInstance& instance);
  void discard(const std::string& entity_id, const InstancePtr& instance, std::string_view reason);
  void run_scheduler();

  const IEventSource& source_;
  ViewConfig config_;
  util::DiagnosticsLog* diagnostics_ = nullptr;
  const ExerciseCatalog* catalog_ = nullptr;

  mutable std::mutex instances_mutex_;
  std::unordered_map<std::string, InstancePtr> instances_;

  mutable std::mutex scheduler_mutex_;
  std::condition_variable scheduler_cv_;
  bool stop_requested_ = false;
  std::thread scheduler_;

  std::atomic<std::uint64_t> created_entities_{0};
  std::atomic<std::uint64_t> refresh_ticks_{0};
  std::atomic<std::uint64_t> evictions_{0};
  std::atomic<std::uint64_t> replay_failures_{0};
  std::atomic<std::uint64_t> folded_events_{0};
  std::atomic<std::uint64_t> ignored_events_{0};
};

}  // namespace lift
