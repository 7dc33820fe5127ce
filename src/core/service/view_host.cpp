#include "core/service/view_host.hpp"

#include <utility>
#include <vector>

namespace lift {

ViewHost::ViewHost(const IEventSource& source, const ViewConfig& config, util::DiagnosticsLog* diagnostics,
                   const ExerciseCatalog* catalog)
    : source_(source), config_(config), diagnostics_(diagnostics), catalog_(catalog) {}

ViewHost::~ViewHost() {
  stop();
}

ExamplesReply ViewHost::get_examples(const UserExamplesRequest& request, Clock::time_point now) {
  const RoutedQuery routed = extract_query(request);
  return deliver<ExamplesReply>(request.user_id, std::get<ExamplesQuery>(routed.query), now);
}

SuggestionsReply ViewHost::get_suggestions(const UserSuggestionsRequest& request, Clock::time_point now) {
  return deliver<SuggestionsReply>(request.user_id, SuggestionsQuery{}, now);
}

RouteKey ViewHost::route(const UserRequest& request) const {
  return lift::route(request, config_.shard_count);
}

template <typename Reply, typename Query>
Reply ViewHost::deliver(const UserId& user_id, const Query& query, Clock::time_point now) {
  if (user_id.empty()) {
    return Reply::failure("Request is missing a user id.");
  }

  const InstancePtr instance = acquire(user_id, now);
  const std::lock_guard<std::mutex> lock(instance->mutex);
  if (instance->failed) {
    return Reply::failure("View for " + user_id.value + " failed and was discarded; retry the request.");
  }

  if (!instance->recovered) {
    const Result recovery = catch_up(*instance);
    if (!recovery.ok) {
      instance->failed = true;
      discard(user_id.value, instance, recovery.message);
      return Reply::failure(recovery.message);
    }
    instance->recovered = true;
  }

  return instance->view.handle(query);
}

ViewHost::InstancePtr ViewHost::acquire(const UserId& user_id, Clock::time_point now) {
  const std::lock_guard<std::mutex> lock(instances_mutex_);
  auto it = instances_.find(user_id.value);
  if (it == instances_.end()) {
    it = instances_.emplace(user_id.value, std::make_shared<ViewInstance>(user_id, catalog_)).first;
    ++created_entities_;
  }
  it->second->last_activity = now;
  return it->second;
}

Result ViewHost::catch_up(ViewInstance& instance) {
  // A fresh instance starts from an empty cursor and so replays the whole stream.
  const JournalRead read = source_.read_from(instance.view.persistence_id(), instance.cursor);
  if (!read.status.ok) {
    return read.status;
  }

  for (const auto& envelope : read.events) {
    const std::uint64_t ignored_before = instance.view.ignored_event_count();
    const Result applied = instance.view.apply(envelope);
    if (!applied.ok) {
      return applied;
    }
    if (instance.view.ignored_event_count() != ignored_before) {
      ++ignored_events_;
    } else {
      ++folded_events_;
    }
  }

  instance.cursor = read.next;
  return Result::success("Caught up to sequence " + std::to_string(instance.view.last_sequence_nr()) + ".");
}

void ViewHost::discard(const std::string& entity_id, const InstancePtr& instance, std::string_view reason) {
  ++replay_failures_;
  if (diagnostics_ != nullptr) {
    diagnostics_->record(entity_id, "view discarded: " + std::string{reason});
  }

  const std::lock_guard<std::mutex> lock(instances_mutex_);
  const auto it = instances_.find(entity_id);
  if (it != instances_.end() && it->second == instance) {
    instances_.erase(it);
  }
}

Result ViewHost::refresh_tick() {
  std::vector<std::pair<std::string, InstancePtr>> live;
  {
    const std::lock_guard<std::mutex> lock(instances_mutex_);
    live.reserve(instances_.size());
    for (const auto& [entity_id, instance] : instances_) {
      live.emplace_back(entity_id, instance);
    }
  }

  std::size_t failures = 0;
  for (const auto& [entity_id, instance] : live) {
    const std::lock_guard<std::mutex> lock(instance->mutex);
    if (instance->failed) {
      continue;
    }

    const Result caught_up = catch_up(*instance);
    if (!caught_up.ok) {
      instance->failed = true;
      discard(entity_id, instance, caught_up.message);
      ++failures;
      continue;
    }
    instance->recovered = true;
  }

  ++refresh_ticks_;
  if (failures > 0) {
    return Result::failure("Refresh discarded " + std::to_string(failures) + " inconsistent views.");
  }
  return Result::success("Refreshed " + std::to_string(live.size()) + " views.");
}

std::size_t ViewHost::evict_idle(Clock::time_point now) {
  const auto idle_window = std::chrono::seconds(config_.idle_timeout_seconds);
  std::size_t evicted = 0;

  const std::lock_guard<std::mutex> lock(instances_mutex_);
  for (auto it = instances_.begin(); it != instances_.end();) {
    const InstancePtr instance = it->second;
    if (now - instance->last_activity < idle_window) {
      ++it;
      continue;
    }

    // An instance whose lock is held is serving a request right now.
    std::unique_lock<std::mutex> busy(instance->mutex, std::try_to_lock);
    if (!busy.owns_lock()) {
      ++it;
      continue;
    }

    if (diagnostics_ != nullptr) {
      diagnostics_->record(it->first, "view evicted after idle window at sequence " +
                                          std::to_string(instance->view.last_sequence_nr()));
    }
    it = instances_.erase(it);
    ++evicted;
  }

  evictions_ += evicted;
  return evicted;
}

Result ViewHost::start() {
  const std::lock_guard<std::mutex> lock(scheduler_mutex_);
  if (scheduler_.joinable()) {
    return Result::success("Refresh scheduler already running.");
  }

  stop_requested_ = false;
  scheduler_ = std::thread([this] { run_scheduler(); });
  return Result::success("Refresh scheduler started.");
}

void ViewHost::stop() {
  {
    const std::lock_guard<std::mutex> lock(scheduler_mutex_);
    stop_requested_ = true;
  }
  scheduler_cv_.notify_all();
  if (scheduler_.joinable()) {
    scheduler_.join();
  }
}

void ViewHost::run_scheduler() {
  const auto interval = std::chrono::milliseconds(config_.refresh_interval_ms);

  std::unique_lock<std::mutex> lock(scheduler_mutex_);
  while (!stop_requested_) {
    if (scheduler_cv_.wait_for(lock, interval, [this] { return stop_requested_; })) {
      break;
    }

    lock.unlock();
    const Result refreshed = refresh_tick();
    if (!refreshed.ok && diagnostics_ != nullptr) {
      diagnostics_->record("refresh", refreshed.message);
    }
    (void)evict_idle(Clock::now());
    lock.lock();
  }
}

bool ViewHost::is_live(std::string_view entity_id) const {
  const std::lock_guard<std::mutex> lock(instances_mutex_);
  return instances_.contains(std::string{entity_id});
}

std::optional<std::uint64_t> ViewHost::last_sequence_nr(std::string_view entity_id) const {
  InstancePtr instance;
  {
    const std::lock_guard<std::mutex> lock(instances_mutex_);
    const auto it = instances_.find(std::string{entity_id});
    if (it == instances_.end()) {
      return std::nullopt;
    }
    instance = it->second;
  }

  const std::lock_guard<std::mutex> lock(instance->mutex);
  return instance->view.last_sequence_nr();
}

HostStatus ViewHost::status() const {
  HostStatus report;
  {
    const std::lock_guard<std::mutex> lock(instances_mutex_);
    report.live_entities = instances_.size();
  }
  {
    const std::lock_guard<std::mutex> lock(scheduler_mutex_);
    report.background_running = scheduler_.joinable();
  }
  report.created_entities = created_entities_.load();
  report.refresh_ticks = refresh_ticks_.load();
  report.evictions = evictions_.load();
  report.replay_failures = replay_failures_.load();
  report.ignored_events = ignored_events_.load();
  report.folded_events = folded_events_.load();
  report.shard_count = config_.shard_count;
  report.refresh_interval_ms = config_.refresh_interval_ms;
  report.idle_timeout_seconds = config_.idle_timeout_seconds;
  report.journal_dir = config_.journal_dir;
  report.diagnostics_log = diagnostics_ != nullptr ? diagnostics_->path() : std::string{};
  return report;
}

}  // namespace lift
