#include "core/api/core_api.hpp"

#include "core/config/view_config.hpp"
#include "core/util/hash.hpp"

namespace lift {

Result CoreApi::init(const ViewConfig& config) {
  if (host_) {
    host_->stop();
    host_.reset();
  }

  if (!util::ensure_sodium_ready()) {
    return Result::failure("libsodium initialization failed.");
  }

  config_ = normalize_view_config(config);
  diagnostics_.open(config_.diagnostics_log);

  const Result journal = journal_.open(config_.journal_dir, &diagnostics_);
  if (!journal.ok) {
    return journal;
  }

  host_ = std::make_unique<ViewHost>(journal_, config_, &diagnostics_);
  return Result::success("Exercise statistics view initialised.");
}

ExamplesReply CoreApi::get_examples(const UserExamplesRequest& request) {
  if (!host_) {
    return ExamplesReply::failure("Core API is not initialised.");
  }
  return host_->get_examples(request);
}

SuggestionsReply CoreApi::get_suggestions(const UserSuggestionsRequest& request) {
  if (!host_) {
    return SuggestionsReply::failure("Core API is not initialised.");
  }
  return host_->get_suggestions(request);
}

RouteKey CoreApi::route(const UserRequest& request) const {
  return lift::route(request, config_.shard_count);
}

Result CoreApi::tick() {
  if (!host_) {
    return Result::failure("Core API is not initialised.");
  }
  const Result refreshed = host_->refresh_tick();
  (void)host_->evict_idle(ViewHost::Clock::now());
  return refreshed;
}

Result CoreApi::start_background() {
  if (!host_) {
    return Result::failure("Core API is not initialised.");
  }
  return host_->start();
}

void CoreApi::stop_background() {
  if (host_) {
    host_->stop();
  }
}

HostStatus CoreApi::status() const {
  if (!host_) {
    return {};
  }
  return host_->status();
}

std::vector<MuscleGroup> CoreApi::muscle_groups() const {
  return default_catalog().muscle_groups();
}

}  // namespace lift
