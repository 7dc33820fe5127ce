#pragma once

#include <memory>
#include <vector>

#include "core/catalog/exercise_catalog.hpp"
#include "core/model/requests.hpp"
#include "core/model/types.hpp"
#include "core/routing/shard_router.hpp"
#include "core/service/view_host.hpp"
#include "core/storage/event_journal.hpp"
#include "core/util/diagnostics.hpp"

namespace lift {

class CoreApi {
public:
  Result init(const ViewConfig& config);

  ExamplesReply get_examples(const UserExamplesRequest& request);
  SuggestionsReply get_suggestions(const UserSuggestionsRequest& request);
  RouteKey route(const UserRequest& request) const;

  Result tick();
  Result start_background();
  void stop_background();

  HostStatus status() const;
  std::vector<MuscleGroup> muscle_groups() const;
  const ViewConfig& config() const { return config_; }

  // Producer side of the journal; the view itself only reads from it.
  EventJournal& journal() { return journal_; }

private:
  ViewConfig config_;
  util::DiagnosticsLog diagnostics_;
  EventJournal journal_;
  std::unique_ptr<ViewHost> host_;
};

}  // namespace lift
