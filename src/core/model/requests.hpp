#pragma once

#include <optional>
#include <variant>
#include <vector>

#include "core/model/types.hpp"

namespace lift {

// Requests as they arrive at the placement layer, tagged with the user.
struct UserExamplesRequest {
  UserId user_id;
  std::optional<SessionId> session_id;
  std::optional<std::vector<MuscleGroupKey>> muscle_group_keys;
};

struct UserSuggestionsRequest {
  UserId user_id;
};

using UserRequest = std::variant<UserExamplesRequest, UserSuggestionsRequest>;

// The same requests once delivered to a user's view; the user id is implied.
struct ExamplesQuery {
  std::optional<SessionId> session_id;
  std::optional<std::vector<MuscleGroupKey>> muscle_group_keys;
};

struct SuggestionsQuery {};

using ViewQuery = std::variant<ExamplesQuery, SuggestionsQuery>;

}  // namespace lift
