#include "core/routing/shard_router.hpp"

#include "core/util/hash.hpp"

namespace lift {

const UserId& request_user(const UserRequest& request) {
  if (const auto* examples = std::get_if<UserExamplesRequest>(&request)) {
    return examples->user_id;
  }
  return std::get<UserSuggestionsRequest>(request).user_id;
}

std::string entity_id_for(const UserRequest& request) {
  return request_user(request).value;
}

std::uint32_t shard_index_for(const UserId& user_id, std::uint32_t shard_count) {
  const std::uint32_t buckets = shard_count == 0 ? 1U : shard_count;
  return static_cast<std::uint32_t>(util::stable_hash64(user_id.value) % buckets);
}

std::string shard_id_for(const UserRequest& request, std::uint32_t shard_count) {
  return std::to_string(shard_index_for(request_user(request), shard_count));
}

RouteKey route(const UserRequest& request, std::uint32_t shard_count) {
  return {entity_id_for(request), shard_id_for(request, shard_count)};
}

RoutedQuery extract_query(const UserRequest& request) {
  if (const auto* examples = std::get_if<UserExamplesRequest>(&request)) {
    return {examples->user_id.value, ExamplesQuery{examples->session_id, examples->muscle_group_keys}};
  }
  return {entity_id_for(request), SuggestionsQuery{}};
}

}  // namespace lift
