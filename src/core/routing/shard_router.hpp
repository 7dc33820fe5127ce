#pragma once

#include <cstdint>
#include <string>

#include "core/model/requests.hpp"
#include "core/model/types.hpp"

namespace lift {

inline constexpr std::uint32_t kDefaultShardCount = 10;

struct RouteKey {
  std::string entity_id;
  std::string shard_id;

  friend bool operator==(const RouteKey&, const RouteKey&) = default;
};

struct RoutedQuery {
  std::string entity_id;
  ViewQuery query;
};

// Pure placement functions. The shard is derived from the user id alone
// through a process-independent digest, so every host agrees on it.
const UserId& request_user(const UserRequest& request);

std::string entity_id_for(const UserRequest& request);
std::uint32_t shard_index_for(const UserId& user_id, std::uint32_t shard_count = kDefaultShardCount);
std::string shard_id_for(const UserRequest& request, std::uint32_t shard_count = kDefaultShardCount);

RouteKey route(const UserRequest& request, std::uint32_t shard_count = kDefaultShardCount);

// Splits a user request into the owning entity and the message it receives.
RoutedQuery extract_query(const UserRequest& request);

}  // namespace lift
