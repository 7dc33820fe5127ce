#pragma once

#include <string_view>

#ifndef LIFT_STATS_APP_VERSION
#define LIFT_STATS_APP_VERSION "0.3.0"
#endif

#ifndef LIFT_STATS_BUILD_RELEASE
#define LIFT_STATS_BUILD_RELEASE "Exercise statistics view"
#endif

namespace lift {

inline constexpr std::string_view kAppDisplayName = "Lift::Exercise Statistics View";
inline constexpr std::string_view kShardRegionName = "user-exercises-statistics";
inline constexpr std::string_view kPersistenceIdPrefix = "user-exercises-";
inline constexpr std::string_view kViewIdPrefix = "user-exercises-statistics-";
inline constexpr std::string_view kAppVersion = LIFT_STATS_APP_VERSION;
inline constexpr std::string_view kBuildRelease = LIFT_STATS_BUILD_RELEASE;

}  // namespace lift
