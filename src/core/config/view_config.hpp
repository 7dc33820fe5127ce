#pragma once

#include <optional>
#include <string_view>

#include "core/model/types.hpp"

namespace lift {

// Reads "key = value" lines over `base`; "#" starts a comment line and unknown
// keys are skipped. Returns nullopt when the file cannot be read.
std::optional<ViewConfig> load_view_config(std::string_view path, const ViewConfig& base = {});

// Fills derived paths and clamps values to their usable ranges.
ViewConfig normalize_view_config(ViewConfig config);

}  // namespace lift
