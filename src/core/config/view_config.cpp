#include "core/config/view_config.hpp"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <limits>
#include <string>
#include <unordered_map>

#include "core/util/canonical.hpp"

namespace lift {
namespace {

constexpr std::uint64_t kMinRefreshIntervalMs = 10;
constexpr std::uint64_t kMinIdleTimeoutSeconds = 1;

std::uint64_t parse_uint64_default(const std::unordered_map<std::string, std::string>& fields,
                                   const std::string& key, std::uint64_t fallback) {
  const auto it = fields.find(key);
  if (it == fields.end()) {
    return fallback;
  }
  return util::parse_uint64(it->second).value_or(fallback);
}

}  // namespace

std::optional<ViewConfig> load_view_config(std::string_view path, const ViewConfig& base) {
  std::ifstream in(std::string{path});
  if (!in) {
    return std::nullopt;
  }

  std::unordered_map<std::string, std::string> fields;
  std::string line;
  while (std::getline(in, line)) {
    const std::string trimmed = util::trim_copy(line);
    if (trimmed.empty() || trimmed.front() == '#') {
      continue;
    }

    const auto split = trimmed.find('=');
    if (split == std::string::npos) {
      continue;
    }

    const std::string key = util::trim_copy(trimmed.substr(0, split));
    const std::string value = util::trim_copy(trimmed.substr(split + 1));
    fields[key] = value;
  }

  ViewConfig config = base;
  if (fields.contains("data_dir") && !fields["data_dir"].empty()) {
    config.data_dir = fields["data_dir"];
  }
  if (fields.contains("journal_dir")) {
    config.journal_dir = fields["journal_dir"];
  }
  if (fields.contains("diagnostics_log")) {
    config.diagnostics_log = fields["diagnostics_log"];
  }
  config.shard_count = static_cast<std::uint32_t>(std::min<std::uint64_t>(
      parse_uint64_default(fields, "shard_count", config.shard_count), std::numeric_limits<std::uint32_t>::max()));
  config.refresh_interval_ms = parse_uint64_default(fields, "refresh_interval_ms", config.refresh_interval_ms);
  config.idle_timeout_seconds = parse_uint64_default(fields, "idle_timeout_seconds", config.idle_timeout_seconds);
  return config;
}

ViewConfig normalize_view_config(ViewConfig config) {
  if (config.data_dir.empty()) {
    config.data_dir = ViewConfig{}.data_dir;
  }
  if (config.journal_dir.empty()) {
    config.journal_dir = (std::filesystem::path{config.data_dir} / "journal").string();
  }
  if (config.diagnostics_log.empty()) {
    config.diagnostics_log = (std::filesystem::path{config.data_dir} / "diagnostics.log").string();
  }
  config.shard_count = std::max<std::uint32_t>(1, config.shard_count);
  config.refresh_interval_ms = std::max(kMinRefreshIntervalMs, config.refresh_interval_ms);
  config.idle_timeout_seconds = std::max(kMinIdleTimeoutSeconds, config.idle_timeout_seconds);
  return config;
}

}  // namespace lift
