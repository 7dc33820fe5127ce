#include "core/util/diagnostics.hpp"

#include <filesystem>
#include <fstream>

#include "core/util/canonical.hpp"

namespace lift::util {

void DiagnosticsLog::open(std::string_view path) {
  const std::lock_guard<std::mutex> lock(mutex_);
  path_ = std::string{path};
  if (path_.empty()) {
    return;
  }

  const std::filesystem::path file_path{path_};
  if (file_path.has_parent_path()) {
    std::error_code ec;
    std::filesystem::create_directories(file_path.parent_path(), ec);
  }
}

void DiagnosticsLog::record(std::string_view subject, std::string_view message) {
  const std::lock_guard<std::mutex> lock(mutex_);
  ++record_count_;
  if (path_.empty()) {
    return;
  }

  std::ofstream out(path_, std::ios::out | std::ios::app);
  if (!out) {
    return;
  }
  out << unix_timestamp_now() << '\t' << subject << '\t' << message << '\n';
}

std::string DiagnosticsLog::path() const {
  const std::lock_guard<std::mutex> lock(mutex_);
  return path_;
}

std::uint64_t DiagnosticsLog::record_count() const {
  const std::lock_guard<std::mutex> lock(mutex_);
  return record_count_;
}

}  // namespace lift::util
