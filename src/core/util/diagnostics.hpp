#pragma once

#include <cstdint>
#include <mutex>
#include <string>
#include <string_view>

namespace lift::util {

// Append-only "unix_ts TAB subject TAB message" log shared by the journal and
// the view host. An empty path disables writing but still counts records.
class DiagnosticsLog {
public:
  void open(std::string_view path);
  void record(std::string_view subject, std::string_view message);

  [[nodiscard]] std::string path() const;
  [[nodiscard]] std::uint64_t record_count() const;

private:
  mutable std::mutex mutex_;
  std::string path_;
  std::uint64_t record_count_ = 0;
};

}  // namespace lift::util
