#pragma once

#include <cstdint>
#include <mutex>
#include <string>
#include <string_view>

#include "core/model/events.hpp"
#include "core/model/types.hpp"
#include "core/storage/event_source.hpp"
#include "core/util/diagnostics.hpp"

namespace lift {

// File-backed journal: one "<persistence id>.log" per stream. Each line holds
// sequence_nr, kind, unix_ts, hex payload and a BLAKE2b digest of the rest.
// A trailing line without a newline is an append in progress and is skipped.
class EventJournal final : public IEventSource {
public:
  Result open(std::string_view journal_dir, util::DiagnosticsLog* diagnostics = nullptr);

  // Producer side. Assigns the next sequence number to the envelope.
  Result append(std::string_view persistence_id, const EventEnvelope& event);
  Result append(std::string_view persistence_id, const DomainEvent& event, std::int64_t unix_ts);

  [[nodiscard]] JournalRead read_since(std::string_view persistence_id,
                                       std::uint64_t after_sequence_nr) const override;
  [[nodiscard]] JournalRead read_from(std::string_view persistence_id, const StreamCursor& cursor) const override;
  [[nodiscard]] std::uint64_t highest_sequence_nr(std::string_view persistence_id) const override;

  [[nodiscard]] std::string stream_path(std::string_view persistence_id) const;
  [[nodiscard]] const std::string& journal_dir() const { return journal_dir_; }

private:
  JournalRead read_stream(std::string_view persistence_id, std::uint64_t after_sequence_nr,
                          const StreamCursor& start) const;
  void record_invalid_record(std::string_view persistence_id, std::string_view reason) const;

  std::string journal_dir_;
  util::DiagnosticsLog* diagnostics_ = nullptr;
  mutable std::mutex append_mutex_;
};

}  // namespace lift
