#pragma once

#include <cstdint>
#include <string_view>
#include <vector>

#include "core/model/events.hpp"
#include "core/model/types.hpp"

namespace lift {

// Resume point in one stream: the last sequence number consumed and the byte
// position just past its record.
struct StreamCursor {
  std::uint64_t sequence_nr = 0;
  std::uint64_t byte_offset = 0;

  friend bool operator==(const StreamCursor&, const StreamCursor&) = default;
};

struct JournalRead {
  Result status;
  std::vector<EventEnvelope> events;
  StreamCursor next;
};

// Read side of a per-stream, append-only event log.
class IEventSource {
public:
  virtual ~IEventSource() = default;

  // Events with sequence_nr > after_sequence_nr, in persisted order, read from
  // the start of the stream.
  [[nodiscard]] virtual JournalRead read_since(std::string_view persistence_id,
                                               std::uint64_t after_sequence_nr) const = 0;

  // Events after `cursor`, reading only the bytes past cursor.byte_offset.
  [[nodiscard]] virtual JournalRead read_from(std::string_view persistence_id, const StreamCursor& cursor) const = 0;

  [[nodiscard]] virtual std::uint64_t highest_sequence_nr(std::string_view persistence_id) const = 0;
};

}  // namespace lift
