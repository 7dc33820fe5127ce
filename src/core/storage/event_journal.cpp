#include "core/storage/event_journal.hpp"

#include <algorithm>
#include <array>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <system_error>
#include <utility>

#include "core/util/canonical.hpp"
#include "core/util/hash.hpp"

namespace lift {
namespace {

constexpr std::string_view kStreamFileSuffix = ".log";
constexpr std::string_view kStreamHeader = "# lift-stats journal v1";

std::string record_digest(std::uint64_t sequence_nr, std::string_view kind, std::int64_t unix_ts,
                          std::string_view hex_payload) {
  std::ostringstream material;
  material << sequence_nr << '\t' << kind << '\t' << unix_ts << '\t' << hex_payload;
  return util::blake2b_hex(material.str());
}

std::string serialize_record_line(const EventEnvelope& event) {
  const std::string hex_payload = util::to_hex(event.payload);
  std::ostringstream out;
  out << event.sequence_nr << '\t' << event.kind << '\t' << event.unix_ts << '\t' << hex_payload << '\t'
      << record_digest(event.sequence_nr, event.kind, event.unix_ts, hex_payload) << '\n';
  return out.str();
}

bool parse_record_line(std::string_view line, EventEnvelope& out, std::string& error) {
  std::array<std::string_view, 5> fields{};
  std::size_t field_index = 0;
  std::size_t start = 0;
  for (std::size_t i = 0; i <= line.size(); ++i) {
    if (i == line.size() || line[i] == '\t') {
      if (field_index >= fields.size()) {
        error = "too many fields";
        return false;
      }
      fields[field_index++] = line.substr(start, i - start);
      start = i + 1U;
    }
  }

  if (field_index != fields.size()) {
    error = "expected 5 fields";
    return false;
  }

  const auto sequence_nr = util::parse_uint64(fields[0]);
  const auto unix_ts = util::parse_int64(fields[2]);
  if (!sequence_nr.has_value() || !unix_ts.has_value() || fields[1].empty()) {
    error = "invalid sequence number, kind or timestamp";
    return false;
  }

  if (record_digest(*sequence_nr, fields[1], *unix_ts, fields[3]) != fields[4]) {
    error = "digest mismatch";
    return false;
  }

  auto payload = util::from_hex(fields[3]);
  if (!payload.has_value()) {
    error = "payload is not hex";
    return false;
  }

  out.sequence_nr = *sequence_nr;
  out.kind = std::string{fields[1]};
  out.unix_ts = *unix_ts;
  out.payload = std::move(*payload);
  out.persistent = true;
  return true;
}

// Persistence ids become file names: no separators, control bytes or dot names.
bool valid_persistence_id(std::string_view persistence_id) {
  if (persistence_id.empty() || persistence_id == "." || persistence_id == "..") {
    return false;
  }
  return std::ranges::none_of(persistence_id, [](char c) {
    return c == '/' || c == '\\' || static_cast<unsigned char>(c) < 0x20U;
  });
}

}  // namespace

Result EventJournal::open(std::string_view journal_dir, util::DiagnosticsLog* diagnostics) {
  if (journal_dir.empty()) {
    return Result::failure("Journal directory is empty.");
  }

  journal_dir_ = std::string{journal_dir};
  diagnostics_ = diagnostics;

  std::error_code ec;
  std::filesystem::create_directories(journal_dir_, ec);
  if (ec) {
    return Result::failure("Failed to create journal directory: " + ec.message());
  }

  return Result::success("Journal opened.");
}

Result EventJournal::append(std::string_view persistence_id, const EventEnvelope& event) {
  if (journal_dir_.empty()) {
    return Result::failure("append failed: journal is not open.");
  }
  if (!valid_persistence_id(persistence_id)) {
    return Result::failure("append failed: invalid persistence id.");
  }
  if (event.kind.empty() || event.kind.find('\t') != std::string::npos) {
    return Result::failure("append failed: invalid event kind.");
  }

  const std::lock_guard<std::mutex> lock(append_mutex_);
  const std::string path = stream_path(persistence_id);
  const bool fresh = !std::filesystem::exists(path);

  EventEnvelope record = event;
  record.sequence_nr = highest_sequence_nr(persistence_id) + 1U;
  record.persistent = true;

  std::ofstream out(path, std::ios::out | std::ios::app);
  if (!out) {
    return Result::failure("Failed to write journal stream file.");
  }
  if (fresh) {
    out << kStreamHeader << '\n';
  }
  out << serialize_record_line(record);
  if (!out.good()) {
    return Result::failure("Failed to flush journal stream file.");
  }

  return Result::success("Event appended.", std::to_string(record.sequence_nr));
}

Result EventJournal::append(std::string_view persistence_id, const DomainEvent& event, std::int64_t unix_ts) {
  EventEnvelope envelope = encode_event(event);
  envelope.unix_ts = unix_ts;
  return append(persistence_id, envelope);
}

JournalRead EventJournal::read_since(std::string_view persistence_id, std::uint64_t after_sequence_nr) const {
  return read_stream(persistence_id, after_sequence_nr, StreamCursor{});
}

JournalRead EventJournal::read_from(std::string_view persistence_id, const StreamCursor& cursor) const {
  return read_stream(persistence_id, cursor.sequence_nr, cursor);
}

std::uint64_t EventJournal::highest_sequence_nr(std::string_view persistence_id) const {
  if (!valid_persistence_id(persistence_id)) {
    return 0;
  }

  std::ifstream in(stream_path(persistence_id));
  if (!in) {
    return 0;
  }

  std::uint64_t highest = 0;
  std::string line;
  while (std::getline(in, line)) {
    if (in.eof() || line.empty() || line.front() == '#') {
      continue;
    }
    const auto split = line.find('\t');
    const auto sequence_nr = util::parse_uint64(std::string_view{line}.substr(0, split));
    if (sequence_nr.has_value() && *sequence_nr > highest) {
      highest = *sequence_nr;
    }
  }
  return highest;
}

std::string EventJournal::stream_path(std::string_view persistence_id) const {
  return (std::filesystem::path{journal_dir_} / (std::string{persistence_id} + std::string{kStreamFileSuffix}))
      .string();
}

JournalRead EventJournal::read_stream(std::string_view persistence_id, std::uint64_t after_sequence_nr,
                                      const StreamCursor& start) const {
  JournalRead read;
  read.next = start;
  if (journal_dir_.empty()) {
    read.status = Result::failure("read failed: journal is not open.");
    return read;
  }
  if (!valid_persistence_id(persistence_id)) {
    read.status = Result::failure("read failed: invalid persistence id.");
    return read;
  }

  std::ifstream in(stream_path(persistence_id), std::ios::in | std::ios::binary);
  if (!in) {
    if (start.byte_offset > 0) {
      const std::string reason = "stream file missing at offset " + std::to_string(start.byte_offset);
      record_invalid_record(persistence_id, reason);
      read.status = Result::failure("Journal stream " + std::string{persistence_id} + " lost its " + reason);
      return read;
    }
    read.status = Result::success("Stream has no events yet.");
    return read;
  }

  if (start.byte_offset > 0) {
    // The byte before the cursor must end the last consumed record.
    in.seekg(static_cast<std::streamoff>(start.byte_offset - 1U));
    char boundary = '\0';
    if (!in.get(boundary) || boundary != '\n') {
      const std::string reason = "offset " + std::to_string(start.byte_offset) + ": not a record boundary";
      record_invalid_record(persistence_id, reason);
      read.status = Result::failure("Journal stream " + std::string{persistence_id} + " changed under the reader at " +
                                    reason);
      return read;
    }
  }

  std::uint64_t expected = start.sequence_nr + 1U;
  std::uint64_t offset = start.byte_offset;
  std::string line;
  while (std::getline(in, line)) {
    if (in.eof()) {
      // No trailing newline: the producer is still writing this record.
      break;
    }

    const std::uint64_t line_offset = offset;
    offset += line.size() + 1U;
    if (line.empty() || line.front() == '#') {
      read.next.byte_offset = offset;
      continue;
    }

    EventEnvelope event;
    std::string error;
    if (!parse_record_line(line, event, error)) {
      const std::string reason = "offset " + std::to_string(line_offset) + ": " + error;
      record_invalid_record(persistence_id, reason);
      read.events.clear();
      read.next = start;
      read.status = Result::failure("Journal stream " + std::string{persistence_id} + " is corrupt at " + reason);
      return read;
    }

    if (event.sequence_nr != expected) {
      const std::string reason = "offset " + std::to_string(line_offset) + ": expected sequence " +
                                 std::to_string(expected) + ", found " + std::to_string(event.sequence_nr);
      record_invalid_record(persistence_id, reason);
      read.events.clear();
      read.next = start;
      read.status = Result::failure("Journal stream " + std::string{persistence_id} + " is out of order at " + reason);
      return read;
    }
    ++expected;

    read.next = {event.sequence_nr, offset};
    if (event.sequence_nr > after_sequence_nr) {
      read.events.push_back(std::move(event));
    }
  }

  read.status = Result::success("Read " + std::to_string(read.events.size()) + " events.");
  return read;
}

void EventJournal::record_invalid_record(std::string_view persistence_id, std::string_view reason) const {
  if (diagnostics_ == nullptr) {
    return;
  }
  diagnostics_->record(persistence_id, reason);
}

}  // namespace lift
