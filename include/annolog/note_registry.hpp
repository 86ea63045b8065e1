#pragma once
#include "annolog/byte_cursor.hpp"
#include "annolog/timestamp.hpp"
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <variant>

namespace simdjson { namespace dom { class object; } }

namespace al {

class LogRecord;

struct TimestampNote {
  std::int64_t millis_since_epoch = 0;
  // Absent in the legacy form; resolved against the build start.
  std::optional<std::int64_t> elapsed_millis;
};

struct HyperlinkNote {
  std::string url;
  std::int64_t length = 0;
};

// A registered kind whose content nobody extracts.
struct OpaqueNote {
  std::string type;
};

using Note = std::variant<TimestampNote, HyperlinkNote, OpaqueNote>;

enum class DecodeStatus {
  Ok,          // note decoded
  NotANote,    // bytes at the cursor are not a preamble
  UnknownType, // well framed, but no decoder for its "type"
  Malformed    // framing or payload is corrupt
};

const char* to_string(DecodeStatus s) noexcept;

struct DecodeResult {
  DecodeStatus status = DecodeStatus::NotANote;
  std::optional<Note> note;
  std::string type; // discriminator as read, when one was reached
};

// Maps a note's "type" discriminator to the function that decodes it.
// Unregistered types are an expected outcome, not an error.
class NoteRegistry {
public:
  // Returns nullopt when the payload is missing required members.
  using Decoder = std::function<std::optional<Note>(const simdjson::dom::object&)>;

  NoteRegistry() = default;

  // "timestamp" and "hyperlink".
  static NoteRegistry with_defaults();

  void add(std::string type, Decoder decoder);
  void add_opaque(std::string type);
  bool contains(std::string_view type) const;

  // Reads one note starting at the cursor. The cursor is left after
  // whatever was consumed, including on failure.
  DecodeResult read_from(ByteCursor& in) const;

private:
  std::unordered_map<std::string, Decoder> decoders_;
};

// Turns a timestamp note into a Timestamp; the legacy form gets its elapsed
// time from the record's start, clamped to the int64 range.
Timestamp resolve_timestamp(const TimestampNote& note, const LogRecord& record);

}
