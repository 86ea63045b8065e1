#include "annolog/note_registry.hpp"
#include "annolog/console_note.hpp"
#include "annolog/log_record.hpp"

#include <simdjson.h>
#include <cstdint>
#include <limits>
#include <utility>

namespace al {

static std::optional<Note> decode_timestamp(const simdjson::dom::object& obj) {
  TimestampNote n;
  if (obj["millis"].get_int64().get(n.millis_since_epoch)) return std::nullopt;

  std::int64_t elapsed = 0;
  auto err = obj["elapsed"].get_int64().get(elapsed);
  if (!err) n.elapsed_millis = elapsed;
  else if (err != simdjson::NO_SUCH_FIELD) return std::nullopt;
  return Note{n};
}

static std::optional<Note> decode_hyperlink(const simdjson::dom::object& obj) {
  HyperlinkNote n;
  std::string_view url;
  if (obj["url"].get_string().get(url)) return std::nullopt;
  if (obj["length"].get_int64().get(n.length)) return std::nullopt;
  n.url = std::string(url);
  return Note{std::move(n)};
}

static std::uint32_t read_u32_be(std::string_view b) {
  return (static_cast<std::uint32_t>(static_cast<unsigned char>(b[0])) << 24)
       | (static_cast<std::uint32_t>(static_cast<unsigned char>(b[1])) << 16)
       | (static_cast<std::uint32_t>(static_cast<unsigned char>(b[2])) << 8)
       |  static_cast<std::uint32_t>(static_cast<unsigned char>(b[3]));
}

const char* to_string(DecodeStatus s) noexcept {
  switch (s) {
    case DecodeStatus::Ok:          return "ok";
    case DecodeStatus::NotANote:    return "not-a-note";
    case DecodeStatus::UnknownType: return "unknown-type";
    case DecodeStatus::Malformed:   return "malformed";
  }
  return "?";
}

NoteRegistry NoteRegistry::with_defaults() {
  NoteRegistry r;
  r.add("timestamp", decode_timestamp);
  r.add("hyperlink", decode_hyperlink);
  return r;
}

void NoteRegistry::add(std::string type, Decoder decoder) {
  decoders_[std::move(type)] = std::move(decoder);
}

void NoteRegistry::add_opaque(std::string type) {
  std::string name = type;
  add(std::move(type), [name](const simdjson::dom::object&) -> std::optional<Note> {
    return Note{OpaqueNote{name}};
  });
}

bool NoteRegistry::contains(std::string_view type) const {
  return decoders_.find(std::string(type)) != decoders_.end();
}

DecodeResult NoteRegistry::read_from(ByteCursor& in) const {
  DecodeResult r;

  std::string_view pre;
  if (!in.read_fully(kNotePreamble.size(), pre) || pre != kNotePreamble) return r;

  r.status = DecodeStatus::Malformed;

  // Base64 body runs up to the postamble's ESC.
  std::string_view rest = in.remaining();
  std::size_t n = 0;
  while (n < rest.size() && is_base64_char(rest[n])) ++n;
  in.skip(n);

  auto body = base64_decode(rest.substr(0, n));
  if (!body || body->size() < 4) return r;
  const std::uint32_t sz = read_u32_be(*body);
  if (body->size() - 4 != sz) return r;

  // Left unread on a mismatch: a preamble may start right here.
  if (in.remaining().compare(0, kNotePostamble.size(), kNotePostamble) != 0) return r;
  in.skip(kNotePostamble.size());

  // thread-local parser, reused across notes
  thread_local simdjson::dom::parser parser;
  simdjson::dom::element doc;
  if (parser.parse(body->data() + 4, sz).get(doc)) return r;
  simdjson::dom::object obj;
  if (doc.get_object().get(obj)) return r;
  std::string_view type;
  if (obj["type"].get_string().get(type)) return r;
  r.type = std::string(type);

  auto it = decoders_.find(r.type);
  if (it == decoders_.end()) {
    r.status = DecodeStatus::UnknownType;
    return r;
  }

  r.note = it->second(obj);
  r.status = r.note ? DecodeStatus::Ok : DecodeStatus::Malformed;
  return r;
}

// a - b, clamped to the int64 range.
static std::int64_t saturating_sub(std::int64_t a, std::int64_t b) noexcept {
  using lim = std::numeric_limits<std::int64_t>;
  if (b < 0 && a > lim::max() + b) return lim::max();
  if (b > 0 && a < lim::min() + b) return lim::min();
  return a - b;
}

Timestamp resolve_timestamp(const TimestampNote& note, const LogRecord& record) {
  if (note.elapsed_millis) return Timestamp{*note.elapsed_millis, note.millis_since_epoch};
  return Timestamp{saturating_sub(note.millis_since_epoch, record.start_millis()), note.millis_since_epoch};
}

}
