#include "annolog/line_decoder.hpp"
#include "annolog/console_note.hpp"

#include <iostream>
#include <stdexcept>
#include <system_error>
#include <utility>

namespace al {

LineDecoder::LineDecoder(std::shared_ptr<const LogRecord> record)
  : LineDecoder(std::move(record), NoteRegistry::with_defaults(), Config{}) {}

LineDecoder::LineDecoder(std::shared_ptr<const LogRecord> record, NoteRegistry registry, Config cfg)
  : record_(std::move(record)), registry_(std::move(registry)), cfg_(cfg) {
  if (!record_) throw std::invalid_argument("LineDecoder: null log record");
  const std::string cs = record_->charset();
  if (!is_ascii_compatible(cs)) throw std::invalid_argument("LineDecoder: charset cannot carry notes: " + cs);
}

LineDecoder::~LineDecoder() { close(); }

std::optional<DecodedLine> LineDecoder::next_line() {
  if (state_ == State::Exhausted) return std::nullopt;

  // Storage may show up after construction, so this is asked every time.
  if (!record_->exists()) {
    if (state_ == State::Streaming) finish();
    return std::nullopt;
  }

  std::string raw;
  try {
    if (!reader_) {
      reader_ = std::make_unique<LineReader>(record_->open(), cfg_.reader);
      state_ = State::Streaming;
    }
    if (!reader_->read_line(raw)) {
      finish();
      return std::nullopt;
    }
  } catch (const std::system_error&) {
    finish();
    throw;
  }
  return decode(raw);
}

DecodedLine LineDecoder::decode(std::string_view raw) const {
  std::optional<Timestamp> ts = read_timestamp(raw);
  return DecodedLine(remove_notes(raw), ts);
}

// The line's bytes are already in the record's charset, checked ASCII
// compatible at construction, so the framing bytes match as written.
std::optional<Timestamp> LineDecoder::read_timestamp(std::string_view raw) const {
  const int first = static_cast<unsigned char>(kNotePreamble[0]);
  std::optional<Timestamp> found;
  ByteCursor in(raw);
  while (true) {
    in.mark();
    const int b = in.read();
    if (b == -1) return found;
    if (b != first) continue;

    in.reset();
    DecodeResult r = registry_.read_from(in);
    switch (r.status) {
      case DecodeStatus::NotANote:
        // Only the ESC is skipped; a real note may start inside the near miss.
        in.reset();
        in.skip(1);
        break;
      case DecodeStatus::UnknownType:
      case DecodeStatus::Malformed:
        if (cfg_.log_dropped_notes) {
          std::cerr << "[decode] dropped " << to_string(r.status) << " note";
          if (!r.type.empty()) std::cerr << " type=" << r.type;
          std::cerr << "\n";
        }
        break;
      case DecodeStatus::Ok:
        if (!found) {
          if (const auto* tn = std::get_if<TimestampNote>(&*r.note)) {
            found = resolve_timestamp(*tn, *record_);
          }
        }
        break;
    }
  }
}

std::uint64_t LineDecoder::line_count() const {
  if (!record_->exists()) return 0;
  // Own reader; released by its destructor on every path.
  LineReader reader(record_->open(), cfg_.reader);
  std::uint64_t n = 0;
  std::string scratch;
  while (reader.read_line(scratch)) ++n;
  return n;
}

void LineDecoder::close() noexcept {
  if (!reader_) return;
  try {
    reader_->close();
  } catch (const std::exception& e) {
    std::cerr << "[decode] close failed: " << e.what() << "\n";
  }
  reader_.reset();
  if (state_ == State::Streaming) state_ = State::Exhausted;
}

void LineDecoder::finish() noexcept {
  close();
  state_ = State::Exhausted;
}

const char* to_string(LineDecoder::State s) noexcept {
  switch (s) {
    case LineDecoder::State::Unstarted: return "unstarted";
    case LineDecoder::State::Streaming: return "streaming";
    case LineDecoder::State::Exhausted: return "exhausted";
  }
  return "?";
}

}
