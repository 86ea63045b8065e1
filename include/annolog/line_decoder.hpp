#pragma once
#include "annolog/decoded_line.hpp"
#include "annolog/line_reader.hpp"
#include "annolog/log_record.hpp"
#include "annolog/note_registry.hpp"
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace al {

// Reads a build log one line at a time, stripping console notes and
// surfacing the timestamp note of each line.
//
// Not thread safe. One instance reads one log, forward only.
class LineDecoder {
public:
  enum class State { Unstarted, Streaming, Exhausted };

  struct Config {
    LineReader::Config reader;
    bool log_dropped_notes = false; // report unknown/corrupt notes on stderr
  };

  // Throws std::invalid_argument for a null record or a record whose charset
  // is not ASCII compatible.
  explicit LineDecoder(std::shared_ptr<const LogRecord> record);
  LineDecoder(std::shared_ptr<const LogRecord> record, NoteRegistry registry, Config cfg);
  ~LineDecoder();

  LineDecoder(const LineDecoder&) = delete;
  LineDecoder& operator=(const LineDecoder&) = delete;

  // The next line, or nullopt when there are no more. The reader is opened
  // on first use. Throws std::system_error if the log cannot be read, after
  // which the decoder stays exhausted.
  std::optional<DecodedLine> next_line();

  // Number of lines in the log, counted on a separate stream. 0 if the log
  // does not exist. Does not disturb next_line().
  std::uint64_t line_count() const;

  // Releases the reader. Never throws; safe to call repeatedly.
  void close() noexcept;

  // Decodes one raw line (without its terminator).
  DecodedLine decode(std::string_view raw) const;

  State state() const noexcept { return state_; }
  std::string charset() const { return record_->charset(); }

private:
  std::optional<Timestamp> read_timestamp(std::string_view raw) const;
  void finish() noexcept;

  std::shared_ptr<const LogRecord> record_;
  NoteRegistry registry_;
  Config cfg_;
  std::unique_ptr<LineReader> reader_;
  State state_{State::Unstarted};
};

const char* to_string(LineDecoder::State s) noexcept;

}
