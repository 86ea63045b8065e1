#pragma once
#include "annolog/byte_source.hpp"
#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include <string_view>

namespace al {

// True for charsets that write bytes 0x00..0x7f as ASCII (UTF-8, US-ASCII,
// ISO-8859-*, windows-125x). Note framing is ASCII, so only these can carry
// notes. Names compare case-insensitively.
bool is_ascii_compatible(std::string_view charset);

// Access to the stored log of one build.
class LogRecord {
public:
  virtual ~LogRecord() = default;

  // Whether the log data exists right now. Callers must not cache the answer.
  virtual bool exists() const = 0;

  // A fresh stream positioned at the first byte of the log.
  virtual std::unique_ptr<ByteSource> open() const = 0;

  // Character set the log's bytes are written in, e.g. "UTF-8".
  virtual std::string charset() const = 0;

  // Build start, milliseconds since the epoch.
  virtual std::int64_t start_millis() const = 0;
};

class FileLogRecord : public LogRecord {
public:
  struct Config {
    std::string charset = "UTF-8";
    std::int64_t start_millis = 0;
  };

  explicit FileLogRecord(std::filesystem::path path);   // uses default Config{}
  FileLogRecord(std::filesystem::path path, Config cfg);

  bool exists() const override;
  std::unique_ptr<ByteSource> open() const override;
  std::string charset() const override { return cfg_.charset; }
  std::int64_t start_millis() const override { return cfg_.start_millis; }

  const std::filesystem::path& path() const noexcept { return path_; }

private:
  std::filesystem::path path_;
  Config cfg_;
};

}
