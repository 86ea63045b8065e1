#pragma once
#include "annolog/byte_source.hpp"
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>

namespace al {

// Splits a ByteSource into lines. "\n", "\r\n" and a lone "\r" all end a
// line; terminators are not returned. A trailing unterminated fragment is a
// line of its own, an empty stream has none.
class LineReader {
public:
  struct Config {
    std::size_t chunk_bytes = 64 * 1024; // 64 KiB read granularity
  };

  explicit LineReader(std::unique_ptr<ByteSource> src);   // uses default Config{}
  LineReader(std::unique_ptr<ByteSource> src, Config cfg);
  ~LineReader();

  LineReader(const LineReader&) = delete;
  LineReader& operator=(const LineReader&) = delete;

  // Replaces `out` with the next line. Returns false once the stream is
  // exhausted; after that it keeps returning false.
  bool read_line(std::string& out);

  // Releases the underlying source. Errors from the source propagate.
  void close();

  std::uint64_t bytes_read() const noexcept;

private:
  struct Impl; Impl* p_;
};

}
