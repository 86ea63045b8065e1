#include "annolog/line_reader.hpp"
#include <utility>
#include <vector>

namespace al {

struct LineReader::Impl {
  std::unique_ptr<ByteSource> src;
  Config cfg;
  std::vector<char> buf;
  std::size_t pos{0};
  std::size_t len{0};
  bool eof{false};
  bool skip_lf{false}; // previous line ended in '\r'; swallow a following '\n'
  std::uint64_t bytes{0};

  bool fill() {
    if (eof || !src) return false;
    if (buf.size() != cfg.chunk_bytes) buf.resize(cfg.chunk_bytes ? cfg.chunk_bytes : 1);
    len = src->read(buf.data(), buf.size());
    pos = 0;
    if (len == 0) { eof = true; return false; }
    bytes += len;
    return true;
  }

  bool read_line(std::string& out) {
    out.clear();
    bool any = false;
    while (true) {
      if (pos == len && !fill()) return any;

      if (skip_lf) {
        skip_lf = false;
        if (buf[pos] == '\n') { ++pos; continue; }
      }

      const char* start = buf.data() + pos;
      const char* end = buf.data() + len;
      const char* p = start;
      while (p < end && *p != '\n' && *p != '\r') ++p;

      any = true;
      out.append(start, static_cast<std::size_t>(p - start));
      if (p == end) { pos = len; continue; } // unfinished line, pull the next chunk

      if (*p == '\r') skip_lf = true;
      pos = static_cast<std::size_t>(p - buf.data()) + 1;
      return true;
    }
  }
};

LineReader::LineReader(std::unique_ptr<ByteSource> src)
  : LineReader(std::move(src), Config{}) {}

LineReader::LineReader(std::unique_ptr<ByteSource> src, Config cfg)
  : p_(new Impl{std::move(src), cfg}) {}

LineReader::~LineReader() { delete p_; }

bool LineReader::read_line(std::string& out) { return p_->read_line(out); }

void LineReader::close() {
  if (!p_->src) return;
  p_->eof = true;
  p_->pos = p_->len = 0; // buffered bytes go with the source
  std::unique_ptr<ByteSource> src = std::move(p_->src);
  src->close();
}

std::uint64_t LineReader::bytes_read() const noexcept { return p_->bytes; }

}
