#pragma once
#include <cstddef>
#include <string_view>

namespace al {

// Read position over the bytes of one line, with a single mark to rewind to.
class ByteCursor {
public:
  explicit ByteCursor(std::string_view bytes) : bytes_(bytes) {}

  void mark() noexcept { mark_ = pos_; }
  void reset() noexcept { pos_ = mark_; }

  // Next byte as 0..255, or -1 at the end.
  int read() noexcept {
    if (pos_ >= bytes_.size()) return -1;
    return static_cast<unsigned char>(bytes_[pos_++]);
  }

  // Consumes `n` bytes into `out`. If fewer remain, consumes what is left
  // and returns false.
  bool read_fully(std::size_t n, std::string_view& out) noexcept {
    const std::size_t avail = bytes_.size() - pos_;
    const std::size_t take = n < avail ? n : avail;
    out = bytes_.substr(pos_, take);
    pos_ += take;
    return take == n;
  }

  void skip(std::size_t n) noexcept {
    const std::size_t avail = bytes_.size() - pos_;
    pos_ += (n < avail ? n : avail);
  }

  std::string_view remaining() const noexcept { return bytes_.substr(pos_); }
  std::size_t position() const noexcept { return pos_; }

private:
  std::string_view bytes_;
  std::size_t pos_{0};
  std::size_t mark_{0};
};

}
