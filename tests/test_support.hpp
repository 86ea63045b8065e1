#pragma once
#include "annolog/byte_source.hpp"
#include "annolog/log_record.hpp"

#include <cerrno>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <iostream>
#include <memory>
#include <string>
#include <system_error>
#include <utility>

namespace al_test {

inline int& failures() { static int n = 0; return n; }

inline void check(bool ok, const std::string& what) {
  if (!ok) { std::cerr << "[FAIL] " << what << "\n"; ++failures(); }
}

inline int finish(const char* name) {
  if (failures() != 0) {
    std::cerr << "[FAIL] " << name << ": " << failures() << " check(s) failed\n";
    return 1;
  }
  std::cout << "[PASS] " << name << "\n";
  return 0;
}

// Counters shared between a MemoryLogRecord and the streams it hands out.
struct StreamStats {
  int opened = 0;
  int closed = 0;
};

// In-memory stream; throws EIO once `fail_at` bytes have been delivered,
// and from close() when `fail_on_close` is set (the stream still counts as released).
class MemoryByteSource : public al::ByteSource {
public:
  MemoryByteSource(std::string data, std::shared_ptr<StreamStats> stats,
                   std::size_t fail_at = std::string::npos, bool fail_on_close = false)
      : data_(std::move(data)), stats_(std::move(stats)), fail_at_(fail_at), fail_on_close_(fail_on_close) {
    if (stats_) ++stats_->opened;
  }
  ~MemoryByteSource() override { release(); }

  std::size_t read(char* buf, std::size_t n) override {
    if (pos_ >= fail_at_) throw std::system_error(EIO, std::generic_category(), "read memory log");
    std::size_t limit = data_.size();
    if (fail_at_ < limit) limit = fail_at_;
    const std::size_t take = (limit - pos_) < n ? (limit - pos_) : n;
    std::memcpy(buf, data_.data() + pos_, take);
    pos_ += take;
    return take;
  }

  void close() override {
    const bool was_open = open_;
    release();
    if (fail_on_close_ && was_open) throw std::system_error(EIO, std::generic_category(), "close memory log");
  }

private:
  void release() {
    if (open_ && stats_) ++stats_->closed;
    open_ = false;
  }

  std::string data_;
  std::shared_ptr<StreamStats> stats_;
  std::size_t fail_at_;
  bool fail_on_close_;
  std::size_t pos_{0};
  bool open_{true};
};

// Log record whose existence and content tests can change between calls.
class MemoryLogRecord : public al::LogRecord {
public:
  explicit MemoryLogRecord(std::string data, std::int64_t start_millis = 0)
      : data(std::move(data)), start(start_millis) {}

  bool exists() const override { return present; }
  std::unique_ptr<al::ByteSource> open() const override {
    return std::make_unique<MemoryByteSource>(data, stats, fail_at, fail_on_close);
  }
  std::string charset() const override { return cs; }
  std::int64_t start_millis() const override { return start; }

  std::string data;
  std::int64_t start;
  bool present = true;
  std::size_t fail_at = std::string::npos;
  bool fail_on_close = false;
  std::string cs = "UTF-8";
  std::shared_ptr<StreamStats> stats = std::make_shared<StreamStats>();
};

}
