#pragma once
#include <cstddef>
#include <cstdio>
#include <string>

namespace al {

// Forward-only byte stream underneath a log.
class ByteSource {
public:
  virtual ~ByteSource() = default;

  // Reads up to `n` bytes; returns 0 at end of stream.
  // Throws std::system_error when the underlying read fails.
  virtual std::size_t read(char* buf, std::size_t n) = 0;

  // Releases the handle; a second call is a no-op.
  // May throw std::system_error if the release itself fails.
  virtual void close() = 0;
};

class FileByteSource : public ByteSource {
public:
  // Opens `path` for binary reading; throws std::system_error on failure.
  explicit FileByteSource(const std::string& path);

  // Reads from an already open stream (e.g. stdin) that this object does not own.
  explicit FileByteSource(std::FILE* borrowed);

  ~FileByteSource() override;

  FileByteSource(const FileByteSource&) = delete;
  FileByteSource& operator=(const FileByteSource&) = delete;

  std::size_t read(char* buf, std::size_t n) override;
  void close() override;

private:
  std::FILE* f_{nullptr};
  bool owned_{true};
  std::string path_;
};

}
