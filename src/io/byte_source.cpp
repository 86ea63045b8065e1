#include "annolog/byte_source.hpp"
#include <cerrno>
#include <system_error>

namespace al {

FileByteSource::FileByteSource(const std::string& path) : path_(path) {
  f_ = std::fopen(path.c_str(), "rb");
  if (!f_) throw std::system_error(errno, std::generic_category(), "open " + path);
}

FileByteSource::FileByteSource(std::FILE* borrowed) : f_(borrowed), owned_(false), path_("<stream>") {}

FileByteSource::~FileByteSource() {
  if (f_ && owned_) std::fclose(f_);
}

std::size_t FileByteSource::read(char* buf, std::size_t n) {
  if (!f_) return 0;
  std::size_t got = std::fread(buf, 1, n, f_);
  if (got == 0 && std::ferror(f_)) {
    const int err = errno;
    std::clearerr(f_);
    throw std::system_error(err ? err : EIO, std::generic_category(), "read " + path_);
  }
  return got;
}

void FileByteSource::close() {
  std::FILE* f = f_;
  f_ = nullptr;
  if (!f || !owned_) return;
  if (std::fclose(f) != 0) throw std::system_error(errno, std::generic_category(), "close " + path_);
}

}
