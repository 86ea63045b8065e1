#include "annolog/log_record.hpp"
#include <system_error>
#include <utility>

namespace al {

FileLogRecord::FileLogRecord(std::filesystem::path path)
  : FileLogRecord(std::move(path), Config{}) {}

FileLogRecord::FileLogRecord(std::filesystem::path path, Config cfg)
  : path_(std::move(path)), cfg_(std::move(cfg)) {}

bool FileLogRecord::exists() const {
  std::error_code ec;
  return std::filesystem::is_regular_file(path_, ec);
}

std::unique_ptr<ByteSource> FileLogRecord::open() const {
  return std::make_unique<FileByteSource>(path_.string());
}

}
