#pragma once
#include <cstddef>
#include <cstdint>
#include <functional>
#include <ostream>
#include <string>

namespace al {

// Time attached to a log line: offset from build start plus wall-clock time.
struct Timestamp {
  std::int64_t elapsed_millis = 0;
  std::int64_t millis_since_epoch = 0;

  bool operator==(const Timestamp& o) const noexcept {
    return elapsed_millis == o.elapsed_millis && millis_since_epoch == o.millis_since_epoch;
  }
  bool operator!=(const Timestamp& o) const noexcept { return !(*this == o); }
};

std::string to_string(const Timestamp& ts);
std::ostream& operator<<(std::ostream& os, const Timestamp& ts);

}

namespace std {
template <> struct hash<al::Timestamp> {
  std::size_t operator()(const al::Timestamp& ts) const noexcept {
    std::size_t h = std::hash<std::int64_t>{}(ts.elapsed_millis);
    return h * 31 + std::hash<std::int64_t>{}(ts.millis_since_epoch);
  }
};
}
