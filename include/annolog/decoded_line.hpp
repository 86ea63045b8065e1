#pragma once
#include "annolog/timestamp.hpp"
#include <cstddef>
#include <functional>
#include <optional>
#include <ostream>
#include <string>
#include <utility>

namespace al {

// One line of a log with every console note removed.
class DecodedLine {
public:
  DecodedLine(std::string text, std::optional<Timestamp> timestamp)
      : text_(std::move(text)), timestamp_(timestamp) {}

  const std::string& text() const noexcept { return text_; }
  const std::optional<Timestamp>& timestamp() const noexcept { return timestamp_; }

  bool operator==(const DecodedLine& o) const {
    return text_ == o.text_ && timestamp_ == o.timestamp_;
  }
  bool operator!=(const DecodedLine& o) const { return !(*this == o); }

private:
  std::string text_;
  std::optional<Timestamp> timestamp_;
};

// e.g. DecodedLine{text="build started", timestamp=Timestamp{elapsed=1000ms, epoch=1000ms}}
std::string to_string(const DecodedLine& line);
std::ostream& operator<<(std::ostream& os, const DecodedLine& line);

}

namespace std {
template <> struct hash<al::DecodedLine> {
  std::size_t operator()(const al::DecodedLine& l) const noexcept {
    std::size_t h = std::hash<std::string>{}(l.text());
    const std::size_t t = l.timestamp() ? std::hash<al::Timestamp>{}(*l.timestamp()) : 0;
    return h * 31 + t;
  }
};
}
