#pragma once
#include "annolog/decoded_line.hpp"
#include <cstdint>
#include <string>

namespace al {

class LineJsonWriter {
public:
  // One compact JSON object per line:
  // {"line":N,"text":"...","millis":M|null,"elapsed":E|null}
  static std::string to_json(const DecodedLine& line, std::uint64_t line_no);
};

}
