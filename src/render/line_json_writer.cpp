#include "annolog/line_json.hpp"
#include "annolog/json_escape.hpp"

namespace al {

std::string LineJsonWriter::to_json(const DecodedLine& line, std::uint64_t line_no) {
  std::string o = "{\"line\":" + std::to_string(line_no) + ",\"text\":";
  append_json_string(o, line.text());
  if (line.timestamp()) {
    o += ",\"millis\":"  + std::to_string(line.timestamp()->millis_since_epoch);
    o += ",\"elapsed\":" + std::to_string(line.timestamp()->elapsed_millis);
  } else {
    o += ",\"millis\":null,\"elapsed\":null";
  }
  o += "}";
  return o;
}

}
