#include "annolog/decoded_line.hpp"
#include <sstream>

namespace al {

std::string to_string(const Timestamp& ts) {
  std::ostringstream o;
  o << "Timestamp{elapsed=" << ts.elapsed_millis << "ms, epoch=" << ts.millis_since_epoch << "ms}";
  return o.str();
}

std::ostream& operator<<(std::ostream& os, const Timestamp& ts) { return os << to_string(ts); }

std::string to_string(const DecodedLine& line) {
  std::ostringstream o;
  o << "DecodedLine{text=\"" << line.text() << "\", timestamp=";
  if (line.timestamp()) o << *line.timestamp();
  else o << "absent";
  o << "}";
  return o.str();
}

std::ostream& operator<<(std::ostream& os, const DecodedLine& line) { return os << to_string(line); }

}
