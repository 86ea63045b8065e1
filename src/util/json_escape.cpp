#include "annolog/json_escape.hpp"
#include <cstdio>

namespace al {

void append_json_string(std::string& o, std::string_view s) {
  o += '"';
  for (char c : s) {
    switch (c) {
      case '\\': o += "\\\\"; break;
      case '"':  o += "\\\""; break;
      case '\n': o += "\\n";  break;
      case '\r': o += "\\r";  break;
      case '\t': o += "\\t";  break;
      default:
        if (static_cast<unsigned char>(c) < 0x20) {
          char tmp[8];
          std::snprintf(tmp, sizeof(tmp), "\\u%04x", static_cast<unsigned>(c));
          o += tmp;
        } else {
          o += c;
        }
        break;
    }
  }
  o += '"';
}

}
