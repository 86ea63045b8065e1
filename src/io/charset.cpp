#include "annolog/log_record.hpp"
#include <cctype>
#include <string>

namespace al {

static std::string upper(std::string_view s) {
  std::string o(s);
  for (char& c : o) c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
  return o;
}

static bool starts_with(const std::string& s, std::string_view pfx) {
  return s.size() >= pfx.size() && s.compare(0, pfx.size(), pfx) == 0;
}

// Digits only after `pfx`, between lo and hi.
static bool numbered(const std::string& s, std::string_view pfx, int lo, int hi) {
  if (!starts_with(s, pfx) || s.size() == pfx.size() || s.size() - pfx.size() > 4) return false;
  int v = 0;
  for (std::size_t i = pfx.size(); i < s.size(); ++i) {
    if (!std::isdigit(static_cast<unsigned char>(s[i]))) return false;
    v = v * 10 + (s[i] - '0');
  }
  return v >= lo && v <= hi;
}

bool is_ascii_compatible(std::string_view charset) {
  const std::string cs = upper(charset);
  if (cs == "UTF-8" || cs == "UTF8" || cs == "US-ASCII" || cs == "ASCII" || cs == "LATIN1") return true;
  return numbered(cs, "ISO-8859-", 1, 16) || numbered(cs, "ISO8859-", 1, 16)
      || numbered(cs, "WINDOWS-", 1250, 1258) || numbered(cs, "CP", 1250, 1258);
}

}
