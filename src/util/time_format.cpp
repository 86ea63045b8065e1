#include "annolog/time_format.hpp"
#include <fast_float/fast_float.h>
#include <cmath>
#include <cstddef>
#include <cstdio>
#include <ctime>
#include <system_error>

namespace al {

namespace {

// Walks a --build-start value field by field.
struct Fields {
  std::string_view s;
  std::size_t i = 0;

  bool done() const { return i == s.size(); }
  bool next_is(char c) const { return i < s.size() && s[i] == c; }
  bool eat(char c) { if (!next_is(c)) return false; ++i; return true; }
  bool next_is_digit() const { return i < s.size() && s[i] >= '0' && s[i] <= '9'; }

  // Exactly `width` digits.
  bool number(std::size_t width, int& out) {
    if (s.size() - i < width) return false;
    int v = 0;
    for (std::size_t k = 0; k < width; ++k) {
      const char c = s[i + k];
      if (c < '0' || c > '9') return false;
      v = v * 10 + (c - '0');
    }
    i += width;
    out = v;
    return true;
  }
};

bool leap(int y) { return (y % 4 == 0 && y % 100 != 0) || y % 400 == 0; }

int month_days(int y, int m) {
  static const int days[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
  return m == 2 && leap(y) ? 29 : days[m - 1];
}

// Days between 1970-01-01 and y-m-d in the proleptic Gregorian calendar.
std::int64_t days_since_epoch(int y, int m, int d) {
  y -= m <= 2;
  const std::int64_t era = (y >= 0 ? y : y - 399) / 400;
  const std::int64_t yoe = y - era * 400;
  const std::int64_t doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d - 1;
  const std::int64_t doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
  return era * 146097 + doe - 719468;
}

}

std::optional<std::int64_t> parse_iso8601_ms(std::string_view s) {
  Fields f{s};
  int y = 0, mo = 0, d = 0, h = 0, mi = 0, sec = 0, ms = 0;
  if (!(f.number(4, y) && f.eat('-') && f.number(2, mo) && f.eat('-') && f.number(2, d))) return std::nullopt;
  if (mo < 1 || mo > 12 || d < 1 || d > month_days(y, mo)) return std::nullopt;

  if (f.eat('T')) {
    if (!(f.number(2, h) && f.eat(':') && f.number(2, mi) && f.eat(':') && f.number(2, sec))) return std::nullopt;
    if (h > 23 || mi > 59 || sec > 59) return std::nullopt;
    if (f.eat('.')) {
      // 1 to 3 digits, scaled to millis
      int scale = 100, digits = 0;
      while (digits < 3 && f.next_is_digit()) {
        ms += (s[f.i++] - '0') * scale;
        scale /= 10;
        ++digits;
      }
      if (digits == 0) return std::nullopt;
    }
  }
  f.eat('Z');
  if (!f.done()) return std::nullopt; // offsets are not supported

  const std::int64_t secs = days_since_epoch(y, mo, d) * 86400 + h * 3600 + mi * 60 + sec;
  return secs * 1000 + ms;
}

std::optional<std::int64_t> parse_epoch_ms(std::string_view s) {
  if (s.empty()) return std::nullopt;
  double v = 0.0;
  auto [ptr, ec] = fast_float::from_chars(s.data(), s.data() + s.size(), v);
  if (ec != std::errc() || ptr != s.data() + s.size()) return std::nullopt;
  // Exact integers only; doubles stay exact well past today's epoch millis.
  if (!std::isfinite(v) || v != std::floor(v) || std::fabs(v) > 9.0e15) return std::nullopt;
  return static_cast<std::int64_t>(v);
}

std::optional<std::int64_t> parse_time_ms(std::string_view s) {
  if (auto v = parse_epoch_ms(s)) return v;
  return parse_iso8601_ms(s);
}

std::string format_clock_time(std::int64_t millis_since_epoch, bool utc) {
  std::int64_t secs = millis_since_epoch / 1000;
  if (millis_since_epoch % 1000 < 0) --secs;
  std::time_t t = static_cast<std::time_t>(secs);
  std::tm tm{};
#if defined(_WIN32)
  if (utc) gmtime_s(&tm, &t); else localtime_s(&tm, &t);
#else
  if (utc) gmtime_r(&t, &tm); else localtime_r(&t, &tm);
#endif
  char buf[16];
  std::snprintf(buf, sizeof(buf), "%02d:%02d:%02d", tm.tm_hour, tm.tm_min, tm.tm_sec);
  return buf;
}

std::string format_elapsed(std::int64_t elapsed_millis) {
  const bool neg = elapsed_millis < 0;
  std::uint64_t v = neg ? static_cast<std::uint64_t>(-(elapsed_millis + 1)) + 1
                        : static_cast<std::uint64_t>(elapsed_millis);
  const unsigned ms = static_cast<unsigned>(v % 1000); v /= 1000;
  const unsigned s  = static_cast<unsigned>(v % 60);   v /= 60;
  const unsigned m  = static_cast<unsigned>(v % 60);   v /= 60;
  char buf[48];
  std::snprintf(buf, sizeof(buf), "%s%02llu:%02u:%02u.%03u", neg ? "-" : "",
                static_cast<unsigned long long>(v), m, s, ms);
  return buf;
}

}
