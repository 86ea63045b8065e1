#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace al {

// Limited ISO-8601 subset: YYYY-MM-DD[THH:MM:SS[.mmm]][Z]. Epoch millis.
std::optional<std::int64_t> parse_iso8601_ms(std::string_view s);

// Integral epoch milliseconds ("1700000000000").
std::optional<std::int64_t> parse_epoch_ms(std::string_view s);

// Either of the above.
std::optional<std::int64_t> parse_time_ms(std::string_view s);

// "HH:MM:SS" wall-clock time of day.
std::string format_clock_time(std::int64_t millis_since_epoch, bool utc);

// "HH:MM:SS.mmm" since build start; negative offsets get a leading '-'.
std::string format_elapsed(std::int64_t elapsed_millis);

}
