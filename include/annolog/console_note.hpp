#pragma once
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace al {

// A console note is framed as
//   ESC "[8mha:"  base64( u32 big-endian length, payload )  ESC "[0m"
// The payload is a JSON object whose "type" member selects the decoder.
inline constexpr std::string_view kNotePreamble{"\x1b[8mha:", 7};
inline constexpr std::string_view kNotePostamble{"\x1b[0m", 4};

// Frames an arbitrary payload as a console note.
std::string encode_note(std::string_view payload);

// {"type":"timestamp","millis":...[,"elapsed":...]}
std::string encode_timestamp_note(std::int64_t millis_since_epoch,
                                  std::optional<std::int64_t> elapsed_millis = std::nullopt);

// {"type":"hyperlink","url":...,"length":...}
std::string encode_hyperlink_note(std::string_view url, std::int64_t length);

// Removes every complete preamble..postamble span. A preamble that is never
// closed is left in place.
std::string remove_notes(std::string_view line);

bool is_base64_char(char c) noexcept;
std::string base64_encode(std::string_view bytes);
// nullopt when `text` is not valid padded base64.
std::optional<std::string> base64_decode(std::string_view text);

}
